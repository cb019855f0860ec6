// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FTP_OPTIONS_H_7738491028374650192
#define FTP_OPTIONS_H_7738491028374650192

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <rvfs/sys_error.h>
#include "../authority.h"
#include "../exec_context.h"


namespace vfs
{
const int DEFAULT_PORT_FTP = 21; //TLS enabled? => same for explicit FTPES, implicit FTPS usually uses port 990 (set it explicitly)
const std::chrono::seconds DEFAULT_DIAL_TIMEOUT{10};

const char* const ENV_FTP_USERNAME     = "VFS_FTP_USERNAME";
const char* const ENV_FTP_PASSWORD     = "VFS_FTP_PASSWORD";
const char* const ENV_FTP_PROTOCOL     = "VFS_FTP_PROTOCOL";
const char* const ENV_FTP_DISABLE_EPSV = "VFS_FTP_DISABLE_EPSV";

enum class FtpProtocol
{
    ftp,
    ftps,  //implicit TLS
    ftpes, //explicit TLS: AUTH TLS on the plain control connection
};

enum class TlsVersion
{
    tls1_0,
    tls1_1,
    tls1_2,
    tls1_3,
};

struct TlsConfig
{
    TlsVersion minVersion = TlsVersion::tls1_2;
    bool verifyPeer = false; //check certificate chain and host name
    std::string serverName;  //empty: the authority's host
};


struct FtpOptions
{
    std::string username; //empty: see resolveUsername()
    std::string password;
    std::string protocol; //"FTP", "FTPS", "FTPES"; empty: see resolveProtocol()
    std::optional<bool> disableEpsv;
    std::chrono::milliseconds dialTimeout{0}; //0: DEFAULT_DIAL_TIMEOUT
    std::optional<TlsConfig> tls;             //none: TlsConfig defaults
    std::function<void(const std::string& line)> debugTrace; //optional: FTP command/response log
};

//precedence: default < environment < authority < option
std::string resolveUsername(const FtpOptions& options, const Authority& authority);
std::string resolvePassword(const FtpOptions& options);
FtpProtocol resolveProtocol(const FtpOptions& options); //throw SysError
bool resolveDisableEpsv(const FtpOptions& options);
TlsConfig resolveTlsConfig(const FtpOptions& options, const Authority& authority);
int resolvePort(const Authority& authority);

//smaller of the dial timeout and the time left until the context's deadline
std::chrono::milliseconds resolveConnectTimeout(const FtpOptions& options, const ExecContext& ctx); //throw SysError

std::string formatProtocol(FtpProtocol protocol);
}

#endif //FTP_OPTIONS_H_7738491028374650192
