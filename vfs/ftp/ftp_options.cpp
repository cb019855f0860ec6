// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "ftp_options.h"
#include <algorithm>
#include <rvfs/file_path.h>

using namespace rvfs;
using namespace vfs;


namespace
{
const char* const DEFAULT_USERNAME = "anonymous";
const char* const DEFAULT_PASSWORD = "anonymous";
}


std::string vfs::resolveUsername(const FtpOptions& options, const Authority& authority)
{
    if (!options.username.empty())
        return options.username;

    if (!authority.userInfo.username.empty())
        return authority.userInfo.username;

    if (const std::optional<std::string> envUser = getEnvironmentVar(ENV_FTP_USERNAME))
        return *envUser; //set, even if empty

    return DEFAULT_USERNAME;
}


std::string vfs::resolvePassword(const FtpOptions& options)
{
    if (!options.password.empty())
        return options.password;

    if (const std::optional<std::string> envPass = getEnvironmentVar(ENV_FTP_PASSWORD))
        return *envPass;

    return DEFAULT_PASSWORD;
}


FtpProtocol vfs::resolveProtocol(const FtpOptions& options) //throw SysError
{
    std::string protocol = "FTP";

    if (const std::optional<std::string> envProtocol = getEnvironmentVar(ENV_FTP_PROTOCOL))
        protocol = *envProtocol;

    if (!options.protocol.empty())
        protocol = options.protocol;

    if (equalAsciiNoCase(protocol, "FTP"))
        return FtpProtocol::ftp;
    if (equalAsciiNoCase(protocol, "FTPS"))
        return FtpProtocol::ftps;
    if (equalAsciiNoCase(protocol, "FTPES"))
        return FtpProtocol::ftpes;

    throw SysError(replaceCpy<std::wstring>(L"Unsupported FTP protocol %x. Expected FTP, FTPS or FTPES.", L"%x", fmtPath(protocol)));
}


bool vfs::resolveDisableEpsv(const FtpOptions& options)
{
    if (options.disableEpsv)
        return *options.disableEpsv;

    if (const std::optional<std::string> envEpsv = getEnvironmentVar(ENV_FTP_DISABLE_EPSV))
        return equalAsciiNoCase(*envEpsv, "true") || *envEpsv == "1";

    return false;
}


TlsConfig vfs::resolveTlsConfig(const FtpOptions& options, const Authority& authority)
{
    TlsConfig cfg = options.tls ? *options.tls : TlsConfig();
    if (cfg.serverName.empty())
        cfg.serverName = authority.host;
    return cfg;
}


int vfs::resolvePort(const Authority& authority)
{
    return authority.port > 0 ? authority.port : DEFAULT_PORT_FTP;
}


std::chrono::milliseconds vfs::resolveConnectTimeout(const FtpOptions& options, const ExecContext& ctx) //throw SysError
{
    if (ctx.isDone())
        throw SysError(L"Operation cancelled or deadline exceeded before connecting.");

    std::chrono::milliseconds timeout = options.dialTimeout > std::chrono::milliseconds(0) ?
                                        options.dialTimeout : std::chrono::milliseconds(DEFAULT_DIAL_TIMEOUT);

    if (const auto& deadline = ctx.getDeadline())
    {
        const auto timeLeft = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
        timeout = std::min(timeout, std::max(timeLeft, std::chrono::milliseconds(1)));
    }
    return timeout;
}


std::string vfs::formatProtocol(FtpProtocol protocol)
{
    switch (protocol)
    {
        case FtpProtocol::ftp:
            return "FTP";
        case FtpProtocol::ftps:
            return "FTPS";
        case FtpProtocol::ftpes:
            return "FTPES";
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
