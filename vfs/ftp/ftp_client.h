// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FTP_CLIENT_H_1203948576120394857
#define FTP_CLIENT_H_1203948576120394857

#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <rvfs/sys_error.h>


namespace vfs
{
const long FTP_STATUS_FILE_UNAVAILABLE = 550;

struct SysErrorFtpProtocol : public rvfs::SysError
{
    SysErrorFtpProtocol(const std::wstring& msg, long ftpError) : SysError(msg), ftpErrorCode(ftpError) {}

    long ftpErrorCode;
};

DEFINE_NEW_SYS_ERROR(SysErrorPassword)

//"file unavailable": FTP status 550, or a plain error whose message starts with it
bool isFileUnavailable(const rvfs::SysError& e);


enum class FtpEntryType
{
    file,
    folder,
    link,
};

struct FtpEntry
{
    std::string name;
    FtpEntryType type = FtpEntryType::file;
    uint64_t size = 0;  //files only
    time_t modTime = 0; //UTC

    bool operator==(const FtpEntry&) const = default;
};


//byte stream of a running download
class FtpByteSource
{
public:
    virtual ~FtpByteSource() {}

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw SysError

    virtual void close() = 0; //throw SysError; idempotent
};


//capabilities of one FTP control connection; all functions throw SysError (or derived)
class FtpClient
{
public:
    virtual ~FtpClient() {}

    virtual void login(const std::string& username, const std::string& password) = 0; //throw SysError, SysErrorPassword
    virtual void quit() = 0; //throw SysError

    virtual void deleteFile(const std::string& path) = 0; //throw SysError, SysErrorFtpProtocol
    virtual FtpEntry getEntry(const std::string& path) = 0; //throw SysError, SysErrorFtpProtocol
    virtual std::vector<FtpEntry> list(const std::string& path) = 0; //throw SysError, SysErrorFtpProtocol
    virtual void makeDir(const std::string& path) = 0; //throw SysError, SysErrorFtpProtocol
    virtual void rename(const std::string& pathFrom, const std::string& pathTo) = 0; //throw SysError, SysErrorFtpProtocol

    //download starting at "offset"; returns after the transfer has been accepted by the server
    virtual std::unique_ptr<FtpByteSource> retrFrom(const std::string& path, uint64_t offset) = 0; //throw SysError, SysErrorFtpProtocol

    //blocking upload starting at "offset"; pulls bytes until readBlock() returns 0
    using ReadBlockFun = std::function<size_t(void* buffer, size_t bytesToRead)>; //return "bytesToRead" bytes unless end of stream!
    virtual void storFrom(const std::string& path, uint64_t offset, const ReadBlockFun& readBlock /*throw X*/) = 0; //throw SysError, SysErrorFtpProtocol, X

    virtual bool isSetTimeSupported() = 0; //throw SysError
    virtual void setTime(const std::string& path, time_t modTime) = 0; //throw SysError, SysErrorFtpProtocol
    virtual bool isTimePreciseInList() = 0; //throw SysError
};


//list the parent folder and look for a folder entry; "/" always exists
bool folderExists(FtpClient& client, const std::string& folderPath); //throw SysError
}

#endif //FTP_CLIENT_H_1203948576120394857
