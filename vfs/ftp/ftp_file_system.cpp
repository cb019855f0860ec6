// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "ftp_file_system.h"
#include <rvfs/extra_log.h>
#include <rvfs/i18n.h>
#include "../vfs_path.h"
#include "ftp_client_curl.h"
#include "ftp_file.h"
#include "ftp_location.h"

using namespace rvfs;
using namespace vfs;


namespace
{
void logOwnerError(const std::exception_ptr& error)
{
    try
    {
        std::rethrow_exception(error); //throw SysError
    }
    catch (const SysError& e) { logExtraError(_("Cannot close abandoned data connection.") + L"\n\n" + e.toString()); }
}
}


FtpFileSystem::FtpFileSystem() : FtpFileSystem(FtpOptions()) {}


FtpFileSystem::FtpFileSystem(const FtpOptions& options, const ClientGetter& getClient, std::unique_ptr<DataConnectionFactory> dataConnFactory) :
    options_(options),
    clientGetter_(getClient ? getClient : ClientGetter(dialFtpClient)),
    dataConnFactory_(dataConnFactory ? std::move(dataConnFactory) : std::make_unique<FtpDataConnFactory>()) {}


FtpFileSystem::~FtpFileSystem()
{
    if (dataConn_.conn)
        try
        {
            dataConn_.conn->close(); //throw SysError
        }
        catch (const SysError& e) { logExtraError(_("Cannot close data connection.") + L"\n\n" + e.toString()); }

    dataConn_.conn.reset(); //before the client

    for (const auto& [file, error] : dataConn_.ownerErrors)
        logOwnerError(error);

    if (client_ && clientAuthority_) //don't quit injected clients
        try
        {
            client_->quit(); //throw SysError
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy(_("Cannot disconnect from %x."), L"%x", fmtPath(getFtpUri(*clientAuthority_, "/"))) + L"\n\n" + e.toString());
        }
}


std::unique_ptr<File> FtpFileSystem::newFile(const std::string& volume, const std::string& absFilePath) //throw FileError
{
    validateAbsoluteFilePath(absFilePath); //throw FileError
    return std::make_unique<FtpFile>(*this, parseAuthority(volume), cleanPath(absFilePath)); //throw FileError
}


std::unique_ptr<Location> FtpFileSystem::newLocation(const std::string& volume, const std::string& absLocPath) //throw FileError
{
    validateAbsoluteLocationPath(absLocPath); //throw FileError
    return std::make_unique<FtpLocation>(*this, parseAuthority(volume), absLocPath); //throw FileError
}


FtpFileSystem& FtpFileSystem::withOptions(const FtpOptions& options)
{
    options_ = options;
    client_.reset(); //re-dial with the new options
    clientAuthority_.reset();
    return *this;
}


FtpFileSystem& FtpFileSystem::withClient(const std::shared_ptr<FtpClient>& client)
{
    options_ = FtpOptions();
    client_ = client;
    clientAuthority_.reset();
    return *this;
}


FtpFileSystem& FtpFileSystem::withDataConn(std::unique_ptr<DataConnection>&& dataConn)
{
    dataConn_.conn = std::move(dataConn);
    dataConn_.owner = nullptr;
    dataConn_.ownerDestroyed = false;
    dataConn_.resetConn = false;
    return *this;
}


std::shared_ptr<FtpClient> FtpFileSystem::getClient(const ExecContext& ctx, const Authority& authority) //throw SysError
{
    if (client_ && (!clientAuthority_ || *clientAuthority_ == authority))
        return client_;

    client_ = clientGetter_(ctx, authority, options_); //throw SysError
    clientAuthority_ = authority;

    if (!client_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    return client_;
}


std::shared_ptr<FtpClient> FtpFileSystem::client(const ExecContext& ctx, const Authority& authority) //throw FileError
{
    try
    {
        return getClient(ctx, authority); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Unable to connect to %x."), L"%x", fmtPath(getFtpUri(authority, "/"))), e.toString()); }
}


DataConnection& FtpFileSystem::dataConn(const ExecContext& ctx, const Authority& authority, DataConnMode mode, const FtpFile* file) //throw SysError
{
    if (!file && mode != DataConnMode::singleOp)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    //the open session still runs on the client of another server
    if (dataConn_.conn && client_ && clientAuthority_ && *clientAuthority_ != authority)
        closeSlotSession(dataConn_, file); //throw SysError

    return dataConnFactory_->getDataConn(dataConn_, mode, file, [&] { return getClient(ctx, authority); }); //throw SysError
}


std::optional<DataConnMode> FtpFileSystem::getStreamMode(const FtpFile& file) const
{
    if (dataConn_.conn && dataConn_.conn->mode() != DataConnMode::singleOp)
        if (dataConn_.owner == &file || (!dataConn_.owner && !dataConn_.ownerDestroyed))
            return dataConn_.conn->mode();
    return std::nullopt;
}


void FtpFileSystem::closeDataConn(const FtpFile& file) //throw SysError
{
    dataConn_.resetConn = true;

    //error of a session another File's request closed: reported before the file's current one
    std::exception_ptr pendingError;
    if (auto it = dataConn_.ownerErrors.find(&file); it != dataConn_.ownerErrors.end())
    {
        pendingError = it->second;
        dataConn_.ownerErrors.erase(it);
    }

    if (dataConn_.conn)
        if (dataConn_.owner == &file || (!dataConn_.owner && !dataConn_.ownerDestroyed))
            try
            {
                closeSlotSession(dataConn_, &file); //throw SysError
            }
            catch (const SysError& e)
            {
                if (!pendingError)
                    throw;
                logExtraError(_("Cannot close data connection.") + L"\n\n" + e.toString());
            }

    if (pendingError)
        std::rethrow_exception(pendingError); //throw SysError
}


void FtpFileSystem::onFileDestroyed(const FtpFile& file)
{
    if (auto it = dataConn_.ownerErrors.find(&file); it != dataConn_.ownerErrors.end())
    {
        logOwnerError(it->second);
        dataConn_.ownerErrors.erase(it);
    }

    if (dataConn_.conn && dataConn_.owner == &file)
    {
        dataConn_.owner = nullptr;
        dataConn_.ownerDestroyed = true;
    }
}
