// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "data_conn.h"
#include <rvfs/extra_log.h>
#include <rvfs/i18n.h>
#include "../vfs_path.h"
#include "ftp_file.h"

using namespace rvfs;
using namespace vfs;


namespace
{
const size_t FTP_UPLOAD_PIPE_SIZE = 1024 * 1024;


[[noreturn]] void throwSingleOpMismatch()
{
    throw ErrorModeMismatch(_("dataconn must be open for single op mode to conduct a single op action"));
}
}


size_t DataConnection::read(void* buffer, size_t bytesToRead) { throw ErrorModeMismatch(_("dataconn must be open for read mode to conduct a read")); }
size_t DataConnection::write(const void* buffer, size_t bytesToWrite) { throw ErrorModeMismatch(_("dataconn must be open for write mode to conduct a write")); }

void                  DataConnection::deleteFile(const std::string& path)                            { throwSingleOpMismatch(); }
FtpEntry              DataConnection::getEntry  (const std::string& path)                            { throwSingleOpMismatch(); }
std::vector<FtpEntry> DataConnection::list      (const std::string& path)                            { throwSingleOpMismatch(); }
void                  DataConnection::makeDir   (const std::string& path)                            { throwSingleOpMismatch(); }
void                  DataConnection::rename    (const std::string& pathFrom, const std::string& pathTo) { throwSingleOpMismatch(); }
void                  DataConnection::setTime   (const std::string& path, time_t modTime)            { throwSingleOpMismatch(); }
bool                  DataConnection::isSetTimeSupported()                                           { throwSingleOpMismatch(); }
bool                  DataConnection::isTimePreciseInList()                                          { throwSingleOpMismatch(); }

//------------------------------------------------------------------------------------

ReadSession::ReadSession(std::unique_ptr<FtpByteSource>&& source) : source_(std::move(source))
{
    if (!source_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


ReadSession::~ReadSession()
{
    if (source_)
        try
        {
            source_->close(); //throw SysError
        }
        catch (const SysError& e) { logExtraError(_("Cannot close download stream.") + L"\n\n" + e.toString()); }
}


size_t ReadSession::read(void* buffer, size_t bytesToRead) //throw SysError
{
    if (!source_)
        throw SysError(_("The download stream is already closed."));

    return source_->tryRead(buffer, bytesToRead); //throw SysError
}


void ReadSession::close() //throw SysError
{
    if (source_)
    {
        const std::unique_ptr<FtpByteSource> source = std::move(source_);
        source->close(); //throw SysError
    }
}

//------------------------------------------------------------------------------------

WriteSession::WriteSession(const std::shared_ptr<FtpClient>& client, const std::string& filePath, uint64_t offset) :
    filePath_(filePath),
    asyncStreamOut_(std::make_shared<AsyncStreamBuffer>(FTP_UPLOAD_PIPE_SIZE))
{
    std::promise<void> promUploadDone;
    futUploadDone_ = promUploadDone.get_future();

    worker_ = InterruptibleThread([asyncStreamIn = asyncStreamOut_, client, filePath, offset,
                                                 promUploadDone = std::move(promUploadDone)]() mutable
    {
        setCurrentThreadName("Upload " + getBaseName(filePath));
        try
        {
            client->storFrom(filePath, offset, [&](void* buffer, size_t bytesToRead)
            {
                interruptionPoint(); //throw ThreadStopRequest
                return asyncStreamIn->read(buffer, bytesToRead); //throw ThreadStopRequest
            }); //throw SysError, ThreadStopRequest

            //release the consumer end: a writer that never closes must not block forever
            asyncStreamIn->setReadError(std::make_exception_ptr(SysError(_("The upload is already finished."))));
            promUploadDone.set_value();
        }
        catch (const SysError&)
        {
            asyncStreamIn->setReadError(std::current_exception()); //unblock write()
            promUploadDone.set_exception(std::current_exception());
        }
    });
}


WriteSession::~WriteSession()
{
    if (!closed_)
    {
        //abort the uploader: its next read() throws ThreadStopRequest
        asyncStreamOut_->setWriteError(std::make_exception_ptr(ThreadStopRequest()));
        logExtraError(replaceCpy(_("The upload of %x was abandoned before completion."), L"%x", fmtPath(filePath_)));
    }
    //~InterruptibleThread: requestStop() + join()
}


size_t WriteSession::write(const void* buffer, size_t bytesToWrite) //throw SysError
{
    if (closed_)
        throw SysError(_("The upload stream is already closed."));

    if (bytesToWrite > 0)
        asyncStreamOut_->write(buffer, bytesToWrite); //throw SysError (from the uploader)
    return bytesToWrite;
}


void WriteSession::close() //throw SysError
{
    if (closed_)
        return;
    closed_ = true;

    asyncStreamOut_->closeStream(); //end of input => storFrom() can finish: *before* waiting on it!

    RVFS_ON_SCOPE_EXIT(if (worker_.joinable()) worker_.join());
    futUploadDone_.get(); //throw SysError
}

//------------------------------------------------------------------------------------

SingleOpSession::SingleOpSession(const std::shared_ptr<FtpClient>& client) : client_(client)
{
    if (!client_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


std::unique_ptr<WriteSession> vfs::openWriteSession(const std::shared_ptr<FtpClient>& client, const std::string& filePath, uint64_t offset) //throw SysError
{
    //not all servers create missing parent folders on STOR
    const std::string folderPath = getParentPath(filePath);
    if (!folderExists(*client, folderPath)) //throw SysError
        try
        {
            client->makeDir(folderPath); //throw SysError
        }
        catch (const SysError& e)
        {
            if (!isFileUnavailable(e)) //550: created in the meantime?
                throw;
        }

    return std::make_unique<WriteSession>(client, filePath, offset);
}


void vfs::closeSlotSession(DataConnSlot& slot, const FtpFile* caller) //throw SysError
{
    const std::unique_ptr<DataConnection> conn = std::move(slot.conn);
    const FtpFile* const owner = slot.owner;
    const bool ownerDestroyed = slot.ownerDestroyed;
    slot.owner = nullptr;
    slot.ownerDestroyed = false;

    if (!conn)
        return;

    const bool streamSession = conn->mode() != DataConnMode::singleOp;
    try
    {
        conn->close(); //throw SysError
    }
    catch (const SysError& e)
    {
        if (streamSession && ownerDestroyed)
            logExtraError(_("Cannot close abandoned data connection.") + L"\n\n" + e.toString());
        else if (streamSession && owner && owner != caller)
            slot.ownerErrors.emplace(owner, std::current_exception()); //first error wins
        else
            throw;
    }
}


DataConnection& FtpDataConnFactory::getDataConn(DataConnSlot& slot, DataConnMode mode, const FtpFile* file, const GetClientFun& getClient) //throw SysError
{
    if (!file && mode != DataConnMode::singleOp)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    if (slot.conn)
        if (slot.conn->mode() != mode || slot.resetConn || slot.ownerDestroyed || (slot.owner && slot.owner != file))
            closeSlotSession(slot, file); //throw SysError

    if (!slot.conn)
    {
        const std::shared_ptr<FtpClient> client = getClient(); //throw SysError

        switch (mode)
        {
            case DataConnMode::read:
                slot.conn = std::make_unique<ReadSession>(client->retrFrom(file->path(), file->getOffset())); //throw SysError
                break;
            case DataConnMode::write:
                slot.conn = openWriteSession(client, file->path(), file->getOffset()); //throw SysError
                break;
            case DataConnMode::singleOp:
                slot.conn = std::make_unique<SingleOpSession>(client);
                break;
        }
    }

    if (mode != DataConnMode::singleOp)
        slot.owner = file; //adopt unowned (e.g. injected) sessions

    if (file)
        slot.resetConn = false;

    return *slot.conn;
}
