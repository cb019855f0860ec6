// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef DATA_CONN_H_4410293847561920384
#define DATA_CONN_H_4410293847561920384

#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <rvfs/file_error.h>
#include <rvfs/stream_buffer.h>
#include <rvfs/thread.h>
#include "ftp_client.h"


namespace vfs
{
class FtpFile;

enum class DataConnMode
{
    read,
    write,
    singleOp,
};

DEFINE_NEW_FILE_ERROR(ErrorModeMismatch)


/*  the one transfer channel of an FTP session, tagged with the purpose it was opened for
    - the mode never changes: switching means close() and create a new one
    - operations invalid for the mode throw ErrorModeMismatch                   */
class DataConnection
{
public:
    virtual ~DataConnection() {}

    virtual DataConnMode mode() const = 0;

    virtual size_t read(void* buffer, size_t bytesToRead); //throw SysError, ErrorModeMismatch; may return short, only 0 means EOF!
    virtual size_t write(const void* buffer, size_t bytesToWrite); //throw SysError, ErrorModeMismatch

    virtual void close() = 0; //throw SysError; idempotent

    virtual void deleteFile(const std::string& path); //throw SysError, ErrorModeMismatch
    virtual FtpEntry getEntry(const std::string& path); //
    virtual std::vector<FtpEntry> list(const std::string& path); //
    virtual void makeDir(const std::string& path); //
    virtual void rename(const std::string& pathFrom, const std::string& pathTo); //
    virtual void setTime(const std::string& path, time_t modTime); //
    virtual bool isSetTimeSupported(); //
    virtual bool isTimePreciseInList(); //
};


class ReadSession final : public DataConnection
{
public:
    explicit ReadSession(std::unique_ptr<FtpByteSource>&& source);
    ~ReadSession();

    DataConnMode mode() const override { return DataConnMode::read; }

    size_t read(void* buffer, size_t bytesToRead) override; //throw SysError
    void close() override; //throw SysError

private:
    std::unique_ptr<FtpByteSource> source_; //nullptr after close()
};


//write() feeds a bounded pipe, a worker thread runs the blocking storFrom() on the other end
class WriteSession final : public DataConnection
{
public:
    WriteSession(const std::shared_ptr<FtpClient>& client, const std::string& filePath, uint64_t offset);
    ~WriteSession();

    DataConnMode mode() const override { return DataConnMode::write; }

    size_t write(const void* buffer, size_t bytesToWrite) override; //throw SysError
    void close() override; //throw SysError: the upload result

    uint64_t getTotalBytesWritten() const { return asyncStreamOut_->getTotalBytesWritten(); }

private:
    const std::string filePath_;
    const std::shared_ptr<rvfs::AsyncStreamBuffer> asyncStreamOut_;
    std::future<void> futUploadDone_;
    rvfs::InterruptibleThread worker_;
    bool closed_ = false;
};


class SingleOpSession final : public DataConnection
{
public:
    explicit SingleOpSession(const std::shared_ptr<FtpClient>& client);

    DataConnMode mode() const override { return DataConnMode::singleOp; }

    void close() override {} //client is owned by the file system

    void deleteFile(const std::string& path) override { client_->deleteFile(path); } //throw SysError
    FtpEntry getEntry(const std::string& path) override { return client_->getEntry(path); }
    std::vector<FtpEntry> list(const std::string& path) override { return client_->list(path); }
    void makeDir(const std::string& path) override { client_->makeDir(path); }
    void rename(const std::string& pathFrom, const std::string& pathTo) override { client_->rename(pathFrom, pathTo); }
    void setTime(const std::string& path, time_t modTime) override { client_->setTime(path, modTime); }
    bool isSetTimeSupported() override { return client_->isSetTimeSupported(); }
    bool isTimePreciseInList() override { return client_->isTimePreciseInList(); }

private:
    const std::shared_ptr<FtpClient> client_;
};

//------------------------------------------------------------------------------------

//the file system's single data connection and who it was opened for
struct DataConnSlot
{
    std::unique_ptr<DataConnection> conn;
    const FtpFile* owner = nullptr; //nullptr: unowned (single op, or injected)
    bool ownerDestroyed = false;
    bool resetConn = false;
    //close errors of sessions taken away from a living owner: reported by the owner's next close
    std::map<const FtpFile*, std::exception_ptr> ownerErrors;
};

//close the slot's session on behalf of "caller" (nullptr for single ops); a living owner other than the caller
//gets the close error stashed in "ownerErrors", a destroyed owner's error is logged
void closeSlotSession(DataConnSlot& slot, const FtpFile* caller); //throw SysError


class DataConnectionFactory
{
public:
    virtual ~DataConnectionFactory() {}

    using GetClientFun = std::function<std::shared_ptr<FtpClient>()>; //throw SysError

    //"file" may be nullptr for DataConnMode::singleOp only
    virtual DataConnection& getDataConn(DataConnSlot& slot, DataConnMode mode, const FtpFile* file, const GetClientFun& getClient) = 0; //throw SysError
};


class FtpDataConnFactory : public DataConnectionFactory
{
public:
    DataConnection& getDataConn(DataConnSlot& slot, DataConnMode mode, const FtpFile* file, const GetClientFun& getClient) override; //throw SysError
};

//make sure the parent folder exists, then start the uploader
std::unique_ptr<WriteSession> openWriteSession(const std::shared_ptr<FtpClient>& client, const std::string& filePath, uint64_t offset); //throw SysError
}

#endif //DATA_CONN_H_4410293847561920384
