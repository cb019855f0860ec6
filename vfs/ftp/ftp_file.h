// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FTP_FILE_H_2039485761029384756
#define FTP_FILE_H_2039485761029384756

#include <optional>
#include "../abstract.h"
#include "../authority.h"
#include "ftp_client.h"


namespace vfs
{
class FtpFileSystem;

/*  FTP transfers are plain streams: the cursor is only tracked locally and a session is
    (re)opened at the cursor whenever it changes                                         */
class FtpFile : public File
{
public:
    FtpFile(FtpFileSystem& fileSystem, const Authority& authority, const std::string& filePath);
    ~FtpFile();

    size_t read(void* buffer, size_t bytesToRead) override; //throw FileError
    size_t write(const void* buffer, size_t bytesToWrite) override; //throw FileError
    uint64_t seek(int64_t offset, Whence whence) override; //throw FileError
    void close() override; //throw FileError

    bool exists() override; //throw FileError
    uint64_t size() override; //throw FileError, ErrorNotExisting
    time_t lastModified() override; //throw FileError, ErrorNotExisting
    void touch() override; //throw FileError
    void deleteFile() override; //throw FileError

    void moveToFile(File& target) override; //throw FileError
    void copyToFile(File& target) override; //throw FileError
    std::unique_ptr<File> moveToLocation(const Location& location) override; //throw FileError
    std::unique_ptr<File> copyToLocation(const Location& location) override; //throw FileError

    std::unique_ptr<Location> location() const override;
    std::string name() const override;
    std::string path() const override { return filePath_; }
    std::string uri() const override;

    const Authority& authority() const { return authority_; }
    FtpFileSystem& fileSystem() const { return fs_; }
    uint64_t getOffset() const { return offset_; }

private:
    FtpFile           (const FtpFile&) = delete;
    FtpFile& operator=(const FtpFile&) = delete;

    std::optional<FtpEntry> stat(); //throw SysError; nullopt if not existing
    void touchExisting(); //throw SysError

    FtpFileSystem& fs_;
    const Authority authority_;
    const std::string filePath_;
    uint64_t offset_ = 0;
};
}

#endif //FTP_FILE_H_2039485761029384756
