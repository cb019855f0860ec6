// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef ABSTRACT_H_8720193847561029384
#define ABSTRACT_H_8720193847561029384

#include <cstdint>
#include <ctime>
#include <memory>
#include <regex>
#include <string>
#include <vector>
#include <rvfs/file_error.h>


namespace vfs
{
DEFINE_NEW_FILE_ERROR(ErrorNotExisting)

class Location;
class FileSystem;

enum class Whence
{
    start,
    current,
    end,
};


/*  file handle of one storage backend
    - not thread-safe: serialize access to one instance (and to Files sharing one FileSystem)
    - read() and write() continue at the cursor; close() resets it to 0          */
class File
{
public:
    virtual ~File() {}

    virtual size_t read(void* buffer, size_t bytesToRead) = 0; //throw FileError; may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    virtual size_t write(const void* buffer, size_t bytesToWrite) = 0; //throw FileError
    virtual uint64_t seek(int64_t offset, Whence whence) = 0; //throw FileError; returns new cursor
    virtual void close() = 0; //throw FileError

    virtual bool exists() = 0; //throw FileError
    virtual uint64_t size() = 0; //throw FileError, ErrorNotExisting
    virtual time_t lastModified() = 0; //throw FileError, ErrorNotExisting
    virtual void touch() = 0; //throw FileError
    virtual void deleteFile() = 0; //throw FileError

    virtual void moveToFile(File& target) = 0; //throw FileError
    virtual void copyToFile(File& target) = 0; //throw FileError
    virtual std::unique_ptr<File> moveToLocation(const Location& location) = 0; //throw FileError
    virtual std::unique_ptr<File> copyToLocation(const Location& location) = 0; //throw FileError

    virtual std::unique_ptr<Location> location() const = 0;
    virtual std::string name() const = 0; //"file.txt"
    virtual std::string path() const = 0; //"/dir/file.txt"
    virtual std::string uri() const = 0;  //"ftp://user@host:21/dir/file.txt"
};


//directory handle: path() starts and ends with '/'
class Location
{
public:
    virtual ~Location() {}

    virtual std::vector<std::string> list() const = 0; //throw FileError; file names only
    virtual std::vector<std::string> listByPrefix(const std::string& prefix) const = 0; //throw FileError
    virtual std::vector<std::string> listByRegex(const std::regex& regex) const = 0; //throw FileError
    virtual bool exists() const = 0; //throw FileError

    virtual std::unique_ptr<Location> newLocation(const std::string& relLocPath) const = 0; //throw FileError; "sub/" or "../sub/"
    virtual void changeDir(const std::string& relLocPath) = 0; //throw FileError
    virtual std::unique_ptr<File> newFile(const std::string& relFilePath) const = 0; //throw FileError; "file.txt" or "sub/file.txt"
    virtual void deleteFile(const std::string& relFilePath) const = 0; //throw FileError

    virtual std::string path() const = 0;
    virtual std::string uri() const = 0;
    virtual std::string volume() const = 0; //"user@host:port"
    virtual FileSystem& fileSystem() const = 0;
};


class FileSystem
{
public:
    virtual ~FileSystem() {}

    virtual std::unique_ptr<File> newFile(const std::string& volume, const std::string& absFilePath) = 0; //throw FileError
    virtual std::unique_ptr<Location> newLocation(const std::string& volume, const std::string& absLocPath) = 0; //throw FileError

    virtual std::string scheme() const = 0; //"ftp"
    virtual std::string name() const = 0;   //"File Transfer Protocol"
};
}

#endif //ABSTRACT_H_8720193847561029384
