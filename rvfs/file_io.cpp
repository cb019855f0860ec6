// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "file_io.h"
#include <cerrno>
#include <stdexcept>
#include "extra_log.h"
#include "file_path.h"
#include "i18n.h"
#include <fcntl.h>  //fcntl
#include <stdlib.h> //mkstemp
#include <unistd.h> //close, read, write, lseek, unlink

using namespace rvfs;


TempFile::TempFile(const std::string& namePrefix) //throw FileError
{
    std::string pathTemplate = appendPath(getTempFolderPath(), namePrefix + ".XXXXXX");
    try
    {
        const int fdFile = ::mkstemp(pathTemplate.data());
        if (fdFile == -1)
            THROW_LAST_SYS_ERROR("mkstemp");

        if (::fcntl(fdFile, F_SETFD, FD_CLOEXEC) == -1)
        {
            const ErrorCode ec = getLastError();
            ::close(fdFile);
            ::unlink(pathTemplate.c_str());
            throw SysError(formatSystemError("fcntl(FD_CLOEXEC)", ec));
        }
        hFile_ = fdFile; //pass ownership
        filePath_ = pathTemplate;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(pathTemplate)), e.toString()); }
}


TempFile::~TempFile()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            remove(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


size_t TempFile::tryRead(void* buffer, size_t bytesToRead) //throw FileError; may return short, only 0 means EOF!
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(hFile_, buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR); //Compare copy_reg() in copy.c: ftp://ftp.gnu.org/gnu/coreutils/coreutils-8.23.tar.xz

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");
        if (static_cast<size_t>(bytesRead) > bytesToRead) //better safe than sorry
            throw SysError(formatSystemError("read", L"", L"Buffer overflow."));

        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath_)), e.toString()); }
}


size_t TempFile::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError; may return short! CONTRACT: bytesToWrite > 0
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesWritten = 0;
        do
        {
            bytesWritten = ::write(hFile_, buffer, bytesToWrite);
        }
        while (bytesWritten < 0 && errno == EINTR);

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                errno = ENOSPC;

            THROW_LAST_SYS_ERROR("write");
        }
        if (static_cast<size_t>(bytesWritten) > bytesToWrite) //better safe than sorry
            throw SysError(formatSystemError("write", L"", L"Buffer overflow."));

        return bytesWritten;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)), e.toString()); }
}


void TempFile::rewind() //throw FileError
{
    try
    {
        if (::lseek(hFile_, 0, SEEK_SET) != 0)
            THROW_LAST_SYS_ERROR("lseek");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot set file position of %x."), L"%x", fmtPath(filePath_)), e.toString()); }
}


void TempFile::remove() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError(L"Contract error: remove() called more than once.");

        const int fdFile = hFile_;
        hFile_ = invalidFileHandle;

        if (::close(fdFile) != 0)
        {
            const ErrorCode ec = getLastError();
            ::unlink(filePath_.c_str());
            throw SysError(formatSystemError("close", ec));
        }
        if (::unlink(filePath_.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath_)), e.toString()); }
}
