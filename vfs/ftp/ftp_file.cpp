// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "ftp_file.h"
#include <algorithm>
#include <chrono>
#include <limits>
#include <rvfs/extra_log.h>
#include <rvfs/file_io.h>
#include <rvfs/i18n.h>
#include "../vfs_path.h"
#include "ftp_file_system.h"
#include "ftp_location.h"

using namespace rvfs;
using namespace vfs;


namespace
{
const size_t FTP_COPY_BLOCK_SIZE = 128 * 1024;


//"base + delta" saturated to the int64_t range
int64_t addSaturated(uint64_t base, int64_t delta)
{
    constexpr int64_t maxOffset = std::numeric_limits<int64_t>::max();
    const int64_t baseVal = static_cast<int64_t>(std::min<uint64_t>(base, maxOffset));

    if (delta > 0 && baseVal > maxOffset - delta)
        return maxOffset;
    return baseVal + delta; //baseVal >= 0: no underflow
}


[[noreturn]] void throwFileError(const std::wstring& msg, const SysError& e) //throw FileError, ErrorNotExisting
{
    if (isFileUnavailable(e))
        throw ErrorNotExisting(msg, e.toString());
    throw FileError(msg, e.toString());
}


std::wstring fmtCopyMsg(const std::wstring& msgTemplate, const File& source, const File& target)
{
    return replaceCpy(replaceCpy(msgTemplate, L"%x", L'\n' + fmtPath(source.uri())), L"%y", L'\n' + fmtPath(target.uri()));
}


void writeAll(File& file, const void* buffer, size_t bytesToWrite) //throw FileError
{
    while (bytesToWrite > 0)
    {
        const size_t bytesWritten = file.write(buffer, bytesToWrite); //throw FileError
        if (bytesWritten == 0 || bytesWritten > bytesToWrite)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        buffer = static_cast<const std::byte*>(buffer) + bytesWritten;
        bytesToWrite -= bytesWritten;
    }
}


//temporary sibling name for the rename-twice touch
std::string getTempFileName(const std::string& fileName)
{
    const auto nowNs = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    return fileName + numberTo<std::string>(nowNs);
}
}


FtpFile::FtpFile(FtpFileSystem& fileSystem, const Authority& authority, const std::string& filePath) :
    fs_(fileSystem),
    authority_(authority),
    filePath_(filePath) {}


FtpFile::~FtpFile()
{
    fs_.onFileDestroyed(*this);
}


size_t FtpFile::read(void* buffer, size_t bytesToRead) //throw FileError
{
    try
    {
        DataConnection& dc = fs_.dataConn(ExecContext(), authority_, DataConnMode::read, this); //throw SysError

        const size_t bytesRead = dc.read(buffer, bytesToRead); //throw SysError
        offset_ += bytesRead;
        return bytesRead;
    }
    catch (const SysError& e) { throwFileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(uri())), e); }
}


size_t FtpFile::write(const void* buffer, size_t bytesToWrite) //throw FileError
{
    try
    {
        DataConnection& dc = fs_.dataConn(ExecContext(), authority_, DataConnMode::write, this); //throw SysError

        const size_t bytesWritten = dc.write(buffer, bytesToWrite); //throw SysError
        offset_ += bytesWritten;
        return bytesWritten;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(uri())), e.toString()); }
}


uint64_t FtpFile::seek(int64_t offset, Whence whence) //throw FileError
{
    try
    {
        //no open stream yet: assume reading; a following write() switches modes anyway
        const DataConnMode mode = fs_.getStreamMode(*this).value_or(DataConnMode::read);

        //a session can't change its position: close and reopen at the new cursor
        fs_.closeDataConn(*this); //throw SysError

        const std::optional<FtpEntry> entry = stat(); //throw SysError
        if (!entry)
        {
            offset_ = 0;
            return offset_;
        }

        int64_t offsetNew = 0;
        switch (whence)
        {
            case Whence::start:
                offsetNew = offset;
                break;
            case Whence::current:
                offsetNew = addSaturated(offset_, offset);
                break;
            case Whence::end:
                offsetNew = addSaturated(entry->size, offset == std::numeric_limits<int64_t>::min() ?
                                         std::numeric_limits<int64_t>::max() : -offset);
                break;
        }
        offset_ = static_cast<uint64_t>(std::max<int64_t>(offsetNew, 0));

        fs_.dataConn(ExecContext(), authority_, mode, this); //throw SysError
        return offset_;
    }
    catch (const SysError& e)
    {
        offset_ = 0;
        throw FileError(replaceCpy(_("Cannot set file position of %x."), L"%x", fmtPath(uri())), e.toString());
    }
}


void FtpFile::close() //throw FileError
{
    RVFS_ON_SCOPE_EXIT(offset_ = 0);
    try
    {
        fs_.closeDataConn(*this); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot close file %x."), L"%x", fmtPath(uri())), e.toString()); }
}


std::optional<FtpEntry> FtpFile::stat() //throw SysError
{
    DataConnection& dc = fs_.dataConn(ExecContext(), authority_, DataConnMode::singleOp, this); //throw SysError
    try
    {
        if (dc.isTimePreciseInList()) //throw SysError
            return dc.getEntry(filePath_); //throw SysError

        const std::vector<FtpEntry> entries = dc.list(filePath_); //throw SysError
        if (entries.empty())
            return std::nullopt;

        const std::string fileName = name();
        for (const FtpEntry& entry : entries)
            if (entry.name == fileName)
                return entry;
        return entries[0];
    }
    catch (const SysError& e)
    {
        if (isFileUnavailable(e))
            return std::nullopt;
        throw;
    }
}


bool FtpFile::exists() //throw FileError
{
    try
    {
        return stat().has_value(); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(uri())), e.toString()); }
}


uint64_t FtpFile::size() //throw FileError, ErrorNotExisting
{
    const std::wstring errorMsg = replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(uri()));
    try
    {
        if (const std::optional<FtpEntry> entry = stat()) //throw SysError
            return entry->size;
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }

    throw ErrorNotExisting(errorMsg, _("The file does not exist."));
}


time_t FtpFile::lastModified() //throw FileError, ErrorNotExisting
{
    const std::wstring errorMsg = replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(uri()));
    try
    {
        if (const std::optional<FtpEntry> entry = stat()) //throw SysError
            return entry->modTime;
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }

    throw ErrorNotExisting(errorMsg, _("The file does not exist."));
}


void FtpFile::touch() //throw FileError
{
    if (!exists()) //throw FileError
    {
        write(nullptr, 0); //throw FileError
        close();           //
        return;
    }

    try
    {
        touchExisting(); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write modification time of %x."), L"%x", fmtPath(uri())), e.toString()); }
}


void FtpFile::touchExisting() //throw SysError
{
    DataConnection& dc = fs_.dataConn(ExecContext(), authority_, DataConnMode::singleOp, this); //throw SysError

    if (dc.isSetTimeSupported()) //throw SysError
        return dc.setTime(filePath_, std::time(nullptr)); //throw SysError

    //no MFMT: moving the file forth and back updates the modification time
    const std::string tempPath = getParentPath(filePath_) + getTempFileName(name());
    dc.rename(filePath_, tempPath); //throw SysError
    dc.rename(tempPath, filePath_); //
}


void FtpFile::deleteFile() //throw FileError
{
    try
    {
        fs_.dataConn(ExecContext(), authority_, DataConnMode::singleOp, this).deleteFile(filePath_); //throw SysError
    }
    catch (const SysError& e) { throwFileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(uri())), e); }
}


void FtpFile::moveToFile(File& target) //throw FileError
{
    if (const auto ftpTarget = dynamic_cast<FtpFile*>(&target);
        ftpTarget && sameServerAndUser(authority_, ftpTarget->authority_))
    {
        //servers don't create missing parent folders on RNTO
        const std::unique_ptr<Location> targetLocation = ftpTarget->location();
        const bool targetFolderExists = targetLocation->exists(); //throw FileError
        try
        {
            DataConnection& dc = fs_.dataConn(ExecContext(), authority_, DataConnMode::singleOp, this); //throw SysError
            if (!targetFolderExists)
                dc.makeDir(targetLocation->path()); //throw SysError

            dc.rename(filePath_, ftpTarget->path()); //throw SysError
        }
        catch (const SysError& e) { throwFileError(fmtCopyMsg(_("Cannot move file %x to %y."), *this, target), e); }
        return;
    }

    copyToFile(target); //throw FileError
    deleteFile();       //
}


void FtpFile::copyToFile(File& target) //throw FileError
{
    if (offset_ != 0)
        throw FileError(fmtCopyMsg(_("Cannot copy file %x to %y."), *this, target), _("The read position is not at the start of the file."));

    //error in flight: still release both sessions, the first error wins
    RVFS_ON_SCOPE_FAIL
    (
        try { target.close(); } catch (const FileError& e) { logExtraError(e.toString()); }
        try { close(); } catch (const FileError& e) { logExtraError(e.toString()); }
    );

    std::vector<std::byte> buffer(FTP_COPY_BLOCK_SIZE);

    const auto ftpTarget = dynamic_cast<const FtpFile*>(&target);
    //a single control connection can't download and upload at the same time
    if (ftpTarget && (&ftpTarget->fs_ == &fs_ || sameServerAndUser(authority_, ftpTarget->authority_)))
    {
        TempFile tempFile(name()); //throw FileError

        for (size_t bytesRead = 0; (bytesRead = read(buffer.data(), buffer.size())) != 0;) //throw FileError
            for (size_t bytesWritten = 0; bytesWritten < bytesRead;)
                bytesWritten += tempFile.tryWrite(buffer.data() + bytesWritten, bytesRead - bytesWritten); //throw FileError
        close(); //throw FileError

        tempFile.rewind(); //throw FileError
        for (size_t bytesRead = 0; (bytesRead = tempFile.tryRead(buffer.data(), buffer.size())) != 0;) //throw FileError
            writeAll(target, buffer.data(), bytesRead); //throw FileError
        target.close(); //throw FileError

        tempFile.remove(); //throw FileError
    }
    else
    {
        for (size_t bytesRead = 0; (bytesRead = read(buffer.data(), buffer.size())) != 0;) //throw FileError
            writeAll(target, buffer.data(), bytesRead); //throw FileError

        target.close(); //throw FileError: flush upload
        close();        //
    }
}


std::unique_ptr<File> FtpFile::moveToLocation(const Location& location) //throw FileError
{
    std::unique_ptr<File> targetFile = location.newFile(name()); //throw FileError
    moveToFile(*targetFile); //throw FileError
    return targetFile;
}


std::unique_ptr<File> FtpFile::copyToLocation(const Location& location) //throw FileError
{
    std::unique_ptr<File> targetFile = location.newFile(name()); //throw FileError
    copyToFile(*targetFile); //throw FileError
    return targetFile;
}


std::unique_ptr<Location> FtpFile::location() const
{
    return std::make_unique<FtpLocation>(fs_, authority_, getParentPath(filePath_));
}


std::string FtpFile::name() const
{
    return getBaseName(filePath_);
}


std::string FtpFile::uri() const
{
    return getFtpUri(authority_, filePath_);
}
