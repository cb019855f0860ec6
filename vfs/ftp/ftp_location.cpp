// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "ftp_location.h"
#include <rvfs/i18n.h>
#include "../vfs_path.h"
#include "ftp_file.h"
#include "ftp_file_system.h"

using namespace rvfs;
using namespace vfs;


std::string vfs::getFtpUri(const Authority& authority, const std::string& itemPath)
{
    return "ftp://" + authority.toString() + ensureLeadingSlash(itemPath);
}


FtpLocation::FtpLocation(FtpFileSystem& fileSystem, const Authority& authority, const std::string& locationPath) :
    fs_(fileSystem),
    authority_(authority),
    locationPath_(ensureTrailingSlash(cleanPath(locationPath))) {}


std::vector<FtpEntry> FtpLocation::listFolder(const std::string& folderPath) const //throw SysError
{
    try
    {
        return fs_.dataConn(ExecContext(), authority_, DataConnMode::singleOp, nullptr).list(folderPath); //throw SysError
    }
    catch (const SysError& e)
    {
        if (isFileUnavailable(e))
            return {};
        throw;
    }
}


std::vector<std::string> FtpLocation::list() const //throw FileError
{
    try
    {
        std::vector<std::string> fileNames;
        for (const FtpEntry& entry : listFolder(locationPath_)) //throw SysError
            if (entry.type == FtpEntryType::file)
                fileNames.push_back(entry.name);
        return fileNames;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(uri())), e.toString()); }
}


std::vector<std::string> FtpLocation::listByPrefix(const std::string& prefix) const //throw FileError
{
    validatePrefix(prefix); //throw FileError

    //"sub/pre": list "sub/" and match "pre"
    std::string folderPath;
    std::string namePrefix;
    if (prefix == ".")
    {
        folderPath = locationPath_;
        namePrefix = prefix;
    }
    else
    {
        const std::string fullPath = joinPath(locationPath_, prefix);
        folderPath = getParentPath(fullPath);
        namePrefix = getBaseName(fullPath);
    }

    try
    {
        std::vector<std::string> fileNames;
        for (const FtpEntry& entry : listFolder(folderPath)) //throw SysError
            if (entry.type == FtpEntryType::file && startsWith(entry.name, namePrefix))
                fileNames.push_back(entry.name);
        return fileNames;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getFtpUri(authority_, folderPath))), e.toString()); }
}


std::vector<std::string> FtpLocation::listByRegex(const std::regex& regex) const //throw FileError
{
    std::vector<std::string> fileNames = list(); //throw FileError
    std::erase_if(fileNames, [&](const std::string& fileName) { return !std::regex_search(fileName, regex); });
    return fileNames;
}


bool FtpLocation::exists() const //throw FileError
{
    if (locationPath_ == "/")
        return true;

    const std::string folderName = getBaseName(locationPath_);
    try
    {
        for (const FtpEntry& entry : listFolder(getParentPath(locationPath_))) //throw SysError
            if (entry.type == FtpEntryType::folder && entry.name == folderName)
                return true;
        return false;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(uri())), e.toString()); }
}


std::unique_ptr<Location> FtpLocation::newLocation(const std::string& relLocPath) const //throw FileError
{
    auto location = std::make_unique<FtpLocation>(fs_, authority_, locationPath_);
    location->changeDir(relLocPath); //throw FileError
    return location;
}


void FtpLocation::changeDir(const std::string& relLocPath) //throw FileError
{
    validateRelativeLocationPath(relLocPath); //throw FileError
    locationPath_ = ensureTrailingSlash(joinPath(locationPath_, relLocPath));
}


std::unique_ptr<File> FtpLocation::newFile(const std::string& relFilePath) const //throw FileError
{
    validateRelativeFilePath(relFilePath); //throw FileError
    return std::make_unique<FtpFile>(fs_, authority_, joinPath(locationPath_, relFilePath));
}


void FtpLocation::deleteFile(const std::string& relFilePath) const //throw FileError
{
    newFile(relFilePath)->deleteFile(); //throw FileError
}


std::string FtpLocation::uri() const
{
    return getFtpUri(authority_, locationPath_);
}


FileSystem& FtpLocation::fileSystem() const
{
    return fs_;
}
