// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FTP_LOCATION_H_5561029384756102938
#define FTP_LOCATION_H_5561029384756102938

#include "../abstract.h"
#include "../authority.h"
#include "ftp_client.h"


namespace vfs
{
class FtpFileSystem;

class FtpLocation : public Location
{
public:
    FtpLocation(FtpFileSystem& fileSystem, const Authority& authority, const std::string& locationPath);

    std::vector<std::string> list() const override; //throw FileError
    std::vector<std::string> listByPrefix(const std::string& prefix) const override; //throw FileError
    std::vector<std::string> listByRegex(const std::regex& regex) const override; //throw FileError
    bool exists() const override; //throw FileError

    std::unique_ptr<Location> newLocation(const std::string& relLocPath) const override; //throw FileError
    void changeDir(const std::string& relLocPath) override; //throw FileError
    std::unique_ptr<File> newFile(const std::string& relFilePath) const override; //throw FileError
    void deleteFile(const std::string& relFilePath) const override; //throw FileError

    std::string path() const override { return locationPath_; }
    std::string uri() const override;
    std::string volume() const override { return authority_.toString(); }
    FileSystem& fileSystem() const override;

    const Authority& authority() const { return authority_; }

private:
    std::vector<FtpEntry> listFolder(const std::string& folderPath) const; //throw SysError; 550 => empty

    FtpFileSystem& fs_;
    const Authority authority_;
    std::string locationPath_; //"/dir/"
};

std::string getFtpUri(const Authority& authority, const std::string& itemPath); //"ftp://user@host:port/path"
}

#endif //FTP_LOCATION_H_5561029384756102938
