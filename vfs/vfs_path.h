// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef VFS_PATH_H_6610293847561092837
#define VFS_PATH_H_6610293847561092837

#include <string>
#include <rvfs/file_error.h>


namespace vfs
{
/*  paths inside a volume use '/' only:
        absolute file path:      "/dir/file.txt"  (leading slash, no trailing slash)
        absolute location path:  "/dir/"          (leading and trailing slash)
        relative file path:      "sub/file.txt"
        relative location path:  "sub/"                                          */

//lexical normalization: collapse "//", resolve "." and ".." (never above root); result has leading slash, no trailing slash (except "/")
std::string cleanPath(const std::string& path);

std::string joinPath(const std::string& basePath, const std::string& relPath); //= cleanPath(basePath + '/' + relPath)

std::string getParentPath(const std::string& itemPath); //"/a/b.txt" -> "/a/", "/a/" -> "/", "/" -> "/"

std::string getBaseName(const std::string& itemPath); //"/a/b.txt" -> "b.txt", "/a/" -> "a", "/" -> "/"

std::string ensureLeadingSlash (const std::string& path);
std::string ensureTrailingSlash(const std::string& path);

void validateAbsoluteFilePath    (const std::string& path); //throw FileError
void validateAbsoluteLocationPath(const std::string& path); //throw FileError
void validateRelativeFilePath    (const std::string& path); //throw FileError
void validateRelativeLocationPath(const std::string& path); //throw FileError
void validatePrefix              (const std::string& prefix); //throw FileError
}

#endif //VFS_PATH_H_6610293847561092837
