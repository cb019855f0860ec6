// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "file_path.h"
#include <cstdlib>
#include <mutex>

using namespace rvfs;


std::string rvfs::appendSeparator(std::string path) //support rvalue references!
{
    if (!endsWith(path, FILE_NAME_SEPARATOR))
        path += FILE_NAME_SEPARATOR;
    return path; //returning a by-value parameter => RVO if possible, r-value otherwise
}


std::string rvfs::appendPath(const std::string& basePath, const std::string& relPath)
{
    if (relPath.empty())
        return basePath;
    if (basePath.empty())
        return relPath;

    if (startsWith(relPath, FILE_NAME_SEPARATOR))
    {
        if (relPath.size() == 1)
            return basePath;

        if (endsWith(basePath, FILE_NAME_SEPARATOR))
            return basePath + (relPath.c_str() + 1);
    }
    else if (!endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + FILE_NAME_SEPARATOR + relPath;

    return basePath + relPath;
}


namespace
{
std::mutex globalEnvLock;
}


std::optional<std::string> rvfs::getEnvironmentVar(std::string_view name)
{
    /*  const char* buffer = ::getenv(name); => *not* thread-safe: returns pointer to internal memory!
        => copy while holding a lock; setenv() is expected during start up (and in tests) only  */
    const std::string nameZ(name);

    std::lock_guard dummy(globalEnvLock);
    if (const char* buffer = ::getenv(nameZ.c_str()))
        return std::string(buffer);
    return {};
}


std::string rvfs::getTempFolderPath()
{
    if (const std::optional<std::string> tempDirPath = getEnvironmentVar("TMPDIR"))
        if (!tempDirPath->empty())
            return *tempDirPath;

    return "/tmp";
}
