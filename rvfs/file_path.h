// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FILE_PATH_H_9102837465019283746
#define FILE_PATH_H_9102837465019283746

#include <optional>
#include <string>
#include <string_view>
#include "string_tools.h"


namespace rvfs
{
    const char FILE_NAME_SEPARATOR = '/';

inline std::string getItemName(const std::string& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

std::string appendSeparator(std::string path); //support rvalue references!

std::string appendPath(const std::string& basePath, const std::string& relPath);

std::optional<std::string> getEnvironmentVar(std::string_view name);

std::string getTempFolderPath(); //$TMPDIR or "/tmp"
}

#endif //FILE_PATH_H_9102837465019283746
