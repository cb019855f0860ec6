// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "vfs_path.h"
#include <vector>
#include <rvfs/file_path.h>

using namespace rvfs;
using namespace vfs;


std::string vfs::cleanPath(const std::string& path)
{
    std::vector<std::string> components;

    split(path, FILE_NAME_SEPARATOR, [&](const std::string_view block)
    {
        if (block.empty() || block == ".")
            ;
        else if (block == "..")
        {
            if (!components.empty())
                components.pop_back();
        }
        else
            components.emplace_back(block);
    });

    std::string output;
    for (const std::string& comp : components)
        output += FILE_NAME_SEPARATOR + comp;

    return output.empty() ? std::string(1, FILE_NAME_SEPARATOR) : output;
}


std::string vfs::joinPath(const std::string& basePath, const std::string& relPath)
{
    return cleanPath(basePath + FILE_NAME_SEPARATOR + relPath);
}


std::string vfs::getParentPath(const std::string& itemPath)
{
    const std::string cleaned = cleanPath(itemPath);
    if (cleaned == "/")
        return cleaned;

    return ensureTrailingSlash(beforeLast(cleaned, FILE_NAME_SEPARATOR, IfNotFoundReturn::none));
}


std::string vfs::getBaseName(const std::string& itemPath)
{
    const std::string cleaned = cleanPath(itemPath);
    if (cleaned == "/")
        return cleaned;

    return getItemName(cleaned);
}


std::string vfs::ensureLeadingSlash(const std::string& path)
{
    return startsWith(path, FILE_NAME_SEPARATOR) ? path : FILE_NAME_SEPARATOR + path;
}


std::string vfs::ensureTrailingSlash(const std::string& path)
{
    return appendSeparator(path);
}


void vfs::validateAbsoluteFilePath(const std::string& path) //throw FileError
{
    if (!startsWith(path, '/') || endsWith(path, '/'))
        throw FileError(replaceCpy(_("Invalid file path %x."), L"%x", fmtPath(path)),
                        L"Absolute file path must include leading slash and may not include trailing slash.");
}


void vfs::validateAbsoluteLocationPath(const std::string& path) //throw FileError
{
    if (!startsWith(path, '/') || !endsWith(path, '/'))
        throw FileError(replaceCpy(_("Invalid folder path %x."), L"%x", fmtPath(path)),
                        L"Absolute location path must include leading and trailing slashes.");
}


void vfs::validateRelativeFilePath(const std::string& path) //throw FileError
{
    if (path.empty() || path == "." || startsWith(path, '/') || endsWith(path, '/'))
        throw FileError(replaceCpy(_("Invalid file path %x."), L"%x", fmtPath(path)),
                        L"Relative file path may not include leading or trailing slashes.");
}


void vfs::validateRelativeLocationPath(const std::string& path) //throw FileError
{
    if (startsWith(path, '/') || !endsWith(path, '/'))
        throw FileError(replaceCpy(_("Invalid folder path %x."), L"%x", fmtPath(path)),
                        L"Relative location path may not include leading slash but must include trailing slash.");
}


void vfs::validatePrefix(const std::string& prefix) //throw FileError
{
    if (prefix.empty() || startsWith(prefix, '/') || endsWith(prefix, '/'))
        throw FileError(replaceCpy(_("Invalid file name prefix %x."), L"%x", fmtPath(prefix)),
                        L"Prefix may not include leading or trailing slashes and may not be empty.");
}
