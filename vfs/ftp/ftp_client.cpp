// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "ftp_client.h"
#include "../vfs_path.h"

using namespace rvfs;
using namespace vfs;


bool vfs::isFileUnavailable(const SysError& e)
{
    if (const auto ftpError = dynamic_cast<const SysErrorFtpProtocol*>(&e))
        return ftpError->ftpErrorCode == FTP_STATUS_FILE_UNAVAILABLE;

    return startsWith(e.toString(), numberTo<std::wstring>(FTP_STATUS_FILE_UNAVAILABLE));
}


bool vfs::folderExists(FtpClient& client, const std::string& folderPath) //throw SysError
{
    if (cleanPath(folderPath) == "/")
        return true;

    const std::string folderName = getBaseName(folderPath);
    try
    {
        for (const FtpEntry& entry : client.list(getParentPath(folderPath))) //throw SysError
            if (entry.type == FtpEntryType::folder && entry.name == folderName)
                return true;
        return false;
    }
    catch (const SysError& e)
    {
        if (isFileUnavailable(e))
            return false;
        throw;
    }
}
