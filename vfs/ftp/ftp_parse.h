// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FTP_PARSE_H_5029384756102938475
#define FTP_PARSE_H_5029384756102938475

#include <string>
#include <string_view>
#include <vector>
#include "ftp_client.h"


namespace vfs
{
std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;
std::vector<std::string_view> splitFtpResponse(const std::string& buf); //non-empty lines only

std::wstring formatFtpStatus(long sc);

struct FtpFeatures
{
    bool mlsd = false; //MLST + MLSD
    bool mfmt = false;
    bool clnt = false;
    bool utf8 = false;
};
FtpFeatures parseFeatResponse(const std::string& featResponse);

//the parsers throw SysError for malformed input, quoting the offending line

//"type=file;size=4;modify=20170113063314; readme.txt"
FtpEntry parseMlstLine(std::string_view rawLine); //throw SysError

//MLSD data connection output; "." and ".." are skipped
std::vector<FtpEntry> parseMlsd(const std::string& buf); //throw SysError

//control connection response of "MLST path"; entry name is reduced to the base name
FtpEntry parseMlstResponse(const std::string& response); //throw SysError

//"ls -l" output; modification times without year are placed into the year before "utcTimeNow" if more than a day ahead
std::vector<FtpEntry> parseUnixListing(const std::string& buf, time_t utcTimeNow); //throw SysError

//"dir" output (IIS and others)
std::vector<FtpEntry> parseDosListing(const std::string& buf, time_t utcTimeNow); //throw SysError

//LIST output of unknown format
std::vector<FtpEntry> parseListing(const std::string& buf, time_t utcTimeNow); //throw SysError
}

#endif //FTP_PARSE_H_5029384756102938475
