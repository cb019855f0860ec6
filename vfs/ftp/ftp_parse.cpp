// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "ftp_parse.h"
#include <algorithm>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>
#include <rvfs/time.h>
#include <rvfs/utf.h>

using namespace rvfs;
using namespace vfs;


namespace
{
class FtpLineParser
{
public:
    explicit FtpLineParser(const std::string_view& line) : it_(line.begin()), itEnd_(line.end()) {}

    template <class Function>
    std::string_view readRange(size_t count, Function acceptChar) //throw SysError
    {
        if (static_cast<ptrdiff_t>(count) > itEnd_ - it_)
            throw SysError(L"Unexpected end of line.");

        const auto rngEnd = it_ + count;

        if (!std::all_of(it_, rngEnd, acceptChar))
            throw SysError(L"Expected char type not found.");

        return makeStringView(std::exchange(it_, rngEnd), rngEnd);
    }

    template <class Function> //expects non-empty range!
    std::string_view readRange(Function acceptChar) //throw SysError
    {
        auto rngEnd = std::find_if_not(it_, itEnd_, acceptChar);
        if (rngEnd == it_)
            throw SysError(L"Expected char range not found.");

        return makeStringView(std::exchange(it_, rngEnd), rngEnd);
    }

    char peekNextChar() const { return it_ == itEnd_ ? '\0' : *it_; }

private:
    std::string_view::const_iterator it_;
    const std::string_view::const_iterator itEnd_;
};


bool isDotEntry(const std::string& name) { return name == "." || name == ".."; }


int getCurrentYear(time_t utcTimeNow) //throw SysError
{
    const TimeComp tc = getUtcTime(utcTimeNow);
    if (tc == TimeComp())
        throw SysError(L"Failed to determine current time: " + numberTo<std::wstring>(utcTimeNow));
    return tc.year;
}


FtpEntry parseUnixLine(const std::string_view& rawLine, time_t utcTimeNow, int utcCurrentYear, int ownerGroupCount) //throw SysError
{
    /*  Unix standard listing: "ls -l --all"

            total 4953                                                  <- optional first line
            drwxr-xr-x 1 root root    4096 Jan 10 11:58 version
            -rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user
            -rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest
            lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects

        No group:
            dr-xr-xr-x   2 root                  512 Apr  8  1994 etc
        No owner, no group:
            drwxrwxrwx 1              0 Jan  1 00:00 dirname/              */
    try
    {
        FtpLineParser parser(rawLine);

        const std::string_view typeTag = parser.readRange(1, [](char c) //throw SysError
        {
            return c == '-' || c == 'b' || c == 'c' || c == 'd' || c == 'l' || c == 'p' || c == 's';
        });
        //------------------------------------------------------------------------------------
        //permissions
        parser.readRange(9, [](char c) //throw SysError
        {
            return c == '-' || c == 'r' || c == 'w' || c == 'x' || c == 's' || c == 'S' || c == 't' || c == 'T';
        });
        parser.readRange(&isWhiteSpace<char>); //throw SysError
        //------------------------------------------------------------------------------------
        //hard-link count (no separators)
        parser.readRange(&isDigit<char>);      //throw SysError
        parser.readRange(&isWhiteSpace<char>); //throw SysError
        //------------------------------------------------------------------------------------
        //both owner + group, owner only, or none at all
        for (int i = 0; i < ownerGroupCount; ++i)
        {
            parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
            parser.readRange(&isWhiteSpace<char>);             //throw SysError
        }
        //------------------------------------------------------------------------------------
        //file size (no separators)
        const uint64_t fileSize = stringTo<uint64_t>(parser.readRange(&isDigit<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                          //throw SysError
        //------------------------------------------------------------------------------------
        const std::string_view monthStr = parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                               //throw SysError

        const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
        auto itMonth = std::find_if(std::begin(months), std::end(months), [&](const char* name) { return equalAsciiNoCase(name, monthStr); });
        if (itMonth == std::end(months))
            throw SysError(L"Failed to parse month name.");
        //------------------------------------------------------------------------------------
        const int day = stringTo<int>(parser.readRange(&isDigit<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                           //throw SysError
        if (day < 1 || day > 31)
            throw SysError(L"Failed to parse day of month.");
        //------------------------------------------------------------------------------------
        const std::string_view timeOrYear = parser.readRange([](char c) { return c == ':' || isDigit(c); }); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                                               //throw SysError

        TimeComp timeComp;
        timeComp.month = 1 + static_cast<int>(itMonth - std::begin(months));
        timeComp.day = day;

        if (contains(timeOrYear, ':'))
        {
            const int hour   = stringTo<int>(beforeFirst(timeOrYear, ':', IfNotFoundReturn::none));
            const int minute = stringTo<int>(afterFirst (timeOrYear, ':', IfNotFoundReturn::none));
            if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
                throw SysError(L"Failed to parse modification time.");

            timeComp.hour   = hour;
            timeComp.minute = minute;
            timeComp.year = utcCurrentYear; //tentatively

            const auto [serverLocalTime, timeValid] = utcToTimeT(timeComp);
            if (!timeValid)
                throw SysError(L"Modification time is invalid.");

            if (serverLocalTime > utcTimeNow + 24 * 3600) //time-zones range from UTC-12:00 to UTC+14:00, consider DST
                --timeComp.year; //"more likely" this time is from last year
        }
        else if (timeOrYear.size() == 4)
        {
            timeComp.year = stringTo<int>(timeOrYear);

            if (timeComp.year < 1600 || timeComp.year >= 3000)
                throw SysError(L"Failed to parse modification time.");
        }
        else
            throw SysError(L"Failed to parse modification time.");

        //let's pretend the time listing is UTC
        const auto [modTime, timeValid] = utcToTimeT(timeComp);
        if (!timeValid)
            throw SysError(L"Modification time is invalid.");
        //------------------------------------------------------------------------------------
        const std::string_view trail = parser.readRange([](char) { return true; }); //throw SysError
        std::string_view itemName;
        if (typeTag == "l")
            itemName = beforeFirst(trail, " -> ", IfNotFoundReturn::none);
        else
            itemName = trail;
        if (itemName.empty())
            throw SysError(L"Item name not available.");

        if (itemName == "." || itemName == "..")
            return {std::string(itemName), FtpEntryType::folder, 0, 0};
        //------------------------------------------------------------------------------------
        FtpEntry entry;
        if (typeTag == "d")
            entry.type = FtpEntryType::folder;
        else if (typeTag == "l")
            entry.type = FtpEntryType::link;
        else
            entry.size = fileSize;

        entry.name = itemName;
        if (entry.type == FtpEntryType::folder && endsWith(entry.name, '/'))
            entry.name.pop_back();

        entry.modTime = modTime;
        return entry;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") [ownerGroupCount: " + numberTo<std::wstring>(ownerGroupCount) + L"] " + e.toString());
    }
}
}


std::vector<std::string_view> vfs::splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;

    split2(buf, [](char c) { return isLineBreak(c) || c == '\0'; },
    [&lines](const std::string_view block)
    {
        if (!block.empty()) //consider Windows' <CR><LF>
            lines.push_back(block);
    });

    return lines;
}


std::wstring vfs::formatFtpStatus(long sc)
{
    const wchar_t* statusText = [&] //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 421: return L"Service not available, closing control connection.";
            case 425: return L"Cannot open data connection.";
            case 426: return L"Connection closed; transfer aborted.";
            case 430: return L"Invalid username or password.";
            case 450: return L"Requested file action not taken.";
            case 451: return L"Local error in processing.";
            case 452: return L"Insufficient storage space in system. File unavailable, e.g. file busy.";

            case 500: return L"Syntax error, command unrecognized or command line too long.";
            case 501: return L"Syntax error in parameters or arguments.";
            case 502: return L"Command not implemented.";
            case 503: return L"Bad sequence of commands.";
            case 504: return L"Command not implemented for that parameter.";
            case 530: return L"User not logged in.";
            case 534: return L"Could not connect to server; issue regarding SSL.";
            case 550: return L"File unavailable, e.g. file not found, no access.";
            case 552: return L"Requested file action aborted. Exceeded storage allocation.";
            case 553: return L"File name not allowed.";

            default:  return L"";
            //*INDENT-ON*
        }
    }();

    if (std::wstring_view(statusText).empty())
        return trimCpy(replaceCpy<std::wstring>(L"FTP status %x.", L"%x", numberTo<std::wstring>(sc)));
    else
        return trimCpy(replaceCpy<std::wstring>(L"FTP status %x: ", L"%x", numberTo<std::wstring>(sc)) + statusText);
}


FtpFeatures vfs::parseFeatResponse(const std::string& featResponse)
{
    FtpFeatures output; //FEAT command: https://tools.ietf.org/html/rfc2389#page-4
    const std::vector<std::string_view> lines = splitFtpResponse(featResponse);

    auto it = std::find_if(lines.begin(), lines.end(), [](const std::string_view& line) { return startsWith(line, "211-") || startsWith(line, "211 "); });
    if (it != lines.end())
    {
        ++it;
        for (; it != lines.end(); ++it)
        {
            if (equalAsciiNoCase     (*it, "211 End") || //Serv-U: "211 End (for details use "HELP commmand" where command is the command of interest)"
                startsWithAsciiNoCase(*it, "211 End "))  //Home Ftp Server: "211 End of extentions."
                break;

            std::string line(*it);
            //ProFTPD with "MultilineRFC2228 = on"
            if (startsWith(line, "211-"))
                line = ' ' + afterFirst(line, '-', IfNotFoundReturn::none);

            //"The presence of the MLST feature indicates that both MLST and MLSD are supported"
            if (equalAsciiNoCase     (line, " MLST")  ||
                startsWithAsciiNoCase(line, " MLST ") || //SP "MLST" [SP factlist] CRLF
                equalAsciiNoCase(line, " MLSD"))
                output.mlsd = true;

            else if (equalAsciiNoCase(line, " MFMT")) //SP "MFMT" CRLF
                output.mfmt = true;

            else if (equalAsciiNoCase(line, " UTF8") ||
                     equalAsciiNoCase(line, " UTF8 ON") ||
                     equalAsciiNoCase(line, " UTF-8"))
                output.utf8 = true;

            else if (equalAsciiNoCase(line, " CLNT"))
                output.clnt = true;
        }
    }
    return output;
}


FtpEntry vfs::parseMlstLine(std::string_view rawLine) //throw SysError
{
    /*  https://tools.ietf.org/html/rfc3659
        type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; .
        type=pdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; ..
        type=file;size=4;modify=20170113063314;UNIX.mode=0600;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c5d; readme.txt
        type=dir;sizd=4096;modify=20170117144634;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e418a; folder   */
    try
    {
        FtpEntry entry;

        auto itBegin = rawLine.begin();
        if (startsWith(rawLine, ' ')) //leading blank is already trimmed if MLSD was processed by curl
            ++itBegin;
        auto itBlank = std::find(itBegin, rawLine.end(), ' ');
        if (itBlank == rawLine.end())
            throw SysError(L"Item name not available.");

        const std::string_view facts = makeStringView(itBegin, itBlank);
        entry.name = std::string(itBlank + 1, rawLine.end());

        std::string_view typeFact;
        std::string_view fileSize;

        split(facts, ';', [&](const std::string_view fact)
        {
            if (!fact.empty())
            {
                if (startsWithAsciiNoCase(fact, "type=")) //must be case-insensitive!!!
                {
                    const std::string_view tmp = afterFirst(fact, '=', IfNotFoundReturn::none);
                    typeFact = beforeFirst(tmp, ':', IfNotFoundReturn::all);
                }
                else if (startsWithAsciiNoCase(fact, "size="))
                    fileSize = afterFirst(fact, '=', IfNotFoundReturn::none);
                else if (startsWithAsciiNoCase(fact, "modify="))
                {
                    std::string_view modifyFact = afterFirst(fact, '=', IfNotFoundReturn::none);
                    modifyFact = beforeLast(modifyFact, '.', IfNotFoundReturn::all); //truncate millisecond precision if available

                    const TimeComp tc = parseTime(formatFtpTimeTag, modifyFact);
                    if (tc == TimeComp())
                        throw SysError(L"Modification time is invalid.");

                    if (const auto [modTime, timeValid] = utcToTimeT(tc);
                        timeValid)
                        entry.modTime = modTime;
                    else
                        throw SysError(L"Modification time is invalid.");
                }
            }
        });

        if (equalAsciiNoCase(typeFact, "cdir"))
            return {".", FtpEntryType::folder, 0, 0};
        if (equalAsciiNoCase(typeFact, "pdir"))
            return {"..", FtpEntryType::folder, 0, 0};

        if (equalAsciiNoCase(typeFact, "dir"))
            entry.type = FtpEntryType::folder;
        else if (equalAsciiNoCase(typeFact, "OS.unix=slink") || //the OS.unix=slink:/target syntax is a hack and often skips
                 equalAsciiNoCase(typeFact, "OS.unix=symlink")) //the target path after the colon
            entry.type = FtpEntryType::link;

        if (entry.name.empty())
            throw SysError(L"Item name not available.");

        if (entry.type == FtpEntryType::file)
        {
            if (fileSize.empty() || !std::all_of(fileSize.begin(), fileSize.end(), &isDigit<char>))
                throw SysError(L"File size not available.");
            entry.size = stringTo<uint64_t>(fileSize);
        }
        return entry;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") " + e.toString());
    }
}


std::vector<FtpEntry> vfs::parseMlsd(const std::string& buf) //throw SysError
{
    std::vector<FtpEntry> output;
    for (const std::string_view& line : splitFtpResponse(buf))
    {
        FtpEntry entry = parseMlstLine(line); //throw SysError
        if (!isDotEntry(entry.name))
            output.push_back(std::move(entry));
    }
    return output;
}


FtpEntry vfs::parseMlstResponse(const std::string& response) //throw SysError
{
    /*  250-Listing /folder/readme.txt
         type=file;size=4;modify=20170113063314; /folder/readme.txt
        250 End                                                          */
    std::optional<std::string_view> factLine;
    for (const std::string_view& line : splitFtpResponse(response))
        if (startsWith(line, ' ') && contains(line, '=')) //the response may also contain the connection preamble
            factLine = line;

    if (!factLine)
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(trimCpy(response)) + L") Item facts not available.");

    FtpEntry entry = parseMlstLine(*factLine); //throw SysError
    if (contains(entry.name, '/'))
        entry.name = afterLast(entry.name, '/', IfNotFoundReturn::all);
    return entry;
}


std::vector<FtpEntry> vfs::parseUnixListing(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    const std::vector<std::string_view> lines = splitFtpResponse(buf);
    auto it = lines.begin();

    if (it != lines.end() && startsWith(*it, "total "))
        ++it;

    const int utcCurrentYear = getCurrentYear(utcTimeNow); //throw SysError

    std::optional<int> dirOwnerGroupCount;  //
    std::optional<int> fileOwnerGroupCount; //caveat: differentiate per item type: see alternative formats!
    std::optional<int> linkOwnerGroupCount; //

    std::vector<FtpEntry> output;

    std::for_each(it, lines.end(), [&](const std::string_view line)
    {
        auto& ownerGroupCount = [&]() -> std::optional<int>&
        {
            switch (line[0]) //non-empty: see splitFtpResponse()
            {
                //*INDENT-OFF*
                case 'd': return  dirOwnerGroupCount;
                case 'l': return linkOwnerGroupCount;
                default : return fileOwnerGroupCount;
                //*INDENT-ON*
            }
        }();

        if (!ownerGroupCount)
            ownerGroupCount = [&]
        {
            std::optional<SysError> firstError;

            for (int i = 3; i-- > 0;)
                try
                {
                    parseUnixLine(line, utcTimeNow, utcCurrentYear, i /*ownerGroupCount*/); //throw SysError
                    return i;
                }
                catch (const SysError& e)
                {
                    if (!firstError)
                        firstError = e;
                }
            throw* firstError; //most likely the relevant one
        }();

        FtpEntry entry = parseUnixLine(line, utcTimeNow, utcCurrentYear, *ownerGroupCount); //throw SysError
        if (!isDotEntry(entry.name))
            output.push_back(std::move(entry));
    });

    return output;
}


std::vector<FtpEntry> vfs::parseDosListing(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    /*  listing supported by libcurl (US server)
            10-27-15  03:46AM       <DIR>          pub
            04-08-14  03:09PM               11,399 readme.txt

        IIS option "four-digit years"
            06-22-2017  04:25PM       <DIR>          test
            06-20-2017  12:50PM              1875499 zstring.obj        */

    const int utcCurrentYear = getCurrentYear(utcTimeNow); //throw SysError

    std::vector<FtpEntry> output;
    for (const std::string_view& line : splitFtpResponse(buf))
    {
        try
        {
            FtpLineParser parser(line);

            const int month = stringTo<int>(parser.readRange(2, &isDigit<char>)); //throw SysError
            parser.readRange(1, [](char c) { return c == '-' || c == '/'; });     //throw SysError
            const int day = stringTo<int>(parser.readRange(2, &isDigit<char>));   //throw SysError
            parser.readRange(1, [](char c) { return c == '-' || c == '/'; });     //throw SysError
            const std::string_view yearString = parser.readRange(&isDigit<char>); //throw SysError
            parser.readRange(&isWhiteSpace<char>);                                //throw SysError

            if (month < 1 || month > 12 || day < 1 || day > 31)
                throw SysError(L"Failed to parse modification time.");

            int year = 0;
            if (yearString.size() == 2)
            {
                year = (utcCurrentYear / 100) * 100 + stringTo<int>(yearString);
                if (year > utcCurrentYear + 1 /*local time leeway*/)
                    year -= 100;
            }
            else if (yearString.size() == 4)
                year = stringTo<int>(yearString);
            else
                throw SysError(L"Failed to parse modification time.");
            //------------------------------------------------------------------------------------
            int hour = stringTo<int>(parser.readRange(2, &isDigit<char>));         //throw SysError
            parser.readRange(1, [](char c) { return c == ':'; });                  //throw SysError
            const int minute = stringTo<int>(parser.readRange(2, &isDigit<char>)); //throw SysError
            if (!isWhiteSpace(parser.peekNextChar()))
            {
                const std::string_view period = parser.readRange(2, [](char c) { return c == 'A' || c == 'P' || c == 'M'; }); //throw SysError
                if (period == "PM")
                {
                    if (0 <= hour && hour < 12)
                        hour += 12;
                }
                else if (hour == 12)
                    hour = 0;
            }
            parser.readRange(&isWhiteSpace<char>); //throw SysError

            if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
                throw SysError(L"Failed to parse modification time.");
            //------------------------------------------------------------------------------------
            TimeComp timeComp;
            timeComp.year   = year;
            timeComp.month  = month;
            timeComp.day    = day;
            timeComp.hour   = hour;
            timeComp.minute = minute;
            //let's pretend the time listing is UTC
            const auto [modTime, timeValid] = utcToTimeT(timeComp);
            if (!timeValid)
                throw SysError(L"Modification time is invalid.");
            //------------------------------------------------------------------------------------
            const std::string_view dirTagOrSize = parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
            parser.readRange(&isWhiteSpace<char>); //throw SysError

            const bool isDir = dirTagOrSize == "<DIR>";
            uint64_t fileSize = 0;
            if (!isDir)
            {
                std::string sizeStr(dirTagOrSize);
                std::erase(sizeStr, ',');
                std::erase(sizeStr, '.');
                if (sizeStr.empty() || !std::all_of(sizeStr.begin(), sizeStr.end(), &isDigit<char>))
                    throw SysError(L"Failed to parse file size.");
                fileSize = stringTo<uint64_t>(sizeStr);
            }
            //------------------------------------------------------------------------------------
            const std::string_view itemName = parser.readRange([](char) { return true; }); //throw SysError
            if (itemName.empty())
                throw SysError(L"Folder contains an item without name.");

            if (itemName != "." &&
                itemName != "..")
            {
                FtpEntry entry;
                if (isDir)
                    entry.type = FtpEntryType::folder;
                entry.name    = itemName;
                entry.size    = fileSize;
                entry.modTime = modTime;

                output.push_back(std::move(entry));
            }
        }
        catch (const SysError& e)
        {
            throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(line) + L") " + e.toString());
        }
    }

    return output;
}


std::vector<FtpEntry> vfs::parseListing(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    if (!buf.empty() && isDigit(buf[0])) //lame test to distinguish Unix/Dos formats as internally used by libcurl
        return parseDosListing(buf, utcTimeNow); //throw SysError
    return parseUnixListing(buf, utcTimeNow);    //
}
