// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include <gtest/gtest.h>
#include <vfs/ftp/ftp_parse.h>

using namespace rvfs;
using namespace vfs;


namespace
{
const time_t TIME_2017_01_13_063314 = 1484289194;
}


TEST(FtpParse, SplitResponse)
{
    const std::string buf = "220 Welcome\r\n\r\n230 Logged in\n";
    const std::vector<std::string_view> lines = splitFtpResponse(buf);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "220 Welcome");
    EXPECT_EQ(lines[1], "230 Logged in");
}


TEST(FtpParse, FormatStatus)
{
    EXPECT_EQ(formatFtpStatus(550), L"FTP status 550: File unavailable, e.g. file not found, no access.");
    EXPECT_EQ(formatFtpStatus(999), L"FTP status 999.");
}


TEST(FtpParse, FeatResponse)
{
    FtpFeatures feat = parseFeatResponse("211-Features:\r\n"
                                         " MLST type*;size*;modify*;\r\n"
                                         " MFMT\r\n"
                                         " UTF8\r\n"
                                         "211 End\r\n");
    EXPECT_TRUE(feat.mlsd);
    EXPECT_TRUE(feat.mfmt);
    EXPECT_TRUE(feat.utf8);
    EXPECT_FALSE(feat.clnt);

    //ProFTPD: "MultilineRFC2228 = on"
    feat = parseFeatResponse("211-Features:\r\n"
                             "211-CLNT\r\n"
                             "211-MDTM\r\n"
                             "211 End\r\n");
    EXPECT_TRUE(feat.clnt);
    EXPECT_FALSE(feat.mlsd);

    feat = parseFeatResponse("500 Unknown command.\r\n");
    EXPECT_FALSE(feat.mlsd || feat.mfmt || feat.clnt || feat.utf8);
}


TEST(FtpParse, MlstLine)
{
    FtpEntry entry = parseMlstLine("type=file;size=4;modify=20170113063314;UNIX.mode=0600; readme.txt");
    EXPECT_EQ(entry, (FtpEntry{"readme.txt", FtpEntryType::file, 4, TIME_2017_01_13_063314}));

    //fact names are case-insensitive, milliseconds are truncated, names may contain blanks
    entry = parseMlstLine("Type=dir;Modify=20170113063314.123; my folder");
    EXPECT_EQ(entry.type, FtpEntryType::folder);
    EXPECT_EQ(entry.name, "my folder");
    EXPECT_EQ(entry.modTime, TIME_2017_01_13_063314);

    EXPECT_EQ(parseMlstLine("type=OS.unix=slink:/target; link").type, FtpEntryType::link);

    EXPECT_THROW(parseMlstLine("type=file;size=abc; x"), SysError);
    EXPECT_THROW(parseMlstLine("type=file;size=4;"), SysError);
    EXPECT_THROW(parseMlstLine("type=file;size=4;modify=2017XX; x"), SysError);
}


TEST(FtpParse, Mlsd)
{
    const std::vector<FtpEntry> entries = parseMlsd("type=cdir;modify=20170116230740; .\r\n"
                                                    "type=pdir;modify=20170116230740; ..\r\n"
                                                    "type=file;size=4;modify=20170113063314; readme.txt\r\n"
                                                    "type=dir;modify=20170113063314; folder\r\n");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "readme.txt");
    EXPECT_EQ(entries[1].name, "folder");
    EXPECT_EQ(entries[1].type, FtpEntryType::folder);
}


TEST(FtpParse, MlstResponse)
{
    const FtpEntry entry = parseMlstResponse("250-Listing /folder/readme.txt\r\n"
                                             " type=file;size=4;modify=20170113063314; /folder/readme.txt\r\n"
                                             "250 End\r\n");
    EXPECT_EQ(entry, (FtpEntry{"readme.txt", FtpEntryType::file, 4, TIME_2017_01_13_063314}));

    EXPECT_THROW(parseMlstResponse("250 End\r\n"), SysError);
}


TEST(FtpParse, UnixListing)
{
    const std::vector<FtpEntry> entries = parseUnixListing("total 4953\r\n"
                                                           "drwxr-xr-x 1 root root    4096 Jan 10 11:58 version\r\n"
                                                           "drwxr-xr-x 2 root root    4096 Jan 10 11:58 .\r\n"
                                                           "-rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user\r\n"
                                                           "-rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest\r\n"
                                                           "lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects\r\n",
                                                           TIME_2017_01_13_063314);
    ASSERT_EQ(entries.size(), 4u);

    EXPECT_EQ(entries[0], (FtpEntry{"version", FtpEntryType::folder, 0, 1484049480})); //2017-01-10 11:58

    //a date without year ahead of "now" belongs to the previous year
    EXPECT_EQ(entries[1], (FtpEntry{"Unit Test.vcxproj.user", FtpEntryType::file, 1084, 1472779020})); //2016-09-02 01:17

    EXPECT_EQ(entries[2], (FtpEntry{"win32.manifest", FtpEntryType::file, 2217, 1456617600})); //2016-02-28

    EXPECT_EQ(entries[3].name, "Projects");
    EXPECT_EQ(entries[3].type, FtpEntryType::link);
}


TEST(FtpParse, UnixListingWithoutOwnerAndGroup)
{
    const std::vector<FtpEntry> entries = parseUnixListing("dr-xr-xr-x   2 root                  512 Apr  8  1994 etc\r\n"
                                                           "-rwxrwxrwx 1              7 Jan  1  2000 file.txt\r\n",
                                                           TIME_2017_01_13_063314);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "etc");
    EXPECT_EQ(entries[0].type, FtpEntryType::folder);
    EXPECT_EQ(entries[1], (FtpEntry{"file.txt", FtpEntryType::file, 7, 946684800}));
}


TEST(FtpParse, UnixListingMalformed)
{
    EXPECT_THROW(parseUnixListing("this is not a listing\r\n", TIME_2017_01_13_063314), SysError);
    EXPECT_THROW(parseUnixListing("-rw-r--r-- 1 u g 12 Foo 10 11:58 name\r\n", TIME_2017_01_13_063314), SysError);
}


TEST(FtpParse, DosListing)
{
    const std::vector<FtpEntry> entries = parseDosListing("10-27-15  03:46AM       <DIR>          pub\r\n"
                                                          "04-08-14  03:09PM               11,399 readme.txt\r\n"
                                                          "06-22-2017  12:25AM       <DIR>          test\r\n",
                                                          TIME_2017_01_13_063314);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].type, FtpEntryType::folder);
    EXPECT_EQ(entries[0].name, "pub");
    EXPECT_EQ(entries[1], (FtpEntry{"readme.txt", FtpEntryType::file, 11399, 1396969740})); //2014-04-08 15:09
    EXPECT_EQ(entries[2].name, "test");

    EXPECT_THROW(parseDosListing("13-01-15  03:46AM  <DIR>  x\r\n", TIME_2017_01_13_063314), SysError);
}


TEST(FtpParse, ListingFormatDetection)
{
    EXPECT_EQ(parseListing("04-08-14  03:09PM  11 a.txt\r\n", TIME_2017_01_13_063314)[0].name, "a.txt");
    EXPECT_EQ(parseListing("-rw-r--r-- 1 u g 11 Feb 28  2016 b.txt\r\n", TIME_2017_01_13_063314)[0].name, "b.txt");
    EXPECT_TRUE(parseListing("", TIME_2017_01_13_063314).empty());
}
