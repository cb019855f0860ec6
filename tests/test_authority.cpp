// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include <gtest/gtest.h>
#include <vfs/authority.h>

using namespace rvfs;
using namespace vfs;


TEST(Authority, Parse)
{
    Authority a = parseAuthority("user:secret@ftp.example.com:2121");
    EXPECT_EQ(a.userInfo.username, "user");
    EXPECT_EQ(a.userInfo.password, "secret");
    EXPECT_EQ(a.host, "ftp.example.com");
    EXPECT_EQ(a.port, 2121);

    a = parseAuthority("host");
    EXPECT_EQ(a.userInfo, UserInfo());
    EXPECT_EQ(a.port, 0);

    //the host starts after the last '@'
    a = parseAuthority("me@corp.com@host");
    EXPECT_EQ(a.userInfo.username, "me@corp.com");
    EXPECT_EQ(a.host, "host");
}


TEST(Authority, ParseIpv6)
{
    const Authority a = parseAuthority("bob@[::1]:21");
    EXPECT_EQ(a.host, "::1");
    EXPECT_EQ(a.port, 21);
    EXPECT_EQ(a.hostPortStr(), "[::1]:21");
    EXPECT_EQ(a.toString(), "bob@[::1]:21");
}


TEST(Authority, ParseErrors)
{
    for (const char* bad : {"", "user@", "host:", "host:abc", "host:0", "host:70000", "host:123456", "[::1", "[::1]x", "[::1]:"})
        EXPECT_THROW(parseAuthority(bad), FileError) << bad;

    try
    {
        parseAuthority("host:abc");
        FAIL();
    }
    catch (const FileError& e)
    {
        EXPECT_EQ(e.toString(), L"Invalid authority \"host:abc\".\n\nInvalid port number.");
    }
}


TEST(Authority, ToStringOmitsPassword)
{
    EXPECT_EQ(parseAuthority("user:secret@host:21").toString(), "user@host:21");
    EXPECT_EQ(parseAuthority("host").toString(), "host");
}


TEST(Authority, SameServerAndUser)
{
    EXPECT_TRUE (sameServerAndUser(parseAuthority("u:a@host:21"), parseAuthority("u:b@host:21")));
    EXPECT_FALSE(sameServerAndUser(parseAuthority("u@host:21"),   parseAuthority("v@host:21")));
    EXPECT_FALSE(sameServerAndUser(parseAuthority("u@host:21"),   parseAuthority("u@host:2121")));
    EXPECT_FALSE(sameServerAndUser(parseAuthority("u@host1"),     parseAuthority("u@host2")));
}
