// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef AUTHORITY_H_8765102938475610293
#define AUTHORITY_H_8765102938475610293

#include <cstdint>
#include <string>
#include <rvfs/file_error.h>


namespace vfs
{
struct UserInfo
{
    std::string username;
    std::string password;

    bool operator==(const UserInfo&) const = default;
};

//connection target of one volume: "[user[:password]@]host[:port]"
struct Authority
{
    UserInfo userInfo;
    std::string host; //IPv6 addresses without brackets
    uint16_t port = 0; //0 = protocol default

    std::string hostPortStr() const; //"host" or "host:port"; IPv6 in brackets
    std::string toString() const;    //"user@host:port" (never contains the password)

    bool operator==(const Authority&) const = default;
};

Authority parseAuthority(const std::string& authority); //throw FileError

//same user on the same server: one control connection can serve both
inline bool sameServerAndUser(const Authority& lhs, const Authority& rhs)
{
    return lhs.userInfo.username == rhs.userInfo.username &&
           lhs.hostPortStr()     == rhs.hostPortStr();
}
}

#endif //AUTHORITY_H_8765102938475610293
