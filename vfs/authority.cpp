// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "authority.h"
#include <algorithm>

using namespace rvfs;
using namespace vfs;


std::string Authority::hostPortStr() const
{
    std::string output = contains(host, ':') ? '[' + host + ']' : host;
    if (port != 0)
        output += ':' + numberTo<std::string>(port);
    return output;
}


std::string Authority::toString() const
{
    if (userInfo.username.empty())
        return hostPortStr();
    return userInfo.username + '@' + hostPortStr();
}


Authority vfs::parseAuthority(const std::string& authority) //throw FileError
{
    try
    {
        Authority output;

        std::string hostPort = authority;
        if (contains(authority, '@'))
        {
            //user names may contain '@' themselves: the host part starts after the last one
            const std::string userInfo = beforeLast(authority, '@', IfNotFoundReturn::none);
            hostPort                   = afterLast (authority, '@', IfNotFoundReturn::none);

            output.userInfo.username = beforeFirst(userInfo, ':', IfNotFoundReturn::all);
            output.userInfo.password = afterFirst (userInfo, ':', IfNotFoundReturn::none);
        }

        std::string portStr;
        if (startsWith(hostPort, '[')) //IPv6 literal
        {
            if (!contains(hostPort, ']'))
                throw SysError(L"Missing closing bracket of IPv6 address.");

            output.host = beforeFirst(afterFirst(hostPort, '[', IfNotFoundReturn::none), ']', IfNotFoundReturn::none);
            const std::string trail = afterFirst(hostPort, ']', IfNotFoundReturn::none);
            if (!trail.empty())
            {
                if (!startsWith(trail, ':'))
                    throw SysError(L"Unexpected characters after IPv6 address.");
                portStr = trail.substr(1);
                if (portStr.empty())
                    throw SysError(L"Port number missing.");
            }
        }
        else
        {
            output.host = beforeFirst(hostPort, ':', IfNotFoundReturn::all);
            if (contains(hostPort, ':'))
            {
                portStr = afterFirst(hostPort, ':', IfNotFoundReturn::none);
                if (portStr.empty())
                    throw SysError(L"Port number missing.");
            }
        }

        if (output.host.empty())
            throw SysError(L"Server name missing.");

        if (!portStr.empty())
        {
            if (portStr.size() > 5 || !std::all_of(portStr.begin(), portStr.end(), &isDigit<char>))
                throw SysError(L"Invalid port number.");

            const int port = stringTo<int>(portStr);
            if (port < 1 || port > 65535)
                throw SysError(L"Invalid port number.");
            output.port = static_cast<uint16_t>(port);
        }
        return output;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Invalid authority %x."), L"%x", fmtPath(authority)), e.toString()); }
}
