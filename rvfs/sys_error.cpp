// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "sys_error.h"
#include <cstring>

using namespace rvfs;


namespace
{
#define RVFS_CHECK_CASE_FOR_CONSTANT(X) case X: return RVFS_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define RVFS_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X

std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //the codes a network file system client runs into
    {
            RVFS_CHECK_CASE_FOR_CONSTANT(EPERM);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENOENT);
            RVFS_CHECK_CASE_FOR_CONSTANT(EINTR);
            RVFS_CHECK_CASE_FOR_CONSTANT(EIO);
            RVFS_CHECK_CASE_FOR_CONSTANT(EBADF);
            RVFS_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            RVFS_CHECK_CASE_FOR_CONSTANT(EACCES);
            RVFS_CHECK_CASE_FOR_CONSTANT(EBUSY);
            RVFS_CHECK_CASE_FOR_CONSTANT(EEXIST);
            RVFS_CHECK_CASE_FOR_CONSTANT(EXDEV);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            RVFS_CHECK_CASE_FOR_CONSTANT(EISDIR);
            RVFS_CHECK_CASE_FOR_CONSTANT(EINVAL);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENFILE);
            RVFS_CHECK_CASE_FOR_CONSTANT(EMFILE);
            RVFS_CHECK_CASE_FOR_CONSTANT(EFBIG);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            RVFS_CHECK_CASE_FOR_CONSTANT(ESPIPE);
            RVFS_CHECK_CASE_FOR_CONSTANT(EROFS);
            RVFS_CHECK_CASE_FOR_CONSTANT(EPIPE);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            RVFS_CHECK_CASE_FOR_CONSTANT(ELOOP);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            RVFS_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            RVFS_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENETRESET);
            RVFS_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            RVFS_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENOBUFS);
            RVFS_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            RVFS_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            RVFS_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            RVFS_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
            RVFS_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            RVFS_CHECK_CASE_FOR_CONSTANT(EINPROGRESS);
            RVFS_CHECK_CASE_FOR_CONSTANT(ESTALE);
            RVFS_CHECK_CASE_FOR_CONSTANT(EDQUOT);
            RVFS_CHECK_CASE_FOR_CONSTANT(ECANCELED);

        default:
            return replaceCpy<std::wstring>(L"Error code %x", L"%x", numberTo<std::wstring>(ec));
    }
}
#undef RVFS_CHECK_CASE_FOR_CONSTANT
#undef RVFS_CHECK_CASE_FOR_CONSTANT_IMPL
}


std::wstring rvfs::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode currentError = getLastError(); //not necessarily == ec
    RVFS_ON_SCOPE_EXIT(errno = currentError);

    char buffer[1024] = {};
    //GNU variant: may return a static string instead of filling the buffer
    const char* msg = ::strerror_r(ec, buffer, sizeof(buffer));
    return msg ? utfTo<std::wstring>(msg) : std::wstring();
}


std::wstring rvfs::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring rvfs::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return output;
}
