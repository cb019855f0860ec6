// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "curl_wrap.h"
#include <mutex>

using namespace rvfs;


namespace
{
std::mutex curlInitLock;
int curlInitLevel = 0; //support interleaving initialization calls!
}

void rvfs::libcurlInit() //throw SysError
{
    std::lock_guard dummy(curlInitLock); //clients may be dialed from any thread
    assert(curlInitLevel >= 0);
    if (++curlInitLevel != 1)
        return;

    if (const CURLcode rc = ::curl_global_init(CURL_GLOBAL_DEFAULT /*= CURL_GLOBAL_SSL*/);
        rc != CURLE_OK)
    {
        --curlInitLevel;
        throw SysError(formatSystemError("curl_global_init", formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
    }
}


void rvfs::libcurlTearDown()
{
    std::lock_guard dummy(curlInitLock);
    assert(curlInitLevel >= 1);
    if (--curlInitLevel != 0)
        return;

    ::curl_global_cleanup();
}


void rvfs::setCurlOption(CURL* easyHandle, const CurlOption& curlOpt) //throw SysError
{
    if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
        rc != CURLE_OK)
        throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                         formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
}


std::wstring rvfs::formatCurlStatusCode(CURLcode sc)
{
    switch (sc)
    {
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_OK);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_UNSUPPORTED_PROTOCOL);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FAILED_INIT);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_URL_MALFORMAT);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_NOT_BUILT_IN);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_PROXY);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_HOST);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_CONNECT);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_WEIRD_SERVER_REPLY);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_ACCESS_DENIED);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_FAILED);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASS_REPLY);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_TIMEOUT);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASV_REPLY);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_227_FORMAT);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_CANT_GET_HOST);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_SET_TYPE);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_PARTIAL_FILE);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_RETR_FILE);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_QUOTE_ERROR);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_WRITE_ERROR);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_UPLOAD_FAILED);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_READ_ERROR);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_OUT_OF_MEMORY);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_OPERATION_TIMEDOUT);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PORT_FAILED);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_USE_REST);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_RANGE_ERROR);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CONNECT_ERROR);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_DOWNLOAD_RESUME);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FILE_COULDNT_READ_FILE);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_ABORTED_BY_CALLBACK);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_FUNCTION_ARGUMENT);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_INTERFACE_FAILED);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_UNKNOWN_OPTION);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_GOT_NOTHING);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_ERROR);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_RECV_ERROR);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CERTPROBLEM);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CIPHER);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_PEER_FAILED_VERIFICATION);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FILESIZE_EXCEEDED);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_USE_SSL_FAILED);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_FAIL_REWIND);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_LOGIN_DENIED);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_DISK_FULL);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_EXISTS);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CACERT_BADFILE);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_NOT_FOUND);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_SHUTDOWN_FAILED);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_AGAIN);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PRET_FAILED);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_BAD_FILE_LIST);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_NO_CONNECTION_AVAILABLE);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_RECURSIVE_API_CALL);
            RVFS_CHECK_CASE_FOR_CONSTANT(CURLE_AUTH_ERROR);

        default:
            break; //codes of no interest for FTP
    }

    return replaceCpy<std::wstring>(L"Curl status %x", L"%x", numberTo<std::wstring>(static_cast<int>(sc)));
}
