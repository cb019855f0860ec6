// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "ftp_client_curl.h"
#include <ctime>
#include <future>
#include <mutex>
#include <optional>
#include <vector>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include <rvfs/file_path.h>
#include <rvfs/stream_buffer.h>
#include <rvfs/thread.h>
#include <rvfs/time.h>
#include "ftp_parse.h"
#include "../vfs_path.h"
#include <fcntl.h> //fcntl, FD_CLOEXEC

using namespace rvfs;
using namespace vfs;


namespace
{
const size_t FTP_STREAM_BUFFER_SIZE = 1024 * 1024; //download prefetch; libcurl delivers blocks of 16 kB

struct FtpSessionCfg
{
    Authority authority;
    FtpProtocol protocol = FtpProtocol::ftp;
    bool disableEpsv = false;
    TlsConfig tls;
    std::chrono::milliseconds connectTimeout{0};
    std::chrono::seconds ioTimeout{0};
    std::function<void(const std::string& line)> debugTrace; //optional
};


class CurlFtpClient : public FtpClient, public std::enable_shared_from_this<CurlFtpClient>
{
public:
    explicit CurlFtpClient(const FtpSessionCfg& sessionCfg) : //throw SysError
        sessionCfg_(sessionCfg)
    {
        libcurlInit(); //throw SysError
    }

    ~CurlFtpClient()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_);
        libcurlTearDown();
    }

    void login(const std::string& username, const std::string& password) override //throw SysError, SysErrorPassword
    {
        std::lock_guard dummy(lockHandle_);
        username_ = username;
        password_ = password;
        features_.reset();

        /*  '*' to the rescue: as long as we get an FTP response - *any* FTP response (including 550) - the connection itself is fine!
            FEAT might not be supported or permitted: "550 FEAT: Operation not permitted"                                             */
        const std::string featBuf = runFtpCommands({"*FEAT"}); //throw SysError, SysErrorPassword, SysErrorFtpProtocol

        for (const std::string_view& line : splitFtpResponse(featBuf))
            if (startsWith(line, "211 ") ||
                startsWith(line, "500 ") ||
                startsWith(line, "550 "))
            {
                features_ = parseFeatResponse(featBuf);

                //some servers require "CLNT" before accepting "OPTS UTF8 ON"
                if (features_->clnt)
                    runFtpCommands({"*CLNT rvfs"}); //throw SysError, SysErrorFtpProtocol

                //RFC-2640-non-compliant servers (e.g. Microsoft FTP Service) need UTF8 to be enabled explicitly
                runFtpCommands({"*OPTS UTF8 ON"}); //throw SysError, SysErrorFtpProtocol
                return;
            }

        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(trimCpy(featBuf)) + L')');
    }

    void quit() override //throw SysError
    {
        std::lock_guard dummy(lockHandle_);
        if (easyHandle_)
        {
            ::curl_easy_cleanup(easyHandle_); //sends "QUIT" on the cached control connection
            easyHandle_ = nullptr;
        }
        features_.reset();
    }

    void deleteFile(const std::string& path) override //throw SysError, SysErrorFtpProtocol
    {
        std::lock_guard dummy(lockHandle_);
        runFtpCommands({"DELE " + cleanPath(path)}); //throw SysError, SysErrorFtpProtocol
    }

    FtpEntry getEntry(const std::string& path) override //throw SysError, SysErrorFtpProtocol
    {
        std::lock_guard dummy(lockHandle_);

        if (getFeatures().mlsd) //throw SysError
            return parseMlstResponse(runFtpCommands({"MLST " + cleanPath(path)})); //throw SysError, SysErrorFtpProtocol

        for (FtpEntry& entry : listFolder(getParentPath(path))) //throw SysError, SysErrorFtpProtocol
            if (entry.name == getBaseName(path))
                return entry;

        throw SysErrorFtpProtocol(formatFtpStatus(FTP_STATUS_FILE_UNAVAILABLE), FTP_STATUS_FILE_UNAVAILABLE);
    }

    std::vector<FtpEntry> list(const std::string& path) override //throw SysError, SysErrorFtpProtocol
    {
        std::lock_guard dummy(lockHandle_);

        if (endsWith(path, FILE_NAME_SEPARATOR))
            return listFolder(path); //throw SysError, SysErrorFtpProtocol

        //file path: MLSD is not defined for files, LIST support is server-specific => filter the parent listing
        std::vector<FtpEntry> output;
        for (FtpEntry& entry : listFolder(getParentPath(path))) //throw SysError, SysErrorFtpProtocol
            if (entry.name == getBaseName(path))
                output.push_back(std::move(entry));
        return output;
    }

    void makeDir(const std::string& path) override //throw SysError, SysErrorFtpProtocol
    {
        std::lock_guard dummy(lockHandle_);
        runFtpCommands({"MKD " + cleanPath(path)}); //throw SysError, SysErrorFtpProtocol
    }

    void rename(const std::string& pathFrom, const std::string& pathTo) override //throw SysError, SysErrorFtpProtocol
    {
        std::lock_guard dummy(lockHandle_);
        runFtpCommands({"RNFR " + cleanPath(pathFrom),
                        "RNTO " + cleanPath(pathTo)}); //throw SysError, SysErrorFtpProtocol
    }

    std::unique_ptr<FtpByteSource> retrFrom(const std::string& path, uint64_t offset) override; //throw SysError, SysErrorFtpProtocol

    void storFrom(const std::string& path, uint64_t offset, const ReadBlockFun& readBlock /*throw X*/) override //throw SysError, SysErrorFtpProtocol, X
    {
        std::lock_guard dummy(lockHandle_);
        std::exception_ptr exception;

        auto getBytesToSend = [&](void* buffer, size_t bytesToRead) -> size_t
        {
            try
            {
                /*  libcurl calls back until 0 bytes are returned (Posix read() semantics)
                    [!] let's NOT use "incomplete read Posix semantics" for libcurl!   */
                return readBlock(buffer, bytesToRead); //throw X; return "bytesToRead" bytes unless end of stream
            }
            catch (...)
            {
                exception = std::current_exception();
                return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
            }
        };
        curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        std::vector<CurlOption> options =
        {
            {CURLOPT_UPLOAD, 1L},
            {CURLOPT_READDATA, &getBytesToSend},
            {CURLOPT_READFUNCTION, getBytesToSendWrapper},
        };

        //write at offset: "REST" + plain "STOR" (CURLOPT_RESUME_FROM_LARGE would make libcurl send "APPE" and append instead)
        curl_slist* preQuote = nullptr;
        RVFS_ON_SCOPE_EXIT(::curl_slist_free_all(preQuote));

        if (offset > 0)
        {
            const std::string restCmd = "REST " + numberTo<std::string>(offset);
            preQuote = ::curl_slist_append(preQuote, restCmd.c_str());
            if (!preQuote)
                throw SysError(formatSystemError("curl_slist_append", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));

            options.emplace_back(CURLOPT_PREQUOTE, preQuote);
        }

        try
        {
            perform(path, false /*isDir*/, CURLFTPMETHOD_NOCWD, options); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
        }
        catch (const SysError&)
        {
            if (exception)
                std::rethrow_exception(exception); //throw X
            throw;
        }
    }

    bool isSetTimeSupported() override //throw SysError
    {
        std::lock_guard dummy(lockHandle_);
        return getFeatures().mfmt; //throw SysError
    }

    void setTime(const std::string& path, time_t modTime) override //throw SysError, SysErrorFtpProtocol
    {
        const std::string ftpTime = formatTime(formatFtpTimeTag, getUtcTime(modTime));
        if (ftpTime.empty())
            throw SysError(L"Invalid modification time (time_t: " + numberTo<std::wstring>(modTime) + L')');

        std::lock_guard dummy(lockHandle_);
        runFtpCommands({"MFMT " + ftpTime + ' ' + cleanPath(path)}); //throw SysError, SysErrorFtpProtocol
    }

    bool isTimePreciseInList() override //throw SysError
    {
        std::lock_guard dummy(lockHandle_);
        return getFeatures().mlsd; //throw SysError
    }

    //context of download thread; blocks until the transfer is done or writeBlock() fails
    void download(const std::string& path, uint64_t offset,
                  const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) //throw SysError, SysErrorFtpProtocol, X
    {
        std::lock_guard dummy(lockHandle_);
        std::exception_ptr exception;

        auto onBytesReceived = [&](const void* buffer, size_t bytesToWrite)
        {
            try
            {
                writeBlock(buffer, bytesToWrite); //throw X
                return bytesToWrite;
            }
            catch (...)
            {
                exception = std::current_exception();
                return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
            }
        };
        curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        std::vector<CurlOption> options =
        {
            {CURLOPT_WRITEDATA, &onBytesReceived},
            {CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper},
            {CURLOPT_IGNORE_CONTENT_LENGTH, 1L}, //skip FTP "SIZE" command before download (=> download until actual EOF if file size changes)
        };
        if (offset > 0)
            options.emplace_back(CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset)); //"REST offset" before "RETR"

        try
        {
            perform(path, false /*isDir*/, CURLFTPMETHOD_NOCWD, options); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
        }
        catch (const SysError&)
        {
            if (exception)
                std::rethrow_exception(exception); //throw X
            throw;
        }
    }

private:
    CurlFtpClient           (const CurlFtpClient&) = delete;
    CurlFtpClient& operator=(const CurlFtpClient&) = delete;

    //requires lockHandle_
    const FtpFeatures& getFeatures() //throw SysError
    {
        if (!features_)
            //*: ignore error if server does not support/allow FEAT
            features_ = parseFeatResponse(runFtpCommands({"*FEAT"})); //throw SysError, (SysErrorFtpProtocol)
        return *features_;
    }

    //requires lockHandle_
    std::vector<FtpEntry> listFolder(const std::string& folderPath) //throw SysError, SysErrorFtpProtocol
    {
        std::string rawListing; //get raw FTP directory listing

        curl_write_callback onBytesReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& listing = *static_cast<std::string*>(callbackData);
            listing.append(buffer, size * nitems);
            return size * nitems;
        };

        std::vector<CurlOption> options =
        {
            {CURLOPT_WRITEDATA, &rawListing},
            {CURLOPT_WRITEFUNCTION, onBytesReceived},
        };
        curl_ftpmethod pathMethod = CURLFTPMETHOD_SINGLECWD;

        const bool useMlsd = getFeatures().mlsd; //throw SysError
        if (useMlsd)
        {
            options.emplace_back(CURLOPT_CUSTOMREQUEST, "MLSD");

            //some FTP servers process wildcards inside the MLSD path argument => CWD into such folders instead
            const std::string path = cleanPath(folderPath);
            const bool pathHasWildcards =
                contains(afterFirst(path, '[', IfNotFoundReturn::none), ']') ||
                contains(path, '*') ||
                contains(path, '?');

            if (!pathHasWildcards)
                pathMethod = CURLFTPMETHOD_NOCWD;
        }
        //else: use "LIST" + CURLFTPMETHOD_SINGLECWD

        perform(folderPath, true /*isDir*/, pathMethod, options); //throw SysError, SysErrorPassword, SysErrorFtpProtocol

        if (useMlsd)
            return parseMlsd(rawListing); //throw SysError
        else
            return parseListing(rawListing, std::time(nullptr)); //throw SysError
    }

    //requires lockHandle_; returns server response (header data)
    std::string runFtpCommands(const std::vector<std::string>& ftpCmds) //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    {
        curl_slist* quote = nullptr;
        RVFS_ON_SCOPE_EXIT(::curl_slist_free_all(quote));

        for (const std::string& cmd : ftpCmds)
            if (curl_slist* tmp = ::curl_slist_append(quote, cmd.c_str()))
                quote = tmp;
            else
                throw SysError(formatSystemError("curl_slist_append", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));

        return perform("/", true /*isDir*/, CURLFTPMETHOD_NOCWD /*avoid needless CWDs*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    }

    //requires lockHandle_
    std::string getCurlUrlPath(const std::string& itemPath, bool isDir) //throw SysError
    {
        std::string curlRelPath; //libcurl expects encoded paths (except for '/' char!!!)

        split(cleanPath(itemPath), FILE_NAME_SEPARATOR, [&](std::string_view comp)
        {
            if (!comp.empty())
            {
                char* compFmt = ::curl_easy_escape(easyHandle_, comp.data(), static_cast<int>(comp.size()));
                if (!compFmt)
                    throw SysError(formatSystemError("curl_easy_escape(" + std::string(comp) + ')', L"", L"Conversion failure"));
                RVFS_ON_SCOPE_EXIT(::curl_free(compFmt));

                if (!curlRelPath.empty())
                    curlRelPath += '/';
                curlRelPath += compFmt;
            }
        });

        if (trimCpy(sessionCfg_.authority.host).empty())
            throw SysError(_("Server name must not be empty."));

        /*  CURLFTPMETHOD_NOCWD requires absolute paths to unconditionally skip CWDs
              => use // because /%2f had bugs                                        */
        const std::string urlHost = getUrlHost();
        std::string path = std::string(sessionCfg_.protocol == FtpProtocol::ftps ? "ftps://" : "ftp://") +
                           (contains(urlHost, ':') ? '[' + urlHost + ']' : urlHost) + "//" + curlRelPath;

        if (isDir && !endsWith(path, '/')) //curl-FTP needs directory paths to end with a slash
            path += '/';
        return path;
    }

    //TLS: connect to the authority's host, but validate the certificate against the configured server name
    const std::string& getUrlHost() const
    {
        if (sessionCfg_.protocol != FtpProtocol::ftp &&
            !sessionCfg_.tls.serverName.empty())
            return sessionCfg_.tls.serverName;
        return sessionCfg_.authority.host;
    }

    //requires lockHandle_; returns server response (header data)
    std::string perform(const std::string& itemPath, bool isDir, curl_ftpmethod pathMethod,
                        const std::vector<CurlOption>& extraOptions) //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    {
        if (!easyHandle_)
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
        }
        else
            ::curl_easy_reset(easyHandle_);

        auto setOption = [easyHandle = easyHandle_](const CurlOption& curlOpt) { setCurlOption(easyHandle, curlOpt); }; //throw SysError

        char curlErrorBuf[CURL_ERROR_SIZE] = {};
        setOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

        std::string headerData;
        curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& output = *static_cast<std::string*>(callbackData);
            output.append(buffer, size * nitems);
            return size * nitems;
        };
        setOption({CURLOPT_HEADERDATA, &headerData}); //throw SysError
        setOption({CURLOPT_HEADERFUNCTION, onHeaderReceived}); //throw SysError

        setOption({CURLOPT_URL, getCurlUrlPath(itemPath, isDir).c_str()}); //throw SysError

        assert(pathMethod != CURLFTPMETHOD_MULTICWD); //too slow!
        setOption({CURLOPT_FTP_FILEMETHOD, pathMethod}); //throw SysError

        setOption({CURLOPT_USERNAME, username_.c_str()}); //throw SysError
        setOption({CURLOPT_PASSWORD, password_.c_str()}); //throw SysError

        const int port = resolvePort(sessionCfg_.authority);
        setOption({CURLOPT_PORT, port}); //throw SysError

        curl_slist* connectTo = nullptr;
        RVFS_ON_SCOPE_EXIT(::curl_slist_free_all(connectTo));
        if (getUrlHost() != sessionCfg_.authority.host)
        {
            auto fmtHost = [](const std::string& host) { return contains(host, ':') ? '[' + host + ']' : host; };
            const std::string mapping = fmtHost(getUrlHost()) + ':' + numberTo<std::string>(port) + ':' +
                                        fmtHost(sessionCfg_.authority.host) + ':' + numberTo<std::string>(port);
            connectTo = ::curl_slist_append(connectTo, mapping.c_str());
            if (!connectTo)
                throw SysError(formatSystemError("curl_slist_append", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
            setOption({CURLOPT_CONNECT_TO, connectTo}); //throw SysError
        }

        //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
        setOption({CURLOPT_NOSIGNAL, 1}); //throw SysError

        //allow PASV IP: some FTP servers really use IP different from control connection
        setOption({CURLOPT_FTP_SKIP_PASV_IP, 0}); //throw SysError

        setOption({CURLOPT_FTP_USE_EPSV, sessionCfg_.disableEpsv ? 0L : 1L}); //throw SysError

        setOption({CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(sessionCfg_.connectTimeout.count())}); //throw SysError

        //CURLOPT_TIMEOUT: "Since this puts a hard limit for how long time a request is allowed to take, it has limited use in dynamic use cases with varying transfer times."
        setOption({CURLOPT_LOW_SPEED_TIME, static_cast<long>(sessionCfg_.ioTimeout.count())}); //throw SysError
        setOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError
        //can't use "0" which means "inactive", so use some low number

        setOption({CURLOPT_SERVER_RESPONSE_TIMEOUT, static_cast<long>(sessionCfg_.ioTimeout.count())}); //throw SysError
        //FTP only; unlike CURLOPT_TIMEOUT, this one is NOT a limit on the total transfer time

        //long-running file uploads require keep-alives for the TCP control connection
        setOption({CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError

        std::optional<SysError> socketException;
        //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
        auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype /*purpose*/)
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1) //=> RACE-condition if other thread calls fork/execv before this thread sets FD_CLOEXEC!
            {
                socketException = SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno));
                return CURL_SOCKOPT_ERROR;
            }
            return CURL_SOCKOPT_OK;
        };

        using SocketCbType = decltype(onSocketCreate);
        using SocketCbWrapperType =            int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
        SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
        {
            return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        setOption({CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
        setOption({CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

        std::exception_ptr traceException;
        auto onDebugInfo = [&](curl_infotype type, const char* data, size_t size)
        {
            const char* prefix = [type]() -> const char*
            {
                switch (type)
                {
                    //*INDENT-OFF*
                    case CURLINFO_TEXT:       return "* ";
                    case CURLINFO_HEADER_IN:  return "< ";
                    case CURLINFO_HEADER_OUT: return "> ";
                    default:                  return nullptr; //skip payload
                    //*INDENT-ON*
                }
            }();
            if (prefix && !traceException)
                try
                {
                    split2(std::string_view(data, size), isLineBreak<char>, [&](std::string_view line)
                    {
                        if (!line.empty())
                            sessionCfg_.debugTrace(prefix + (type == CURLINFO_HEADER_OUT && startsWith(line, "PASS ") ?
                                                             std::string("PASS ***") : std::string(line))); //throw X
                    });
                }
                catch (...) { traceException = std::current_exception(); } //rethrown after curl_easy_perform()
            return 0;
        };

        using DebugCbType = decltype(onDebugInfo);
        using DebugCbWrapperType =          int (*)(CURL* handle, curl_infotype type, char* data, size_t size, DebugCbType* clientp);
        DebugCbWrapperType onDebugInfoWrapper = [](CURL* /*handle*/, curl_infotype type, char* data, size_t size, DebugCbType* clientp)
        {
            return (*clientp)(type, data, size);
        };

        if (sessionCfg_.debugTrace)
        {
            setOption({CURLOPT_DEBUGFUNCTION, onDebugInfoWrapper}); //throw SysError
            setOption({CURLOPT_DEBUGDATA, &onDebugInfo}); //throw SysError
            setOption({CURLOPT_VERBOSE, 1L}); //throw SysError
        }

        if (sessionCfg_.protocol != FtpProtocol::ftp)
        {
            const long sslVersion = [&]
            {
                switch (sessionCfg_.tls.minVersion)
                {
                    //*INDENT-OFF*
                    case TlsVersion::tls1_0: return CURL_SSLVERSION_TLSv1_0;
                    case TlsVersion::tls1_1: return CURL_SSLVERSION_TLSv1_1;
                    case TlsVersion::tls1_2: return CURL_SSLVERSION_TLSv1_2;
                    case TlsVersion::tls1_3: return CURL_SSLVERSION_TLSv1_3;
                    //*INDENT-ON*
                }
                throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
            }();
            setOption({CURLOPT_SSLVERSION, sslVersion}); //throw SysError

            if (sessionCfg_.tls.verifyPeer)
            {
                setOption({CURLOPT_SSL_VERIFYPEER, 1}); //throw SysError
                setOption({CURLOPT_SSL_VERIFYHOST, 2}); //throw SysError
            }
            else
            {
                setOption({CURLOPT_CAINFO, 0}); //throw SysError
                //be explicit: "even when [CURLOPT_SSL_VERIFYPEER] is disabled [...] curl may still load the certificate file specified in CURLOPT_CAINFO."
                setOption({CURLOPT_SSL_VERIFYPEER, 0}); //throw SysError
                setOption({CURLOPT_SSL_VERIFYHOST, 0}); //throw SysError
            }

            if (sessionCfg_.protocol == FtpProtocol::ftpes) //https://tools.ietf.org/html/rfc4217
            {
                //require SSL for both control and data:
                setOption({CURLOPT_USE_SSL,    CURLUSESSL_ALL}); //throw SysError
                //try TLS first, then SSL (currently: CURLFTPAUTH_DEFAULT == CURLFTPAUTH_SSL):
                setOption({CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS}); //throw SysError
            }
        }

        for (const CurlOption& option : extraOptions)
            setOption(option); //throw SysError

        //=======================================================================================================
        const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
        //curl_easy_perform() considers FTP response codes >= 400 as failure
        //=> prefix FTP commands with * to ignore: https://curl.se/libcurl/c/CURLOPT_QUOTE.html

        if (socketException)
            throw* socketException; //throw SysError

        if (traceException)
            std::rethrow_exception(traceException);
        //=======================================================================================================

        if (rcPerf != CURLE_OK)
        {
            std::wstring errorMsg = trimCpy(utfTo<std::wstring>(curlErrorBuf)); //optional

            if (const std::vector<std::string_view>& headerLines = splitFtpResponse(headerData);
                !headerLines.empty())
                if (const std::string_view& response = trimCpy(headerLines.back()); //that *should* be the server's error response
                    !response.empty())
                    errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(response);

            if (rcPerf == CURLE_LOGIN_DENIED)
                throw SysErrorPassword(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));

            long ftpStatusCode = 0; //optional
            /*const CURLcode rc =*/ ::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatusCode);
            //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
            if (ftpStatusCode >= 400)
                throw SysErrorFtpProtocol(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg), ftpStatusCode);

            throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
        }

        return headerData;
    }

    const FtpSessionCfg sessionCfg_;
    std::string username_;
    std::string password_;

    std::mutex lockHandle_; //one transfer at a time on the control connection
    CURL* easyHandle_ = nullptr;
    std::optional<FtpFeatures> features_;
};

//===========================================================================================================================

class FtpDownloadStream : public FtpByteSource
{
public:
    FtpDownloadStream(const std::shared_ptr<CurlFtpClient>& client, const std::string& filePath, uint64_t offset) //throw SysError, SysErrorFtpProtocol
    {
        std::promise<void> promiseStarted;
        std::future<void> futStarted = promiseStarted.get_future();

        worker_ = InterruptibleThread([asyncStreamOut = this->asyncStreamIn_, client, filePath, offset, promiseStarted = std::move(promiseStarted)]() mutable
        {
            setCurrentThreadName("Download " + getBaseName(filePath));

            bool started = false;
            auto notifyStarted = [&]
            {
                if (!started)
                {
                    started = true;
                    promiseStarted.set_value();
                }
            };

            try
            {
                client->download(filePath, offset, [&](const void* buffer, size_t bytesToWrite)
                {
                    notifyStarted();
                    asyncStreamOut->write(buffer, bytesToWrite); //throw ThreadStopRequest
                }); //throw SysError, ThreadStopRequest

                notifyStarted();
                asyncStreamOut->closeStream();
            }
            catch (const SysError&) //let ThreadStopRequest pass through!
            {
                if (!started)
                {
                    started = true;
                    promiseStarted.set_exception(std::current_exception());
                }
                asyncStreamOut->setWriteError(std::current_exception());
            }
        });

        try
        {
            futStarted.get(); //throw SysError, SysErrorFtpProtocol
        }
        catch (const SysError&)
        {
            close();
            throw;
        }
    }

    ~FtpDownloadStream() { close(); }

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw SysError
    {
        if (closed_)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation! Read after close().");

        return asyncStreamIn_->tryRead(buffer, bytesToRead); //throw SysError
    }

    void close() override
    {
        if (!closed_)
        {
            closed_ = true;
            asyncStreamIn_->setReadError(std::make_exception_ptr(ThreadStopRequest())); //unblock a worker waiting for buffer space
            worker_.requestStop();
            if (worker_.joinable())
                worker_.join();
        }
    }

private:
    FtpDownloadStream           (const FtpDownloadStream&) = delete;
    FtpDownloadStream& operator=(const FtpDownloadStream&) = delete;

    bool closed_ = false;
    const std::shared_ptr<AsyncStreamBuffer> asyncStreamIn_ = std::make_shared<AsyncStreamBuffer>(FTP_STREAM_BUFFER_SIZE);
    InterruptibleThread worker_;
};


std::unique_ptr<FtpByteSource> CurlFtpClient::retrFrom(const std::string& path, uint64_t offset) //throw SysError, SysErrorFtpProtocol
{
    return std::make_unique<FtpDownloadStream>(shared_from_this(), path, offset); //throw SysError, SysErrorFtpProtocol
}
}


std::shared_ptr<FtpClient> vfs::dialFtpClient(const ExecContext& ctx, const Authority& authority, const FtpOptions& options) //throw SysError, SysErrorPassword
{
    FtpSessionCfg cfg;
    cfg.authority      = authority;
    cfg.protocol       = resolveProtocol(options); //throw SysError
    cfg.disableEpsv    = resolveDisableEpsv(options);
    cfg.tls            = resolveTlsConfig(options, authority);
    cfg.connectTimeout = resolveConnectTimeout(options, ctx); //throw SysError
    cfg.ioTimeout      = std::chrono::duration_cast<std::chrono::seconds>(options.dialTimeout > std::chrono::milliseconds(0) ?
                                                                           options.dialTimeout : std::chrono::milliseconds(DEFAULT_DIAL_TIMEOUT));
    if (cfg.ioTimeout < std::chrono::seconds(1))
        cfg.ioTimeout = std::chrono::seconds(1);
    cfg.debugTrace     = options.debugTrace;

    auto client = std::make_shared<CurlFtpClient>(cfg); //throw SysError
    client->login(resolveUsername(options, authority), resolvePassword(options)); //throw SysError, SysErrorPassword

    if (ctx.isDone())
        throw SysError(L"Operation cancelled or deadline exceeded while logging in.");
    return client;
}
