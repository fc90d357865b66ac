// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "curl_wrap.h"
#include <fcntl.h>

using namespace ferry;


CurlSession::~CurlSession()
{
    if (easyHandle_)
        ::curl_easy_cleanup(easyHandle_);
}


std::string CurlSession::perform(const std::string& url, const std::vector<CurlOption>& extraOptions,
                                 const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/, //optional
                                 const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/, //optional; return "bytesToRead" bytes unless end of stream!
                                 int timeoutSec) //throw SysError, SysErrorCurl, X
{
    if (!easyHandle_)
    {
        easyHandle_ = ::curl_easy_init();
        if (!easyHandle_)
            throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
    }
    else
        ::curl_easy_reset(easyHandle_);

    auto setCurlOption = [easyHandle = easyHandle_](const CurlOption& curlOpt) //throw SysError
    {
        if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
            rc != CURLE_OK)
            throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                             formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
    };

    char curlErrorBuf[CURL_ERROR_SIZE] = {};
    setCurlOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

    std::string headerData;
    curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        auto& output = *static_cast<std::string*>(callbackData);
        output.append(buffer, size * nitems);
        return size * nitems;
    };
    setCurlOption({CURLOPT_HEADERDATA, &headerData}); //throw SysError
    setCurlOption({CURLOPT_HEADERFUNCTION, onHeaderReceived}); //throw SysError

    setCurlOption({CURLOPT_URL, url.c_str()}); //throw SysError

    //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
    setCurlOption({CURLOPT_NOSIGNAL, 1}); //throw SysError

    setCurlOption({CURLOPT_CONNECTTIMEOUT, timeoutSec}); //throw SysError

    //CURLOPT_TIMEOUT would limit the total transfer time => use a low-speed limit instead
    setCurlOption({CURLOPT_LOW_SPEED_TIME, timeoutSec}); //throw SysError
    setCurlOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError
    //can't use "0" which means "inactive", so use some low number

    //long-running file uploads require keep-alives for the TCP control connection
    setCurlOption({CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError

    std::exception_ptr userCallbackException;

    //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
    auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype /*purpose*/)
    {
        if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1) //=> RACE-condition if other thread calls fork/execv before this thread sets FD_CLOEXEC!
        {
            userCallbackException = std::make_exception_ptr(SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno)));
            return CURL_SOCKOPT_ERROR;
        }
        return CURL_SOCKOPT_OK;
    };

    using SocketCbType = decltype(onSocketCreate);
    using SocketCbWrapperType = int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
    SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
    {
        return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
    };

    setCurlOption({CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
    setCurlOption({CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

    //---------------------------------------------------
    auto onBytesReceived = [&](const char* buffer, size_t bytesToWrite)
    {
        try
        {
            writeResponse({buffer, bytesToWrite}); //throw X
            return bytesToWrite;
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
        }
    };
    curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems);
    };
    //---------------------------------------------------
    auto getBytesToSend = [&](char* buffer, size_t bytesToRead) -> size_t
    {
        try
        {
            //libcurl calls back until 0 bytes are returned (Posix read() semantics)
            return readRequest({buffer, bytesToRead}); //throw X; return "bytesToRead" bytes unless end of stream
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
        }
    };
    curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems);
    };
    //---------------------------------------------------
    if (writeResponse)
    {
        setCurlOption({CURLOPT_WRITEDATA, &onBytesReceived}); //throw SysError
        setCurlOption({CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper}); //throw SysError
    }
    if (readRequest)
    {
        setCurlOption({CURLOPT_UPLOAD, 1}); //throw SysError
        setCurlOption({CURLOPT_READDATA, &getBytesToSend}); //throw SysError
        setCurlOption({CURLOPT_READFUNCTION, getBytesToSendWrapper}); //throw SysError
    }

    if (std::any_of(extraOptions.begin(), extraOptions.end(), [](const CurlOption& o) { return o.option == CURLOPT_WRITEFUNCTION || o.option == CURLOPT_READFUNCTION; }))
    /**/ throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!"); //Option already used here!

    for (const CurlOption& option : extraOptions)
        setCurlOption(option); //throw SysError

    //=======================================================================================================
    const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
    //curl_easy_perform() considers FTP response codes >= 400 as failure

    if (userCallbackException)
        std::rethrow_exception(userCallbackException); //throw X
    //=======================================================================================================

    if (rcPerf != CURLE_OK)
    {
        std::wstring errorMsg = trimCpy(utfTo<std::wstring>(curlErrorBuf)); //optional

        //the last line *should* be the server's error response
        std::string_view lastResponse;
        split(headerData, '\n', [&](std::string_view line)
        {
            if (const std::string line2 = trimCpy(std::string(line));
                !line2.empty())
                lastResponse = line;
        });
        if (const std::string response = trimCpy(std::string(lastResponse));
            !response.empty())
            errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(response);

        long responseCode = 0; //optional
        /*const CURLcode rc =*/ ::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &responseCode);

        throw SysErrorCurl(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg), rcPerf, responseCode);
    }

    return headerData;
}


std::wstring ferry::formatCurlStatusCode(CURLcode sc)
{
    switch (sc)
    {
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_OK);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_UNSUPPORTED_PROTOCOL);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FAILED_INIT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_URL_MALFORMAT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_NOT_BUILT_IN);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_PROXY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_HOST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_CONNECT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_WEIRD_SERVER_REPLY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_ACCESS_DENIED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASS_REPLY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_TIMEOUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASV_REPLY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_227_FORMAT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_CANT_GET_HOST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_SET_TYPE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_PARTIAL_FILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_RETR_FILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_QUOTE_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_WRITE_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_UPLOAD_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_READ_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_OUT_OF_MEMORY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_OPERATION_TIMEDOUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PORT_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_USE_REST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_RANGE_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CONNECT_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_DOWNLOAD_RESUME);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_ABORTED_BY_CALLBACK);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_FUNCTION_ARGUMENT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_INTERFACE_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_UNKNOWN_OPTION);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_GOT_NOTHING);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_RECV_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CERTPROBLEM);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CIPHER);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_PEER_FAILED_VERIFICATION);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FILESIZE_EXCEEDED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_USE_SSL_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_FAIL_REWIND);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_LOGIN_DENIED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_DISK_FULL);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_EXISTS);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CACERT_BADFILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_NOT_FOUND);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_SHUTDOWN_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_AGAIN);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PRET_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_BAD_FILE_LIST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_NO_CONNECTION_AVAILABLE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_AUTH_ERROR);
        default:
            break;
    }
    return replaceCpy<std::wstring>(L"Curl status %x", L"%x", numberTo<std::wstring>(static_cast<int>(sc)));
}
