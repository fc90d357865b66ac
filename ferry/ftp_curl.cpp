// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "ftp_curl.h"
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "ftp_common.h"

using namespace ferry;


namespace
{
void appendCommand(curl_slist*& quote, const std::string& ftpCmd) //throw SysError
{
    curl_slist* quoteNew = ::curl_slist_append(quote, ftpCmd.c_str());
    if (!quoteNew)
        throw SysError(formatSystemError("curl_slist_append", L"", L"Out of memory."));
    quote = quoteNew;
}
}


FtpQuoteCommands ferry::getFtpQuoteCommands(const FtpRequest& request)
{
    const std::string itemName = decodeUriComponent(afterLast(request.uri, '/', IfNotFoundReturn::all));

    FtpQuoteCommands quote;
    quote.url = beforeLast(request.uri, '/', IfNotFoundReturn::none) + '/';

    switch (request.method)
    {
        case FtpMethod::remove:
            quote.commands.push_back("DELE " + itemName);
            return quote;
        case FtpMethod::makeDir:
            quote.commands.push_back("MKD " + itemName);
            return quote;
        case FtpMethod::removeDir:
            quote.commands.push_back("RMD " + itemName);
            return quote;
        case FtpMethod::rename:
            quote.commands.push_back("RNFR " + itemName);
            quote.commands.push_back("RNTO " + request.renameTo);
            return quote;

        case FtpMethod::list:
        case FtpMethod::retrieve:
        case FtpMethod::store:
            break;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


std::string CurlFtpTransport::perform(const FtpRequest& request,
                                      const std::function<void  (std::span<const char> buf)>& writeResponse,
                                      const std::function<size_t(std::span<      char> buf)>& readRequest) //throw SysError, SysErrorFtpProtocol, SysErrorPassword, X
{
    const SecureSecret password = request.password.secureHandle(); //keep alive until curl is done

    std::vector<CurlOption> options;

    if (!request.username.empty()) //else: libcurl handles anonymous login for us (including fake email as password)
    {
        options.emplace_back(CURLOPT_USERNAME, request.username.c_str());
        options.emplace_back(CURLOPT_PASSWORD, password.c_str());
    }

    //default is 60 sec
    options.emplace_back(CURLOPT_SERVER_RESPONSE_TIMEOUT, request.timeoutSec);

    //be explicit: "even when [CURLOPT_SSL_VERIFYPEER] is disabled [...] curl may still load the certificate file specified in CURLOPT_CAINFO."
    options.emplace_back(CURLOPT_CAINFO, 0);
    options.emplace_back(CURLOPT_SSL_VERIFYPEER, 0);
    options.emplace_back(CURLOPT_SSL_VERIFYHOST, 0);

    if (request.useTls) //https://tools.ietf.org/html/rfc4217
    {
        //require SSL for both control and data:
        options.emplace_back(CURLOPT_USE_SSL, CURLUSESSL_ALL);
        //try TLS first, then SSL:
        options.emplace_back(CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS);
    }

    std::string url = request.uri;
    std::function<void(std::span<const char> buf)> onResponse = writeResponse;

    curl_slist* quote = nullptr;
    FERRY_ON_SCOPE_EXIT(::curl_slist_free_all(quote));

    switch (request.method)
    {
        case FtpMethod::list:
            options.emplace_back(CURLOPT_DIRLISTONLY, 1); //NLST
            break;

        case FtpMethod::retrieve:
            break;

        case FtpMethod::store:
            if (!readRequest)
                throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
            break;

        case FtpMethod::remove:
        case FtpMethod::makeDir:
        case FtpMethod::removeDir:
        case FtpMethod::rename:
        {
            const FtpQuoteCommands quoteCmds = getFtpQuoteCommands(request);
            url = quoteCmds.url;
            for (const std::string& ftpCmd : quoteCmds.commands)
                appendCommand(quote, ftpCmd); //throw SysError

            options.emplace_back(CURLOPT_NOBODY, 1); //no data transfer
            options.emplace_back(CURLOPT_QUOTE, quote);
        }
        break;
    }

    if (!onResponse && !readRequest) //else libcurl writes to stdout
        onResponse = [](std::span<const char> /*buf*/) {};

    try
    {
        CurlSession session;
        return session.perform(url, options, onResponse, readRequest, request.timeoutSec); //throw SysError, SysErrorCurl, X
    }
    catch (const SysErrorCurl& e)
    {
        //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
        if (e.responseCode != 0) //includes "530 Not logged in" for CURLE_LOGIN_DENIED
            throw SysErrorFtpProtocol(e.toString(), e.responseCode);

        if (e.curlCode == CURLE_LOGIN_DENIED)
            throw SysErrorPassword(e.toString());
        throw;
    }
}
