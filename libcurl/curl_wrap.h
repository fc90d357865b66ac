// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CURL_WRAP_H_4918265037712840
#define CURL_WRAP_H_4918265037712840

#include <span>
#include <functional>
#include <vector>
#include <base/sys_error.h>


//-------------------------------------------------
#include <curl/curl.h>
//-------------------------------------------------

#ifndef CURLINC_CURL_H
    #error curl.h header guard changed
#endif

namespace ferry
{
struct CurlOption
{
    template <class T>
    CurlOption(CURLoption o, T val) : option(o), value(static_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    template <class T>
    CurlOption(CURLoption o, T* val) : option(o), value(reinterpret_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    CURLoption option = CURLOPT_LASTENTRY;
    uint64_t value = 0;
};


//curl_easy_perform() failed: keep the raw codes for protocol-specific error mapping
struct SysErrorCurl : public SysError
{
    SysErrorCurl(const std::wstring& msg, CURLcode rc, long response) : SysError(msg), curlCode(rc), responseCode(response) {}

    CURLcode curlCode = CURLE_OK;
    long responseCode = 0; //protocol status, e.g. FTP reply code; 0 if not available
};


//one easy handle per session; one request per perform()
class CurlSession
{
public:
    CurlSession() {}
    ~CurlSession();

    //returns server response (header data)
    std::string perform(const std::string& url, const std::vector<CurlOption>& extraOptions,
                        const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/, //optional
                        const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/, //optional; return "bytesToRead" bytes unless end of stream!
                        int timeoutSec); //throw SysError, SysErrorCurl, X

private:
    CurlSession           (const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    CURL* easyHandle_ = nullptr;
};


std::wstring formatCurlStatusCode(CURLcode sc);
}

#else
#error Why is this header already defined? Do not include in other headers: encapsulate the gory details!
#endif //CURL_WRAP_H_4918265037712840
