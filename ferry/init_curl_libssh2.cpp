// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "init_curl_libssh2.h"
#include <mutex>
#include <openssl/ssl.h>
#include <libcurl/curl_wrap.h>    //DON'T include <curl/curl.h> directly!
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!

using namespace ferry;


namespace
{
std::mutex initLock;
int initLevel = 0; //protected by initLock; support interleaving FTP and SFTP usage


void libsshCurlUnifiedInit() //nothrow
{
    try
    {
        //explicit OpenSSL init: libcurl and libssh2 may be linked against the same instance
        ASSERT_SYSERROR(::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) == 1);

        ASSERT_SYSERROR(::curl_global_init(CURL_GLOBAL_NOTHING /*OpenSSL is already set up*/) == CURLE_OK);

        if (const int rc = ::libssh2_init(0);
            rc != 0)
            throw SysError(formatSystemError("libssh2_init", formatSshStatusCode(rc), L""));
    }
    catch (const SysError& e) { logExtraError(_("Error during process initialization.") + L"\n\n" + e.toString()); }
}


void libsshCurlUnifiedTearDown()
{
    ::libssh2_exit();
    ::curl_global_cleanup();
    //OpenSSL >= 1.1 cleans up itself at process exit
}
}


NetworkInitCookie::NetworkInitCookie()
{
    std::lock_guard dummy(initLock);
    assert(initLevel >= 0);
    if (++initLevel == 1)
        libsshCurlUnifiedInit();
}


NetworkInitCookie::~NetworkInitCookie()
{
    std::lock_guard dummy(initLock);
    assert(initLevel >= 1);
    if (--initLevel == 0)
        libsshCurlUnifiedTearDown();
}


std::shared_ptr<NetworkInitCookie> ferry::acquireNetworkInit()
{
    return std::make_shared<NetworkInitCookie>();
}


int ferry::getNetworkInitLevel()
{
    std::lock_guard dummy(initLock);
    return initLevel;
}
