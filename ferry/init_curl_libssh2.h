// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef INIT_CURL_LIBSSH2_H_1958274630491827
#define INIT_CURL_LIBSSH2_H_1958274630491827

#include <memory>


namespace ferry
{
/*  process-wide OpenSSL/libcurl/libssh2 initialization:
    - every live FTP transport and SFTP session holds a cookie
    - first cookie initializes the libraries, last one to go tears them down   */
class NetworkInitCookie
{
public:
    NetworkInitCookie();
    ~NetworkInitCookie();

private:
    NetworkInitCookie           (const NetworkInitCookie&) = delete;
    NetworkInitCookie& operator=(const NetworkInitCookie&) = delete;
};

std::shared_ptr<NetworkInitCookie> acquireNetworkInit();

int getNetworkInitLevel(); //number of live cookies
}

#endif //INIT_CURL_LIBSSH2_H_1958274630491827
