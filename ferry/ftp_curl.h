// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FTP_CURL_H_6120458397714362
#define FTP_CURL_H_6120458397714362

#include <vector>
#include "ftp.h"
#include "init_curl_libssh2.h"


namespace ferry
{
//libcurl has no URL semantics for these methods: run raw commands inside the parent folder
struct FtpQuoteCommands
{
    std::string url; //parent folder, ending with '/'
    std::vector<std::string> commands;
};
FtpQuoteCommands getFtpQuoteCommands(const FtpRequest& request); //for FtpMethod::remove, makeDir, removeDir, rename only


//FtpTransport over libcurl: new control connection for every request
class CurlFtpTransport : public FtpTransport
{
public:
    CurlFtpTransport() : initCookie_(acquireNetworkInit()) {}

    std::string perform(const FtpRequest& request,
                        const std::function<void  (std::span<const char> buf)>& writeResponse,
                        const std::function<size_t(std::span<      char> buf)>& readRequest) override; //throw SysError, SysErrorFtpProtocol, SysErrorPassword, X
private:
    const std::shared_ptr<NetworkInitCookie> initCookie_;
};
}

#endif //FTP_CURL_H_6120458397714362
