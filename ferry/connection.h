// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CONNECTION_H_8143750926381572
#define CONNECTION_H_8143750926381572

#include <base/file_error.h>
#include "credential.h"


namespace ferry
{
enum class Protocol
{
    ftp,
    sftp,
};

const int DEFAULT_PORT_FTP  = 21;
const int DEFAULT_PORT_SFTP = 22;
const int DEFAULT_TIMEOUT_SEC = 10;

struct TransportOptions
{
    int timeoutSec = DEFAULT_TIMEOUT_SEC;
    bool useTls    = false; //FTP only: explicit TLS ("AUTH TLS") for control and data connection
    bool allowZlib = false; //SFTP only

    bool operator==(const TransportOptions&) const = default;
};


//everything needed to reach a remote folder; no session state
class ConnectionDescriptor
{
public:
    ConnectionDescriptor(Protocol protocol, const std::string& host, int port = 0 /*0: protocol default*/,
                         const std::string& username = {}, const Credential& secret = Credential()); //throw ErrorInvalidArgument

    Protocol           getProtocol() const { return protocol_; }
    const std::string& getHost    () const { return host_; }
    int                getPort    () const { return port_; } //0 if not set
    const std::string& getUsername() const { return username_; }
    const Credential&  getSecret  () const { return secret_; }

    //remote folder all item names are relative to; empty: login directory
    const std::string& getWorkingPath() const { return workingPath_; }
    void setWorkingPath(const std::string& workingPath) { workingPath_ = workingPath; }

    TransportOptions options;

    bool operator==(const ConnectionDescriptor& other) const; //ports compare by effective value

private:
    Protocol protocol_;
    std::string host_;
    int port_ = 0;
    std::string username_;
    Credential secret_;
    std::string workingPath_;
};

int getDefaultPort(Protocol protocol);
int getEffectivePort(const ConnectionDescriptor& conn);

std::wstring getProtocolName(Protocol protocol);

//user-visible path for error messages and logs; never includes the password
std::wstring getDisplayPath(const ConnectionDescriptor& conn, const std::string& itemName = {});

/*  connection phrases:
        ftp://[user[:pass]@]host[:port][/path][|option...]
        sftp://[user[:pass]@]host[:port][/path][|option...]

    options: timeout=N, ssl (FTP), zlib (SFTP), pass64=<base64>         */
ConnectionDescriptor parseConnectionPhrase(std::string_view phrase); //throw ErrorInvalidArgument
std::string formatConnectionPhrase(const ConnectionDescriptor& conn);
}

#endif //CONNECTION_H_8143750926381572
