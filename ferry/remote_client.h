// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef REMOTE_CLIENT_H_9026471835502189
#define REMOTE_CLIENT_H_9026471835502189

#include <map>
#include <memory>
#include "remote_driver.h"


namespace ferry
{
/*  one API for FTP and SFTP: routes every call by ConnectionDescriptor::getProtocol()

    - empty required arguments fail with ErrorInvalidArgument before any I/O
    - directory transfer fails with ErrorUnsupported before any transfer I/O
    - each operation is recorded in the extra log                               */
class RemoteClient
{
public:
    RemoteClient(); //FTP via libcurl, SFTP via libssh2
    explicit RemoteClient(std::map<Protocol, std::unique_ptr<RemoteDriver>>&& drivers);

    std::vector<std::string> listDirectory(const ConnectionDescriptor& conn); //throw ErrorRemoteOperation, ErrorUnsupported

    //destinationName: empty => local file name
    void upload(const ConnectionDescriptor& conn, const Zstring& sourcePath, const std::string& destinationName = {});
    //throw ErrorInvalidArgument, ErrorUnsupported, ErrorLocalIo, ErrorRemoteOperation

    //writes destinationPath/destinationName; destinationName: empty => sourceName
    void download(const ConnectionDescriptor& conn, const std::string& sourceName, const Zstring& destinationPath, const std::string& destinationName = {});
    //throw ErrorInvalidArgument, ErrorUnsupported, ErrorLocalIo, ErrorRemoteOperation

    void deleteFile     (const ConnectionDescriptor& conn, const std::string& itemName);                             //throw ErrorInvalidArgument, ErrorRemoteOperation
    void renameFile     (const ConnectionDescriptor& conn, const std::string& itemName, const std::string& newName); //throw ErrorInvalidArgument, ErrorRemoteOperation
    void makeDirectory  (const ConnectionDescriptor& conn, const std::string& folderName);                           //throw ErrorInvalidArgument, ErrorRemoteOperation
    void removeDirectory(const ConnectionDescriptor& conn, const std::string& folderName);                           //throw ErrorInvalidArgument, ErrorRemoteOperation

    PathType getPathType(const ConnectionDescriptor& conn, const std::string& itemName); //throw ErrorInvalidArgument, ErrorRemoteOperation

private:
    RemoteClient           (const RemoteClient&) = delete;
    RemoteClient& operator=(const RemoteClient&) = delete;

    RemoteDriver& getDriver(Protocol protocol) const; //throw ErrorUnsupported

    const std::map<Protocol, std::unique_ptr<RemoteDriver>> drivers_;
};
}

#endif //REMOTE_CLIENT_H_9026471835502189
