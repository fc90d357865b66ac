// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef REMOTE_DRIVER_H_3390718264450127
#define REMOTE_DRIVER_H_3390718264450127

#include <vector>
#include "connection.h"


namespace ferry
{
enum class PathType
{
    file,
    folder,
};

DEFINE_NEW_SYS_ERROR(SysErrorPassword) //server rejected the credentials


//one protocol; no state is kept between two calls: every operation connects on its own
//item names are relative to ConnectionDescriptor::getWorkingPath()
struct RemoteDriver
{
    virtual ~RemoteDriver() {}

    //names in server order
    virtual std::vector<std::string> listDirectory(const ConnectionDescriptor& conn) = 0; //throw ErrorRemoteOperation

    virtual PathType getPathType(const ConnectionDescriptor& conn, const std::string& itemName) = 0; //throw ErrorRemoteOperation

    //localFilePath must be an existing file
    virtual void uploadFile  (const ConnectionDescriptor& conn, const Zstring& localFilePath, const std::string& itemName) = 0; //throw ErrorRemoteOperation, ErrorLocalIo
    //overwrites localFilePath transactionally
    virtual void downloadFile(const ConnectionDescriptor& conn, const std::string& itemName, const Zstring& localFilePath) = 0; //throw ErrorRemoteOperation, ErrorLocalIo

    virtual void deleteFile     (const ConnectionDescriptor& conn, const std::string& itemName) = 0; //throw ErrorRemoteOperation
    virtual void renameFile     (const ConnectionDescriptor& conn, const std::string& itemName, const std::string& newName) = 0; //throw ErrorRemoteOperation
    virtual void makeDirectory  (const ConnectionDescriptor& conn, const std::string& folderName) = 0; //throw ErrorRemoteOperation
    virtual void removeDirectory(const ConnectionDescriptor& conn, const std::string& folderName) = 0; //throw ErrorRemoteOperation
};
}

#endif //REMOTE_DRIVER_H_3390718264450127
