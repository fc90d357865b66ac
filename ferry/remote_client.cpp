// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "remote_client.h"
#include <base/file_access.h>
#include "ftp_curl.h"
#include "sftp_libssh2.h"

using namespace ferry;


namespace
{
std::map<Protocol, std::unique_ptr<RemoteDriver>> createDefaultDrivers()
{
    std::map<Protocol, std::unique_ptr<RemoteDriver>> drivers;
    drivers.emplace(Protocol::ftp,  std::make_unique<FtpDriver >(std::make_shared<CurlFtpTransport>()));
    drivers.emplace(Protocol::sftp, std::make_unique<SftpDriver>(getLibssh2SessionFactory()));
    return drivers;
}


void checkArgument(const std::string& value, const wchar_t* argName) //throw ErrorInvalidArgument
{
    if (value.empty())
        throw ErrorInvalidArgument(replaceCpy(_("Argument %x must not be empty."), L"%x", argName));
}


//the log shows what was attempted and, on failure, why
template <class Function> inline
auto runLogged(const std::wstring& operationMsg, Function fun) //throw FileError
{
    logExtraInfo(operationMsg);
    try
    {
        return fun(); //throw FileError
    }
    catch (const FileError& e)
    {
        logExtraError(e.toString());
        throw;
    }
}


std::wstring getDirectoryTransferMsg()
{
    return _("Directory transfer is not supported.");
}
}


RemoteClient::RemoteClient() : drivers_(createDefaultDrivers()) {}


RemoteClient::RemoteClient(std::map<Protocol, std::unique_ptr<RemoteDriver>>&& drivers) : drivers_(std::move(drivers)) {}


RemoteDriver& RemoteClient::getDriver(Protocol protocol) const //throw ErrorUnsupported
{
    if (auto it = drivers_.find(protocol);
        it != drivers_.end() && it->second)
        return *it->second;

    throw ErrorUnsupported(replaceCpy(_("Protocol %x is not supported."), L"%x", getProtocolName(protocol)));
}


std::vector<std::string> RemoteClient::listDirectory(const ConnectionDescriptor& conn) //throw ErrorRemoteOperation, ErrorUnsupported
{
    return runLogged(replaceCpy(_("Listing directory %x"), L"%x", fmtPath(getDisplayPath(conn))), [&]
    {
        return getDriver(conn.getProtocol()).listDirectory(conn); //throw ErrorRemoteOperation, ErrorUnsupported
    });
}


void RemoteClient::upload(const ConnectionDescriptor& conn, const Zstring& sourcePath, const std::string& destinationName)
//throw ErrorInvalidArgument, ErrorUnsupported, ErrorLocalIo, ErrorRemoteOperation
{
    checkArgument(sourcePath, L"sourcePath"); //throw ErrorInvalidArgument

    const std::string itemName = destinationName.empty() ? getItemName(sourcePath) : destinationName;
    checkArgument(itemName, L"destinationName"); //throw ErrorInvalidArgument

    runLogged(replaceCpy(replaceCpy(_("Uploading %x to %y"), L"%x", fmtPath(sourcePath)), L"%y", fmtPath(getDisplayPath(conn, itemName))), [&]
    {
        RemoteDriver& driver = getDriver(conn.getProtocol()); //throw ErrorUnsupported

        if (getItemTypeFollowLink(sourcePath) == ItemType::folder) //throw ErrorLocalIo
            throw ErrorUnsupported(replaceCpy(_("Cannot upload %x."), L"%x", fmtPath(sourcePath)), getDirectoryTransferMsg());

        driver.uploadFile(conn, sourcePath, itemName); //throw ErrorRemoteOperation, ErrorLocalIo
    });
}


void RemoteClient::download(const ConnectionDescriptor& conn, const std::string& sourceName, const Zstring& destinationPath, const std::string& destinationName)
//throw ErrorInvalidArgument, ErrorUnsupported, ErrorLocalIo, ErrorRemoteOperation
{
    checkArgument(sourceName,      L"sourceName");      //throw ErrorInvalidArgument
    checkArgument(destinationPath, L"destinationPath"); //

    const Zstring targetPath = appendPath(destinationPath, destinationName.empty() ? sourceName : destinationName);

    runLogged(replaceCpy(replaceCpy(_("Downloading %x to %y"), L"%x", fmtPath(getDisplayPath(conn, sourceName))), L"%y", fmtPath(targetPath)), [&]
    {
        RemoteDriver& driver = getDriver(conn.getProtocol()); //throw ErrorUnsupported

        if (driver.getPathType(conn, sourceName) == PathType::folder) //throw ErrorRemoteOperation
            throw ErrorUnsupported(replaceCpy(_("Cannot download %x."), L"%x", fmtPath(getDisplayPath(conn, sourceName))), getDirectoryTransferMsg());

        driver.downloadFile(conn, sourceName, targetPath); //throw ErrorRemoteOperation, ErrorLocalIo
    });
}


void RemoteClient::deleteFile(const ConnectionDescriptor& conn, const std::string& itemName) //throw ErrorInvalidArgument, ErrorRemoteOperation
{
    checkArgument(itemName, L"itemName"); //throw ErrorInvalidArgument

    runLogged(replaceCpy(_("Deleting file %x"), L"%x", fmtPath(getDisplayPath(conn, itemName))), [&]
    {
        getDriver(conn.getProtocol()).deleteFile(conn, itemName); //throw ErrorRemoteOperation, ErrorUnsupported
    });
}


void RemoteClient::renameFile(const ConnectionDescriptor& conn, const std::string& itemName, const std::string& newName) //throw ErrorInvalidArgument, ErrorRemoteOperation
{
    checkArgument(itemName, L"itemName"); //throw ErrorInvalidArgument
    checkArgument(newName,  L"newName");  //

    runLogged(replaceCpy(replaceCpy(_("Renaming %x to %y"), L"%x", fmtPath(getDisplayPath(conn, itemName))), L"%y", fmtPath(getDisplayPath(conn, newName))), [&]
    {
        getDriver(conn.getProtocol()).renameFile(conn, itemName, newName); //throw ErrorRemoteOperation, ErrorUnsupported
    });
}


void RemoteClient::makeDirectory(const ConnectionDescriptor& conn, const std::string& folderName) //throw ErrorInvalidArgument, ErrorRemoteOperation
{
    checkArgument(folderName, L"folderName"); //throw ErrorInvalidArgument

    runLogged(replaceCpy(_("Creating directory %x"), L"%x", fmtPath(getDisplayPath(conn, folderName))), [&]
    {
        getDriver(conn.getProtocol()).makeDirectory(conn, folderName); //throw ErrorRemoteOperation, ErrorUnsupported
    });
}


void RemoteClient::removeDirectory(const ConnectionDescriptor& conn, const std::string& folderName) //throw ErrorInvalidArgument, ErrorRemoteOperation
{
    checkArgument(folderName, L"folderName"); //throw ErrorInvalidArgument

    runLogged(replaceCpy(_("Deleting directory %x"), L"%x", fmtPath(getDisplayPath(conn, folderName))), [&]
    {
        getDriver(conn.getProtocol()).removeDirectory(conn, folderName); //throw ErrorRemoteOperation, ErrorUnsupported
    });
}


PathType RemoteClient::getPathType(const ConnectionDescriptor& conn, const std::string& itemName) //throw ErrorInvalidArgument, ErrorRemoteOperation
{
    checkArgument(itemName, L"itemName"); //throw ErrorInvalidArgument

    return runLogged(replaceCpy(_("Reading attributes of %x"), L"%x", fmtPath(getDisplayPath(conn, itemName))), [&]
    {
        return getDriver(conn.getProtocol()).getPathType(conn, itemName); //throw ErrorRemoteOperation, ErrorUnsupported
    });
}
