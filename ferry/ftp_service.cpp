// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "ftp_service.h"
#include <base/file_io.h>
#include <base/file_path.h>
#include "ftp_common.h"
#include "ftp_curl.h"

using namespace ferry;


namespace
{
void checkServerUri(const std::string& serverUri) //throw ErrorInvalidArgument
{
    if (!startsWithAsciiNoCase(serverUri, "ftp://") ||
        beforeFirst(afterFirst(serverUri, "://", IfNotFoundReturn::none), '/', IfNotFoundReturn::all).empty())
        throw ErrorInvalidArgument(replaceCpy(_("Invalid FTP server address %x."), L"%x", fmtPath(utfTo<std::wstring>(serverUri))));
}


void checkName(const std::string& name, const wchar_t* argName) //throw ErrorInvalidArgument
{
    if (name.empty())
        throw ErrorInvalidArgument(replaceCpy(_("Argument %x must not be empty."), L"%x", argName));
}


std::string getItemUri(const std::string& serverUri, const std::string& itemName)
{
    std::string uri = serverUri;
    if (!endsWith(uri, '/'))
        uri += '/';
    return uri + encodeUriComponent(itemName);
}


std::wstring getDisplayUri(const std::string& serverUri, const std::string& itemName)
{
    std::string uri = serverUri;
    if (!itemName.empty())
    {
        if (!endsWith(uri, '/'))
            uri += '/';
        uri += itemName;
    }
    return fmtPath(utfTo<std::wstring>(uri));
}
}


FtpService::FtpService() : transport_(std::make_shared<CurlFtpTransport>()) {}


void FtpService::runRequest(FtpMethod method, const std::string& serverUri, const FtpCredential& cred, const std::string& itemName, const std::wstring& errorMsg,
                            const std::function<void  (std::span<const char> buf)>& writeResponse,
                            const std::function<size_t(std::span<      char> buf)>& readRequest,
                            const std::string& renameTo) //throw ErrorRemoteOperation
{
    FtpRequest request;
    request.method   = method;
    request.uri      = getItemUri(serverUri, itemName); //folder URI if itemName is empty
    request.renameTo = renameTo;
    request.username = cred.username;
    request.password = cred.password;

    logExtraInfo(L"FTP " + getDisplayUri(serverUri, itemName));
    try
    {
        runFtpRequest(errorMsg, [&] { transport_->perform(request, writeResponse, readRequest); }); //throw ErrorRemoteOperation
    }
    catch (const ErrorRemoteOperation& e)
    {
        logExtraError(e.toString());
        throw;
    }
}


std::vector<std::string> FtpService::listFiles(const std::string& serverUri, const FtpCredential& cred) //throw ErrorInvalidArgument, ErrorRemoteOperation
{
    checkServerUri(serverUri); //throw ErrorInvalidArgument

    const std::wstring errorMsg = replaceCpy(_("Cannot read directory %x."), L"%x", getDisplayUri(serverUri, ""));
    std::string rawListing;

    runRequest(FtpMethod::list, serverUri, cred, "", errorMsg,
    [&](std::span<const char> buf) { rawListing.append(buf.data(), buf.size()); }, nullptr); //throw ErrorRemoteOperation

    std::vector<std::string> names = runFtpRequest(errorMsg, [&] { return parseFtpNameList(rawListing); }); //throw ErrorRemoteOperation
    std::erase_if(names, [](const std::string& name) { return name.empty(); });
    return names;
}


void FtpService::uploadFile(const std::string& serverUri, const FtpCredential& cred, const Zstring& localFilePath, const std::string& remoteFileName)
//throw ErrorInvalidArgument, ErrorLocalIo, ErrorRemoteOperation
{
    checkServerUri(serverUri); //throw ErrorInvalidArgument
    checkName(localFilePath, L"localFilePath"); //

    const std::string fileName = remoteFileName.empty() ? getItemName(localFilePath) : remoteFileName;
    checkName(fileName, L"remoteFileName"); //throw ErrorInvalidArgument

    const std::string content = getFileContent(localFilePath); //throw ErrorLocalIo
    size_t bytesSent = 0;

    runRequest(FtpMethod::store, serverUri, cred, fileName, replaceCpy(_("Cannot write file %x."), L"%x", getDisplayUri(serverUri, fileName)), nullptr,
               [&](std::span<char> buf)
    {
        const size_t bytesToSend = std::min(buf.size(), content.size() - bytesSent);
        std::copy(content.begin() + bytesSent, content.begin() + bytesSent + bytesToSend, buf.begin());
        bytesSent += bytesToSend;
        return bytesToSend;
    }); //throw ErrorRemoteOperation
}


void FtpService::downloadFile(const std::string& serverUri, const FtpCredential& cred, const std::string& fileName, const Zstring& localDirPath)
//throw ErrorInvalidArgument, ErrorLocalIo, ErrorRemoteOperation
{
    checkServerUri(serverUri); //throw ErrorInvalidArgument
    checkName(fileName,     L"fileName");     //
    checkName(localDirPath, L"localDirPath"); //

    std::string content;
    runRequest(FtpMethod::retrieve, serverUri, cred, fileName, replaceCpy(_("Cannot read file %x."), L"%x", getDisplayUri(serverUri, fileName)),
    [&](std::span<const char> buf) { content.append(buf.data(), buf.size()); }, nullptr); //throw ErrorRemoteOperation

    setFileContent(appendPath(localDirPath, fileName), content); //throw ErrorLocalIo
}


void FtpService::deleteFile(const std::string& serverUri, const FtpCredential& cred, const std::string& fileName) //throw ErrorInvalidArgument, ErrorRemoteOperation
{
    checkServerUri(serverUri); //throw ErrorInvalidArgument
    checkName(fileName, L"fileName"); //

    runRequest(FtpMethod::remove, serverUri, cred, fileName, replaceCpy(_("Cannot delete file %x."), L"%x", getDisplayUri(serverUri, fileName)), nullptr, nullptr); //throw ErrorRemoteOperation
}


void FtpService::renameFile(const std::string& serverUri, const FtpCredential& cred, const std::string& fileName, const std::string& newName) //throw ErrorInvalidArgument, ErrorRemoteOperation
{
    checkServerUri(serverUri); //throw ErrorInvalidArgument
    checkName(fileName, L"fileName"); //
    checkName(newName,  L"newName");  //

    runRequest(FtpMethod::rename, serverUri, cred, fileName,
               replaceCpy(replaceCpy(_("Cannot move file %x to %y."), L"%x", L'\n' + getDisplayUri(serverUri, fileName)), L"%y", L'\n' + getDisplayUri(serverUri, newName)),
               nullptr, nullptr, newName /*bare name*/); //throw ErrorRemoteOperation
}


void FtpService::makeDirectory(const std::string& serverUri, const FtpCredential& cred, const std::string& dirName) //throw ErrorInvalidArgument, ErrorRemoteOperation
{
    checkServerUri(serverUri); //throw ErrorInvalidArgument
    checkName(dirName, L"dirName"); //

    runRequest(FtpMethod::makeDir, serverUri, cred, dirName, replaceCpy(_("Cannot create directory %x."), L"%x", getDisplayUri(serverUri, dirName)), nullptr, nullptr); //throw ErrorRemoteOperation
}


void FtpService::removeDirectory(const std::string& serverUri, const FtpCredential& cred, const std::string& dirName) //throw ErrorInvalidArgument, ErrorRemoteOperation
{
    checkServerUri(serverUri); //throw ErrorInvalidArgument
    checkName(dirName, L"dirName"); //

    runRequest(FtpMethod::removeDir, serverUri, cred, dirName, replaceCpy(_("Cannot delete directory %x."), L"%x", getDisplayUri(serverUri, dirName)), nullptr, nullptr); //throw ErrorRemoteOperation
}
