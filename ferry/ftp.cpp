// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "ftp.h"
#include <base/file_io.h>
#include "ftp_common.h"

using namespace ferry;


namespace
{
std::string ansiToUtfEncoding(std::string_view str) //throw SysError
{
    if (str.empty()) return {};

    gsize bytesWritten = 0; //not including the terminating null

    GError* error = nullptr;
    FERRY_ON_SCOPE_EXIT(if (error) ::g_error_free(error));

    gchar* utfStr = ::g_convert(str.data(),    //const gchar* str
                                str.size(),    //gssize len
                                "UTF-8",       //const gchar* to_codeset
                                "LATIN1",      //const gchar* from_codeset
                                nullptr,       //gsize* bytes_read
                                &bytesWritten, //gsize* bytes_written
                                &error);       //GError** error
    if (!utfStr)
        throw SysError(formatGlibError("g_convert(LATIN1 -> UTF-8)", error));
    FERRY_ON_SCOPE_EXIT(::g_free(utfStr));

    return {utfStr, bytesWritten};
}
}


std::wstring ferry::formatFtpStatus(long sc)
{
    const wchar_t* statusText = [&] //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 421: return L"Service not available, closing control connection.";
            case 425: return L"Cannot open data connection.";
            case 426: return L"Connection closed; transfer aborted.";
            case 430: return L"Invalid username or password.";
            case 450: return L"Requested file action not taken.";
            case 451: return L"Local error in processing.";
            case 452: return L"Insufficient storage space in system.";

            case 500: return L"Syntax error, command unrecognized.";
            case 501: return L"Syntax error in parameters or arguments.";
            case 502: return L"Command not implemented.";
            case 503: return L"Bad sequence of commands.";
            case 530: return L"User not logged in.";
            case 534: return L"Could not connect to server; issue regarding SSL.";
            case 550: return L"File unavailable, e.g. file not found, no access.";
            case 552: return L"Exceeded storage allocation.";
            case 553: return L"File name not allowed.";

            default:  return L"";
            //*INDENT-ON*
        }
    }();

    if (std::wstring_view(statusText).empty())
        return replaceCpy<std::wstring>(L"FTP status %x.", L"%x", numberTo<std::wstring>(sc));
    else
        return replaceCpy<std::wstring>(L"FTP status %x: ", L"%x", numberTo<std::wstring>(sc)) + statusText;
}


std::string ferry::buildFtpUri(const ConnectionDescriptor& conn, const std::string& itemName, bool isDir)
{
    std::string uri = "ftp://" + conn.getHost();
    if (conn.getPort() > 0)
        uri += ':' + numberTo<std::string>(conn.getPort());
    uri += '/';

    split(conn.getWorkingPath(), '/', [&](std::string_view component)
    {
        if (!component.empty())
            uri += encodeUriComponent(component) + '/';
    });

    const std::string baseName = afterLast(itemName, '/', IfNotFoundReturn::all);
    if (!baseName.empty())
    {
        uri += encodeUriComponent(baseName);
        if (isDir)
            uri += '/';
    }
    return uri;
}


const std::map<long, PathType> ferry::FTP_STATUS_CLASSIFICATION =
{
    {550, PathType::file}, //"File unavailable": cannot change into a file
};


PathType ferry::classifyFtpStatus(long ftpStatus)
{
    if (auto it = FTP_STATUS_CLASSIFICATION.find(ftpStatus);
        it != FTP_STATUS_CLASSIFICATION.end())
        return it->second;
    return PathType::folder;
}


std::vector<std::string> ferry::parseFtpNameList(const std::string& response) //throw SysError
{
    const std::string buf = isValidUtf(response) ? response : ansiToUtfEncoding(response); //throw SysError

    std::vector<std::string> output;
    for (const std::string_view line : splitCpy(std::string_view(buf), '\n', SplitOnEmpty::allow))
    {
        std::string name(line);
        if (endsWith(name, '\r'))
            name.pop_back();

        output.push_back(name);
        if (name.empty()) //end-of-listing marker
            return output;
    }
    output.emplace_back(); //listing ended without marker
    return output;
}


FtpRequest FtpDriver::makeRequest(const ConnectionDescriptor& conn, FtpMethod method, const std::string& itemName, bool isDir) const
{
    FtpRequest request;
    request.method     = method;
    request.uri        = buildFtpUri(conn, itemName, isDir);
    request.username   = conn.getUsername();
    request.password   = conn.getSecret();
    request.timeoutSec = conn.options.timeoutSec;
    request.useTls     = conn.options.useTls;
    return request;
}


std::vector<std::string> FtpDriver::listDirectory(const ConnectionDescriptor& conn) //throw ErrorRemoteOperation
{
    const std::wstring errorMsg = replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(conn)));

    std::string rawListing;
    runFtpRequest(errorMsg, [&]
    {
        transport_->perform(makeRequest(conn, FtpMethod::list, {}, true /*isDir*/),
        [&](std::span<const char> buf) { rawListing.append(buf.data(), buf.size()); }, nullptr); //throw SysError, SysErrorFtpProtocol, SysErrorPassword
    });

    return runFtpRequest(errorMsg, [&] { return parseFtpNameList(rawListing); }); //throw ErrorRemoteOperation
}


PathType FtpDriver::getPathType(const ConnectionDescriptor& conn, const std::string& itemName) //throw ErrorRemoteOperation
{
    try
    {
        //list the item as if it were a folder
        transport_->perform(makeRequest(conn, FtpMethod::list, itemName, true /*isDir*/),
                            [](std::span<const char> /*buf*/) {}, nullptr); //throw SysError, SysErrorFtpProtocol, SysErrorPassword
        return PathType::folder;
    }
    catch (const SysErrorFtpProtocol& e)
    {
        return classifyFtpStatus(e.ftpErrorCode);
    }
    catch (const SysError& e) //no FTP status: not a classification answer
    {
        throw ErrorRemoteOperation(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(conn, itemName))), e.toString(), 0);
    }
}


void FtpDriver::uploadFile(const ConnectionDescriptor& conn, const Zstring& localFilePath, const std::string& itemName) //throw ErrorRemoteOperation, ErrorLocalIo
{
    const std::string content = getFileContent(localFilePath); //throw ErrorLocalIo
    size_t bytesSent = 0;

    runFtpRequest(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getDisplayPath(conn, itemName))), [&]
    {
        transport_->perform(makeRequest(conn, FtpMethod::store, itemName, false /*isDir*/), nullptr,
                            [&](std::span<char> buf) //throw SysError, SysErrorFtpProtocol, SysErrorPassword
        {
            const size_t bytesToSend = std::min(buf.size(), content.size() - bytesSent);
            std::copy(content.begin() + bytesSent, content.begin() + bytesSent + bytesToSend, buf.begin());
            bytesSent += bytesToSend;
            return bytesToSend;
        });
    });
}


void FtpDriver::downloadFile(const ConnectionDescriptor& conn, const std::string& itemName, const Zstring& localFilePath) //throw ErrorRemoteOperation, ErrorLocalIo
{
    std::string content;
    runFtpRequest(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getDisplayPath(conn, itemName))), [&]
    {
        transport_->perform(makeRequest(conn, FtpMethod::retrieve, itemName, false /*isDir*/),
        [&](std::span<const char> buf) { content.append(buf.data(), buf.size()); }, nullptr); //throw SysError, SysErrorFtpProtocol, SysErrorPassword
    });

    setFileContent(localFilePath, content); //throw ErrorLocalIo
}


void FtpDriver::deleteFile(const ConnectionDescriptor& conn, const std::string& itemName) //throw ErrorRemoteOperation
{
    runFtpRequest(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getDisplayPath(conn, itemName))), [&]
    {
        transport_->perform(makeRequest(conn, FtpMethod::remove, itemName, false /*isDir*/), nullptr, nullptr); //throw SysError, SysErrorFtpProtocol, SysErrorPassword
    });
}


void FtpDriver::renameFile(const ConnectionDescriptor& conn, const std::string& itemName, const std::string& newName) //throw ErrorRemoteOperation
{
    FtpRequest request = makeRequest(conn, FtpMethod::rename, itemName, false /*isDir*/);
    request.renameTo = buildFtpUri(conn, newName, false /*isDir*/); //RNTO gets the full URI, RNFR the bare name

    runFtpRequest(replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                        L"%x", L'\n' + fmtPath(getDisplayPath(conn, itemName))),
                             L"%y", L'\n' + fmtPath(getDisplayPath(conn, newName))), [&]
    {
        transport_->perform(request, nullptr, nullptr); //throw SysError, SysErrorFtpProtocol, SysErrorPassword
    });
}


void FtpDriver::makeDirectory(const ConnectionDescriptor& conn, const std::string& folderName) //throw ErrorRemoteOperation
{
    runFtpRequest(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(getDisplayPath(conn, folderName))), [&]
    {
        transport_->perform(makeRequest(conn, FtpMethod::makeDir, folderName, false /*isDir*/), nullptr, nullptr); //throw SysError, SysErrorFtpProtocol, SysErrorPassword
    });
}


void FtpDriver::removeDirectory(const ConnectionDescriptor& conn, const std::string& folderName) //throw ErrorRemoteOperation
{
    runFtpRequest(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(getDisplayPath(conn, folderName))), [&]
    {
        transport_->perform(makeRequest(conn, FtpMethod::removeDir, folderName, false /*isDir*/), nullptr, nullptr); //throw SysError, SysErrorFtpProtocol, SysErrorPassword
    });
}
