// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FAKE_FTP_SERVER_H_8820317465190346
#define FAKE_FTP_SERVER_H_8820317465190346

#include <gmock/gmock.h>
#include <ferry/ftp.h>
#include <ferry/ftp_common.h>
#include "fake_remote_fs.h"


namespace ferry::test
{
//FtpTransport answering from an in-memory file system; records every request
class FakeFtpServer : public FtpTransport
{
public:
    std::string perform(const FtpRequest& request,
                        const std::function<void  (std::span<const char> buf)>& writeResponse,
                        const std::function<size_t(std::span<      char> buf)>& readRequest) override
    {
        requests.push_back(request);

        if (refuseConnection)
            throw SysError(L"Connection refused.");

        if (requiredPassword && request.password.plainText() != *requiredPassword)
            throw SysErrorFtpProtocol(L"530 Login incorrect.", 530); //CurlFtpTransport keeps the reply code

        const std::string path = getServerPath(request.uri);

        switch (request.method)
        {
            case FtpMethod::list:
                if (!fs.isFolder(path))
                    throw SysErrorFtpProtocol(L"550 Failed to change directory.", 550);
                if (rawListing)
                    writeResponse(*rawListing);
                else
                    for (const std::string& name : fs.listFolder(path))
                        writeResponse(name + "\r\n");
                break;

            case FtpMethod::retrieve:
                if (!fs.isFile(path))
                    throw SysErrorFtpProtocol(L"550 Failed to open file.", 550);
                writeResponse(fs.getContent(path));
                break;

            case FtpMethod::store:
            {
                std::string content;
                std::vector<char> buf(7); //small blocks: exercise the read loop
                for (size_t bytesRead; (bytesRead = readRequest(buf)) != 0;)
                    content.append(buf.data(), bytesRead);

                if (!fs.writeFile(path, content))
                    throw SysErrorFtpProtocol(L"553 Could not create file.", 553);
            }
            break;

            case FtpMethod::remove:
                if (!fs.removeFile(path))
                    throw SysErrorFtpProtocol(L"550 Delete operation failed.", 550);
                break;

            case FtpMethod::rename:
            {
                //RNTO: full URI or bare name inside the source folder
                const std::string pathTo = startsWith(request.renameTo, "ftp://") ?
                                           getServerPath(request.renameTo) :
                                           FakeRemoteFs::appendPath(FakeRemoteFs::getParent(path), request.renameTo);
                if (!fs.rename(path, pathTo))
                    throw SysErrorFtpProtocol(L"550 Rename failed.", 550);
            }
            break;

            case FtpMethod::makeDir:
                if (!fs.makeFolder(path))
                    throw SysErrorFtpProtocol(L"550 Create directory operation failed.", 550);
                break;

            case FtpMethod::removeDir:
                if (!fs.removeFolder(path))
                    throw SysErrorFtpProtocol(L"550 Remove directory operation failed.", 550);
                break;
        }
        return "226 Transfer complete.\r\n";
    }

    //"ftp://host:port/a%20b/c/" -> "a b/c"
    static std::string getServerPath(const std::string& uri)
    {
        const std::string serverRelPath = afterFirst(afterFirst(uri, "://", IfNotFoundReturn::all), '/', IfNotFoundReturn::none);

        std::string path;
        split(serverRelPath, '/', [&](std::string_view comp)
        {
            if (!comp.empty())
                path = FakeRemoteFs::appendPath(path, decodeUriComponent(comp));
        });
        return path;
    }

    FakeRemoteFs fs;
    std::vector<FtpRequest> requests;

    bool refuseConnection = false;
    std::optional<std::string> requiredPassword;
    std::optional<std::string> rawListing; //NLST response overriding the file system
};


struct MockFtpTransport : public FtpTransport
{
    MOCK_METHOD(std::string, perform, (const FtpRequest& request,
                                       const std::function<void  (std::span<const char> buf)>& writeResponse,
                                       const std::function<size_t(std::span<      char> buf)>& readRequest), (override));
};
}

#endif //FAKE_FTP_SERVER_H_8820317465190346
