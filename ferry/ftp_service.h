// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FTP_SERVICE_H_5803917264401785
#define FTP_SERVICE_H_5803917264401785

#include "ftp.h"


namespace ferry
{
struct FtpCredential
{
    std::string username; //empty: anonymous login
    Credential password;
};


/*  FTP-only convenience API addressing a server folder by its full URI, e.g. "ftp://example.com:2121/pub/"
    - item names are relative to serverUri
    - RNTO gets the bare new name
    - empty listing lines are dropped                                               */
class FtpService
{
public:
    FtpService(); //libcurl
    explicit FtpService(const std::shared_ptr<FtpTransport>& transport) : transport_(transport) {}

    std::vector<std::string> listFiles(const std::string& serverUri, const FtpCredential& cred); //throw ErrorInvalidArgument, ErrorRemoteOperation

    //remoteFileName: empty => local file name
    void uploadFile  (const std::string& serverUri, const FtpCredential& cred, const Zstring& localFilePath, const std::string& remoteFileName = {}); //throw ErrorInvalidArgument, ErrorLocalIo, ErrorRemoteOperation
    //writes localDirPath/fileName
    void downloadFile(const std::string& serverUri, const FtpCredential& cred, const std::string& fileName, const Zstring& localDirPath);              //throw ErrorInvalidArgument, ErrorLocalIo, ErrorRemoteOperation

    void deleteFile     (const std::string& serverUri, const FtpCredential& cred, const std::string& fileName);                             //throw ErrorInvalidArgument, ErrorRemoteOperation
    void renameFile     (const std::string& serverUri, const FtpCredential& cred, const std::string& fileName, const std::string& newName); //throw ErrorInvalidArgument, ErrorRemoteOperation
    void makeDirectory  (const std::string& serverUri, const FtpCredential& cred, const std::string& dirName);                              //throw ErrorInvalidArgument, ErrorRemoteOperation
    void removeDirectory(const std::string& serverUri, const FtpCredential& cred, const std::string& dirName);                              //throw ErrorInvalidArgument, ErrorRemoteOperation

private:
    void runRequest(FtpMethod method, const std::string& serverUri, const FtpCredential& cred, const std::string& itemName, const std::wstring& errorMsg,
                    const std::function<void  (std::span<const char> buf)>& writeResponse,
                    const std::function<size_t(std::span<      char> buf)>& readRequest,
                    const std::string& renameTo = {}); //throw ErrorRemoteOperation

    const std::shared_ptr<FtpTransport> transport_;
};
}

#endif //FTP_SERVICE_H_5803917264401785
