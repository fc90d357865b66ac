// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FTP_H_7451093826617340
#define FTP_H_7451093826617340

#include <functional>
#include <map>
#include <memory>
#include <span>
#include "remote_driver.h"


namespace ferry
{
struct SysErrorFtpProtocol : public SysError
{
    SysErrorFtpProtocol(const std::wstring& msg, long ftpError) : SysError(msg), ftpErrorCode(ftpError) {}

    long ftpErrorCode;
};


enum class FtpMethod
{
    list,     //NLST
    retrieve, //RETR
    store,    //STOR
    remove,   //DELE
    rename,   //RNFR + RNTO
    makeDir,  //MKD
    removeDir //RMD
};

struct FtpRequest
{
    FtpMethod method = FtpMethod::list;
    std::string uri;      //folder URIs end with '/'
    std::string renameTo; //FtpMethod::rename only: sent as-is in RNTO
    std::string username; //empty: anonymous login
    Credential password;
    int timeoutSec = DEFAULT_TIMEOUT_SEC;
    bool useTls = false;
};


//request-per-operation FTP client: one connection per perform()
struct FtpTransport
{
    virtual ~FtpTransport() {}

    //returns server response (header data)
    virtual std::string perform(const FtpRequest& request,
                                const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/, //optional: list, retrieve
                                const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/) = 0; //optional: store; return 0 on end of stream
    //throw SysError, SysErrorFtpProtocol, SysErrorPassword, X
};


std::wstring formatFtpStatus(long sc);

//one request; every low-level error is reported with the user-visible context
template <class Function>
auto runFtpRequest(const std::wstring& errorMsg, Function fun); //throw ErrorRemoteOperation

//ftp://host[:port]/<workingPath>/<name>: percent-encoded components; only the base name of itemName is used
std::string buildFtpUri(const ConnectionDescriptor& conn, const std::string& itemName, bool isDir);

//failed list request on a candidate folder: FTP status => item type; statuses not listed mean "folder"
extern const std::map<long, PathType> FTP_STATUS_CLASSIFICATION;

PathType classifyFtpStatus(long ftpStatus);

//NLST response: lines up to and including the first empty line; always ends with an empty entry
std::vector<std::string> parseFtpNameList(const std::string& response); //throw SysError


class FtpDriver : public RemoteDriver
{
public:
    explicit FtpDriver(const std::shared_ptr<FtpTransport>& transport) : transport_(transport) {}

    std::vector<std::string> listDirectory(const ConnectionDescriptor& conn) override; //throw ErrorRemoteOperation
    PathType getPathType(const ConnectionDescriptor& conn, const std::string& itemName) override; //throw ErrorRemoteOperation

    void uploadFile  (const ConnectionDescriptor& conn, const Zstring& localFilePath, const std::string& itemName) override; //throw ErrorRemoteOperation, ErrorLocalIo
    void downloadFile(const ConnectionDescriptor& conn, const std::string& itemName, const Zstring& localFilePath) override; //throw ErrorRemoteOperation, ErrorLocalIo

    void deleteFile     (const ConnectionDescriptor& conn, const std::string& itemName) override; //throw ErrorRemoteOperation
    void renameFile     (const ConnectionDescriptor& conn, const std::string& itemName, const std::string& newName) override; //throw ErrorRemoteOperation
    void makeDirectory  (const ConnectionDescriptor& conn, const std::string& folderName) override; //throw ErrorRemoteOperation
    void removeDirectory(const ConnectionDescriptor& conn, const std::string& folderName) override; //throw ErrorRemoteOperation

private:
    FtpRequest makeRequest(const ConnectionDescriptor& conn, FtpMethod method, const std::string& itemName, bool isDir) const;

    const std::shared_ptr<FtpTransport> transport_;
};



//------------------------------- implementation -------------------------------
template <class Function> inline
auto runFtpRequest(const std::wstring& errorMsg, Function fun) //throw ErrorRemoteOperation
{
    try
    {
        return fun(); //throw SysError, SysErrorFtpProtocol, SysErrorPassword
    }
    catch (const SysErrorFtpProtocol& e) { throw ErrorRemoteOperation(errorMsg, e.toString() + L'\n' + formatFtpStatus(e.ftpErrorCode), e.ftpErrorCode); }
    catch (const SysError&            e) { throw ErrorRemoteOperation(errorMsg, e.toString(), 0); }
}
}

#endif //FTP_H_7451093826617340
