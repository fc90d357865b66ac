// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SFTP_H_0817364925583016
#define SFTP_H_0817364925583016

#include <functional>
#include <memory>
#include <span>
#include "remote_driver.h"


namespace ferry
{
//=> most likely *not* a connection issue
struct SysErrorSftpProtocol : public SysError
{
    SysErrorSftpProtocol(const std::wstring& msg, unsigned long sftpError) : SysError(msg), sftpErrorCode(sftpError) {}

    const unsigned long sftpErrorCode;
};


//connected + authenticated SFTP session; relative item names resolve against the current directory
struct SftpSession
{
    virtual ~SftpSession() {}

    //empty path: login directory
    virtual void changeDirectory(const std::string& folderPath) = 0; //throw SysError, SysErrorSftpProtocol

    //current directory; server order, "." and ".." included if reported
    virtual std::vector<std::string> readDirectory() = 0; //throw SysError, SysErrorSftpProtocol

    //follows symlinks
    virtual bool isDirectory(const std::string& itemName) = 0; //throw SysError, SysErrorSftpProtocol

    //create or truncate; readBlock returns 0 at end of stream
    virtual void uploadFile  (const std::string& itemName, const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/) = 0; //throw SysError, SysErrorSftpProtocol, X
    virtual void downloadFile(const std::string& itemName, const std::function<void(std::span<const char> buf)>& writeBlock /*throw X*/) = 0; //throw SysError, SysErrorSftpProtocol, X

    virtual void deleteFile     (const std::string& itemName) = 0; //throw SysError, SysErrorSftpProtocol
    virtual void renameFile     (const std::string& itemName, const std::string& newName) = 0; //throw SysError, SysErrorSftpProtocol; overwrites target
    virtual void createDirectory(const std::string& folderName) = 0; //throw SysError, SysErrorSftpProtocol
    virtual void deleteDirectory(const std::string& folderName) = 0; //throw SysError, SysErrorSftpProtocol
};

//connect, handshake and authenticate
using SftpSessionFactory = std::function<std::unique_ptr<SftpSession>(const ConnectionDescriptor& conn)>; //throw SysError, SysErrorPassword


//fresh session for every operation
class SftpDriver : public RemoteDriver
{
public:
    explicit SftpDriver(const SftpSessionFactory& sessionFactory) : sessionFactory_(sessionFactory) {}

    std::vector<std::string> listDirectory(const ConnectionDescriptor& conn) override; //throw ErrorRemoteOperation
    PathType getPathType(const ConnectionDescriptor& conn, const std::string& itemName) override; //throw ErrorRemoteOperation

    void uploadFile  (const ConnectionDescriptor& conn, const Zstring& localFilePath, const std::string& itemName) override; //throw ErrorRemoteOperation, ErrorLocalIo
    void downloadFile(const ConnectionDescriptor& conn, const std::string& itemName, const Zstring& localFilePath) override; //throw ErrorRemoteOperation, ErrorLocalIo

    void deleteFile     (const ConnectionDescriptor& conn, const std::string& itemName) override; //throw ErrorRemoteOperation
    void renameFile     (const ConnectionDescriptor& conn, const std::string& itemName, const std::string& newName) override; //throw ErrorRemoteOperation
    void makeDirectory  (const ConnectionDescriptor& conn, const std::string& folderName) override; //throw ErrorRemoteOperation
    void removeDirectory(const ConnectionDescriptor& conn, const std::string& folderName) override; //throw ErrorRemoteOperation

private:
    template <class Function>
    auto runSftpCommand(const ConnectionDescriptor& conn, const std::wstring& errorMsg, Function sftpCommand); //throw ErrorRemoteOperation, X

    const SftpSessionFactory sessionFactory_;
};
}

#endif //SFTP_H_0817364925583016
