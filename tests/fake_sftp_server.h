// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FAKE_SFTP_SERVER_H_1974603285517429
#define FAKE_SFTP_SERVER_H_1974603285517429

#include <ferry/sftp.h>
#include "fake_remote_fs.h"


namespace ferry::test
{
//SFTP status codes as sent by the server
const unsigned long SSH_FX_NO_SUCH_FILE = 2;
const unsigned long SSH_FX_FAILURE      = 4;


//hands out sessions on a shared in-memory file system; records sessions and calls
class FakeSftpServer
{
public:
    SftpSessionFactory getSessionFactory()
    {
        return [this](const ConnectionDescriptor& conn) -> std::unique_ptr<SftpSession>
        {
            ++sessionsCreated;
            if (refuseConnection)
                throw SysError(L"Connection refused.");
            if (requiredPassword && conn.getSecret().plainText() != *requiredPassword)
                throw SysErrorPassword(L"Authentication failed (username/password).");

            return std::make_unique<Session>(*this);
        };
    }

    FakeRemoteFs fs;

    int sessionsCreated = 0;
    int sessionsAlive   = 0;
    std::vector<std::string> calls; //"<operation> <argument>"

    bool refuseConnection = false;
    std::optional<std::string> requiredPassword;

private:
    class Session : public SftpSession
    {
    public:
        explicit Session(FakeSftpServer& server) : server_(server) { ++server_.sessionsAlive; }
        ~Session() { --server_.sessionsAlive; }

        void changeDirectory(const std::string& folderPath) override
        {
            server_.calls.push_back("cd " + folderPath);
            std::string path; //absolute and relative paths both start at the root
            split(folderPath, '/', [&](std::string_view comp)
            {
                if (!comp.empty())
                    path = FakeRemoteFs::appendPath(path, std::string(comp));
            });
            if (!server_.fs.isFolder(path))
                throw SysErrorSftpProtocol(L"No such file", SSH_FX_NO_SUCH_FILE);
            cwd_ = path;
        }

        std::vector<std::string> readDirectory() override
        {
            server_.calls.push_back("readdir " + cwd_);
            std::vector<std::string> names{".", ".."};
            for (const std::string& name : server_.fs.listFolder(cwd_))
                names.push_back(name);
            return names;
        }

        bool isDirectory(const std::string& itemName) override
        {
            server_.calls.push_back("stat " + itemName);
            const std::string path = getPath(itemName);
            if (!server_.fs.exists(path))
                throw SysErrorSftpProtocol(L"No such file", SSH_FX_NO_SUCH_FILE);
            return server_.fs.isFolder(path);
        }

        void uploadFile(const std::string& itemName, const std::function<size_t(std::span<char> buf)>& readBlock) override
        {
            server_.calls.push_back("put " + itemName);
            std::string content;
            std::vector<char> buf(5);
            for (size_t bytesRead; (bytesRead = readBlock(buf)) != 0;)
                content.append(buf.data(), bytesRead);

            if (!server_.fs.writeFile(getPath(itemName), content))
                throw SysErrorSftpProtocol(L"Failure", SSH_FX_FAILURE);
        }

        void downloadFile(const std::string& itemName, const std::function<void(std::span<const char> buf)>& writeBlock) override
        {
            server_.calls.push_back("get " + itemName);
            const std::string path = getPath(itemName);
            if (!server_.fs.isFile(path))
                throw SysErrorSftpProtocol(L"No such file", SSH_FX_NO_SUCH_FILE);

            const std::string& content = server_.fs.getContent(path);
            for (size_t pos = 0; pos < content.size(); pos += 3) //streamed in small blocks
                writeBlock(std::span<const char>(content.data() + pos, std::min<size_t>(3, content.size() - pos)));
        }

        void deleteFile(const std::string& itemName) override
        {
            server_.calls.push_back("rm " + itemName);
            if (!server_.fs.removeFile(getPath(itemName)))
                throw SysErrorSftpProtocol(L"No such file", SSH_FX_NO_SUCH_FILE);
        }

        void renameFile(const std::string& itemName, const std::string& newName) override
        {
            server_.calls.push_back("rename " + itemName + ' ' + newName);
            if (!server_.fs.rename(getPath(itemName), getPath(newName)))
                throw SysErrorSftpProtocol(L"Failure", SSH_FX_FAILURE);
        }

        void createDirectory(const std::string& folderName) override
        {
            server_.calls.push_back("mkdir " + folderName);
            if (!server_.fs.makeFolder(getPath(folderName)))
                throw SysErrorSftpProtocol(L"Failure", SSH_FX_FAILURE);
        }

        void deleteDirectory(const std::string& folderName) override
        {
            server_.calls.push_back("rmdir " + folderName);
            if (!server_.fs.removeFolder(getPath(folderName)))
                throw SysErrorSftpProtocol(L"Failure", SSH_FX_FAILURE);
        }

    private:
        std::string getPath(const std::string& itemName) const { return FakeRemoteFs::appendPath(cwd_, itemName); }

        FakeSftpServer& server_;
        std::string cwd_; //login directory: file system root
    };
};
}

#endif //FAKE_SFTP_SERVER_H_1974603285517429
