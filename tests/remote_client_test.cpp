// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <base/extra_log.h>
#include <base/file_io.h>
#include <ferry/remote_client.h>
#include "fake_ftp_server.h"
#include "fake_sftp_server.h"
#include "temp_folder.h"

using namespace ferry;
using namespace ferry::test;


class RemoteClientTest : public TempFolderTest, public ::testing::WithParamInterface<Protocol>
{
protected:
    void SetUp() override
    {
        TempFolderTest::SetUp();
        (void)fetchExtraLog(); //start with an empty log

        std::map<Protocol, std::unique_ptr<RemoteDriver>> drivers;
        drivers.emplace(Protocol::ftp,  std::make_unique<FtpDriver >(ftpServer_));
        drivers.emplace(Protocol::sftp, std::make_unique<SftpDriver>(sftpServer_.getSessionFactory()));
        client_ = std::make_unique<RemoteClient>(std::move(drivers));
    }

    ConnectionDescriptor makeConn(const std::string& workingPath = {}) const
    {
        ConnectionDescriptor conn(GetParam(), "files.example.com", 0, "anna", Credential("secret"));
        conn.setWorkingPath(workingPath);
        return conn;
    }

    FakeRemoteFs& remoteFs() { return GetParam() == Protocol::ftp ? ftpServer_->fs : sftpServer_.fs; }

    size_t remoteCallCount() const { return ftpServer_->requests.size() + sftpServer_.calls.size() + sftpServer_.sessionsCreated; }

    std::shared_ptr<FakeFtpServer> ftpServer_ = std::make_shared<FakeFtpServer>();
    FakeSftpServer sftpServer_;
    std::unique_ptr<RemoteClient> client_;
};


TEST_P(RemoteClientTest, UploadListDownload)
{
    remoteFs().makeFolder("inbox");
    setFileContent(getPath("report.csv"), "a;b\n1;2\n");

    client_->upload(makeConn("inbox"), getPath("report.csv"));
    EXPECT_EQ(remoteFs().getContent("inbox/report.csv"), "a;b\n1;2\n");

    const std::vector<std::string> names = client_->listDirectory(makeConn("inbox"));
    EXPECT_NE(std::find(names.begin(), names.end(), "report.csv"), names.end());

    client_->download(makeConn("inbox"), "report.csv", tempFolder_, "copy.csv");
    EXPECT_EQ(getFileContent(getPath("copy.csv")), "a;b\n1;2\n");
}


TEST_P(RemoteClientTest, UploadWithDestinationName)
{
    setFileContent(getPath("local.txt"), "x");

    client_->upload(makeConn(), getPath("local.txt"), "remote.txt");
    EXPECT_TRUE(remoteFs().isFile("remote.txt"));
    EXPECT_FALSE(remoteFs().exists("local.txt"));
}


TEST_P(RemoteClientTest, DownloadDefaultsToSourceName)
{
    remoteFs().makeFolder("pub");
    remoteFs().writeFile("pub/data.bin", "123");

    client_->download(makeConn("pub"), "data.bin", tempFolder_);
    EXPECT_EQ(getFileContent(getPath("data.bin")), "123");
}


TEST_P(RemoteClientTest, RenameThenList)
{
    remoteFs().writeFile("old.txt", "content");

    client_->renameFile(makeConn(), "old.txt", "new.txt");

    const std::vector<std::string> names = client_->listDirectory(makeConn());
    EXPECT_NE(std::find(names.begin(), names.end(), "new.txt"), names.end());
    EXPECT_EQ(std::find(names.begin(), names.end(), "old.txt"), names.end());
    EXPECT_EQ(remoteFs().getContent("new.txt"), "content");
}


TEST_P(RemoteClientTest, DirectoryLifecycle)
{
    client_->makeDirectory(makeConn(), "new folder");
    EXPECT_EQ(client_->getPathType(makeConn(), "new folder"), PathType::folder);

    remoteFs().writeFile("new folder/f.txt", "");
    EXPECT_EQ(client_->getPathType(makeConn("new folder"), "f.txt"), PathType::file);

    client_->deleteFile(makeConn("new folder"), "f.txt");
    client_->removeDirectory(makeConn(), "new folder");
    EXPECT_FALSE(remoteFs().exists("new folder"));
}


TEST_P(RemoteClientTest, EmptyArgumentsFailBeforeIo)
{
    setFileContent(getPath("a.txt"), "a");

    EXPECT_THROW(client_->upload(makeConn(), ""), ErrorInvalidArgument);
    EXPECT_THROW(client_->upload(makeConn(), "/"), ErrorInvalidArgument); //no file name
    EXPECT_THROW(client_->download(makeConn(), "", tempFolder_), ErrorInvalidArgument);
    EXPECT_THROW(client_->download(makeConn(), "a.txt", ""), ErrorInvalidArgument);
    EXPECT_THROW(client_->deleteFile(makeConn(), ""), ErrorInvalidArgument);
    EXPECT_THROW(client_->renameFile(makeConn(), "", "b"), ErrorInvalidArgument);
    EXPECT_THROW(client_->renameFile(makeConn(), "a", ""), ErrorInvalidArgument);
    EXPECT_THROW(client_->makeDirectory(makeConn(), ""), ErrorInvalidArgument);
    EXPECT_THROW(client_->removeDirectory(makeConn(), ""), ErrorInvalidArgument);
    EXPECT_THROW(client_->getPathType(makeConn(), ""), ErrorInvalidArgument);

    EXPECT_EQ(remoteCallCount(), 0u);
    EXPECT_TRUE(fetchExtraLog().empty());
}


TEST_P(RemoteClientTest, DirectoryUploadIsUnsupported)
{
    std::filesystem::create_directory(getPath("folder"));

    EXPECT_THROW(client_->upload(makeConn(), getPath("folder")), ErrorUnsupported);
    EXPECT_EQ(remoteCallCount(), 0u);
}


TEST_P(RemoteClientTest, DirectoryWithTrailingSlashIsUnsupported)
{
    std::filesystem::create_directory(getPath("folder"));

    EXPECT_THROW(client_->upload(makeConn(), getPath("folder") + "/"), ErrorUnsupported);
    EXPECT_THROW(client_->upload(makeConn(), getPath("folder") + "//"), ErrorUnsupported);
    EXPECT_EQ(remoteCallCount(), 0u);
}


TEST_P(RemoteClientTest, DirectoryDownloadIsUnsupported)
{
    remoteFs().makeFolder("docs");

    EXPECT_THROW(client_->download(makeConn(), "docs", tempFolder_), ErrorUnsupported);
    EXPECT_FALSE(std::filesystem::exists(getPath("docs")));
}


TEST_P(RemoteClientTest, MissingLocalFile)
{
    EXPECT_THROW(client_->upload(makeConn(), getPath("missing.txt")), ErrorLocalIo);
    EXPECT_EQ(remoteCallCount(), 0u);
}


TEST_P(RemoteClientTest, RemoteErrorIsLogged)
{
    try
    {
        client_->deleteFile(makeConn(), "missing.txt");
        FAIL() << "expected ErrorRemoteOperation";
    }
    catch (const ErrorRemoteOperation& e)
    {
        EXPECT_NE(e.getProtocolStatus(), 0);
    }

    const ErrorLog log = fetchExtraLog();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].type, MSG_TYPE_INFO);
    EXPECT_NE(log[0].message.find("missing.txt"), std::string::npos);

    const ErrorLog errors = filterLog(log, MSG_TYPE_ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].message.find("Cannot delete file"), std::string::npos);
}


TEST_P(RemoteClientTest, OperationIsLogged)
{
    client_->makeDirectory(makeConn(), "logged");

    const ErrorLog log = fetchExtraLog();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].type, MSG_TYPE_INFO);
    EXPECT_NE(log[0].message.find("logged"), std::string::npos);
    EXPECT_EQ(log[0].message.find("secret"), std::string::npos);
}


INSTANTIATE_TEST_SUITE_P(Protocols, RemoteClientTest, ::testing::Values(Protocol::ftp, Protocol::sftp),
                         [](const ::testing::TestParamInfo<Protocol>& info) { return info.param == Protocol::ftp ? "Ftp" : "Sftp"; });


using RemoteClientSftpTest = TempFolderTest;

TEST_F(RemoteClientSftpTest, DownloadKeepsRelativeSourceName)
{
    FakeSftpServer sftpServer;
    sftpServer.fs.makeFolder("sub");
    sftpServer.fs.writeFile("sub/a.txt", "nested");

    std::map<Protocol, std::unique_ptr<RemoteDriver>> drivers;
    drivers.emplace(Protocol::sftp, std::make_unique<SftpDriver>(sftpServer.getSessionFactory()));
    RemoteClient client(std::move(drivers));

    std::filesystem::create_directory(getPath("sub"));

    client.download(ConnectionDescriptor(Protocol::sftp, "host"), "sub/a.txt", tempFolder_);

    EXPECT_EQ(getFileContent(getPath("sub/a.txt")), "nested");
    EXPECT_FALSE(std::filesystem::exists(getPath("a.txt")));
    (void)fetchExtraLog();
}


TEST(RemoteClient, MissingDriverIsUnsupported)
{
    auto ftpServer = std::make_shared<FakeFtpServer>();
    std::map<Protocol, std::unique_ptr<RemoteDriver>> drivers;
    drivers.emplace(Protocol::ftp, std::make_unique<FtpDriver>(ftpServer));
    RemoteClient client(std::move(drivers));

    EXPECT_THROW(client.listDirectory(ConnectionDescriptor(Protocol::sftp, "host")), ErrorUnsupported);
    EXPECT_NO_THROW(client.listDirectory(ConnectionDescriptor(Protocol::ftp, "host")));
    (void)fetchExtraLog();
}
