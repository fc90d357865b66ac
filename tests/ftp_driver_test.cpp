// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <base/file_io.h>
#include "fake_ftp_server.h"
#include "temp_folder.h"

using namespace ferry;
using namespace ferry::test;
using ::testing::_;
using ::testing::Throw;
using ::testing::Return;
using namespace std::string_literals;


namespace
{
ConnectionDescriptor makeConn(int port = 0, const std::string& workingPath = {})
{
    ConnectionDescriptor conn(Protocol::ftp, "ftp.example.com", port, "user", Credential("pw"));
    conn.setWorkingPath(workingPath);
    return conn;
}
}


TEST(FtpUri, Build)
{
    EXPECT_EQ(buildFtpUri(makeConn(), "a.txt", false), "ftp://ftp.example.com/a.txt");
    EXPECT_EQ(buildFtpUri(makeConn(2121, "pub"), "a.txt", false), "ftp://ftp.example.com:2121/pub/a.txt");
    EXPECT_EQ(buildFtpUri(makeConn(21, "/pub/"), "a.txt", false), "ftp://ftp.example.com:21/pub/a.txt"); //explicit port is kept
    EXPECT_EQ(buildFtpUri(makeConn(0, "pub"), "", true), "ftp://ftp.example.com/pub/");
    EXPECT_EQ(buildFtpUri(makeConn(0, "pub"), "docs", true), "ftp://ftp.example.com/pub/docs/");
}


TEST(FtpUri, PercentEncoding)
{
    EXPECT_EQ(buildFtpUri(makeConn(0, "my docs/#1"), "a b%.txt", false), "ftp://ftp.example.com/my%20docs/%231/a%20b%25.txt");
    EXPECT_EQ(buildFtpUri(makeConn(), "\xc3\xa4-_.~", false), "ftp://ftp.example.com/%C3%A4-_.~");
}


TEST(FtpUri, OnlyBaseNameIsUsed)
{
    EXPECT_EQ(buildFtpUri(makeConn(0, "pub"), "sub/dir/a.txt", false), "ftp://ftp.example.com/pub/a.txt");
}


TEST(FtpUri, IsPure)
{
    const ConnectionDescriptor conn = makeConn(2121, "x/y");
    EXPECT_EQ(buildFtpUri(conn, "z", false), buildFtpUri(conn, "z", false));
}


TEST(FtpNameList, StopsAtFirstEmptyLine)
{
    EXPECT_EQ(parseFtpNameList("a.txt\r\nb.txt\r\n\r\nhidden\r\n"), (std::vector<std::string>{"a.txt", "b.txt", ""}));
}


TEST(FtpNameList, AppendsEndMarker)
{
    EXPECT_EQ(parseFtpNameList("a.txt\r\nb.txt"), (std::vector<std::string>{"a.txt", "b.txt", ""}));
    EXPECT_EQ(parseFtpNameList("a.txt\nb.txt\n"), (std::vector<std::string>{"a.txt", "b.txt", ""}));
    EXPECT_EQ(parseFtpNameList(""), (std::vector<std::string>{""}));
}


TEST(FtpNameList, KeepsServerOrder)
{
    EXPECT_EQ(parseFtpNameList("zeta\r\nalpha\r\nmid\r\n"), (std::vector<std::string>{"zeta", "alpha", "mid", ""}));
}


TEST(FtpNameList, Latin1Fallback)
{
    EXPECT_EQ(parseFtpNameList("caf\xe9\r\n"), (std::vector<std::string>{"caf\xc3\xa9", ""}));
    EXPECT_EQ(parseFtpNameList("caf\xc3\xa9\r\n"), (std::vector<std::string>{"caf\xc3\xa9", ""})); //valid UTF-8 stays as is
}


TEST(FtpStatus, Format)
{
    EXPECT_EQ(formatFtpStatus(550), L"FTP status 550: File unavailable, e.g. file not found, no access.");
    EXPECT_EQ(formatFtpStatus(599), L"FTP status 599.");
}


TEST(FtpClassification, Table)
{
    ASSERT_EQ(FTP_STATUS_CLASSIFICATION.size(), 1u);
    EXPECT_EQ(FTP_STATUS_CLASSIFICATION.at(550), PathType::file);

    EXPECT_EQ(classifyFtpStatus(550), PathType::file);
    EXPECT_EQ(classifyFtpStatus(530), PathType::folder);
    EXPECT_EQ(classifyFtpStatus(450), PathType::folder);
}


TEST(FtpClassification, ListSuccessMeansFolder)
{
    auto transport = std::make_shared<MockFtpTransport>();
    EXPECT_CALL(*transport, perform(_, _, _)).WillOnce(Return("226 Transfer complete."));

    EXPECT_EQ(FtpDriver(transport).getPathType(makeConn(), "docs"), PathType::folder);
}


TEST(FtpClassification, Status550MeansFile)
{
    auto transport = std::make_shared<MockFtpTransport>();
    EXPECT_CALL(*transport, perform(_, _, _)).WillOnce(Throw(SysErrorFtpProtocol(L"550 Failed to change directory.", 550)));

    EXPECT_EQ(FtpDriver(transport).getPathType(makeConn(), "a.txt"), PathType::file);
}


TEST(FtpClassification, OtherStatusMeansFolder)
{
    auto transport = std::make_shared<MockFtpTransport>();
    EXPECT_CALL(*transport, perform(_, _, _)).WillOnce(Throw(SysErrorFtpProtocol(L"530 Not logged in.", 530)));

    EXPECT_EQ(FtpDriver(transport).getPathType(makeConn(), "x"), PathType::folder);
}


TEST(FtpClassification, NoStatusIsAnError)
{
    auto transport = std::make_shared<MockFtpTransport>();
    EXPECT_CALL(*transport, perform(_, _, _)).WillOnce(Throw(SysError(L"Connection refused.")));

    try
    {
        FtpDriver(transport).getPathType(makeConn(), "x");
        FAIL() << "expected ErrorRemoteOperation";
    }
    catch (const ErrorRemoteOperation& e)
    {
        EXPECT_EQ(e.getProtocolStatus(), 0);
        EXPECT_NE(e.toString().find(L"Connection refused."), std::wstring::npos);
    }
}


TEST(FtpClassification, ListsItemAsFolderUri)
{
    auto transport = std::make_shared<MockFtpTransport>();
    FtpRequest seen;
    EXPECT_CALL(*transport, perform(_, _, _)).WillOnce([&](const FtpRequest& request,
                                                          const std::function<void  (std::span<const char> buf)>& /*writeResponse*/,
                                                          const std::function<size_t(std::span<      char> buf)>& /*readRequest*/)
    {
        seen = request;
        return std::string();
    });

    FtpDriver(transport).getPathType(makeConn(2121, "pub"), "docs");
    EXPECT_EQ(seen.method, FtpMethod::list);
    EXPECT_EQ(seen.uri, "ftp://ftp.example.com:2121/pub/docs/");
    EXPECT_EQ(seen.username, "user");
    EXPECT_EQ(seen.password.plainText(), "pw");
}


TEST(FtpDriverTest, ListDirectory)
{
    auto server = std::make_shared<FakeFtpServer>();
    server->fs.makeFolder("pub");
    server->fs.writeFile("pub/b.txt", "");
    server->fs.writeFile("pub/a.txt", "");

    EXPECT_EQ(FtpDriver(server).listDirectory(makeConn(0, "pub")), (std::vector<std::string>{"b.txt", "a.txt", ""}));
    ASSERT_EQ(server->requests.size(), 1u);
    EXPECT_EQ(server->requests[0].uri, "ftp://ftp.example.com/pub/");
}


TEST(FtpDriverTest, ListDirectoryRawResponse)
{
    auto server = std::make_shared<FakeFtpServer>();
    server->rawListing = "one\r\n\r\ntwo\r\n";

    EXPECT_EQ(FtpDriver(server).listDirectory(makeConn()), (std::vector<std::string>{"one", ""}));
}


TEST(FtpDriverTest, RenameSendsFullTargetUri)
{
    auto server = std::make_shared<FakeFtpServer>();
    server->fs.makeFolder("pub");
    server->fs.writeFile("pub/a.txt", "data");

    FtpDriver(server).renameFile(makeConn(2121, "pub"), "a.txt", "b.txt");

    ASSERT_EQ(server->requests.size(), 1u);
    EXPECT_EQ(server->requests[0].method, FtpMethod::rename);
    EXPECT_EQ(server->requests[0].uri, "ftp://ftp.example.com:2121/pub/a.txt");
    EXPECT_EQ(server->requests[0].renameTo, "ftp://ftp.example.com:2121/pub/b.txt");
    EXPECT_TRUE(server->fs.isFile("pub/b.txt"));
    EXPECT_FALSE(server->fs.exists("pub/a.txt"));
}


TEST(FtpDriverTest, ErrorCarriesFtpStatus)
{
    auto server = std::make_shared<FakeFtpServer>();

    try
    {
        FtpDriver(server).deleteFile(makeConn(), "missing.txt");
        FAIL() << "expected ErrorRemoteOperation";
    }
    catch (const ErrorRemoteOperation& e)
    {
        EXPECT_EQ(e.getProtocolStatus(), 550);
        EXPECT_NE(e.toString().find(L"ftp://user@ftp.example.com/missing.txt"), std::wstring::npos);
        EXPECT_NE(e.toString().find(L"FTP status 550"), std::wstring::npos);
    }
}


TEST(FtpDriverTest, WrongPasswordIsRemoteError)
{
    auto server = std::make_shared<FakeFtpServer>();
    server->requiredPassword = "other";

    try
    {
        FtpDriver(server).listDirectory(makeConn());
        FAIL() << "expected ErrorRemoteOperation";
    }
    catch (const ErrorRemoteOperation& e)
    {
        EXPECT_EQ(e.getProtocolStatus(), 530);
    }
    EXPECT_EQ(FtpDriver(server).getPathType(makeConn(), "a.txt"), PathType::folder);
}


TEST(FtpDriverTest, DirectoryCommands)
{
    auto server = std::make_shared<FakeFtpServer>();
    FtpDriver driver(server);

    driver.makeDirectory(makeConn(), "new dir");
    EXPECT_TRUE(server->fs.isFolder("new dir"));
    EXPECT_EQ(server->requests.back().method, FtpMethod::makeDir);
    EXPECT_EQ(server->requests.back().uri, "ftp://ftp.example.com/new%20dir");

    EXPECT_THROW(driver.makeDirectory(makeConn(), "new dir"), ErrorRemoteOperation);

    driver.removeDirectory(makeConn(), "new dir");
    EXPECT_FALSE(server->fs.exists("new dir"));
    EXPECT_EQ(server->requests.back().method, FtpMethod::removeDir);
}


class FtpDriverTransfer : public TempFolderTest {};

TEST_F(FtpDriverTransfer, UploadDownload)
{
    auto server = std::make_shared<FakeFtpServer>();
    FtpDriver driver(server);

    const std::string content = "binary\0data\r\nwith line breaks"s;
    setFileContent(getPath("local.bin"), content);

    driver.uploadFile(makeConn(), getPath("local.bin"), "remote.bin");
    EXPECT_EQ(server->requests.back().method, FtpMethod::store);
    EXPECT_EQ(server->fs.getContent("remote.bin"), content);

    driver.downloadFile(makeConn(), "remote.bin", getPath("copy.bin"));
    EXPECT_EQ(server->requests.back().method, FtpMethod::retrieve);
    EXPECT_EQ(getFileContent(getPath("copy.bin")), content);
}


TEST_F(FtpDriverTransfer, MissingLocalFile)
{
    auto server = std::make_shared<FakeFtpServer>();

    EXPECT_THROW(FtpDriver(server).uploadFile(makeConn(), getPath("missing.txt"), "x.txt"), ErrorLocalIo);
    EXPECT_TRUE(server->requests.empty());
}


TEST_F(FtpDriverTransfer, FailedDownloadLeavesNoFile)
{
    auto server = std::make_shared<FakeFtpServer>();

    EXPECT_THROW(FtpDriver(server).downloadFile(makeConn(), "missing.txt", getPath("target.txt")), ErrorRemoteOperation);
    EXPECT_FALSE(std::filesystem::exists(getPath("target.txt")));
}
