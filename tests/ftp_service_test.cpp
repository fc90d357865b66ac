// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <base/extra_log.h>
#include <base/file_io.h>
#include <ferry/ftp_service.h>
#include "fake_ftp_server.h"
#include "temp_folder.h"

using namespace ferry;
using namespace ferry::test;


class FtpServiceTest : public TempFolderTest
{
protected:
    void SetUp() override
    {
        TempFolderTest::SetUp();
        (void)fetchExtraLog();
        server_->fs.makeFolder("pub");
    }

    const std::string serverUri_ = "ftp://ftp.example.com:2121/pub/";
    const FtpCredential cred_{"anna", Credential("pw")};

    std::shared_ptr<FakeFtpServer> server_ = std::make_shared<FakeFtpServer>();
    FtpService service_{server_};
};


TEST_F(FtpServiceTest, ListDropsEmptyLines)
{
    server_->fs.writeFile("pub/b.txt", "");
    server_->fs.writeFile("pub/a.txt", "");

    EXPECT_EQ(service_.listFiles(serverUri_, cred_), (std::vector<std::string>{"b.txt", "a.txt"}));
    ASSERT_EQ(server_->requests.size(), 1u);
    EXPECT_EQ(server_->requests[0].uri, "ftp://ftp.example.com:2121/pub/");
    EXPECT_EQ(server_->requests[0].username, "anna");
}


TEST_F(FtpServiceTest, ListStopsAtEmptyLine)
{
    server_->rawListing = "x\r\n\r\ny\r\n";
    EXPECT_EQ(service_.listFiles(serverUri_, cred_), (std::vector<std::string>{"x"}));
}


TEST_F(FtpServiceTest, UriWithoutTrailingSlash)
{
    service_.makeDirectory("ftp://ftp.example.com:2121/pub", cred_, "new dir");

    EXPECT_EQ(server_->requests.back().uri, "ftp://ftp.example.com:2121/pub/new%20dir");
    EXPECT_TRUE(server_->fs.isFolder("pub/new dir"));
}


TEST_F(FtpServiceTest, InvalidServerUri)
{
    EXPECT_THROW(service_.listFiles("", cred_), ErrorInvalidArgument);
    EXPECT_THROW(service_.listFiles("sftp://ftp.example.com/", cred_), ErrorInvalidArgument);
    EXPECT_THROW(service_.listFiles("ftp:///pub", cred_), ErrorInvalidArgument);
    EXPECT_THROW(service_.deleteFile(serverUri_, cred_, ""), ErrorInvalidArgument);
    EXPECT_THROW(service_.renameFile(serverUri_, cred_, "a", ""), ErrorInvalidArgument);
    EXPECT_THROW(service_.downloadFile(serverUri_, cred_, "a", ""), ErrorInvalidArgument);
    EXPECT_TRUE(server_->requests.empty());

    EXPECT_NO_THROW(service_.listFiles("FTP://ftp.example.com:2121/pub/", cred_));
}


TEST_F(FtpServiceTest, RenameSendsBareName)
{
    server_->fs.writeFile("pub/old.txt", "x");

    service_.renameFile(serverUri_, cred_, "old.txt", "new.txt");

    EXPECT_EQ(server_->requests.back().uri, "ftp://ftp.example.com:2121/pub/old.txt");
    EXPECT_EQ(server_->requests.back().renameTo, "new.txt");
    EXPECT_TRUE(server_->fs.isFile("pub/new.txt"));
}


TEST_F(FtpServiceTest, UploadDownload)
{
    setFileContent(getPath("local.txt"), "hello");

    service_.uploadFile(serverUri_, cred_, getPath("local.txt"));
    EXPECT_EQ(server_->fs.getContent("pub/local.txt"), "hello");

    service_.uploadFile(serverUri_, cred_, getPath("local.txt"), "renamed.txt");
    EXPECT_EQ(server_->fs.getContent("pub/renamed.txt"), "hello");

    std::filesystem::create_directory(getPath("out"));
    service_.downloadFile(serverUri_, cred_, "renamed.txt", getPath("out"));
    EXPECT_EQ(getFileContent(getPath("out/renamed.txt")), "hello");
}


TEST_F(FtpServiceTest, DeleteAndRemoveDirectory)
{
    server_->fs.makeFolder("pub/sub");
    server_->fs.writeFile("pub/sub/f", "");

    EXPECT_THROW(service_.removeDirectory(serverUri_, cred_, "sub"), ErrorRemoteOperation);

    service_.deleteFile("ftp://ftp.example.com:2121/pub/sub/", cred_, "f");
    service_.removeDirectory(serverUri_, cred_, "sub");
    EXPECT_FALSE(server_->fs.exists("pub/sub"));
}


TEST_F(FtpServiceTest, ErrorsAreLogged)
{
    try
    {
        service_.deleteFile(serverUri_, cred_, "missing");
        FAIL() << "expected ErrorRemoteOperation";
    }
    catch (const ErrorRemoteOperation& e)
    {
        EXPECT_EQ(e.getProtocolStatus(), 550);
    }

    const ErrorLogStats stats = getStats(fetchExtraLog());
    EXPECT_EQ(stats.info,  1);
    EXPECT_EQ(stats.error, 1);
}
