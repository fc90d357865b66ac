// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <optional>
#include <gtest/gtest.h>
#include <ferry/credential.h>

using namespace ferry;


TEST(Credential, DefaultIsEmpty)
{
    const Credential cred;
    EXPECT_EQ(cred.plainText(), "");
    EXPECT_TRUE(cred.secureHandle().empty());
    EXPECT_STREQ(cred.secureHandle().c_str(), "");
}


TEST(Credential, PlainTextAndSecureHandleAgree)
{
    const Credential cred("s3cr3t");
    EXPECT_EQ(cred.plainText(), "s3cr3t");

    const SecureSecret secret = cred.secureHandle();
    EXPECT_EQ(secret.size(), 6u);
    EXPECT_STREQ(secret.c_str(), "s3cr3t");
}


TEST(Credential, EmbeddedNullIsKept)
{
    const Credential cred(std::string_view("a\0b", 3));
    EXPECT_EQ(cred.plainText(), std::string("a\0b", 3));
    EXPECT_EQ(cred.secureHandle().size(), 3u);
}


TEST(Credential, SecureHandleOutlivesCredential)
{
    std::optional<SecureSecret> secret;
    {
        const Credential cred("outlive");
        secret = cred.secureHandle();
    }
    EXPECT_STREQ(secret->c_str(), "outlive");
}


TEST(Credential, CopiesShareValue)
{
    const Credential cred("pass");
    const Credential copy = cred;
    EXPECT_EQ(copy, cred);
    EXPECT_EQ(copy.secureHandle().c_str(), cred.secureHandle().c_str()); //same buffer
}


TEST(Credential, Comparison)
{
    EXPECT_EQ(Credential("abc"), Credential("abc"));
    EXPECT_FALSE(Credential("abc") == Credential("abd"));
    EXPECT_FALSE(Credential("abc") == Credential("abcd"));
    EXPECT_EQ(Credential(), Credential(""));
}
