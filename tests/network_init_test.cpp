// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <ferry/ftp_curl.h>
#include <ferry/init_curl_libssh2.h>

using namespace ferry;


TEST(NetworkInit, CookiesAreCounted)
{
    const int levelBefore = getNetworkInitLevel();
    {
        const std::shared_ptr<NetworkInitCookie> cookie1 = acquireNetworkInit();
        EXPECT_EQ(getNetworkInitLevel(), levelBefore + 1);
        {
            const std::shared_ptr<NetworkInitCookie> cookie2 = acquireNetworkInit();
            EXPECT_EQ(getNetworkInitLevel(), levelBefore + 2);

            const std::shared_ptr<NetworkInitCookie> cookie2Copy = cookie2; //same cookie
            EXPECT_EQ(getNetworkInitLevel(), levelBefore + 2);
        }
        EXPECT_EQ(getNetworkInitLevel(), levelBefore + 1);
    }
    EXPECT_EQ(getNetworkInitLevel(), levelBefore);
}


TEST(NetworkInit, TransportHoldsCookie)
{
    const int levelBefore = getNetworkInitLevel();
    {
        CurlFtpTransport transport;
        EXPECT_EQ(getNetworkInitLevel(), levelBefore + 1);
    }
    EXPECT_EQ(getNetworkInitLevel(), levelBefore);
}


TEST(NetworkInit, ReinitAfterTeardown)
{
    for (int i = 0; i < 3; ++i)
    {
        const std::shared_ptr<NetworkInitCookie> cookie = acquireNetworkInit();
        EXPECT_GE(getNetworkInitLevel(), 1);
    }
}
