// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <stdexcept>
#include <gtest/gtest.h>
#include <base/scope_guard.h>
#include <base/thread.h>

using namespace ferry;


namespace
{
std::string runGuarded(bool fail)
{
    std::string trace;
    try
    {
        FERRY_ON_SCOPE_EXIT   (trace += "exit;");
        FERRY_ON_SCOPE_FAIL   (trace += "fail;");
        FERRY_ON_SCOPE_SUCCESS(trace += "success;");
        if (fail)
            throw std::runtime_error("fail");
    }
    catch (const std::runtime_error&) { trace += "caught;"; }
    return trace;
}
}


TEST(ScopeGuard, RunModes)
{
    //guards run in reverse order of declaration
    EXPECT_EQ(runGuarded(false), "success;exit;");
    EXPECT_EQ(runGuarded(true),  "fail;exit;caught;");
}


TEST(ScopeGuard, Dismiss)
{
    int count = 0;
    {
        auto guard = makeGuard<ScopeGuardRunMode::onExit>([&] { ++count; });
        guard.dismiss();
    }
    EXPECT_EQ(count, 0);
}


TEST(Protected, Access)
{
    Protected<std::vector<int>> numbers;
    numbers.access([](std::vector<int>& v) { v.push_back(1); v.push_back(2); });

    EXPECT_EQ(numbers.access([](const std::vector<int>& v) { return v.size(); }), 2u);
}
