// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_5520917346120874
#define SCOPE_GUARD_H_5520917346120874

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>


namespace ferry
{
/*  Scope Guard

        auto guardSession = ferry::makeGuard<ScopeGuardRunMode::onExit>([&] { ::libssh2_session_free(session); });
            ...
        guardSession.dismiss();

    Scope Exit:
        FERRY_ON_SCOPE_EXIT   (releaseHandle());
        FERRY_ON_SCOPE_FAIL   (removeTempFile());
        FERRY_ON_SCOPE_SUCCESS(logSuccess());                    */

enum class ScopeGuardRunMode
{
    onExit,
    onSuccess,
    onFail
};


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onExit>)
{
    if (!failed)
        fun(); //throw X
    else
        try { fun(); }
        catch (...) { assert(false); } //exception already in flight
}


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onSuccess>)
{
    if (!failed)
        fun(); //throw X
}


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onFail>) noexcept
{
    if (failed)
        try { fun(); }
        catch (...) { assert(false); }
}


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (!dismissed_)
        {
            const bool failed = std::uncaught_exceptions() > exceptionCount_;
            runScopeGuardDestructor(fun_, failed, std::integral_constant<ScopeGuardRunMode, runMode>());
        }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define FERRY_CONCAT_SUB(X, Y) X ## Y
#define FERRY_CONCAT(X, Y) FERRY_CONCAT_SUB(X, Y)

#define FERRY_CHECK_CASE_FOR_CONSTANT(X) case X: return FERRY_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define FERRY_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X


#define FERRY_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto FERRY_CONCAT(scopeGuard, __LINE__) = ferry::makeGuard<ferry::ScopeGuardRunMode::onExit   >([&]{ X; });
#define FERRY_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto FERRY_CONCAT(scopeGuard, __LINE__) = ferry::makeGuard<ferry::ScopeGuardRunMode::onFail   >([&]{ X; });
#define FERRY_ON_SCOPE_SUCCESS(X) [[maybe_unused]] auto FERRY_CONCAT(scopeGuard, __LINE__) = ferry::makeGuard<ferry::ScopeGuardRunMode::onSuccess>([&]{ X; });

#endif //SCOPE_GUARD_H_5520917346120874
