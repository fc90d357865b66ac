// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef EXTRA_LOG_H_1802673519043387
#define EXTRA_LOG_H_1802673519043387

#include <functional>
#include "error_log.h"
#include "globals.h"
#include "thread.h"

/*  process-wide log:
    - one info entry per remote operation
    - errors in "exceptional situations" when no other means are available, e.g.
        - while an exception is in flight
        - cleanup errors in destructors
    at most EXTRA_LOG_MAX_ENTRIES are kept: the oldest entries are dropped first    */

namespace ferry
{
const size_t EXTRA_LOG_MAX_ENTRIES = 10000;

namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog)
    {
        reportOutstandingLog_ = reportOutstandingLog;
    }

    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    void log(const std::wstring& msg, MessageType type)
    {
        if (log_.size() >= EXTRA_LOG_MAX_ENTRIES)
            log_.erase(log_.begin(), log_.end() - (EXTRA_LOG_MAX_ENTRIES - 1));

        logMsg(log_, msg, type);
    }

private:
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};

inline constinit Global<Protected<ExtraLog>> globalExtraLog;

template <class Function>
void accessExtraLog(Function fun)
{
    globalExtraLog.setOnce([] { return std::make_unique<Protected<ExtraLog>>(); });

    if (std::shared_ptr<Protected<ExtraLog>> protExtraLog = globalExtraLog.get())
        protExtraLog->access([&](ExtraLog& el) { fun(el); });
    //else: access after global shutdown: entry is lost
}
}

inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.init(reportOutstandingLog); });
}


inline
ErrorLog fetchExtraLog()
{
    ErrorLog output;
    impl::accessExtraLog([&](impl::ExtraLog& el) { output = el.fetchLog(); });
    return output;
}


inline
void logExtraInfo(const std::wstring& msg)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_INFO); });
}


inline
void logExtraWarning(const std::wstring& msg)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_WARNING); });
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_ERROR); });
}
}

#endif //EXTRA_LOG_H_1802673519043387
