// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef THREAD_H_6618203947561203
#define THREAD_H_6618203947561203

#include <mutex>


namespace ferry
{
//serialized access to a shared value
//    Protected<ErrorLog> log;
//    log.access([&](ErrorLog& l) { logMsg(l, msg, MSG_TYPE_ERROR); });
template <class T>
class Protected
{
public:
    Protected() {}
    explicit Protected(T& value) : value_(value) {}

    template <class Function>
    auto access(Function fun)
    {
        std::lock_guard dummy(lockValue_);
        return fun(value_);
    }

private:
    Protected           (const Protected&) = delete;
    Protected& operator=(const Protected&) = delete;

    std::mutex lockValue_;
    T value_{};
};
}

#endif //THREAD_H_6618203947561203
