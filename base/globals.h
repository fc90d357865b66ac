// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef GLOBALS_H_3390417256618023
#define GLOBALS_H_3390417256618023

#include <atomic>
#include <memory>
#include <utility>
#include "scope_guard.h"


namespace ferry
{
/*  process-wide instance with shared ownership and serialized access:
    - a caller that still holds the std::shared_ptr keeps the instance alive past static destruction
    - get() after static destruction returns nullptr instead of touching a dead object
    - the bookkeeping is trivially destructible POD: its memory stays valid until process exit

    not for function-scope statics: their "magic statics" guard code has no such guarantee  */
class PodSpinMutex
{
public:
    bool tryLock() { return !flag_.test_and_set(std::memory_order_acquire); }

    void lock()
    {
        while (!tryLock())
            flag_.wait(true, std::memory_order_relaxed);
    }

    void unlock()
    {
        flag_.clear(std::memory_order_release);
        flag_.notify_one();
    }

private:
    std::atomic_flag flag_{}; //clear state after static zero-initialization
};


template <class T>
class Global
{
public:
    consteval Global() {} //static zero-initialization only: no construction order issues

    ~Global()
    {
        static_assert(std::is_trivially_destructible_v<Pod>, "this memory needs to live forever");

        pod_.spinLock.lock();
        std::shared_ptr<T>* oldInst = std::exchange(pod_.inst, nullptr);
        pod_.destroyed = true;
        pod_.spinLock.unlock();

        delete oldInst; //outstanding std::shared_ptr copies keep T alive
    }

    std::shared_ptr<T> get()
    {
        pod_.spinLock.lock();
        FERRY_ON_SCOPE_EXIT(pod_.spinLock.unlock());

        if (pod_.inst)
            return *pod_.inst;
        return nullptr;
    }

    void set(std::unique_ptr<T>&& newInst)
    {
        std::shared_ptr<T>* tmpInst = nullptr;
        if (newInst)
            tmpInst = new std::shared_ptr<T>(std::move(newInst));
        {
            pod_.spinLock.lock();
            FERRY_ON_SCOPE_EXIT(pod_.spinLock.unlock());

            if (!pod_.destroyed)
                std::swap(pod_.inst, tmpInst);

            pod_.initialized = true;
        }
        delete tmpInst;
    }

    //lazy creation from frequently-called functions, possibly on parallel threads
    template <class Function>
    void setOnce(Function getInitialValue /*-> std::unique_ptr<T>*/)
    {
        pod_.spinLock.lock();
        FERRY_ON_SCOPE_EXIT(pod_.spinLock.unlock());

        if (!pod_.initialized)
        {
            if (!pod_.destroyed)
                if (std::unique_ptr<T> newInst = getInitialValue())
                    pod_.inst = new std::shared_ptr<T>(std::move(newInst));

            pod_.initialized = true;
        }
    }

private:
    Global           (const Global&) = delete;
    Global& operator=(const Global&) = delete;

    struct Pod
    {
        PodSpinMutex spinLock; //std::mutex has a non-trivial destructor
        std::shared_ptr<T>* inst = nullptr;
        bool initialized = false;
        bool destroyed   = false;
    } pod_;
};
}

#endif //GLOBALS_H_3390417256618023
