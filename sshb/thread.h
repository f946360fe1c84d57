// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef THREAD_H_4128806559032771
#define THREAD_H_4128806559032771

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "scope_guard.h"


namespace sshb
{
/*  worker thread that is stopped and joined by its owner:
    - session executor: waits for queued tasks
    - keep-alive: sleeps between two keep-alive requests
    both waits end with ThreadStopRequest as soon as the owner calls requestStop()  */

class ThreadStopRequest {};

class StopState;

class InterruptibleThread
{
public:
    InterruptibleThread() {}

    template <class Function>
    explicit InterruptibleThread(Function&& f);

    InterruptibleThread(InterruptibleThread&&) noexcept = default;
    InterruptibleThread& operator=(InterruptibleThread&& tmp) noexcept
    {
        stopAndJoin(); //end old thread's life time right here
        stdThread_ = std::move(tmp.stdThread_);
        stopState_ = std::move(tmp.stopState_);
        return *this;
    }

    ~InterruptibleThread() { stopAndJoin(); }

    bool joinable() const { return stdThread_.joinable(); }
    void requestStop();
    void join() { stdThread_.join(); }

    bool isCurrentThread() const { return stdThread_.get_id() == std::this_thread::get_id(); }

private:
    void stopAndJoin()
    {
        if (joinable())
        {
            requestStop();
            join();
        }
    }

    std::thread stdThread_;
    std::shared_ptr<StopState> stopState_ = std::make_shared<StopState>();
};

//context of worker thread; plain waits when called outside an InterruptibleThread:
template <class Predicate>
void interruptibleWait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred); //throw ThreadStopRequest

template <class Rep, class Period>
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime); //throw ThreadStopRequest

void setCurrentThreadName(const std::string& threadName); //shown by "top -H" and debuggers


//value associated with mutex and guaranteed protected access:
template <class T>
class Protected
{
public:
    Protected() {}

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




//###################### implementation ######################

class StopState
{
public:
    //context of owner:
    void requestStop()
    {
        {
            std::lock_guard dummy(lockStop_);
            stopRequested_ = true;
            if (waitingOn_)
                waitingOn_->notify_all(); //foreign mutex not held: worker may miss this => bounded wait below
        }
        conditionStop_.notify_all();
    }

    //context of worker thread:
    template <class Predicate>
    void wait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred) //throw ThreadStopRequest
    {
        setWaitingOn(&cv);
        SSHB_ON_SCOPE_EXIT(setWaitingOn(nullptr));

        while (!cv.wait_for(lock, std::chrono::milliseconds(1), [&] { return stopRequested_ || pred(); }))
            ;
        if (stopRequested_)
            throw ThreadStopRequest();
    }

    //context of worker thread:
    template <class Rep, class Period>
    void sleep(const std::chrono::duration<Rep, Period>& relTime) //throw ThreadStopRequest
    {
        std::unique_lock lock(lockStop_);
        if (conditionStop_.wait_for(lock, relTime, [this] { return stopRequested_.load(); }))
            throw ThreadStopRequest();
    }

private:
    void setWaitingOn(std::condition_variable* cv)
    {
        std::lock_guard dummy(lockStop_);
        waitingOn_ = cv;
    }

    std::atomic<bool> stopRequested_{false};
    std::condition_variable* waitingOn_ = nullptr; //protected by lockStop_

    std::mutex lockStop_;
    std::condition_variable conditionStop_;
};


namespace impl
{
inline thread_local StopState* threadStopState = nullptr;
}


template <class Predicate> inline
void interruptibleWait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred) //throw ThreadStopRequest
{
    if (impl::threadStopState)
        impl::threadStopState->wait(cv, lock, pred); //throw ThreadStopRequest
    else
        cv.wait(lock, pred);
}


template <class Rep, class Period> inline
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime) //throw ThreadStopRequest
{
    if (impl::threadStopState)
        impl::threadStopState->sleep(relTime); //throw ThreadStopRequest
    else
        std::this_thread::sleep_for(relTime);
}


template <class Function> inline
InterruptibleThread::InterruptibleThread(Function&& f)
{
    stdThread_ = std::thread([f = std::forward<Function>(f), stopState = stopState_]() mutable
    {
        impl::threadStopState = stopState.get();
        SSHB_ON_SCOPE_EXIT(impl::threadStopState = nullptr);
        try
        {
            f(); //throw ThreadStopRequest
        }
        catch (const ThreadStopRequest&) {} //regular end of thread: requested by owner
    });
}


inline
void InterruptibleThread::requestStop() { stopState_->requestStop(); }
}

#endif //THREAD_H_4128806559032771
