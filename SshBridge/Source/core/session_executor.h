// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SESSION_EXECUTOR_H_3348102776659014
#define SESSION_EXECUTOR_H_3348102776659014

#include <functional>
#include <future>
#include <sshb/ring_buffer.h>
#include <sshb/thread.h>
#include "ssh_status.h"


namespace sshb
{
/*  serialize all work against one non-reentrant session:
        - a single worker thread owns "Context" and runs tasks in submission order (FIFO)
        - tasks run one at a time: never interleaved, never concurrent
        - exceptions thrown by a task are delivered through its future; the executor stays usable
        - after shutdown(): tasks fail with ErrorSessionClosed, including those still queued
        - "Context" is destroyed on the worker thread                                      */
template <class Context>
class SessionExecutor
{
public:
    SessionExecutor(std::unique_ptr<Context>&& context, const std::string& sessionName);
    ~SessionExecutor() { shutdown(); }

    //context of any thread, non-blocking; R fun(Context&)
    template <class Function>
    auto submit(Function&& fun) -> std::future<decltype(fun(std::declval<Context&>()))>;

    //context of any thread except the worker: blocks until the running task (if any) has finished
    void shutdown();

    bool isClosed() const;

private:
    SessionExecutor           (const SessionExecutor&) = delete;
    SessionExecutor& operator=(const SessionExecutor&) = delete;

    struct Task
    {
        std::function<void(Context& ctx)> run;               //noexcept! failures are forwarded to the future
        std::function<void(std::exception_ptr e)> reject; //
    };

    struct WorkLoad
    {
        mutable std::mutex lock;
        std::condition_variable conditionNewTask;
        RingBuffer<Task> tasks; //FIFO!
        bool closed = false;
    };

    ErrorSessionClosed makeClosedError() const { return ErrorSessionClosed(replaceCpy(_("Session %x has been closed."), "%x", fmtPath(sessionName_))); }

    const std::string sessionName_;
    const std::shared_ptr<WorkLoad> workLoad_ = std::make_shared<WorkLoad>();

    std::mutex lockShutdown_;
    InterruptibleThread worker_;
};








//###################### implementation ######################
template <class Context> inline
SessionExecutor<Context>::SessionExecutor(std::unique_ptr<Context>&& context, const std::string& sessionName) : sessionName_(sessionName)
{
    if (!context)
        throw SSHB_CONTRACT_VIOLATION();

    worker_ = InterruptibleThread([workLoad = workLoad_ /*share ownership!*/, context = std::move(context), threadName = "SSH " + sessionName]() mutable
    {
        setCurrentThreadName(threadName);
        SSHB_ON_SCOPE_EXIT(context.reset()); //tear down handle tree in serialized context

        std::unique_lock dummy(workLoad->lock);
        for (;;)
        {
            interruptibleWait(workLoad->conditionNewTask, dummy, [&tasks = workLoad->tasks] { return !tasks.empty(); }); //throw ThreadStopRequest

            Task task = std::move(workLoad->tasks.front()); //noexcept thanks to move
            /**/                  workLoad->tasks.pop_front(); //

            dummy.unlock();
            task.run(*context);
            dummy.lock();
        }
    });
}


template <class Context>
template <class Function> inline
auto SessionExecutor<Context>::submit(Function&& fun) -> std::future<decltype(fun(std::declval<Context&>()))>
{
    using ResultType = decltype(fun(std::declval<Context&>()));

    auto promResult = std::make_shared<std::promise<ResultType>>(); //std::function doesn't support construction involving move-only types!
    std::future<ResultType> futResult = promResult->get_future();

    auto sharedFun = std::make_shared<std::decay_t<Function>>(std::forward<Function>(fun)); //support move-only function objects

    Task task
    {
        .run = [promResult, sharedFun](Context& ctx)
        {
            try
            {
                if constexpr (std::is_void_v<ResultType>)
                {
                    (*sharedFun)(ctx); //throw X
                    promResult->set_value();
                }
                else
                    promResult->set_value((*sharedFun)(ctx)); //throw X
            }
            catch (...) { promResult->set_exception(std::current_exception()); } //delivered to the caller unchanged
        },
        .reject = [promResult](std::exception_ptr e) { promResult->set_exception(e); },
    };

    {
        std::lock_guard dummy(workLoad_->lock);

        if (!workLoad_->closed)
        {
            workLoad_->tasks.push_back(std::move(task));
            task.reject = nullptr; //queued
        }
    }

    if (task.reject) //executor is closed
        task.reject(std::make_exception_ptr(makeClosedError()));
    else
        workLoad_->conditionNewTask.notify_all();

    return futResult;
}


template <class Context> inline
void SessionExecutor<Context>::shutdown()
{
    if (worker_.joinable() && worker_.isCurrentThread())
        throw SSHB_CONTRACT_VIOLATION(); //would dead-lock: joining ourselves

    std::lock_guard dummyShutdown(lockShutdown_);

    RingBuffer<Task> pendingTasks;
    {
        std::lock_guard dummy(workLoad_->lock);
        workLoad_->closed = true;
        pendingTasks.swap(workLoad_->tasks);
    }

    for (; !pendingTasks.empty(); pendingTasks.pop_front())
        pendingTasks.front().reject(std::make_exception_ptr(makeClosedError()));

    if (worker_.joinable())
    {
        worker_.requestStop();
        worker_.join();
    }
}


template <class Context> inline
bool SessionExecutor<Context>::isClosed() const
{
    std::lock_guard dummy(workLoad_->lock);
    return workLoad_->closed;
}
}

#endif //SESSION_EXECUTOR_H_3348102776659014
