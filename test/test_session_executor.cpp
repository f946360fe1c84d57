// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <SshBridge/Source/core/session_executor.h>
#include <catch2/catch.hpp>

using namespace sshb;
using namespace std::chrono_literals;


namespace
{
struct Journal
{
    std::vector<int> order;
    int active = 0;
    int maxActive = 0;
};


std::unique_ptr<Journal> makeJournal() { return std::make_unique<Journal>(); }
}


TEST_CASE("executor_runs_tasks_in_submission_order", "[unit][executor]")
{
    SessionExecutor<Journal> executor(makeJournal(), "fifo");

    std::vector<std::future<void>> results;
    for (int i = 0; i < 200; ++i)
        results.push_back(executor.submit([i](Journal& j) { j.order.push_back(i); }));

    for (std::future<void>& fut : results)
        fut.get();

    const std::vector<int> order = executor.submit([](Journal& j) { return j.order; }).get();

    REQUIRE(order.size() == 200);
    for (int i = 0; i < 200; ++i)
        CHECK(order[i] == i);
}


TEST_CASE("executor_never_interleaves_tasks", "[unit][executor]")
{
    SessionExecutor<Journal> executor(makeJournal(), "no-interleave");

    std::vector<std::thread> callers;
    std::mutex lockResults;
    std::vector<std::future<void>> results;

    for (int t = 0; t < 4; ++t)
        callers.emplace_back([&]
        {
            for (int i = 0; i < 50; ++i)
            {
                std::future<void> fut = executor.submit([](Journal& j)
                {
                    j.maxActive = std::max(j.maxActive, ++j.active);
                    std::this_thread::sleep_for(50us);
                    --j.active;
                });
                std::lock_guard dummy(lockResults);
                results.push_back(std::move(fut));
            }
        });

    for (std::thread& t : callers)
        t.join();
    for (std::future<void>& fut : results)
        fut.get();

    CHECK(executor.submit([](Journal& j) { return j.maxActive; }).get() == 1);
}


TEST_CASE("executor_delivers_task_exceptions_and_stays_usable", "[unit][executor]")
{
    SessionExecutor<Journal> executor(makeJournal(), "failing");

    std::future<int> failed = executor.submit([](Journal& j) -> int { throw ErrorProtocol("Task failed.", "details"); });
    CHECK_THROWS_AS(failed.get(), ErrorProtocol);

    CHECK(executor.submit([](Journal& j) { return 42; }).get() == 42);
    CHECK(!executor.isClosed());
}


TEST_CASE("executor_rejects_tasks_after_shutdown", "[unit][executor]")
{
    SessionExecutor<Journal> executor(makeJournal(), "closed");
    executor.submit([](Journal& j) { j.order.push_back(1); }).get();

    executor.shutdown();
    CHECK(executor.isClosed());

    std::future<int> late = executor.submit([](Journal& j) { return 1; });
    REQUIRE(late.wait_for(0s) == std::future_status::ready); //rejected immediately
    CHECK_THROWS_AS(late.get(), ErrorSessionClosed);

    executor.shutdown(); //idempotent
}


TEST_CASE("executor_fails_queued_tasks_at_shutdown", "[unit][executor]")
{
    SessionExecutor<Journal> executor(makeJournal(), "queued");

    std::promise<void> started;
    std::promise<void> gate;
    std::shared_future<void> gateFut = gate.get_future().share();

    std::future<int> running = executor.submit([&started, gateFut](Journal& j)
    {
        started.set_value();
        gateFut.wait();
        return 1;
    });
    started.get_future().wait();

    std::future<int> queued = executor.submit([](Journal& j) { return 2; });

    std::thread closer([&] { executor.shutdown(); }); //blocks until the running task is done

    //queued work is failed right away, without waiting for the running task
    const bool rejectedEarly = queued.wait_for(5s) == std::future_status::ready;

    gate.set_value();
    closer.join();

    CHECK(rejectedEarly);
    CHECK_THROWS_AS(queued.get(), ErrorSessionClosed);

    CHECK(running.get() == 1); //the task in flight completes normally
}


TEST_CASE("executor_destroys_context_on_worker_thread", "[unit][executor]")
{
    struct Context
    {
        explicit Context(std::thread::id& destroyedOn) : destroyedOn_(destroyedOn) {}
        ~Context() { destroyedOn_ = std::this_thread::get_id(); }
        std::thread::id& destroyedOn_;
    };

    std::thread::id destroyedOn;
    std::thread::id workerId;
    {
        SessionExecutor<Context> executor(std::make_unique<Context>(destroyedOn), "teardown");
        workerId = executor.submit([](Context& ctx) { return std::this_thread::get_id(); }).get();
    }
    CHECK(destroyedOn == workerId);
    CHECK(destroyedOn != std::this_thread::get_id());
}


TEST_CASE("executor_rejects_null_context", "[unit][executor]")
{
    CHECK_THROWS_AS(SessionExecutor<Journal>(nullptr, "null"), std::logic_error);
}
