#include <catch2/catch_test_macros.hpp>
#include <herald/coro/task.hpp>
#include <herald/runtime/scheduler.hpp>
#include <herald/runtime/run.hpp>
#include <string>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>
#include "../test_main.cpp"  // For scaled timeouts

using namespace herald::coro;
using namespace herald::runtime;
using namespace herald::test;

// Helper: Simple coroutine that returns a value
task<int> simple_return_value() {
    co_return 42;
}

// Helper: Simple void coroutine
task<void> simple_void() {
    co_return;
}

// Helper: Coroutine that throws
task<int> throwing_coroutine() {
    throw std::runtime_error("test error");
    co_return 0;  // Unreachable
}

// Helper: Nested coroutines
task<int> nested_inner() {
    co_return 10;
}

task<int> nested_outer() {
    int value = co_await nested_inner();
    co_return value * 2;
}

TEST_CASE("task is lazily started", "[task]") {
    bool started = false;
    auto body = [&]() -> task<void> {
        started = true;
        co_return;
    };

    {
        auto t = body();
        REQUIRE(t.handle() != nullptr);
        REQUIRE_FALSE(started);
    }
    // Destroying an unstarted task frees the frame without running it
    REQUIRE_FALSE(started);
}

TEST_CASE("task move semantics", "[task]") {
    auto t1 = simple_return_value();
    auto h1 = t1.handle();
    REQUIRE(h1 != nullptr);

    auto t2 = std::move(t1);
    REQUIRE(t1.handle() == nullptr);  // Moved-from
    REQUIRE(t2.handle() == h1);       // Moved-to
}

TEST_CASE("task<int> co_return value", "[task]") {
    auto t = simple_return_value();
    t.handle().resume();

    REQUIRE(t.handle().promise().value_.has_value());
    REQUIRE(t.handle().promise().value_.value() == 42);
}

TEST_CASE("task<void> co_return void", "[task]") {
    auto t = simple_void();
    t.handle().resume();
    REQUIRE(t.handle().done());
}

TEST_CASE("task stores exception", "[task]") {
    auto t = throwing_coroutine();
    t.handle().resume();
    REQUIRE(t.handle().promise().exception() != nullptr);
}

TEST_CASE("task nested co_await", "[task]") {
    auto t = nested_outer();
    t.handle().resume();
    REQUIRE(t.handle().promise().value_.value() == 20);
}

TEST_CASE("task exception propagation via co_await", "[task]") {
    std::string message;
    auto outer = [&]() -> task<void> {
        try {
            co_await throwing_coroutine();
        } catch (const std::runtime_error& e) {
            message = e.what();
        }
    };

    auto t = outer();
    t.handle().resume();

    REQUIRE(t.handle().done());
    REQUIRE(message == "test error");
}

TEST_CASE("task move-only result", "[task]") {
    auto make = []() -> task<std::unique_ptr<int>> {
        co_return std::make_unique<int>(7);
    };
    auto out = std::make_unique<int>(0);
    auto driver = [&]() -> task<void> {
        out = co_await make();
    };

    auto t = driver();
    t.handle().resume();
    REQUIRE(*out == 7);
}

// ============================================================================
// go(), spawn(), join_handle
// ============================================================================

TEST_CASE("task::go() without a scheduler runs inline", "[task][spawn]") {
    bool executed = false;
    auto body = [&]() -> task<void> {
        executed = true;
        co_return;
    };

    body().go();
    REQUIRE(executed);
}

TEST_CASE("task::go() spawns fire-and-forget task", "[task][spawn]") {
    scheduler sched(2);
    sched.start();

    std::atomic<bool> executed{false};
    auto body = [&]() -> task<void> {
        executed.store(true);
        co_return;
    };

    body().go(sched);

    REQUIRE(wait_until([&] { return executed.load(); }));
    sched.shutdown();
}

TEST_CASE("task::spawn() returns joinable handle", "[task][spawn][join_handle]") {
    scheduler sched(2);
    sched.start();

    auto compute = []() -> task<int> {
        co_return 100;
    };
    auto driver = [&]() -> task<int> {
        auto handle = compute().spawn(sched);
        co_return co_await handle;
    };

    REQUIRE(block_on(sched, driver()) == 100);
    sched.shutdown();
}

TEST_CASE("join_handle propagates exceptions", "[task][spawn][join_handle]") {
    scheduler sched(2);
    sched.start();

    auto thrower = []() -> task<int> {
        throw std::runtime_error("spawn error");
        co_return 0;
    };
    auto catcher = [&]() -> task<std::string> {
        try {
            auto handle = thrower().spawn(sched);
            co_await handle;
        } catch (const std::runtime_error& e) {
            co_return std::string(e.what());
        }
        co_return std::string();
    };

    REQUIRE(block_on(sched, catcher()) == "spawn error");
    sched.shutdown();
}

TEST_CASE("many spawned tasks all join", "[task][spawn][join_handle]") {
    scheduler sched(4);
    sched.start();

    auto work = [](int n) -> task<int> {
        co_return n * n;
    };
    auto driver = [&]() -> task<int> {
        std::vector<join_handle<int>> handles;
        for (int i = 1; i <= 50; ++i) {
            handles.push_back(work(i).spawn(sched));
        }
        int sum = 0;
        for (auto& h : handles) {
            sum += co_await h;
        }
        co_return sum;
    };

    REQUIRE(block_on(sched, driver()) == 42925);  // sum of squares 1..50
    sched.shutdown();
}

TEST_CASE("run() drives a task on a private scheduler", "[task][run]") {
    auto body = []() -> task<int> {
        co_return co_await nested_outer();
    };
    REQUIRE(herald::run(body(), herald::run_config{2}) == 20);

    auto failing = []() -> task<void> {
        throw std::logic_error("boom");
        co_return;
    };
    REQUIRE_THROWS_AS(herald::run(failing()), std::logic_error);
}
