#include <catch2/catch_test_macros.hpp>
#include <herald/pubsub/subscriber_queue.hpp>
#include <herald/coro/task.hpp>
#include <herald/coro/cancel_token.hpp>
#include <herald/runtime/scheduler.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "../test_main.cpp"

using namespace herald::pubsub;
using namespace herald::coro;
using namespace herald::runtime;
using namespace herald::test;

namespace {

std::string text_of(const std::optional<queue_item>& item) {
    if (!item) return "<none>";
    if (std::holds_alternative<close_signal>(*item)) return "<close>";
    return *std::get<frame_ptr>(*item);
}

} // namespace

TEST_CASE("subscriber_queue starts empty", "[pubsub][queue]") {
    subscriber_queue q;
    REQUIRE(q.empty());
    REQUIRE(q.size() == 0);
    REQUIRE(q.unfinished() == 0);
    REQUIRE_FALSE(q.is_closed());
    REQUIRE_FALSE(q.try_receive().has_value());
}

TEST_CASE("subscriber_queue is FIFO", "[pubsub][queue]") {
    subscriber_queue q;
    REQUIRE(q.push(make_frame("a")));
    REQUIRE(q.push(make_frame("b")));
    REQUIRE(q.push(make_frame("c")));
    REQUIRE(q.size() == 3);

    REQUIRE(text_of(q.try_receive()) == "a");
    REQUIRE(text_of(q.try_receive()) == "b");
    REQUIRE(text_of(q.try_receive()) == "c");
    REQUIRE(q.empty());
}

TEST_CASE("subscriber_queue drops pushes after close", "[pubsub][queue]") {
    subscriber_queue q;
    REQUIRE(q.push(make_frame("before")));
    REQUIRE(q.push_close());
    REQUIRE(q.is_closed());

    REQUIRE_FALSE(q.push(make_frame("after")));
    REQUIRE_FALSE(q.push_close());

    REQUIRE(text_of(q.try_receive()) == "before");
    REQUIRE(text_of(q.try_receive()) == "<close>");
}

TEST_CASE("subscriber_queue keeps reporting close once taken", "[pubsub][queue]") {
    subscriber_queue q;
    q.push_close();
    REQUIRE(text_of(q.try_receive()) == "<close>");
    REQUIRE(text_of(q.try_receive()) == "<close>");
}

TEST_CASE("subscriber_queue task_done accounting", "[pubsub][queue]") {
    subscriber_queue q;
    q.push(make_frame("a"));
    q.push(make_frame("b"));
    REQUIRE(q.unfinished() == 2);

    REQUIRE_THROWS_AS(q.task_done(), std::logic_error);

    (void)q.try_receive();
    REQUIRE(q.unfinished() == 2);
    q.task_done();
    REQUIRE(q.unfinished() == 1);

    REQUIRE_THROWS_AS(q.task_done(), std::logic_error);
}

TEST_CASE("subscriber_queue receive without waiting", "[pubsub][queue]") {
    subscriber_queue q;
    q.push(make_frame("ready"));

    std::optional<queue_item> got;
    auto consumer = [&]() -> task<void> {
        got = co_await q.receive();
    };

    auto t = consumer();
    t.handle().resume();

    REQUIRE(t.handle().done());
    REQUIRE(text_of(got) == "ready");
}

TEST_CASE("subscriber_queue wakes a parked consumer inline", "[pubsub][queue]") {
    subscriber_queue q;

    std::optional<queue_item> got;
    auto consumer = [&]() -> task<void> {
        got = co_await q.receive();
    };

    auto t = consumer();
    t.handle().resume();
    REQUIRE_FALSE(t.handle().done());

    // No scheduler: push resumes the consumer on this thread
    q.push(make_frame("late"));
    REQUIRE(t.handle().done());
    REQUIRE(text_of(got) == "late");
    REQUIRE(q.unfinished() == 1);
}

TEST_CASE("subscriber_queue close wakes a parked consumer", "[pubsub][queue]") {
    subscriber_queue q;

    std::optional<queue_item> got;
    auto consumer = [&]() -> task<void> {
        got = co_await q.receive();
    };

    auto t = consumer();
    t.handle().resume();
    q.push_close();

    REQUIRE(t.handle().done());
    REQUIRE(text_of(got) == "<close>");
}

TEST_CASE("subscriber_queue receive is cancellable", "[pubsub][queue]") {
    subscriber_queue q;
    cancel_source source;

    bool resumed = false;
    std::optional<queue_item> got = queue_item{close_signal{}};
    auto consumer = [&]() -> task<void> {
        got = co_await q.receive(source.get_token());
        resumed = true;
    };

    auto t = consumer();
    t.handle().resume();
    REQUIRE_FALSE(resumed);

    source.cancel();
    REQUIRE(resumed);
    REQUIRE_FALSE(got.has_value());

    // A later push is kept for the next receive
    REQUIRE(q.push(make_frame("kept")));
    REQUIRE(text_of(q.try_receive()) == "kept");
}

TEST_CASE("subscriber_queue receive with an already cancelled token", "[pubsub][queue]") {
    subscriber_queue q;
    cancel_source source;
    source.cancel();

    SECTION("nothing queued") {
        std::optional<queue_item> got = queue_item{close_signal{}};
        auto consumer = [&]() -> task<void> {
            got = co_await q.receive(source.get_token());
        };
        auto t = consumer();
        t.handle().resume();
        REQUIRE(t.handle().done());
        REQUIRE_FALSE(got.has_value());
    }

    SECTION("queued items are still delivered") {
        q.push(make_frame("x"));
        std::optional<queue_item> got;
        auto consumer = [&]() -> task<void> {
            got = co_await q.receive(source.get_token());
        };
        auto t = consumer();
        t.handle().resume();
        REQUIRE(text_of(got) == "x");
    }
}

TEST_CASE("subscriber_queue rejects a second concurrent consumer", "[pubsub][queue]") {
    subscriber_queue q;

    auto first = [&]() -> task<void> {
        (void)co_await q.receive();
    };
    bool threw = false;
    auto second = [&]() -> task<void> {
        try {
            (void)co_await q.receive();
        } catch (const std::logic_error&) {
            threw = true;
        }
    };

    auto t1 = first();
    t1.handle().resume();
    auto t2 = second();
    t2.handle().resume();

    REQUIRE(threw);
    REQUIRE(t2.handle().done());

    q.push(make_frame("for first"));
    REQUIRE(t1.handle().done());
}

TEST_CASE("subscriber_queue consumer on a scheduler", "[pubsub][queue]") {
    scheduler sched(2);
    sched.start();

    subscriber_queue q;
    std::vector<std::string> received;
    std::atomic<bool> done{false};

    auto consumer = [&]() -> task<void> {
        while (true) {
            auto item = co_await q.receive();
            if (!item || std::holds_alternative<close_signal>(*item)) break;
            received.push_back(*std::get<frame_ptr>(*item));
            q.task_done();
        }
        done = true;
    };

    auto t = consumer();
    sched.spawn(t.release());

    std::thread producer([&] {
        for (int i = 0; i < 100; ++i) {
            q.push(make_frame(std::to_string(i)));
        }
        q.push_close();
    });
    producer.join();

    REQUIRE(wait_until([&] { return done.load(); }));
    sched.shutdown();

    REQUIRE(received.size() == 100);
    for (int i = 0; i < 100; ++i) {
        REQUIRE(received[i] == std::to_string(i));
    }
    REQUIRE(q.unfinished() == 0);
}
