/// @file sse_broadcast.cpp
/// @brief Event-stream fan-out example
///
/// Simulates a handful of client connections on one hub and prints the
/// bytes each one would receive. Two clients share the "sports" channel
/// name under the shared policy, one listens to "weather", and one has no
/// channel and only sees broadcasts and keep-alives.
///
/// Usage: ./sse_broadcast [ping_ms] [events]
/// Default: 500 ms keep-alive, 6 events
///
/// Set HERALD_LOG_LEVEL=debug|info|warn|error to adjust logging.

#include <herald/herald.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using namespace herald;
using namespace std::chrono_literals;

namespace {

struct client {
    std::string name;
    std::string target;
};

/// What a route handler does: admit the request, then stream into the socket
coro::task<void> serve(sse::hub& hub, client c) {
    sse::stream_request request;
    request.target = c.target;

    auto session = co_await hub.open_stream(std::move(request));
    if (!session) {
        HERALD_LOG_WARNING("{} refused: {} {}", c.name,
                           http::status_code(session.error().status), session.error().message);
        co_return;
    }

    // stdout stands in for the client's socket
    sse::callback_writer writer([&c](std::string_view frame) {
        fmt::print("--- {} ---\n{}", c.name, frame);
        std::fflush(stdout);
        return true;
    });

    auto result = co_await session->run(writer);
    HERALD_LOG_INFO("{} stream ended ({}), {} frames sent", c.name,
                    sse::stream_result_to_string(result), session->frames_sent());
}

coro::task<int> async_main(int argc, char* argv[]) {
    if (const char* env = std::getenv("HERALD_LOG_LEVEL")) {
        if (auto lvl = log::parse_level(env)) {
            log::logger::instance().set_level(*lvl);
        } else {
            HERALD_LOG_WARNING("unknown HERALD_LOG_LEVEL '{}', keeping info", env);
        }
    }

    sse::hub_config config;
    config.ping_interval = std::chrono::milliseconds(argc > 1 ? std::atoi(argv[1]) : 500);
    config.policy = pubsub::channel_policy::shared;
    int events = argc > 2 ? std::atoi(argv[2]) : 6;

    std::unique_ptr<sse::hub> hub;
    try {
        hub = std::make_unique<sse::hub>(config);
    } catch (const sse::validation_error& e) {
        HERALD_LOG_ERROR("invalid configuration: {}", e.what());
        co_return 1;
    }

    auto* sched = runtime::scheduler::current();
    hub->start(*sched);

    std::vector<client> clients{
        {"fan-1", "/sse?channel_id=sports"},
        {"fan-2", "/sse?channel_id=sports"},
        {"forecaster", "/sse?channel_id=weather"},
        {"lurker", "/sse"},
        {"lost", "/elsewhere"},
    };
    std::vector<coro::join_handle<void>> streams;
    for (const auto& c : clients) {
        streams.push_back(serve(*hub, c).spawn(*sched));
    }

    // Let the streams register before publishing
    co_await time::sleep_for(50ms);

    for (int i = 1; i <= events; ++i) {
        switch (i % 3) {
            case 0:
                hub->send(sse::event::with_id(std::to_string(i), "goal!\nscore " + std::to_string(i)),
                          "sports");
                break;
            case 1:
                hub->send(sse::event::typed("forecast", "rain"), "weather");
                break;
            default:
                hub->send(sse::event::full(std::to_string(i), "notice", "hello everyone", 3000ms));
                break;
        }
        co_await time::sleep_for(config.ping_interval / 2);
    }

    co_await time::sleep_for(config.ping_interval);
    co_await hub->stop();
    for (auto& stream : streams) {
        co_await stream;
    }

    HERALD_LOG_INFO("done, {} keep-alives sent", hub->ticker().ticks());
    co_return 0;
}

} // namespace

HERALD_ASYNC_MAIN(async_main)
