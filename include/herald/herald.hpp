#pragma once

/// herald - Server-Sent Events publish/subscribe
///
/// Version: 0.1.0
///
/// Include this file to get the whole library: the coroutine runtime,
/// the subscriber registry and the event-stream hub.

// Version information
#define HERALD_VERSION_MAJOR 0
#define HERALD_VERSION_MINOR 1
#define HERALD_VERSION_PATCH 0

// Core coroutine types
#include "coro/task.hpp"
#include "coro/cancel_token.hpp"

// Runtime scheduler
#include "runtime/scheduler.hpp"
#include "runtime/run.hpp"

// Timers
#include "time/timer.hpp"

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// Publish/subscribe
#include "pubsub/subscriber_queue.hpp"
#include "pubsub/subscription.hpp"
#include "pubsub/registry.hpp"

// Event streams
#include "http/http_common.hpp"
#include "sse/error.hpp"
#include "sse/frame.hpp"
#include "sse/keepalive.hpp"
#include "sse/stream_session.hpp"
#include "sse/hub.hpp"

#include <tuple>

/// Root namespace for the herald library
namespace herald {

/// Get library version string
inline const char* version() noexcept {
    return "0.1.0";
}

/// Get library version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(HERALD_VERSION_MAJOR, HERALD_VERSION_MINOR, HERALD_VERSION_PATCH);
}

} // namespace herald

/// Quick Start Example:
///
/// ```cpp
/// #include <herald/herald.hpp>
///
/// using namespace herald;
///
/// coro::task<void> serve(sse::hub& hub, sse::stream_request request, sse::stream_writer& out) {
///     auto session = co_await hub.open_stream(std::move(request));
///     if (session) {
///         co_await session->run(out);
///     }
/// }
///
/// int main() {
///     runtime::scheduler sched(4);  // 4 worker threads
///     sched.start();
///
///     sse::hub hub;
///     hub.start(sched);
///     // ... hand requests to serve(), call hub.send(...) from producers ...
///     runtime::block_on(sched, hub.stop());
///     sched.shutdown();
/// }
/// ```
