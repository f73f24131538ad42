#pragma once

#include <herald/sse/frame.hpp>
#include <herald/sse/error.hpp>
#include <herald/pubsub/registry.hpp>
#include <herald/coro/task.hpp>
#include <herald/coro/cancel_token.hpp>
#include <herald/runtime/scheduler.hpp>
#include <herald/time/timer.hpp>
#include <herald/log/macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace herald::sse {

/// Periodically broadcasts a comment frame to every subscriber so idle
/// connections are not dropped by proxies.
///
/// stop() must be awaited before the registry goes away.
class keepalive_ticker {
public:
    keepalive_ticker(pubsub::registry& registry, std::chrono::nanoseconds interval,
                     std::string frame = keepalive_frame())
        : state_(std::make_shared<shared_state>(registry, interval, std::move(frame))) {
        if (interval.count() <= 0) {
            throw validation_error("keep-alive interval must be positive");
        }
    }

    ~keepalive_ticker() {
        // A loop still sleeping just exits; it never touches *this
        source_.cancel();
    }

    keepalive_ticker(const keepalive_ticker&) = delete;
    keepalive_ticker& operator=(const keepalive_ticker&) = delete;

    /// Spawn the tick loop. Does nothing if already started.
    void start(runtime::scheduler& sched) {
        if (handle_) {
            return;
        }
        source_ = coro::cancel_source{};
        handle_.emplace(tick_loop(state_, source_.get_token()).spawn(sched));
        HERALD_LOG_INFO("keep-alive started, interval {}ms",
                        std::chrono::duration_cast<std::chrono::milliseconds>(state_->interval).count());
    }

    /// Cancel the loop and wait for it to finish
    coro::task<void> stop() {
        if (!handle_) {
            co_return;
        }
        source_.cancel();
        auto handle = std::move(*handle_);
        handle_.reset();
        co_await handle;
        HERALD_LOG_INFO("keep-alive stopped after {} ticks", ticks());
    }

    [[nodiscard]] bool is_running() const noexcept {
        return handle_.has_value();
    }

    /// Number of frames published so far
    [[nodiscard]] size_t ticks() const noexcept {
        return state_->ticks.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::chrono::nanoseconds interval() const noexcept {
        return state_->interval;
    }

private:
    struct shared_state {
        shared_state(pubsub::registry& r, std::chrono::nanoseconds i, std::string f)
            : registry(r), interval(i), frame(pubsub::make_frame(std::move(f))) {}

        pubsub::registry& registry;
        const std::chrono::nanoseconds interval;
        const pubsub::frame_ptr frame;
        std::atomic<size_t> ticks{0};
    };

    static coro::task<void> tick_loop(std::shared_ptr<shared_state> state, coro::cancel_token token) {
        while (true) {
            auto result = co_await time::sleep_for(state->interval, token);
            if (result != coro::cancel_result::completed) {
                break;
            }
            state->registry.publish(state->frame);
            state->ticks.fetch_add(1, std::memory_order_relaxed);
        }
    }

    std::shared_ptr<shared_state> state_;
    coro::cancel_source source_;
    std::optional<coro::join_handle<void>> handle_;
};

} // namespace herald::sse
