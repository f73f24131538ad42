#pragma once

#include <herald/runtime/scheduler.hpp>
#include <herald/coro/cancel_token.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <coroutine>
#include <memory>
#include <thread>

namespace herald::time {

/// Awaitable for sleeping, optionally cancellable.
///
/// co_await yields cancel_result::cancelled if the token fired before the
/// deadline, cancel_result::completed otherwise.
class sleep_awaitable {
public:
    using cancel_result = coro::cancel_result;

    template<typename Rep, typename Period>
    explicit sleep_awaitable(std::chrono::duration<Rep, Period> duration,
                             coro::cancel_token token = {})
        : duration_(std::chrono::duration_cast<std::chrono::nanoseconds>(duration))
        , token_(std::move(token)) {}

    bool await_ready() const noexcept {
        return duration_.count() <= 0 || token_.is_cancelled();
    }

    bool await_suspend(std::coroutine_handle<> awaiter) {
        auto* sched = runtime::scheduler::current();
        if (!sched || !sched->is_running()) {
            block_current_thread();
            return false;
        }

        auto deadline = runtime::scheduler::clock::now() + duration_;
        auto timer = std::make_shared<timer_slot>(awaiter);
        timer_ = timer;

        // The callback may run right here (token raced to cancelled) or on
        // the cancelling thread later. It only resumes the awaiter once the
        // timer is armed; before that we resume inline by returning false.
        registration_ = token_.on_cancel([sched, timer]() {
            if (!timer->claim()) return;
            timer->cancelled.store(true, std::memory_order_release);
            int expected = arming;
            if (timer->phase.compare_exchange_strong(expected, cancelled_while_arming,
                    std::memory_order_acq_rel)) {
                return;
            }
            runtime::schedule_handle(*sched, timer->awaiter());
        });

        int expected = arming;
        if (!timer->phase.compare_exchange_strong(expected, armed, std::memory_order_acq_rel)) {
            return false;
        }

        // From here on the coroutine may already be running elsewhere: locals only
        if (!sched->schedule_timer(deadline, timer)) {
            if (timer->claim()) {
                return false;
            }
        }
        return true;
    }

    cancel_result await_resume() noexcept {
        registration_.unregister();
        if (timer_) {
            return timer_->cancelled.load(std::memory_order_acquire)
                ? cancel_result::cancelled : cancel_result::completed;
        }
        if (blocked_) {
            return cancelled_inline_ ? cancel_result::cancelled : cancel_result::completed;
        }
        return token_.is_cancelled() ? cancel_result::cancelled : cancel_result::completed;
    }

private:
    static constexpr int arming = 0;
    static constexpr int armed = 1;
    static constexpr int cancelled_while_arming = 2;

    struct timer_slot : runtime::timer_state {
        using runtime::timer_state::timer_state;
        std::atomic<int> phase{arming};
        std::atomic<bool> cancelled{false};
    };

    /// No scheduler on this thread: sleep it, polling the token
    void block_current_thread() {
        blocked_ = true;
        auto end = std::chrono::steady_clock::now() + duration_;
        while (std::chrono::steady_clock::now() < end) {
            if (token_.is_cancelled()) {
                cancelled_inline_ = true;
                return;
            }
            auto remaining = end - std::chrono::steady_clock::now();
            std::this_thread::sleep_for(std::min<std::chrono::nanoseconds>(
                remaining, std::chrono::milliseconds(1)));
        }
    }

    std::chrono::nanoseconds duration_;
    coro::cancel_token token_;
    coro::cancel_token::registration registration_;
    std::shared_ptr<timer_slot> timer_;
    bool blocked_ = false;
    bool cancelled_inline_ = false;
};

/// Sleep for a duration
template<typename Rep, typename Period>
inline auto sleep_for(std::chrono::duration<Rep, Period> duration) {
    return sleep_awaitable(duration);
}

/// Sleep for a duration, returning early if token is cancelled
template<typename Rep, typename Period>
inline auto sleep_for(std::chrono::duration<Rep, Period> duration, coro::cancel_token token) {
    return sleep_awaitable(duration, std::move(token));
}

/// Sleep until a time point
template<typename Clock, typename Duration>
inline auto sleep_until(std::chrono::time_point<Clock, Duration> time_point) {
    auto now = Clock::now();
    if (time_point <= now) {
        return sleep_awaitable(std::chrono::nanoseconds(0));
    }
    return sleep_awaitable(time_point - now);
}

/// Reschedule the current coroutine behind other ready work
class yield_awaitable {
public:
    bool await_ready() const noexcept {
        auto* sched = runtime::scheduler::current();
        return !sched || !sched->is_running();
    }

    bool await_suspend(std::coroutine_handle<> awaiter) const {
        return runtime::scheduler::current()->spawn(awaiter);
    }

    void await_resume() const noexcept {}
};

inline auto yield() {
    return yield_awaitable{};
}

} // namespace herald::time
