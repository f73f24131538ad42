#pragma once

#include <herald/coro/cancel_token.hpp>
#include <herald/runtime/scheduler.hpp>

#include <atomic>
#include <coroutine>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace herald::pubsub {

/// An already formatted frame, shared by every queue it was fanned out to
using frame_ptr = std::shared_ptr<const std::string>;

/// Sentinel telling the consumer to stop
struct close_signal {
    bool operator==(const close_signal&) const noexcept = default;
};

using queue_item = std::variant<frame_ptr, close_signal>;

inline frame_ptr make_frame(std::string bytes) {
    return std::make_shared<const std::string>(std::move(bytes));
}

/// Unbounded FIFO feeding exactly one consumer coroutine.
///
/// push() never blocks or suspends. Once a close signal is queued, later
/// pushes are dropped; after the consumer has taken the close signal every
/// further receive yields it again.
class subscriber_queue {
    /// A parked receive. Whoever claims it first (a push or the cancel
    /// callback) decides how it resumes.
    struct waiter {
        static constexpr int arming = 0;
        static constexpr int armed = 1;
        static constexpr int resolved_while_arming = 2;

        waiter(std::coroutine_handle<> h, runtime::scheduler* s) noexcept
            : handle(h), sched(s) {}

        bool claim() noexcept {
            return !claimed.exchange(true, std::memory_order_acq_rel);
        }

        /// Called by the claimer after filling in the outcome
        void resume() noexcept {
            int expected = arming;
            if (phase.compare_exchange_strong(expected, resolved_while_arming,
                    std::memory_order_acq_rel)) {
                // still inside await_suspend, which resumes inline
                return;
            }
            if (sched) {
                runtime::schedule_handle(*sched, handle);
            } else {
                runtime::schedule_handle(handle);
            }
        }

        std::coroutine_handle<> handle;
        runtime::scheduler* sched;
        std::atomic<bool> claimed{false};
        std::atomic<int> phase{arming};
        std::optional<queue_item> item;
    };

public:
    subscriber_queue() = default;

    subscriber_queue(const subscriber_queue&) = delete;
    subscriber_queue& operator=(const subscriber_queue&) = delete;

    class receive_awaitable {
    public:
        receive_awaitable(subscriber_queue& queue, coro::cancel_token token)
            : queue_(queue), token_(std::move(token)) {}

        /// A frame destroyed while parked must not be resumed by a later push
        ~receive_awaitable() {
            if (waiter_ && waiter_->claim()) {
                std::lock_guard<std::mutex> guard(queue_.mutex_);
                if (queue_.waiter_ == waiter_) {
                    queue_.waiter_.reset();
                }
            }
        }

        receive_awaitable(const receive_awaitable&) = delete;
        receive_awaitable& operator=(const receive_awaitable&) = delete;

        bool await_ready() {
            result_ = queue_.try_receive();
            return result_.has_value() || token_.is_cancelled();
        }

        bool await_suspend(std::coroutine_handle<> awaiter) {
            auto w = std::make_shared<waiter>(awaiter, runtime::scheduler::current());
            {
                std::lock_guard<std::mutex> guard(queue_.mutex_);
                if (auto item = queue_.take_locked()) {
                    result_ = std::move(item);
                    return false;
                }
                if (queue_.waiter_ && !queue_.waiter_->claimed.load(std::memory_order_acquire)) {
                    throw std::logic_error("subscriber_queue supports a single consumer");
                }
                queue_.waiter_ = w;
            }
            waiter_ = w;

            registration_ = token_.on_cancel([w]() {
                if (w->claim()) {
                    w->resume();
                }
            });

            int expected = waiter::arming;
            if (!w->phase.compare_exchange_strong(expected, waiter::armed,
                    std::memory_order_acq_rel)) {
                return false;
            }
            // may already be resumed elsewhere from here on
            return true;
        }

        /// @return the item, or std::nullopt if the token was cancelled first
        std::optional<queue_item> await_resume() {
            registration_.unregister();
            if (result_) {
                return std::move(result_);
            }
            if (waiter_ && waiter_->item) {
                return std::move(waiter_->item);
            }
            return std::nullopt;
        }

    private:
        subscriber_queue& queue_;
        coro::cancel_token token_;
        coro::cancel_registration registration_;
        std::shared_ptr<waiter> waiter_;
        std::optional<queue_item> result_;
    };

    /// Enqueue a frame; never suspends.
    /// @return false if the queue was already closed and the frame dropped
    bool push(frame_ptr frame) {
        return deliver(queue_item{std::move(frame)});
    }

    /// Enqueue the close signal. Only the first call has an effect.
    bool push_close() {
        return deliver(queue_item{close_signal{}});
    }

    /// Wait for the next item
    receive_awaitable receive(coro::cancel_token token = {}) {
        return receive_awaitable(*this, std::move(token));
    }

    /// Take the next item if one is ready
    std::optional<queue_item> try_receive() {
        std::lock_guard<std::mutex> guard(mutex_);
        return take_locked();
    }

    /// Mark one delivered frame as processed
    void task_done() {
        std::lock_guard<std::mutex> guard(mutex_);
        if (in_progress_ == 0) {
            throw std::logic_error("task_done() called more times than frames were received");
        }
        --in_progress_;
    }

    /// Items waiting to be received
    size_t size() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return items_.size();
    }

    bool empty() const {
        return size() == 0;
    }

    /// Frames queued or received but not yet marked done
    size_t unfinished() const {
        std::lock_guard<std::mutex> guard(mutex_);
        size_t queued = 0;
        for (const auto& item : items_) {
            if (std::holds_alternative<frame_ptr>(item)) ++queued;
        }
        return queued + in_progress_;
    }

    /// True once the close signal has been enqueued
    bool is_closed() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return closed_;
    }

private:
    bool deliver(queue_item item) {
        std::shared_ptr<waiter> to_wake;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return false;
            }
            if (std::holds_alternative<close_signal>(item)) {
                closed_ = true;
            }

            if (waiter_ && waiter_->claim()) {
                to_wake = std::move(waiter_);
                account_locked(item);
                to_wake->item = std::move(item);
            } else {
                // a waiter claimed by cancellation is stale
                waiter_.reset();
                items_.push_back(std::move(item));
            }
        }

        // Re-schedule outside the lock
        if (to_wake) {
            to_wake->resume();
        }
        return true;
    }

    // Caller holds mutex_
    std::optional<queue_item> take_locked() {
        if (items_.empty()) {
            if (close_taken_) {
                return queue_item{close_signal{}};
            }
            return std::nullopt;
        }
        queue_item item = std::move(items_.front());
        items_.pop_front();
        account_locked(item);
        return item;
    }

    // Caller holds mutex_
    void account_locked(const queue_item& item) noexcept {
        if (std::holds_alternative<close_signal>(item)) {
            close_taken_ = true;
        } else {
            ++in_progress_;
        }
    }

    mutable std::mutex mutex_;
    std::deque<queue_item> items_;
    std::shared_ptr<waiter> waiter_;
    size_t in_progress_ = 0;
    bool closed_ = false;
    bool close_taken_ = false;
};

} // namespace herald::pubsub
