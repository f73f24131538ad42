#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace herald::coro {

/// Result of a cancellable operation
enum class cancel_result {
    completed,   ///< Operation completed normally
    cancelled    ///< Operation was cancelled
};

namespace detail {

/// Shared cancellation state
struct cancel_state {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    uint64_t next_id = 1;

    /// Returns 0 when the callback already ran because cancellation happened first
    uint64_t add_callback(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!cancelled.load(std::memory_order_relaxed)) {
                uint64_t id = next_id++;
                callbacks.emplace_back(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    void remove_callback(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        std::erase_if(callbacks, [id](const auto& entry) { return entry.first == id; });
    }

    void trigger() {
        std::vector<std::pair<uint64_t, std::function<void()>>> to_invoke;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            to_invoke.swap(callbacks);
        }
        for (auto& [id, cb] : to_invoke) {
            cb();
        }
    }
};

} // namespace detail

/// Registration handle for a cancel callback; unregisters on destruction
class cancel_registration {
public:
    cancel_registration() = default;

    cancel_registration(cancel_registration&& other) noexcept
        : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

    cancel_registration& operator=(cancel_registration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    ~cancel_registration() { unregister(); }

    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;

    void unregister() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
        }
        id_ = 0;
        state_.reset();
    }

private:
    friend class cancel_token;

    cancel_registration(std::shared_ptr<detail::cancel_state> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::cancel_state> state_;
    uint64_t id_ = 0;
};

/// Copyable view of a cancel_source's state.
///
/// A default-constructed token is never cancelled, so APIs can take
/// `cancel_token token = {}` and callers that don't care pass nothing.
///
/// ```cpp
/// task<void> ticker(cancel_token token) {
///     while (true) {
///         auto result = co_await time::sleep_for(1s, token);
///         if (result != cancel_result::completed) break;
///         tick();
///     }
/// }
/// ```
class cancel_token {
public:
    using registration = cancel_registration;

    cancel_token() = default;

    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    /// True while NOT cancelled
    explicit operator bool() const noexcept {
        return !is_cancelled();
    }

    /// Run callback when cancellation is requested (immediately if it already was).
    /// The callback may run on whichever thread calls cancel_source::cancel().
    template<typename F>
    [[nodiscard]] registration on_cancel(F&& callback) const {
        if (!state_) {
            return registration{};
        }
        return registration{state_, state_->add_callback(std::forward<F>(callback))};
    }

private:
    friend class cancel_source;

    explicit cancel_token(std::shared_ptr<detail::cancel_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_;
};

/// Owner of a cancellation state; hands out tokens and triggers them
class cancel_source {
public:
    cancel_source()
        : state_(std::make_shared<detail::cancel_state>()) {}

    cancel_token get_token() const noexcept {
        return cancel_token{state_};
    }

    /// Request cancellation; registered callbacks run on this thread
    void cancel() {
        state_->trigger();
    }

    bool is_cancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::cancel_state> state_;
};

} // namespace herald::coro
