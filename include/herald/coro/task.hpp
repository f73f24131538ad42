#pragma once

#include <atomic>
#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace herald::runtime {
class scheduler;  // Forward declaration
inline scheduler* get_current_scheduler() noexcept;
inline void schedule_handle(std::coroutine_handle<> handle) noexcept;
inline void schedule_handle(scheduler& sched, std::coroutine_handle<> handle) noexcept;
}

namespace herald::coro {

template<typename T = void>
class task;

template<typename T = void>
class join_handle;

namespace detail {

/// Common promise state: continuation, ownership and captured exception
struct promise_base {
    std::coroutine_handle<> continuation_;
    std::exception_ptr exception_;
    bool detached_ = false;

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    [[nodiscard]] std::exception_ptr exception() const noexcept {
        return exception_;
    }
};

struct final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
        auto& promise = h.promise();
        if (promise.continuation_) {
            return promise.continuation_;
        }
        if (promise.detached_) {
            // Nobody owns the frame any more
            h.destroy();
        }
        return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
};

/// Completion slot shared between a spawned task and its join_handle
template<typename T>
class join_state {
public:
    template<typename... Args>
    void set_value(Args&&... args) {
        if constexpr (!std::is_void_v<T>) {
            value_.emplace(std::forward<Args>(args)...);
        }
        complete();
    }

    void set_exception(std::exception_ptr ex) {
        exception_ = std::move(ex);
        complete();
    }

    [[nodiscard]] bool is_completed() const noexcept {
        return completed_.load(std::memory_order_acquire);
    }

    /// @return true if the waiter was parked, false if the task already finished
    bool set_waiter(std::coroutine_handle<> h) noexcept {
        void* expected = nullptr;
        if (!waiter_.compare_exchange_strong(expected, h.address(),
                std::memory_order_acq_rel, std::memory_order_acquire)) {
            return false;
        }
        if (completed_.load(std::memory_order_acquire)) {
            // Lost the race with complete(); whoever takes the waiter back resumes it
            void* addr = waiter_.exchange(nullptr, std::memory_order_acq_rel);
            if (addr) {
                return false;
            }
        }
        return true;
    }

    decltype(auto) get() {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*value_);
        }
    }

private:
    void complete() {
        completed_.store(true, std::memory_order_release);
        void* addr = waiter_.exchange(nullptr, std::memory_order_acq_rel);
        if (addr) {
            runtime::schedule_handle(std::coroutine_handle<>::from_address(addr));
        }
    }

    struct empty {};
    std::conditional_t<std::is_void_v<T>, empty, std::optional<T>> value_;
    std::exception_ptr exception_;
    std::atomic<void*> waiter_{nullptr};
    std::atomic<bool> completed_{false};
};

} // namespace detail

/// Join handle for awaiting spawned tasks
/// Returned by task<T>::spawn(); co_await yields the task's result
template<typename T>
class join_handle {
public:
    explicit join_handle(std::shared_ptr<detail::join_state<T>> state) noexcept
        : state_(std::move(state)) {}

    join_handle(join_handle&&) noexcept = default;
    join_handle& operator=(join_handle&&) noexcept = default;

    join_handle(const join_handle&) = delete;
    join_handle& operator=(const join_handle&) = delete;

    [[nodiscard]] bool await_ready() const noexcept {
        return state_->is_completed();
    }

    bool await_suspend(std::coroutine_handle<> awaiter) noexcept {
        return state_->set_waiter(awaiter);
    }

    T await_resume() {
        return state_->get();
    }

    [[nodiscard]] bool is_ready() const noexcept {
        return state_->is_completed();
    }

private:
    std::shared_ptr<detail::join_state<T>> state_;
};

namespace detail {

template<typename T>
struct value_promise : promise_base {
    std::optional<T> value_;

    template<typename U>
    void return_value(U&& value) {
        value_.emplace(std::forward<U>(value));
    }
};

struct void_promise : promise_base {
    void return_void() noexcept {}
};

} // namespace detail

/// Lazily started coroutine task
///
/// A task does nothing until it is co_awaited, detached with go(), or
/// spawned. Destroying an unstarted or finished task frees its frame.
template<typename T>
class task {
public:
    struct promise_type
        : std::conditional_t<std::is_void_v<T>, detail::void_promise, detail::value_promise<T>> {

        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }

    /// Give up ownership; the frame destroys itself when it finishes
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    /// Fire-and-forget on the current scheduler
    void go() {
        runtime::schedule_handle(release());
    }

    /// Fire-and-forget on a specific scheduler
    void go(runtime::scheduler& sched) {
        runtime::schedule_handle(sched, release());
    }

    /// Spawn on the current scheduler and get a handle to await the result
    [[nodiscard]] join_handle<T> spawn();

    /// Spawn on a specific scheduler
    [[nodiscard]] join_handle<T> spawn(runtime::scheduler& sched);

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    T await_resume() {
        auto& promise = handle_.promise();
        if (promise.exception()) {
            std::rethrow_exception(promise.exception());
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*promise.value_);
        }
    }

private:
    handle_type handle_;
};

namespace detail {

/// Runs the task and forwards its outcome into the join state
template<typename T>
task<void> join_wrapper(task<T> t, std::shared_ptr<join_state<T>> state) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(t);
            state->set_value();
        } else {
            state->set_value(co_await std::move(t));
        }
    } catch (...) {
        state->set_exception(std::current_exception());
    }
}

} // namespace detail

template<typename T>
join_handle<T> task<T>::spawn() {
    auto state = std::make_shared<detail::join_state<T>>();
    detail::join_wrapper(std::move(*this), state).go();
    return join_handle<T>(std::move(state));
}

template<typename T>
join_handle<T> task<T>::spawn(runtime::scheduler& sched) {
    auto state = std::make_shared<detail::join_state<T>>();
    detail::join_wrapper(std::move(*this), state).go(sched);
    return join_handle<T>(std::move(state));
}

} // namespace herald::coro
