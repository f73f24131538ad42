#pragma once

#include "scheduler.hpp"
#include <herald/coro/task.hpp>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>

namespace herald::runtime {

/// Configuration for run()
struct run_config {
    /// Number of worker threads (0 = hardware concurrency)
    size_t num_threads = 0;
};

namespace detail {

/// Blocks a plain thread until a coroutine running on a scheduler finishes
template<typename T>
class completion_signal {
public:
    template<typename... Args>
    void set_result(Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if constexpr (!std::is_void_v<T>) {
            result_.emplace(std::forward<Args>(args)...);
        }
        completed_ = true;
        cv_.notify_one();
    }

    void set_exception(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex_);
        exception_ = std::move(e);
        completed_ = true;
        cv_.notify_one();
    }

    T wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return completed_; });
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*result_);
        }
    }

private:
    struct empty {};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::conditional_t<std::is_void_v<T>, empty, std::optional<T>> result_;
    std::exception_ptr exception_;
    bool completed_ = false;
};

template<typename T>
coro::task<void> completion_wrapper(coro::task<T> inner, completion_signal<T>* signal) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(inner);
            signal->set_result();
        } else {
            signal->set_result(co_await std::move(inner));
        }
    } catch (...) {
        signal->set_exception(std::current_exception());
    }
}

} // namespace detail

/// Run a task on an already started scheduler and block until it finishes.
/// Exceptions thrown by the task are rethrown here.
/// Must not be called from one of sched's own workers.
template<typename T>
T block_on(scheduler& sched, coro::task<T> task) {
    detail::completion_signal<T> signal;
    auto wrapper = detail::completion_wrapper(std::move(task), &signal);
    sched.spawn(wrapper.release());
    return signal.wait();
}

/// Run a task to completion on a private scheduler
///
/// @code
/// coro::task<int> async_main() {
///     co_return 42;
/// }
///
/// int main() {
///     return herald::run(async_main());
/// }
/// @endcode
template<typename T>
T run(coro::task<T> task, const run_config& config = {}) {
    size_t threads = config.num_threads;
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 1;
    }

    scheduler sched(threads);
    sched.start();

    if constexpr (std::is_void_v<T>) {
        block_on(sched, std::move(task));
        sched.shutdown();
    } else {
        T result = block_on(sched, std::move(task));
        sched.shutdown();
        return result;
    }
}

} // namespace herald::runtime

namespace herald {

using runtime::run;
using runtime::run_config;

} // namespace herald

/// Define main() that runs `coro::task<int> async_main(int argc, char* argv[])`
#define HERALD_ASYNC_MAIN(async_main_func) \
    int main(int argc, char* argv[]) { \
        return herald::run(async_main_func(argc, argv)); \
    }
