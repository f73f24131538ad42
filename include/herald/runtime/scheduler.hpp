#pragma once

#include <herald/log/macros.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace herald::runtime {

/// A one-shot timer shared between the scheduler's timer heap and
/// whoever may fire it early (cancellation).
class timer_state {
public:
    explicit timer_state(std::coroutine_handle<> awaiter) noexcept
        : awaiter_(awaiter) {}

    /// First caller wins the right to resume the awaiter
    [[nodiscard]] bool claim() noexcept {
        return !fired_.exchange(true, std::memory_order_acq_rel);
    }

    [[nodiscard]] bool fired() const noexcept {
        return fired_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::coroutine_handle<> awaiter() const noexcept {
        return awaiter_;
    }

private:
    std::coroutine_handle<> awaiter_;
    std::atomic<bool> fired_{false};
};

/// Worker-pool scheduler for coroutines.
///
/// Ready coroutines go into one shared FIFO served by N worker threads.
/// Timers live in a min-heap; whichever worker is idle sleeps until the
/// earliest deadline and moves due timers onto the ready queue.
///
/// shutdown() stops accepting timers, lets workers drain the ready queue,
/// then joins them. Coroutines still parked on a timer or on a queue at
/// that point are left suspended.
class scheduler {
public:
    using clock = std::chrono::steady_clock;

    explicit scheduler(size_t num_threads = std::thread::hardware_concurrency())
        : num_threads_(num_threads == 0 ? 1 : num_threads) {}

    ~scheduler() {
        shutdown();
    }

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;
    scheduler(scheduler&&) = delete;
    scheduler& operator=(scheduler&&) = delete;

    void start() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != run_state::stopped) {
                return;
            }
            state_ = run_state::running;
            running_.store(true, std::memory_order_release);
        }

        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(&scheduler::worker_loop, this);
        }
        current_scheduler_ = this;
        HERALD_LOG_DEBUG("scheduler started with {} workers", num_threads_);
    }

    void shutdown() {
        for (auto& worker : workers_) {
            if (worker.get_id() == std::this_thread::get_id()) {
                throw std::logic_error("scheduler::shutdown() called from a worker thread");
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != run_state::running) {
                return;
            }
            state_ = run_state::draining;
            running_.store(false, std::memory_order_release);
        }
        cv_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
        workers_.clear();

        size_t abandoned = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = run_state::stopped;
            abandoned = timers_.size();
            timers_ = {};
        }
        if (abandoned > 0) {
            HERALD_LOG_DEBUG("scheduler stopped with {} pending timers", abandoned);
        }

        if (current_scheduler_ == this) {
            current_scheduler_ = nullptr;
        }
    }

    /// Queue a coroutine for execution.
    /// @return false if the scheduler is stopped; the handle is left untouched
    bool spawn(std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return true;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == run_state::stopped) [[unlikely]] {
                return false;
            }
            ready_.push_back(handle);
        }
        cv_.notify_one();
        return true;
    }

    /// Resume timer->awaiter() at deadline, unless someone claims it first
    bool schedule_timer(clock::time_point deadline, std::shared_ptr<timer_state> timer) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != run_state::running) [[unlikely]] {
                return false;
            }
            timers_.push(timer_entry{deadline, next_timer_sequence_++, std::move(timer)});
        }
        cv_.notify_one();
        return true;
    }

    [[nodiscard]] size_t num_threads() const noexcept {
        return num_threads_;
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t pending_tasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ready_.size();
    }

    [[nodiscard]] size_t pending_timers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timers_.size();
    }

    [[nodiscard]] size_t total_tasks_executed() const noexcept {
        return tasks_executed_.load(std::memory_order_relaxed);
    }

    /// Scheduler owning the calling worker thread (or the thread that started it)
    [[nodiscard]] static scheduler* current() noexcept {
        return current_scheduler_;
    }

private:
    enum class run_state {
        stopped,
        running,
        draining
    };

    struct timer_entry {
        clock::time_point deadline;
        uint64_t sequence;
        std::shared_ptr<timer_state> timer;

        bool operator>(const timer_entry& other) const noexcept {
            if (deadline != other.deadline) return deadline > other.deadline;
            return sequence > other.sequence;
        }
    };

    void worker_loop() {
        current_scheduler_ = this;

        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            promote_due_timers(clock::now());

            if (!ready_.empty()) {
                auto handle = ready_.front();
                ready_.pop_front();
                lock.unlock();

                if (!handle.done()) {
                    handle.resume();
                }
                tasks_executed_.fetch_add(1, std::memory_order_relaxed);

                lock.lock();
                continue;
            }

            if (state_ != run_state::running) {
                break;
            }

            if (timers_.empty()) {
                cv_.wait(lock);
            } else {
                // Copy: the heap may reallocate while we wait
                auto deadline = timers_.top().deadline;
                cv_.wait_until(lock, deadline);
            }
        }

        current_scheduler_ = nullptr;
    }

    // Caller holds mutex_
    void promote_due_timers(clock::time_point now) {
        while (!timers_.empty() && timers_.top().deadline <= now) {
            auto timer = timers_.top().timer;
            timers_.pop();
            if (timer->claim()) {
                ready_.push_back(timer->awaiter());
            }
        }
    }

    const size_t num_threads_;
    run_state state_ = run_state::stopped;
    std::atomic<bool> running_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::coroutine_handle<>> ready_;
    std::priority_queue<timer_entry, std::vector<timer_entry>, std::greater<>> timers_;
    uint64_t next_timer_sequence_ = 0;
    std::vector<std::thread> workers_;
    std::atomic<size_t> tasks_executed_{0};

    static inline thread_local scheduler* current_scheduler_ = nullptr;
};

inline scheduler* get_current_scheduler() noexcept {
    return scheduler::current();
}

/// Resume a handle on the current scheduler, or inline if there is none
inline void schedule_handle(std::coroutine_handle<> handle) noexcept {
    if (!handle) return;

    auto* sched = scheduler::current();
    if (sched && sched->is_running() && sched->spawn(handle)) {
        return;
    }
    // No scheduler - run synchronously
    if (!handle.done()) handle.resume();
}

/// Resume a handle on a specific scheduler, or inline if it has stopped
inline void schedule_handle(scheduler& sched, std::coroutine_handle<> handle) noexcept {
    if (!handle) return;
    if (sched.spawn(handle)) return;
    if (!handle.done()) handle.resume();
}

} // namespace herald::runtime
