#pragma once

/// @file registry.hpp
/// @brief Channel-aware publish/subscribe registry
///
/// The registry maps subscriber ids to their queues and channels to their
/// member ids. Every mutation happens under one mutex; publish takes a
/// snapshot of the target queues under that mutex and pushes outside it,
/// so producers never wait on consumers.
///
/// Publishing without a channel reaches every subscriber, including those
/// that joined a named channel.

#include <herald/pubsub/subscriber_queue.hpp>
#include <herald/pubsub/subscription.hpp>
#include <herald/sse/error.hpp>
#include <herald/coro/task.hpp>
#include <herald/coro/cancel_token.hpp>
#include <herald/runtime/scheduler.hpp>
#include <herald/log/macros.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace herald::pubsub {

/// How a named channel maps onto subscribers
enum class channel_policy {
    /// The channel name is the subscriber id; a second subscriber with the
    /// same name is rejected
    exclusive,
    /// Any number of subscribers (with generated ids) share the channel
    shared
};

namespace detail {

/// Random (version 4) UUID in canonical text form
inline std::string generate_uuid() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    uint64_t hi = engine();
    uint64_t lo = engine();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant
    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(hi >> 32),
                       static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                       static_cast<uint32_t>(hi & 0xFFFF),
                       static_cast<uint32_t>(lo >> 48),
                       lo & 0xFFFFFFFFFFFFULL);
}

} // namespace detail

class registry {
public:
    using channel_type = std::optional<std::string_view>;

    explicit registry(channel_policy policy = channel_policy::exclusive)
        : policy_(policy) {}

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;

    /// Register a new subscriber.
    /// @param channel Channel to join; std::nullopt gives the subscriber a
    ///        personal channel named after its generated id
    /// @return the subscriber id
    /// @throws sse::duplicate_subscriber_error if the channel is taken
    ///         under channel_policy::exclusive
    std::string register_subscriber(channel_type channel = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string id;
        std::string channel_name;
        if (channel && policy_ == channel_policy::exclusive) {
            id = std::string(*channel);
            if (subscribers_.contains(id) || channels_.contains(id)) {
                HERALD_LOG_WARNING("rejected duplicate subscriber '{}'", id);
                throw sse::duplicate_subscriber_error(id);
            }
            channel_name = id;
        } else {
            do {
                id = detail::generate_uuid();
            } while (subscribers_.contains(id));
            channel_name = channel ? std::string(*channel) : id;
        }

        subscribers_.emplace(id, entry{channel_name, std::make_shared<subscriber_queue>()});
        channels_[channel_name].insert(id);
        HERALD_LOG_DEBUG("registered subscriber '{}' on channel '{}' ({} total)",
                         id, channel_name, subscribers_.size());
        return id;
    }

    /// register_subscriber() wrapped in a handle that unregisters on destruction
    subscription subscribe(channel_type channel = std::nullopt) {
        auto id = register_subscriber(channel);
        auto channel_name = channel_of(id).value_or(id);
        return subscription(*this, std::move(id), std::move(channel_name));
    }

    /// Remove a subscriber from its channel and from the unscoped set.
    /// @param channel if given, must match the subscriber's channel
    /// @return false if nothing was removed
    bool unregister_subscriber(std::string_view id, channel_type channel = std::nullopt) {
        std::shared_ptr<subscriber_queue> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = subscribers_.find(std::string(id));
            if (it == subscribers_.end()) {
                return false;
            }
            if (channel && *channel != it->second.channel) {
                return false;
            }

            auto bucket = channels_.find(it->second.channel);
            if (bucket != channels_.end()) {
                bucket->second.erase(it->first);
                if (bucket->second.empty()) {
                    channels_.erase(bucket);
                }
            }
            removed = std::move(it->second.queue);
            subscribers_.erase(it);
        }
        // wake a consumer still parked on the queue
        removed->push_close();
        HERALD_LOG_DEBUG("removed subscriber '{}'", id);
        return true;
    }

    /// Fan a frame out to one channel, or to everyone.
    /// @return number of queues that accepted the frame
    size_t publish(frame_ptr frame, channel_type channel = std::nullopt) {
        auto targets = snapshot(channel);
        size_t delivered = 0;
        for (auto& queue : targets) {
            if (queue->push(frame)) {
                ++delivered;
            }
        }
        HERALD_LOG_DEBUG("published {} bytes to {} of {} subscribers", frame->size(),
                         delivered, targets.size());
        return delivered;
    }

    size_t publish(std::string_view payload, channel_type channel = std::nullopt) {
        return publish(make_frame(std::string(payload)), channel);
    }

    /// Hand the fan-out to a scheduler and return at once.
    /// Runs inline when no scheduler is running. The queued fan-out refers
    /// to this registry: drain or shut down the scheduler before destroying it.
    void publish_nowait(frame_ptr frame, channel_type channel = std::nullopt,
                        runtime::scheduler* sched = runtime::scheduler::current()) {
        if (!sched || !sched->is_running()) {
            publish(std::move(frame), channel);
            return;
        }
        std::optional<std::string> target;
        if (channel) target.emplace(*channel);
        publish_task(std::move(frame), std::move(target)).go(*sched);
    }

    void publish_nowait(std::string_view payload, channel_type channel = std::nullopt,
                        runtime::scheduler* sched = runtime::scheduler::current()) {
        publish_nowait(make_frame(std::string(payload)), channel, sched);
    }

    /// Wait for the subscriber's next frame.
    ///
    /// Yields std::nullopt when the subscriber was closed (its registration
    /// is removed), is unknown, or the token was cancelled.
    coro::task<std::optional<frame_ptr>> receive(std::string id, coro::cancel_token token = {}) {
        auto queue = find_queue(id);
        if (!queue) {
            co_return std::nullopt;
        }

        auto item = co_await queue->receive(std::move(token));
        if (!item) {
            co_return std::nullopt;
        }
        if (std::holds_alternative<close_signal>(*item)) {
            unregister_subscriber(id);
            co_return std::nullopt;
        }
        co_return std::get<frame_ptr>(std::move(*item));
    }

    /// Mark the last received frame processed; unknown ids are ignored
    void task_done(std::string_view id) {
        if (auto queue = find_queue(id)) {
            queue->task_done();
        }
    }

    /// Queue the close signal for every current subscriber
    /// @return number of subscribers signalled
    size_t close() {
        auto targets = snapshot(std::nullopt);
        size_t signalled = 0;
        for (auto& queue : targets) {
            if (queue->push_close()) {
                ++signalled;
            }
        }
        HERALD_LOG_DEBUG("close signalled to {} subscribers", signalled);
        return signalled;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
    }

    /// Number of non-empty channels
    [[nodiscard]] size_t channel_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return channels_.size();
    }

    [[nodiscard]] size_t channel_size(std::string_view channel) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(std::string(channel));
        return it == channels_.end() ? 0 : it->second.size();
    }

    [[nodiscard]] bool contains(std::string_view id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.contains(std::string(id));
    }

    [[nodiscard]] std::optional<std::string> channel_of(std::string_view id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(std::string(id));
        if (it == subscribers_.end()) {
            return std::nullopt;
        }
        return it->second.channel;
    }

    /// Items waiting in the subscriber's queue (0 for unknown ids)
    [[nodiscard]] size_t queued(std::string_view id) const {
        auto queue = find_queue(id);
        return queue ? queue->size() : 0;
    }

    [[nodiscard]] channel_policy policy() const noexcept {
        return policy_;
    }

private:
    struct entry {
        std::string channel;
        std::shared_ptr<subscriber_queue> queue;
    };

    std::shared_ptr<subscriber_queue> find_queue(std::string_view id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(std::string(id));
        if (it == subscribers_.end()) {
            return nullptr;
        }
        return it->second.queue;
    }

    std::vector<std::shared_ptr<subscriber_queue>> snapshot(channel_type channel) const {
        std::vector<std::shared_ptr<subscriber_queue>> targets;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!channel) {
            targets.reserve(subscribers_.size());
            for (const auto& [id, sub] : subscribers_) {
                targets.push_back(sub.queue);
            }
            return targets;
        }

        auto bucket = channels_.find(std::string(*channel));
        if (bucket == channels_.end()) {
            return targets;
        }
        targets.reserve(bucket->second.size());
        for (const auto& id : bucket->second) {
            auto it = subscribers_.find(id);
            if (it != subscribers_.end()) {
                targets.push_back(it->second.queue);
            }
        }
        return targets;
    }

    coro::task<void> publish_task(frame_ptr frame, std::optional<std::string> channel) {
        try {
            publish(std::move(frame), channel);
        } catch (const std::exception& e) {
            // Nobody joins a detached publish; report the loss here
            HERALD_LOG_ERROR("detached publish to {} failed: {}", channel.value_or("everyone"), e.what());
        }
        co_return;
    }

    const channel_policy policy_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, entry> subscribers_;
    std::unordered_map<std::string, std::unordered_set<std::string>> channels_;
};

inline void subscription::release() noexcept {
    if (!registry_) {
        return;
    }
    try {
        std::exchange(registry_, nullptr)->unregister_subscriber(id_);
    } catch (const std::exception& e) {
        HERALD_LOG_ERROR("failed to unregister subscriber {}: {}", id_, e.what());
    }
}

} // namespace herald::pubsub
