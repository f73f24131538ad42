#pragma once

#include <string>
#include <utility>

namespace herald::pubsub {

class registry;

/// Move-only handle for one registered subscriber.
///
/// Destroying (or release()-ing) the handle unregisters the subscriber,
/// exactly once, whichever way its owner exits. Obtain one from
/// registry::subscribe(); release() is defined in registry.hpp.
class subscription {
public:
    subscription() = default;

    subscription(registry& owner, std::string id, std::string channel)
        : registry_(&owner), id_(std::move(id)), channel_(std::move(channel)) {}

    subscription(subscription&& other) noexcept
        : registry_(std::exchange(other.registry_, nullptr))
        , id_(std::move(other.id_))
        , channel_(std::move(other.channel_)) {}

    subscription& operator=(subscription&& other) noexcept {
        if (this != &other) {
            release();
            registry_ = std::exchange(other.registry_, nullptr);
            id_ = std::move(other.id_);
            channel_ = std::move(other.channel_);
        }
        return *this;
    }

    ~subscription() { release(); }

    subscription(const subscription&) = delete;
    subscription& operator=(const subscription&) = delete;

    const std::string& id() const noexcept { return id_; }
    const std::string& channel() const noexcept { return channel_; }

    /// Still registered through this handle
    bool active() const noexcept { return registry_ != nullptr; }
    explicit operator bool() const noexcept { return active(); }

    /// Unregister now; later calls do nothing
    void release() noexcept;

private:
    registry* registry_ = nullptr;
    std::string id_;
    std::string channel_;
};

} // namespace herald::pubsub
