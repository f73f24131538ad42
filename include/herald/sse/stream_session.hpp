#pragma once

#include <herald/pubsub/registry.hpp>
#include <herald/pubsub/subscription.hpp>
#include <herald/coro/task.hpp>
#include <herald/coro/cancel_token.hpp>
#include <herald/log/macros.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace herald::sse {

/// Transport side of a stream: writes one frame to the client connection.
/// Returning false, or throwing, means the connection is gone.
class stream_writer {
public:
    virtual ~stream_writer() = default;
    virtual coro::task<bool> write(std::string_view frame) = 0;
};

/// stream_writer over a callable returning bool or coro::task<bool>
template<typename F>
class callback_writer final : public stream_writer {
public:
    explicit callback_writer(F fn) : fn_(std::move(fn)) {}

    coro::task<bool> write(std::string_view frame) override {
        using result_type = std::invoke_result_t<F&, std::string_view>;
        if constexpr (std::is_same_v<result_type, coro::task<bool>>) {
            co_return co_await fn_(frame);
        } else {
            co_return static_cast<bool>(fn_(frame));
        }
    }

private:
    F fn_;
};

template<typename F>
callback_writer(F) -> callback_writer<F>;

/// Why a stream ended
enum class stream_result {
    closed,        ///< Close signal received (server shutdown or unregistered)
    write_failed,  ///< The writer reported a transport failure
    cancelled      ///< The caller's cancel token fired
};

inline constexpr std::string_view stream_result_to_string(stream_result r) noexcept {
    switch (r) {
        case stream_result::closed:       return "closed";
        case stream_result::write_failed: return "write_failed";
        case stream_result::cancelled:    return "cancelled";
    }
    return "unknown";
}

/// Session lifecycle
enum class session_state {
    active,      ///< Streaming (or not yet started)
    closing,     ///< Loop has decided to stop
    terminated   ///< Subscription released
};

/// One client connection: drains its subscriber queue into a writer.
///
/// The session owns the subscription. However run() ends (close signal,
/// write failure, cancellation, an exception, or its coroutine frame being
/// destroyed while suspended), the subscriber is unregistered exactly once.
/// A session must stay at one address while run() is in progress.
class stream_session {
public:
    stream_session(pubsub::registry& registry, pubsub::subscription subscription,
                   std::string last_event_id = {})
        : registry_(&registry)
        , subscription_(std::move(subscription))
        , id_(subscription_.id())
        , channel_(subscription_.channel())
        , last_event_id_(std::move(last_event_id)) {}

    stream_session(stream_session&&) noexcept = default;
    stream_session& operator=(stream_session&&) noexcept = default;

    stream_session(const stream_session&) = delete;
    stream_session& operator=(const stream_session&) = delete;

    /// Stream frames until the subscription closes, the writer fails, or
    /// token is cancelled.
    /// @throws std::logic_error if the session has already run
    coro::task<stream_result> run(stream_writer& writer, coro::cancel_token token = {}) {
        if (started_) {
            throw std::logic_error("stream_session::run() may only be called once");
        }
        started_ = true;

        struct release_on_exit {
            stream_session& session;
            ~release_on_exit() {
                session.state_ = session_state::terminated;
                session.subscription_.release();
            }
        } guard{*this};

        HERALD_LOG_DEBUG("stream for subscriber '{}' started", id_);
        while (true) {
            auto frame = co_await registry_->receive(id_, token);
            if (!frame) {
                state_ = session_state::closing;
                if (token.is_cancelled()) {
                    HERALD_LOG_DEBUG("stream for subscriber '{}' cancelled", id_);
                    co_return stream_result::cancelled;
                }
                HERALD_LOG_DEBUG("stream for subscriber '{}' closed after {} frames", id_, frames_sent_);
                co_return stream_result::closed;
            }

            bool written = false;
            try {
                written = co_await writer.write(**frame);
            } catch (const std::exception& e) {
                HERALD_LOG_WARNING("write to subscriber '{}' failed: {}", id_, e.what());
                state_ = session_state::closing;
                co_return stream_result::write_failed;
            }
            if (!written) {
                HERALD_LOG_WARNING("write to subscriber '{}' failed: connection closed", id_);
                state_ = session_state::closing;
                co_return stream_result::write_failed;
            }

            registry_->task_done(id_);
            ++frames_sent_;
        }
    }

    const std::string& id() const noexcept { return id_; }
    const std::string& channel() const noexcept { return channel_; }

    /// Value of the client's Last-Event-ID header (empty if none)
    const std::string& last_event_id() const noexcept { return last_event_id_; }

    session_state state() const noexcept { return state_; }
    size_t frames_sent() const noexcept { return frames_sent_; }

    /// False once the subscriber has been unregistered
    bool subscribed() const noexcept { return subscription_.active(); }

private:
    pubsub::registry* registry_;
    pubsub::subscription subscription_;
    std::string id_;
    std::string channel_;
    std::string last_event_id_;
    session_state state_ = session_state::active;
    size_t frames_sent_ = 0;
    bool started_ = false;
};

} // namespace herald::sse
