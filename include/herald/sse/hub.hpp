#pragma once

/// @file hub.hpp
/// @brief Event-stream endpoint: lifecycle, request admission and sending
///
/// A hub owns the subscriber registry and the keep-alive ticker. The HTTP
/// layer hands it each incoming request through open_stream(); on success
/// it answers with response_headers() and runs the returned session with a
/// writer for the connection.
///
/// @code
/// sse::hub hub;
/// hub.start(sched);
///
/// auto session = co_await hub.open_stream(request);
/// if (!session) {
///     co_return respond(session.error().status);
/// }
/// sse::callback_writer writer([&](std::string_view frame) { return conn.write(frame); });
/// co_await session->run(writer);
///
/// hub.send(sse::event::typed("update", "42"));
/// co_await hub.stop();
/// @endcode

#include <herald/sse/frame.hpp>
#include <herald/sse/error.hpp>
#include <herald/sse/keepalive.hpp>
#include <herald/sse/stream_session.hpp>
#include <herald/pubsub/registry.hpp>
#include <herald/http/http_common.hpp>
#include <herald/coro/task.hpp>
#include <herald/runtime/scheduler.hpp>
#include <herald/log/macros.hpp>

#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace herald::sse {

/// What the HTTP layer knows about an incoming stream request
struct stream_request {
    http::method method = http::method::GET;
    std::string target = "/";    ///< Request target: path plus optional ?query
    http::headers headers;

    std::string_view path() const noexcept {
        return http::target::split(target).path;
    }

    std::string_view query() const noexcept {
        return http::target::split(target).query;
    }

    /// URL-decoded query parameter, std::nullopt if absent
    std::optional<std::string> query_param(std::string_view name) const {
        auto params = http::parse_query_string(query());
        auto it = params.find(std::string(name));
        if (it == params.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/// Why open_stream() refused a request
struct rejection {
    http::status status;
    std::string message;
};

/// Hub configuration
struct hub_config {
    /// Path the stream is served on
    std::string url = "/sse";
    /// Interval between keep-alive comments
    std::chrono::milliseconds ping_interval = std::chrono::seconds(15);
    /// Query parameter naming the channel
    std::string channel_param = "channel_id";
    pubsub::channel_policy policy = pubsub::channel_policy::exclusive;
    /// Custom channel lookup; when empty the channel_param query parameter is used
    std::function<std::optional<std::string>(const stream_request&)> channel_extractor;
    /// Added to response_headers()
    http::headers extra_headers;
};

class hub {
public:
    /// Pre-subscription hook, typically authorization. Throw
    /// request_rejected to refuse the stream with a given status.
    using before_request_hook = std::function<coro::task<void>(const stream_request&)>;

    /// @throws validation_error for an empty url or a non-positive ping interval
    explicit hub(hub_config config = {})
        : config_(validated(std::move(config)))
        , registry_(config_.policy)
        , ticker_(registry_, config_.ping_interval) {}

    hub(const hub&) = delete;
    hub& operator=(const hub&) = delete;

    /// Install the pre-subscription hook; must be callable as
    /// coro::task<void>(const stream_request&)
    template<typename F>
    void set_before_request(F&& hook) {
        static_assert(std::is_invocable_r_v<coro::task<void>, std::decay_t<F>&, const stream_request&>,
                      "before-request hook must be callable as coro::task<void>(const stream_request&)");
        before_request_hook fn(std::forward<F>(hook));
        if (!fn) {
            throw validation_error("before-request hook is empty");
        }
        before_request_ = std::move(fn);
    }

    /// Start the keep-alive ticker on sched
    void start(runtime::scheduler& sched) {
        if (running_.exchange(true)) {
            return;
        }
        ticker_.start(sched);
        HERALD_LOG_INFO("event stream hub on {} started", config_.url);
    }

    /// Stop the ticker, then close every open stream.
    /// Also closes streams of a hub that was never started.
    coro::task<void> stop() {
        running_.store(false);
        co_await ticker_.stop();
        auto closed = registry_.close();
        HERALD_LOG_INFO("event stream hub on {} stopped, {} streams closed", config_.url, closed);
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load();
    }

    /// Admit a request: check method and path, run the hook, extract the
    /// channel and register a subscriber. Nothing is registered on rejection.
    coro::task<std::expected<stream_session, rejection>> open_stream(stream_request request) {
        if (request.method != http::method::GET) {
            co_return std::unexpected(rejection{http::status::method_not_allowed,
                fmt::format("{} not allowed", http::method_to_string(request.method))});
        }
        if (request.path() != config_.url) {
            co_return std::unexpected(rejection{http::status::not_found,
                fmt::format("no event stream at {}", request.path())});
        }

        if (before_request_) {
            try {
                co_await before_request_(request);
            } catch (const request_rejected& e) {
                HERALD_LOG_INFO("stream request rejected ({}): {}",
                                http::status_code(e.status()), e.what());
                co_return std::unexpected(rejection{e.status(), e.what()});
            }
        }

        auto channel = extract_channel(request);
        pubsub::registry::channel_type target;
        if (channel) target = *channel;

        try {
            auto sub = registry_.subscribe(target);
            co_return stream_session(registry_, std::move(sub),
                                     std::string(request.headers.get("Last-Event-ID")));
        } catch (const duplicate_subscriber_error& e) {
            co_return std::unexpected(rejection{http::status::bad_request, e.what()});
        }
    }

    /// Headers a successful stream response starts with
    http::headers response_headers() const {
        http::headers result{
            {"Content-Type", http::mime::text_event_stream},
            {"Cache-Control", "no-cache"},
            {"Connection", "keep-alive"},
        };
        for (const auto& [name, value] : config_.extra_headers) {
            result.set(name, value);
        }
        return result;
    }

    /// Publish an event to one channel or to everyone
    /// @return number of subscribers it was queued for
    size_t send(const event& evt, pubsub::registry::channel_type channel = std::nullopt) {
        return registry_.publish(serialize_event(evt), channel);
    }

    size_t send(std::string_view data, pubsub::registry::channel_type channel = std::nullopt) {
        return registry_.publish(sse::format(data), channel);
    }

    /// Format now, fan out later on the current scheduler
    void send_nowait(const event& evt, pubsub::registry::channel_type channel = std::nullopt) {
        registry_.publish_nowait(pubsub::make_frame(serialize_event(evt)), channel);
    }

    pubsub::registry& registry() noexcept { return registry_; }
    const pubsub::registry& registry() const noexcept { return registry_; }
    const keepalive_ticker& ticker() const noexcept { return ticker_; }
    const hub_config& config() const noexcept { return config_; }

private:
    static hub_config validated(hub_config config) {
        if (config.url.empty()) {
            throw validation_error("stream url must not be empty");
        }
        if (config.ping_interval.count() <= 0) {
            throw validation_error("ping interval must be positive");
        }
        return config;
    }

    std::optional<std::string> extract_channel(const stream_request& request) const {
        if (config_.channel_extractor) {
            return config_.channel_extractor(request);
        }
        auto value = request.query_param(config_.channel_param);
        if (!value || value->empty()) {
            return std::nullopt;
        }
        return value;
    }

    hub_config config_;
    pubsub::registry registry_;
    keepalive_ticker ticker_;
    before_request_hook before_request_;
    std::atomic<bool> running_{false};
};

} // namespace herald::sse
