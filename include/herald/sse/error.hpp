#pragma once

#include <herald/http/http_common.hpp>
#include <stdexcept>
#include <string>

namespace herald::sse {

/// Base class for every error thrown by the event-stream layer
class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Bad argument or configuration (negative retry, empty url, ...)
class validation_error : public error {
public:
    using error::error;
};

/// Subscriber id already registered under the exclusive channel policy
class duplicate_subscriber_error : public error {
public:
    explicit duplicate_subscriber_error(const std::string& id)
        : error("subscriber '" + id + "' is already registered")
        , id_(id) {}

    const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

/// Thrown by a before-request hook to refuse a stream with a given status
class request_rejected : public error {
public:
    explicit request_rejected(http::status status, const std::string& message = {})
        : error(message.empty() ? std::string(http::status_reason(status)) : message)
        , status_(status) {}

    http::status status() const noexcept { return status_; }

private:
    http::status status_;
};

} // namespace herald::sse
