#pragma once

/// @file frame.hpp
/// @brief Event-stream wire format
///
/// Every frame is a block of CRLF-terminated field lines followed by one
/// empty line:
///
///     id: <id>\r\n
///     event: <type>\r\n
///     data: <line>\r\n      (one per line of the payload)
///     retry: <ms>\r\n
///     \r\n
///
/// Calls here are pure; they keep no state.

#include <herald/sse/error.hpp>
#include <fmt/format.h>
#include <fmt/chrono.h>

#include <charconv>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace herald::sse {

/// Line terminator used by every frame
inline constexpr std::string_view line_separator = "\r\n";

/// SSE event structure
struct event {
    std::optional<std::string> id;                   ///< Event ID
    std::optional<std::string> type;                 ///< Event type ("message" when absent)
    std::string data;                                ///< Payload, may span lines
    std::optional<std::chrono::milliseconds> retry;  ///< Client reconnect delay

    /// Create a simple event with just data
    static event message(std::string_view data) {
        return event{std::nullopt, std::nullopt, std::string(data), std::nullopt};
    }

    /// Create a typed event
    static event typed(std::string_view type, std::string_view data) {
        return event{std::nullopt, std::string(type), std::string(data), std::nullopt};
    }

    /// Create an event with ID
    static event with_id(std::string_view id, std::string_view data) {
        return event{std::string(id), std::nullopt, std::string(data), std::nullopt};
    }

    /// Create a full event
    static event full(std::string_view id, std::string_view type, std::string_view data,
                      std::optional<std::chrono::milliseconds> retry = std::nullopt) {
        return event{std::string(id), std::string(type), std::string(data), retry};
    }
};

namespace detail {

/// Append `text` with every CR and LF removed
inline void append_single_line(fmt::memory_buffer& out, std::string_view text) {
    for (char c : text) {
        if (c != '\r' && c != '\n') {
            out.push_back(c);
        }
    }
}

inline void append_field(fmt::memory_buffer& out, std::string_view name, std::string_view value) {
    fmt::format_to(fmt::appender(out), "{}: ", name);
    append_single_line(out, value);
    out.append(line_separator);
}

/// One data line per segment; CRLF, CR and LF each end a segment
inline void append_data(fmt::memory_buffer& out, std::string_view data) {
    size_t start = 0;
    size_t i = 0;
    while (i < data.size()) {
        char c = data[i];
        if (c == '\r' || c == '\n') {
            fmt::format_to(fmt::appender(out), "data: {}{}",
                           data.substr(start, i - start), line_separator);
            i += (c == '\r' && i + 1 < data.size() && data[i + 1] == '\n') ? 2 : 1;
            start = i;
        } else {
            ++i;
        }
    }
    fmt::format_to(fmt::appender(out), "data: {}{}", data.substr(start), line_separator);
}

} // namespace detail

/// Build one frame.
/// @throws validation_error if retry is negative
inline std::string format(std::string_view data,
                          std::optional<std::string_view> id = std::nullopt,
                          std::optional<std::string_view> type = std::nullopt,
                          std::optional<std::chrono::milliseconds> retry = std::nullopt) {
    if (retry && retry->count() < 0) {
        throw validation_error(fmt::format("retry must not be negative, got {}", *retry));
    }

    fmt::memory_buffer out;
    if (id) {
        detail::append_field(out, "id", *id);
    }
    if (type) {
        detail::append_field(out, "event", *type);
    }
    detail::append_data(out, data);
    if (retry) {
        fmt::format_to(fmt::appender(out), "retry: {}{}", retry->count(), line_separator);
    }
    out.append(line_separator);
    return fmt::to_string(out);
}

/// Serialize an SSE event to wire format
inline std::string serialize_event(const event& evt) {
    std::optional<std::string_view> id;
    std::optional<std::string_view> type;
    if (evt.id) id = *evt.id;
    if (evt.type) type = *evt.type;
    return sse::format(evt.data, id, type, evt.retry);
}

/// Comment frame, ignored by clients: `: <text>\r\n\r\n`
inline std::string comment_frame(std::string_view text) {
    fmt::memory_buffer out;
    out.append(std::string_view(": "));
    detail::append_single_line(out, text);
    out.append(line_separator);
    out.append(line_separator);
    return fmt::to_string(out);
}

/// The periodic keep-alive frame
inline std::string keepalive_frame() {
    return comment_frame("ping");
}

/// Parse a retry value given as text (configuration, query strings).
/// Accepts an optional '+' followed by decimal digits only.
/// @throws validation_error for anything else ("5.5", "abc", "", "-1")
inline std::chrono::milliseconds parse_retry(std::string_view text) {
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    if (digits.empty()) {
        throw validation_error(fmt::format("retry must be an integer, got '{}'", text));
    }

    std::chrono::milliseconds::rep value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range) {
        throw validation_error(fmt::format("retry out of range: '{}'", text));
    }
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || digits.front() == '-') {
        throw validation_error(fmt::format("retry must be an integer, got '{}'", text));
    }
    return std::chrono::milliseconds(value);
}

} // namespace herald::sse
