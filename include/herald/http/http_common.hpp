#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <charconv>
#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <utility>

namespace herald::http {

/// HTTP methods a stream request can carry
enum class method {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE_,  // DELETE is a C++ keyword
    OPTIONS,
    PATCH
};

/// Convert method enum to string
inline constexpr std::string_view method_to_string(method m) noexcept {
    switch (m) {
        case method::GET:      return "GET";
        case method::HEAD:     return "HEAD";
        case method::POST:     return "POST";
        case method::PUT:      return "PUT";
        case method::DELETE_:  return "DELETE";
        case method::OPTIONS:  return "OPTIONS";
        case method::PATCH:    return "PATCH";
    }
    return "UNKNOWN";
}

/// HTTP status codes an event stream can be answered with
enum class status : uint16_t {
    ok = 200,
    no_content = 204,

    bad_request = 400,
    unauthorized = 401,
    forbidden = 403,
    not_found = 404,
    method_not_allowed = 405,
    conflict = 409,
    too_many_requests = 429,

    internal_server_error = 500,
    service_unavailable = 503
};

/// Get reason phrase for status code
inline constexpr std::string_view status_reason(status s) noexcept {
    switch (s) {
        case status::ok: return "OK";
        case status::no_content: return "No Content";
        case status::bad_request: return "Bad Request";
        case status::unauthorized: return "Unauthorized";
        case status::forbidden: return "Forbidden";
        case status::not_found: return "Not Found";
        case status::method_not_allowed: return "Method Not Allowed";
        case status::conflict: return "Conflict";
        case status::too_many_requests: return "Too Many Requests";
        case status::internal_server_error: return "Internal Server Error";
        case status::service_unavailable: return "Service Unavailable";
    }
    return "Unknown";
}

/// Numeric value of a status
inline constexpr uint16_t status_code(status s) noexcept {
    return static_cast<uint16_t>(s);
}

/// Case-insensitive string comparison for headers
struct case_insensitive_hash {
    size_t operator()(std::string_view s) const noexcept {
        size_t hash = 0;
        for (char c : s) {
            hash = hash * 31 + static_cast<size_t>(std::tolower(static_cast<unsigned char>(c)));
        }
        return hash;
    }
};

struct case_insensitive_equal {
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }
};

/// HTTP headers collection (case-insensitive keys)
class headers {
public:
    using map_type = std::unordered_map<std::string, std::string, case_insensitive_hash, case_insensitive_equal>;
    using const_iterator = map_type::const_iterator;

    headers() = default;

    headers(std::initializer_list<std::pair<std::string_view, std::string_view>> init) {
        for (const auto& [name, value] : init) {
            set(name, value);
        }
    }

    /// Set a header (overwrites existing)
    void set(std::string_view name, std::string_view value) {
        headers_[std::string(name)] = std::string(value);
    }

    /// Get a header value (or empty if not found)
    std::string_view get(std::string_view name) const {
        auto it = headers_.find(std::string(name));
        if (it != headers_.end()) {
            return it->second;
        }
        return {};
    }

    bool contains(std::string_view name) const {
        return headers_.find(std::string(name)) != headers_.end();
    }

    void remove(std::string_view name) {
        headers_.erase(std::string(name));
    }

    size_t size() const noexcept { return headers_.size(); }
    bool empty() const noexcept { return headers_.empty(); }

    const_iterator begin() const { return headers_.begin(); }
    const_iterator end() const { return headers_.end(); }

private:
    map_type headers_;
};

/// Request target split at the first '?'
struct target {
    std::string_view path;   ///< path including leading /
    std::string_view query;  ///< query string (without ?)

    static target split(std::string_view raw) noexcept {
        auto query_pos = raw.find('?');
        if (query_pos == std::string_view::npos) {
            return target{raw, {}};
        }
        return target{raw.substr(0, query_pos), raw.substr(query_pos + 1)};
    }
};

/// URL-decode a string
inline std::string url_decode(std::string_view str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = 0, lo = 0;
            const char* digits = str.data() + i + 1;
            auto [p1, e1] = std::from_chars(digits, digits + 1, hi, 16);
            auto [p2, e2] = std::from_chars(digits + 1, digits + 2, lo, 16);
            if (e1 == std::errc{} && e2 == std::errc{}) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
            } else {
                result += str[i];
            }
        } else if (str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }

    return result;
}

/// Parse query string into key-value pairs; a repeated key keeps its first value
inline std::unordered_map<std::string, std::string> parse_query_string(std::string_view query) {
    std::unordered_map<std::string, std::string> result;

    while (!query.empty()) {
        auto amp_pos = query.find('&');
        auto pair = (amp_pos == std::string_view::npos) ? query : query.substr(0, amp_pos);

        auto eq_pos = pair.find('=');
        if (eq_pos != std::string_view::npos) {
            result.try_emplace(url_decode(pair.substr(0, eq_pos)),
                               url_decode(pair.substr(eq_pos + 1)));
        } else if (!pair.empty()) {
            result.try_emplace(url_decode(pair), "");
        }

        if (amp_pos == std::string_view::npos) break;
        query = query.substr(amp_pos + 1);
    }

    return result;
}

namespace mime {
    inline constexpr std::string_view text_event_stream = "text/event-stream";
}

} // namespace herald::http
