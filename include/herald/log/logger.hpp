#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>

namespace herald::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

/// Parse a level name as written in configuration ("debug", "WARN", ...)
inline std::optional<level> parse_level(std::string_view name) noexcept {
    auto equals = [name](std::string_view candidate) {
        if (name.size() != candidate.size()) return false;
        for (size_t i = 0; i < name.size(); ++i) {
            char c = name[i];
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            if (c != candidate[i]) return false;
        }
        return true;
    };

    if (equals("debug"))                      return level::debug;
    if (equals("info"))                       return level::info;
    if (equals("warn") || equals("warning"))  return level::warning;
    if (equals("error"))                      return level::error;
    return std::nullopt;
}

/// ANSI color for a level; empty when colors are disabled
constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";
        case level::info:    return "\033[32m";
        case level::warning: return "\033[33m";
        case level::error:   return "\033[31m";
        default:             return "\033[0m";
    }
}

/// Process-wide logger writing to stderr
class logger {
public:
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    /// Enable or disable ANSI colors (enabled by default)
    void set_colored(bool enabled) noexcept {
        colored_.store(enabled, std::memory_order_relaxed);
    }

    bool is_colored() const noexcept {
        return colored_.load(std::memory_order_relaxed);
    }

    bool should_log(level lvl) const noexcept {
        return lvl >= min_level_.load(std::memory_order_relaxed);
    }

    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!should_log(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        bool colored = is_colored();

        std::lock_guard<std::mutex> lock(mutex_);

        // [TIMESTAMP] [LEVEL] [file:line] message
        fmt::print(stderr,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}{}\n",
            colored ? level_to_color(lvl) : "",
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            basename(file),
            line,
            msg,
            colored ? "\033[0m" : ""
        );
    }

private:
    logger() noexcept : min_level_(level::info), colored_(true) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    static std::string_view basename(const char* path) noexcept {
        std::string_view p(path);
        auto pos = p.find_last_of('/');
        return pos == std::string_view::npos ? p : p.substr(pos + 1);
    }

    std::atomic<level> min_level_;
    std::atomic<bool> colored_;
    std::mutex mutex_;
};

} // namespace herald::log
