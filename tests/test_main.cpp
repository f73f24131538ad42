// Test main - Catch2 provides main via Catch2::Catch2WithMain
// Included by test sources for sanitizer-aware timeouts and polling helpers

#ifndef HERALD_TEST_HELPERS_HPP
#define HERALD_TEST_HELPERS_HPP

#include <chrono>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace herald::test {

// Detect if running under ThreadSanitizer
constexpr bool is_tsan_enabled() {
#if defined(__SANITIZE_THREAD__)
    return true;
#elif defined(__has_feature)
    #if __has_feature(thread_sanitizer)
        return true;
    #else
        return false;
    #endif
#else
    return false;
#endif
}

// Detect if running under AddressSanitizer
constexpr bool is_asan_enabled() {
#if defined(__SANITIZE_ADDRESS__)
    return true;
#elif defined(__has_feature)
    #if __has_feature(address_sanitizer)
        return true;
    #else
        return false;
    #endif
#else
    return false;
#endif
}

// Scale factor for timeouts under sanitizers
constexpr int timeout_scale_factor() {
    if (is_tsan_enabled()) return 10;  // TSAN is ~5-15x slower
    if (is_asan_enabled()) return 3;   // ASAN is ~2-3x slower
    return 1;
}

// Helper to scale milliseconds timeout
inline std::chrono::milliseconds scaled_ms(int base_ms) {
    return std::chrono::milliseconds(base_ms * timeout_scale_factor());
}

// Helper to scale seconds timeout
inline std::chrono::seconds scaled_sec(int base_sec) {
    return std::chrono::seconds(base_sec * timeout_scale_factor());
}

// Poll pred every millisecond until it holds or base_ms (scaled) elapses
template<typename Pred>
bool wait_until(Pred&& pred, int base_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + scaled_ms(base_ms);
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return pred();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

// Split a byte stream of frames at the blank line that ends each frame
inline std::vector<std::string> split_frames(std::string_view stream) {
    std::vector<std::string> frames;
    constexpr std::string_view terminator = "\r\n\r\n";
    while (!stream.empty()) {
        auto end = stream.find(terminator);
        if (end == std::string_view::npos) {
            frames.emplace_back(stream);
            break;
        }
        frames.emplace_back(stream.substr(0, end + terminator.size()));
        stream.remove_prefix(end + terminator.size());
    }
    return frames;
}

} // namespace herald::test

#endif // HERALD_TEST_HELPERS_HPP