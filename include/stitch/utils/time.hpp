#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace stitch::utils {

// Get current time in milliseconds (monotonic)
inline uint64_t time_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

// Format a UTC wall-clock time with strftime
inline std::string format_utc(std::chrono::system_clock::time_point tp, const char* format) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), format, &tm);
    return std::string(buf, n);
}

// UTC timestamp as YYYYmmddHHMMSS, used for synthesized transfer ids
inline std::string utc_compact(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    return format_utc(tp, "%Y%m%d%H%M%S");
}

// UTC ISO-8601 timestamp with microseconds, e.g. 2024-05-01T12:00:00.123456
inline std::string utc_iso8601(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count() % 1000000;
    char frac[8];
    std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(us));
    return format_utc(tp, "%Y-%m-%dT%H:%M:%S") + frac;
}

// Simple timer class
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] uint64_t elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

}  // namespace stitch::utils
