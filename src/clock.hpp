// src/clock.hpp
// Wall-clock capture and ISO-8601 rendering.

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace pulse {

inline uint64_t now_ms() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

// Render epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
inline std::string format_iso8601(uint64_t timestamp_ms) {
    std::time_t secs = static_cast<std::time_t>(timestamp_ms / 1000);
    unsigned millis = static_cast<unsigned>(timestamp_ms % 1000);

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[32];
    int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                          tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                          tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return std::string(buf, n > 0 ? static_cast<size_t>(n) : 0);
}

} // namespace pulse
