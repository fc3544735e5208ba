#pragma once

#include <string>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <cstdio>

/**
 * Time/timestamp utility functions.
 */
namespace profile_export {
namespace time_utils {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * Milliseconds since Unix epoch for a wall-clock time point.
 */
inline int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

/**
 * Convert milliseconds since Unix epoch to RFC3339/ISO8601 UTC string.
 * Format: "YYYY-MM-DDTHH:MM:SS.mmmZ"
 *
 * Example: 1609459200123 -> "2021-01-01T00:00:00.123Z"
 */
inline std::string to_rfc3339_utc(int64_t timestamp_ms) {
    time_t seconds = static_cast<time_t>(timestamp_ms / 1000);
    int millis = static_cast<int>(timestamp_ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }

    std::tm tm = {};
    gmtime_r(&seconds, &tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);

    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03dZ", buffer, millis);
    return std::string(result);
}

inline std::string to_rfc3339_utc(TimePoint tp) {
    return to_rfc3339_utc(to_epoch_ms(tp));
}

/**
 * Seconds elapsed on a steady clock since `start`.
 */
inline double seconds_since(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double>(elapsed).count();
}

} // namespace time_utils
} // namespace profile_export
