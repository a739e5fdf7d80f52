#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace arbor {

/// Milliseconds since the Unix epoch.
using Timestamp = int64_t;

inline Timestamp nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/// ISO-8601 UTC with millisecond precision, e.g. 2026-10-19T08:15:02.117Z
inline std::string isoTimestamp(Timestamp ms) {
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm utc{};
    gmtime_r(&secs, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
    return out;
}

inline std::string isoNow() {
    return isoTimestamp(nowMillis());
}

} // namespace arbor
