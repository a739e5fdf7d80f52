#pragma once

#include <string>

namespace arbor {

// ─── Logging ───────────────────────────────────────────────────
// Component-tagged diagnostic lines on stderr:
//   [14:02:11.204][WARN][store] parent of 'a' already set to 'root'
// The level is process-wide. Lines are written under a mutex so
// contexts running on different threads do not interleave.

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERROR = 3,
    OFF   = 4
};

void setLogLevel(LogLevel level);
LogLevel logLevel();

/// Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
/// Returns false and leaves `out` untouched on an unknown name.
bool parseLogLevel(const std::string& name, LogLevel& out);

#if defined(__GNUC__)
#define ARBOR_PRINTF_FORMAT(fmt_idx, args_idx) \
    __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define ARBOR_PRINTF_FORMAT(fmt_idx, args_idx)
#endif

void logMessage(LogLevel level, const char* component, const char* fmt, ...)
    ARBOR_PRINTF_FORMAT(3, 4);

#define ARBOR_LOG_DEBUG(component, ...) \
    ::arbor::logMessage(::arbor::LogLevel::DEBUG, component, __VA_ARGS__)
#define ARBOR_LOG_INFO(component, ...) \
    ::arbor::logMessage(::arbor::LogLevel::INFO, component, __VA_ARGS__)
#define ARBOR_LOG_WARN(component, ...) \
    ::arbor::logMessage(::arbor::LogLevel::WARN, component, __VA_ARGS__)
#define ARBOR_LOG_ERROR(component, ...) \
    ::arbor::logMessage(::arbor::LogLevel::ERROR, component, __VA_ARGS__)

} // namespace arbor
