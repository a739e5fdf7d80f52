#include "common/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace arbor {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::WARN)};
std::mutex g_write_mutex;

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "?";
}

} // namespace

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_level.load());
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug")      out = LogLevel::DEBUG;
    else if (lower == "info")  out = LogLevel::INFO;
    else if (lower == "warn" || lower == "warning") out = LogLevel::WARN;
    else if (lower == "error") out = LogLevel::ERROR;
    else if (lower == "off")   out = LogLevel::OFF;
    else return false;
    return true;
}

void logMessage(LogLevel level, const char* component, const char* fmt, ...) {
    if (level == LogLevel::OFF || static_cast<int>(level) < g_level.load()) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[16];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fprintf(stderr, "[%s.%03d][%s][%s] ", time_buf,
                 static_cast<int>(now_ms.count()), levelTag(level), component);

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace arbor
