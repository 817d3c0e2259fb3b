#include "log.hpp"
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <strings.h>

namespace centrix {

namespace {

LogLevel level_from_env() {
    const char* env = std::getenv("CENTRIX_LOG_LEVEL");
    if (!env) return LogLevel::Info;
    if (strcasecmp(env, "debug") == 0) return LogLevel::Debug;
    if (strcasecmp(env, "warn") == 0) return LogLevel::Warn;
    if (strcasecmp(env, "off") == 0) return LogLevel::Off;
    return LogLevel::Info;
}

std::atomic<int>& threshold() {
    static std::atomic<int> t{static_cast<int>(level_from_env())};
    return t;
}

void vlog(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (static_cast<int>(level) < threshold().load(std::memory_order_relaxed))
        return;
    // Format into one buffer so concurrent writers do not interleave.
    char buf[1024];
    int off = std::snprintf(buf, sizeof(buf), "[centrix][%s] ", tag);
    if (off < 0) return;
    std::vsnprintf(buf + off, sizeof(buf) - static_cast<size_t>(off), fmt, args);
    std::fprintf(stderr, "%s\n", buf);
}

}  // namespace

void set_log_level(LogLevel level) {
    threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(threshold().load(std::memory_order_relaxed));
}

void log_debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, "DEBUG", fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, "INFO", fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warn, "WARN", fmt, args);
    va_end(args);
}

}  // namespace centrix
