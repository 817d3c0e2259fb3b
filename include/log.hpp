#ifndef CENTRIX_LOG_HPP
#define CENTRIX_LOG_HPP

namespace centrix {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Off = 3 };

// Messages below the threshold are dropped. The initial threshold is Info,
// or the value of CENTRIX_LOG_LEVEL (debug|info|warn|off) when set.
void set_log_level(LogLevel level);
LogLevel log_level();

// Unbuffered printf-style logging to stderr, one line per call:
//   [centrix][INFO] <message>
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace centrix

#endif  // CENTRIX_LOG_HPP
