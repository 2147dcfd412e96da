#pragma once

#include <string_view>

namespace glance::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_log_level(LogLevel level);
[[nodiscard]] bool log_enabled(LogLevel level);

// "debug" | "info" | "warn" | "error" | "off" (case-insensitive). Unknown
// names return `defv`.
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel defv);

// Writes "glance: <level>: <message>\n" to stderr.
void log_write(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// True the first time `key` is seen in this process.
[[nodiscard]] bool log_first_time(const char* key);

} // namespace glance::util

#define GLANCE_LOG_AT(lvl, ...) \
  do { if (::glance::util::log_enabled(lvl)) ::glance::util::log_write(lvl, __VA_ARGS__); } while (0)

#define GLANCE_LOG_DEBUG(...) GLANCE_LOG_AT(::glance::util::LogLevel::Debug, __VA_ARGS__)
#define GLANCE_LOG_INFO(...)  GLANCE_LOG_AT(::glance::util::LogLevel::Info, __VA_ARGS__)
#define GLANCE_LOG_WARN(...)  GLANCE_LOG_AT(::glance::util::LogLevel::Warn, __VA_ARGS__)
#define GLANCE_LOG_ERROR(...) GLANCE_LOG_AT(::glance::util::LogLevel::Error, __VA_ARGS__)

// Logs once per call site key for the life of the process.
#define GLANCE_LOG_ONCE(lvl, key, ...) \
  do { if (::glance::util::log_first_time(key)) GLANCE_LOG_AT(lvl, __VA_ARGS__); } while (0)
