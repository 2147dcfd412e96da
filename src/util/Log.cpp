#include "util/Log.hpp"
#include "util/Strings.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>
#include <unordered_set>

namespace glance::util {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

bool log_enabled(LogLevel level) {
  return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

LogLevel parse_log_level(std::string_view name, LogLevel defv) {
  auto s = to_lower(trim(name));
  if (s == "debug") return LogLevel::Debug;
  if (s == "info") return LogLevel::Info;
  if (s == "warn" || s == "warning") return LogLevel::Warn;
  if (s == "error") return LogLevel::Error;
  if (s == "off" || s == "none") return LogLevel::Off;
  return defv;
}

static const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   break;
  }
  return "";
}

void log_write(LogLevel level, const char* fmt, ...) {
  char msg[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);
  // One fprintf per line keeps lines from different threads whole.
  std::fprintf(stderr, "glance: %s: %s\n", level_name(level), msg);
}

bool log_first_time(const char* key) {
  static std::mutex mu;
  static std::unordered_set<std::string> seen;
  std::lock_guard lk(mu);
  return seen.insert(key).second;
}

} // namespace glance::util
