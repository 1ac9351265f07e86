#pragma once
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace symx {

enum class LogLevel : int { Debug = 0, Info, Warn, Error, Off };

inline const char* log_level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "?";
}

// Parse "debug" / "info" / "warn" / "error" / "off"; anything else keeps the fallback.
inline LogLevel parse_log_level(std::string_view s, LogLevel fallback) {
  for (LogLevel l : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off})
    if (s == log_level_name(l)) return l;
  return fallback;
}

namespace detail {
inline std::atomic<int>& log_threshold() {
  static std::atomic<int> lvl{ [] {
    const char* env = std::getenv("SYMX_LOG_LEVEL");
    LogLevel l = env ? parse_log_level(env, LogLevel::Warn) : LogLevel::Warn;
    return static_cast<int>(l);
  }() };
  return lvl;
}
} // namespace detail

inline void set_log_level(LogLevel l) { detail::log_threshold().store(static_cast<int>(l)); }
inline LogLevel log_level() { return static_cast<LogLevel>(detail::log_threshold().load()); }
inline bool log_enabled(LogLevel l) {
  return l != LogLevel::Off && static_cast<int>(l) >= detail::log_threshold().load();
}

// One line per message on stderr: "[symx:<level>] <tag>: <message>"
template <class... Args>
inline void log_at(LogLevel l, std::string_view tag, fmt::format_string<Args...> f, Args&&... args) {
  if (!log_enabled(l)) return;
  fmt::print(stderr, "[symx:{}] {}: {}\n", log_level_name(l), tag,
             fmt::format(f, std::forward<Args>(args)...));
}

template <class... Args>
inline void log_debug(std::string_view tag, fmt::format_string<Args...> f, Args&&... args) {
  log_at(LogLevel::Debug, tag, f, std::forward<Args>(args)...);
}
template <class... Args>
inline void log_info(std::string_view tag, fmt::format_string<Args...> f, Args&&... args) {
  log_at(LogLevel::Info, tag, f, std::forward<Args>(args)...);
}
template <class... Args>
inline void log_warn(std::string_view tag, fmt::format_string<Args...> f, Args&&... args) {
  log_at(LogLevel::Warn, tag, f, std::forward<Args>(args)...);
}
template <class... Args>
inline void log_error(std::string_view tag, fmt::format_string<Args...> f, Args&&... args) {
  log_at(LogLevel::Error, tag, f, std::forward<Args>(args)...);
}

} // namespace symx
