#pragma once

#include <format>
#include <iostream>
#include <string_view>
#include <utility>

namespace dashgrid {

enum struct LogLevel {
  trace = 1,
  info = 2,
  warn = 3,
  error = 4,
  none = 5,
};

// Process-wide threshold; messages below it are dropped.
inline LogLevel &log_threshold() {
  static LogLevel level = LogLevel::info;
  return level;
}

inline void set_log_level(LogLevel level) { log_threshold() = level; }

[[nodiscard]] inline bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(log_threshold());
}

#if !defined(DASHGRID_REPLACE_LOGGING)

namespace detail {
inline std::string_view level_prefix(LogLevel level) {
  switch (level) {
  case LogLevel::trace:
    return "[trace] ";
  case LogLevel::info:
    return "[info] ";
  case LogLevel::warn:
    return "[warn] ";
  case LogLevel::error:
    return "[error] ";
  case LogLevel::none:
    break;
  }
  return "";
}

template <typename... Args>
void write_log(LogLevel level, std::format_string<Args...> fmt,
               Args &&...args) {
  if (!log_enabled(level))
    return;
  std::cerr << level_prefix(level)
            << std::format(fmt, std::forward<Args>(args)...) << '\n';
}
} // namespace detail

template <typename... Args>
void log_trace(std::format_string<Args...> fmt, Args &&...args) {
  detail::write_log(LogLevel::trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(std::format_string<Args...> fmt, Args &&...args) {
  detail::write_log(LogLevel::info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(std::format_string<Args...> fmt, Args &&...args) {
  detail::write_log(LogLevel::warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_error(std::format_string<Args...> fmt, Args &&...args) {
  detail::write_log(LogLevel::error, fmt, std::forward<Args>(args)...);
}

#endif

} // namespace dashgrid
