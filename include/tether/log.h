#pragma once

#include <format>

#include <cstdio>
#include <string_view>
#include <utility>

namespace tether {

enum class log_level {
  trace,
  debug,
  info,
  warn,
  error,
  off,
};

std::string_view to_string(log_level level);

// Parses "trace", "debug", ... (case-sensitive). Unknown names map to warn.
log_level parse_log_level(std::string_view name);

log_level get_log_level();
void set_log_level(log_level level);

void write_log(log_level level, std::string_view message);

template <typename... Args>
void log(log_level level, std::format_string<Args...> format, Args &&...args) {
  if (level < get_log_level())
    return;

  write_log(level, std::format(format, std::forward<Args>(args)...));
}

// Graph events (set, notify, recalculate, flush, ...), only visible at trace.
template <typename... Args>
void event(std::format_string<Args...> format, Args &&...args) {
  log(log_level::trace, format, std::forward<Args>(args)...);
}

} // namespace tether
