#include <tether/log.h>

#include <cstdio>
#include <cstdlib>
#include <print>

namespace tether {

namespace {

auto level_from_environment() {
  const auto name = std::getenv("TETHER_LOG_LEVEL");
  if (name == nullptr)
    return log_level::warn;

  return parse_log_level(name);
}

auto &current_level() {
  static auto level = level_from_environment();
  return level;
}

} // namespace

std::string_view to_string(log_level level) {
  switch (level) {
  default:
    return "unknown";
  case log_level::trace:
    return "trace";
  case log_level::debug:
    return "debug";
  case log_level::info:
    return "info";
  case log_level::warn:
    return "warn";
  case log_level::error:
    return "error";
  case log_level::off:
    return "off";
  }
}

log_level parse_log_level(std::string_view name) {
  for (auto level : {log_level::trace, log_level::debug, log_level::info,
                     log_level::warn, log_level::error, log_level::off}) {
    if (to_string(level) == name)
      return level;
  }

  return log_level::warn;
}

log_level get_log_level() { return current_level(); }

void set_log_level(log_level level) { current_level() = level; }

void write_log(log_level level, std::string_view message) {
  std::print(stderr, "[tether] {}: {}\n", to_string(level), message);
}

} // namespace tether
