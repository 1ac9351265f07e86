#include <cassert>
#include <string>

#include "symx/log.hpp"

using namespace symx;

int main() {
  assert(parse_log_level("debug", LogLevel::Warn) == LogLevel::Debug);
  assert(parse_log_level("off", LogLevel::Warn) == LogLevel::Off);
  assert(parse_log_level("verbose", LogLevel::Info) == LogLevel::Info);
  assert(std::string(log_level_name(LogLevel::Error)) == "error");

  set_log_level(LogLevel::Off);
  assert(log_level() == LogLevel::Off);
  assert(!log_enabled(LogLevel::Error));

  set_log_level(LogLevel::Info);
  assert(log_enabled(LogLevel::Warn));
  assert(log_enabled(LogLevel::Info));
  assert(!log_enabled(LogLevel::Debug));
  assert(!log_enabled(LogLevel::Off));

  log_info("test", "{} + {} = {}", 1, 2, 3);
  log_debug("test", "suppressed {}", std::string("message"));
  return 0;
}
