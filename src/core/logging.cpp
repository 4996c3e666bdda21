#include <autotag/core/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace autotag::core {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get(kLoggerName)) {
      return existing;
    }
    return spdlog::stderr_color_mt(kLoggerName);
  }();
  return instance;
}

bool set_log_level(std::string_view level) {
  const std::string name(level);
  const auto parsed = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"; only accept "off" when asked for it.
  if (parsed == spdlog::level::off && name != "off") {
    return false;
  }
  logger()->set_level(parsed);
  return true;
}

}  // namespace autotag::core
