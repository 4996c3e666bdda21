#pragma once

#include <spdlog/logger.h>
#include <memory>
#include <string_view>

namespace autotag::core {

inline constexpr const char* kLoggerName = "autotag";

/// Shared "autotag" logger (stderr, colour). Created on first use; registered with spdlog
/// so applications may replace it by registering their own logger under the same name first.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Sets the level from a name ("trace", "debug", "info", "warn", "error", "critical", "off").
/// Returns false for an unknown name and leaves the level unchanged.
bool set_log_level(std::string_view level);

}  // namespace autotag::core
