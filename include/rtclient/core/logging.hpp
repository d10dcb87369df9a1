#pragma once

#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace rtclient::core {

struct LoggingConfig;

// Map a config level name to spdlog's level. Accepts "warning" for "warn".
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

// Set the default logger's level from configuration
void init_logging(const LoggingConfig& config);

}  // namespace rtclient::core
