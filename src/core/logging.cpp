#include "rtclient/core/logging.hpp"
#include "rtclient/core/config.hpp"

namespace rtclient::core {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

void init_logging(const LoggingConfig& config) {
    auto level = parse_log_level(config.level);
    if (!level) {
        spdlog::warn("Unknown log level '{}', keeping {}", config.level,
                     spdlog::level::to_string_view(spdlog::get_level()));
        return;
    }

    spdlog::set_level(*level);
    spdlog::debug("Log level set to {}", config.level);
}

}  // namespace rtclient::core
