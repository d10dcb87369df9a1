#include "rtclient/core/config.hpp"
#include "rtclient/core/logging.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace rtclient::core {

namespace {

constexpr int kMaxBacktraceFrames = 256;

std::string config_error(const std::string& what, const fs::path& path) {
    return what + " [" + path.string() + "]";
}

}  // namespace

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path Config::default_path() {
    return fs::path(expand_path(std::string("~/.rtclient/config.yaml")));
}

Result<void, ApiError> Config::validate() const {
    if (!backtrace_mode_from_string(backtrace.mode)) {
        return Result<void, ApiError>::err(Unrecoverable{
            "backtrace.mode must be one of env, always, never (got '" + backtrace.mode + "')"
        });
    }

    if (backtrace.mode == "env" && backtrace.env_var.empty()) {
        return Result<void, ApiError>::err(Unrecoverable{
            "backtrace.env_var must be set when backtrace.mode is env"
        });
    }

    if (backtrace.max_frames < 1 || backtrace.max_frames > kMaxBacktraceFrames) {
        return Result<void, ApiError>::err(Unrecoverable{
            "backtrace.max_frames must be between 1 and " + std::to_string(kMaxBacktraceFrames)
        });
    }

    if (!parse_log_level(logging.level)) {
        return Result<void, ApiError>::err(Unrecoverable{
            "logging.level is not a valid level: '" + logging.level + "'"
        });
    }

    return Result<void, ApiError>::ok();
}

BacktraceSettings Config::backtrace_settings() const {
    BacktraceSettings settings;
    settings.mode = backtrace_mode_from_string(backtrace.mode).value_or(BacktraceMode::Env);
    settings.env_var = backtrace.env_var;
    settings.max_frames = backtrace.max_frames;
    return settings;
}

Result<void, ApiError> Config::apply() const {
    RTCLIENT_TRY_VOID(validate());

    Backtrace::configure(backtrace_settings());
    init_logging(logging);
    return Result<void, ApiError>::ok();
}

Result<Config, ApiError> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path.string());

    if (!fs::exists(expanded)) {
        return Result<Config, ApiError>::err(Unrecoverable{
            config_error("Configuration file not found", expanded)
        });
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        // Parse backtrace config
        if (auto bt_node = root["backtrace"]) {
            config.backtrace.mode = bt_node["mode"].as<std::string>(config.backtrace.mode);
            config.backtrace.env_var = bt_node["env_var"].as<std::string>(config.backtrace.env_var);
            config.backtrace.max_frames = bt_node["max_frames"].as<int>(config.backtrace.max_frames);
        }

        // Parse logging config
        if (auto log_node = root["logging"]) {
            config.logging.level = log_node["level"].as<std::string>(config.logging.level);
        }

        // Environment overrides the file
        if (const char* level = std::getenv("RTCLIENT_LOG_LEVEL")) {
            config.logging.level = level;
        }

        // Validate
        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, ApiError>::err(std::move(validation).error());
        }

        return Result<Config, ApiError>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, ApiError>::err(Unrecoverable{
            config_error(std::string("YAML parse error: ") + e.what(), expanded)
        });
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    if (fs::exists(expand_path(path.string()))) {
        spdlog::warn("Ignoring config, using defaults: {}", result.error().full_message());
    } else {
        spdlog::debug("No config at {}, using defaults", path.string());
    }

    Config config;
    if (const char* level = std::getenv("RTCLIENT_LOG_LEVEL")) {
        config.logging.level = level;
    }
    return config;
}

Result<void, ApiError> Config::save(const fs::path& path) const {
    fs::path expanded = expand_path(path.string());

    try {
        // Create parent directories if needed
        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "backtrace" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "mode" << YAML::Value << backtrace.mode;
        out << YAML::Key << "env_var" << YAML::Value << backtrace.env_var;
        out << YAML::Key << "max_frames" << YAML::Value << backtrace.max_frames;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << logging.level;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, ApiError>::err(Unrecoverable{
                config_error("Failed to open config file for writing", expanded)
            });
        }

        file << out.c_str();
        return Result<void, ApiError>::ok();

    } catch (const fs::filesystem_error& e) {
        return Result<void, ApiError>::err(Unrecoverable{config_error(e.what(), expanded)});
    } catch (const YAML::Exception& e) {
        return Result<void, ApiError>::err(Unrecoverable{config_error(e.what(), expanded)});
    }
}

}  // namespace rtclient::core
