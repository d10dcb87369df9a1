#pragma once

#include "backtrace.hpp"
#include "errors.hpp"
#include "result.hpp"

#include <filesystem>
#include <string>

namespace rtclient::core {

namespace fs = std::filesystem;

// Stack trace capture for error envelopes
struct BacktraceConfig {
    std::string mode = "env";                   // env | always | never
    std::string env_var = "RTCLIENT_BACKTRACE"; // Checked in env mode
    int max_frames = 64;
};

// Logging configuration
struct LoggingConfig {
    std::string level = "info";  // trace, debug, info, warn, error, critical, off
};

// Main configuration
struct Config {
    BacktraceConfig backtrace;
    LoggingConfig logging;

    // Load configuration from file
    static Result<Config, ApiError> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, ApiError> save(const fs::path& path) const;

    // Get default config path
    static fs::path default_path();

    // Validate configuration
    Result<void, ApiError> validate() const;

    // Push settings to the backtrace facility and the logger
    Result<void, ApiError> apply() const;

    BacktraceSettings backtrace_settings() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);

}  // namespace rtclient::core
