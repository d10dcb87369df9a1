#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtclient::core {

// When stack traces are collected
enum class BacktraceMode {
    Env,     // Controlled by an environment variable (default)
    Always,
    Never
};

std::string_view backtrace_mode_to_string(BacktraceMode mode);
std::optional<BacktraceMode> backtrace_mode_from_string(std::string_view str);

// Process-wide capture settings. Written once at startup by Config::apply().
struct BacktraceSettings {
    BacktraceMode mode = BacktraceMode::Env;
    std::string env_var = "RTCLIENT_BACKTRACE";
    int max_frames = 64;
};

// Captured call stack, rendered as one line per frame.
//
// Capture is gated by the ambient toggle: in Env mode the variable named by
// BacktraceSettings::env_var must be set to something other than "" or "0".
// Callers never consult the toggle themselves; they call capture() and get
// an empty optional when tracing is off.
class Backtrace {
public:
    // Capture the current stack, skipping this function's own frame
    static std::optional<Backtrace> capture();

    // Check the toggle without capturing
    static bool enabled();

    static void configure(BacktraceSettings settings);
    static BacktraceSettings settings();

    // Build from already-symbolized frames
    explicit Backtrace(std::vector<std::string> frames) : frames_(std::move(frames)) {}

    const std::vector<std::string>& frames() const { return frames_; }
    size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }

    // Rendered lines, "   0: symbol" style
    std::vector<std::string> lines() const;

    // All lines joined with '\n'
    std::string to_string() const;

private:
    std::vector<std::string> frames_;
};

// Demangle a single backtrace_symbols() entry, "module(mangled+0x1f) [0x...]"
std::string demangle_frame(const std::string& symbol);

}  // namespace rtclient::core
