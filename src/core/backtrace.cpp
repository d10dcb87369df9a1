#include "rtclient/core/backtrace.hpp"

#include <cstdlib>
#include <mutex>
#include <sstream>
#include <iomanip>

#if defined(__linux__) || defined(__APPLE__)
#include <cxxabi.h>
#include <execinfo.h>
#define RTCLIENT_HAS_EXECINFO 1
#else
#define RTCLIENT_HAS_EXECINFO 0
#endif

namespace rtclient::core {

namespace {

constexpr int kMaxFramesLimit = 256;

std::mutex& settings_mutex() {
    static std::mutex mutex;
    return mutex;
}

BacktraceSettings& settings_storage() {
    static BacktraceSettings settings;
    return settings;
}

}  // namespace

std::string_view backtrace_mode_to_string(BacktraceMode mode) {
    switch (mode) {
        case BacktraceMode::Env: return "env";
        case BacktraceMode::Always: return "always";
        case BacktraceMode::Never: return "never";
    }
    return "env";
}

std::optional<BacktraceMode> backtrace_mode_from_string(std::string_view str) {
    if (str == "env") return BacktraceMode::Env;
    if (str == "always") return BacktraceMode::Always;
    if (str == "never") return BacktraceMode::Never;
    return std::nullopt;
}

void Backtrace::configure(BacktraceSettings settings) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    settings_storage() = std::move(settings);
}

BacktraceSettings Backtrace::settings() {
    std::lock_guard<std::mutex> lock(settings_mutex());
    return settings_storage();
}

bool Backtrace::enabled() {
    BacktraceSettings current = settings();

    switch (current.mode) {
        case BacktraceMode::Always: return true;
        case BacktraceMode::Never: return false;
        case BacktraceMode::Env: break;
    }

    const char* value = std::getenv(current.env_var.c_str());
    if (!value) {
        return false;
    }
    std::string_view flag(value);
    return !flag.empty() && flag != "0";
}

std::optional<Backtrace> Backtrace::capture() {
    if (!enabled()) {
        return std::nullopt;
    }

#if RTCLIENT_HAS_EXECINFO
    int max_frames = settings().max_frames;
    if (max_frames < 1) max_frames = 1;
    if (max_frames > kMaxFramesLimit) max_frames = kMaxFramesLimit;

    // One extra slot for capture() itself, which is skipped below
    void* buffer[kMaxFramesLimit + 1];
    int frame_count = ::backtrace(buffer, max_frames + 1);
    if (frame_count <= 1) {
        return std::nullopt;
    }

    char** symbols = ::backtrace_symbols(buffer + 1, frame_count - 1);
    if (!symbols) {
        return std::nullopt;
    }

    std::vector<std::string> frames;
    frames.reserve(static_cast<size_t>(frame_count - 1));
    for (int i = 0; i < frame_count - 1; ++i) {
        frames.push_back(demangle_frame(symbols[i]));
    }
    std::free(symbols);

    return Backtrace(std::move(frames));
#else
    // No unwinder on this platform
    return std::nullopt;
#endif
}

std::vector<std::string> Backtrace::lines() const {
    std::vector<std::string> result;
    result.reserve(frames_.size());

    for (size_t i = 0; i < frames_.size(); ++i) {
        std::ostringstream line;
        line << std::setw(4) << i << ": " << frames_[i];
        result.push_back(line.str());
    }

    return result;
}

std::string Backtrace::to_string() const {
    std::string result;
    auto rendered = lines();
    for (size_t i = 0; i < rendered.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += rendered[i];
    }
    return result;
}

std::string demangle_frame(const std::string& symbol) {
#if RTCLIENT_HAS_EXECINFO
    auto open = symbol.find('(');
    auto plus = symbol.find('+', open == std::string::npos ? 0 : open);
    if (open == std::string::npos || plus == std::string::npos || plus <= open + 1) {
        return symbol;
    }

    std::string mangled = symbol.substr(open + 1, plus - open - 1);
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
    if (status != 0 || !demangled) {
        std::free(demangled);
        return symbol;
    }

    std::string result = symbol.substr(0, open + 1) + demangled + symbol.substr(plus);
    std::free(demangled);
    return result;
#else
    return symbol;
#endif
}

}  // namespace rtclient::core
