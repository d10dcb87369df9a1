#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rtclient::core {

// JSON alias
using Json = nlohmann::json;

// Identifies one invocation handed out by the runtime API
using RequestId = std::string;

// Type tag reported for errors raised by the runtime API client itself
inline constexpr std::string_view kRuntimeApiErrorType = "RuntimeApiError";

// Type tag used for application errors that do not declare their own
inline constexpr std::string_view kRuntimeErrorType = "RuntimeError";

}  // namespace rtclient::core
