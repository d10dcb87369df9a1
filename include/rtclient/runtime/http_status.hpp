#pragma once

#include "rtclient/core/errors.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rtclient::runtime {

using namespace rtclient::core;

// Status used by transports to signal that no response was received
inline constexpr int kNoResponse = 0;

// Classify the outcome of a runtime API call.
//
// Returns nothing for 2xx. A missing response, 429 and 5xx are Recoverable;
// every other status is Unrecoverable. When the body is an error envelope
// its type and message are appended to the error message.
std::optional<ApiError> classify_response(int status,
                                          std::string_view operation,
                                          const std::string& body = {});

}  // namespace rtclient::runtime
