#include "rtclient/runtime/http_status.hpp"
#include "rtclient/core/envelope.hpp"

namespace rtclient::runtime {

namespace {

std::string with_body_details(std::string message, const std::string& body) {
    if (body.empty()) {
        return message;
    }

    auto parsed = ErrorEnvelope::parse(body);
    if (parsed.is_ok()) {
        message += " (" + parsed.value().error_type + ": " + parsed.value().error_message + ")";
    }
    return message;
}

}  // namespace

std::optional<ApiError> classify_response(int status,
                                          std::string_view operation,
                                          const std::string& body) {
    std::string prefix(operation);

    if (status == kNoResponse) {
        return ApiError::recoverable(prefix + ": no response from runtime API");
    }

    if (status >= 200 && status < 300) {
        return std::nullopt;
    }

    if (status == 429) {
        return ApiError::recoverable(
            with_body_details(prefix + ": rate limited by runtime API", body));
    }

    if (status >= 500 && status < 600) {
        return ApiError::recoverable(
            with_body_details(prefix + ": runtime API server error " + std::to_string(status), body));
    }

    return ApiError::unrecoverable(
        with_body_details(prefix + ": unexpected status code " + std::to_string(status), body));
}

}  // namespace rtclient::runtime
