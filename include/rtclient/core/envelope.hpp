#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rtclient::core {

// Error body posted to the runtime API's error and init-failure endpoints.
//
// Wire format (field names and order are fixed):
//   {"errorMessage": "...", "errorType": "...", "stackTrace": ["...", ...] | null}
struct ErrorEnvelope {
    std::string error_message;
    std::string error_type;
    std::optional<std::vector<std::string>> stack_trace;

    ErrorEnvelope() = default;

    // Populates stack_trace from the backtrace when one is given. Never fails.
    ErrorEnvelope(std::string message, std::string type, const Backtrace* backtrace);

    // Build from any reportable error. The error's own type tag is used.
    template<Reportable E>
    static ErrorEnvelope from_error(const E& error) {
        return ErrorEnvelope(error.display(), error.error_type(), error.backtrace());
    }

    Json to_json() const;
    std::string dump(int indent = -1) const;

    static Result<ErrorEnvelope, ApiError> parse(const std::string& body);

    bool operator==(const ErrorEnvelope&) const = default;
};

void to_json(Json& j, const ErrorEnvelope& envelope);
void from_json(const Json& j, ErrorEnvelope& envelope);

}  // namespace rtclient::core
