#include "rtclient/core/envelope.hpp"

#include <spdlog/spdlog.h>
#include <sstream>

namespace rtclient::core {

ErrorEnvelope::ErrorEnvelope(std::string message, std::string type, const Backtrace* backtrace)
    : error_message(std::move(message))
    , error_type(std::move(type))
{
    // A trace with no frames is reported as no trace
    if (!backtrace || backtrace->empty()) {
        return;
    }

    spdlog::trace("Begin backtrace collection");

    std::vector<std::string> lines;
    std::istringstream rendered(backtrace->to_string());
    std::string line;
    while (std::getline(rendered, line)) {
        lines.push_back(std::move(line));
    }
    stack_trace = std::move(lines);

    spdlog::trace("Completed backtrace collection");
}

Json ErrorEnvelope::to_json() const {
    Json j;
    rtclient::core::to_json(j, *this);
    return j;
}

std::string ErrorEnvelope::dump(int indent) const {
    return to_json().dump(indent);
}

Result<ErrorEnvelope, ApiError> ErrorEnvelope::parse(const std::string& body) {
    try {
        return Result<ErrorEnvelope, ApiError>::ok(Json::parse(body).get<ErrorEnvelope>());
    } catch (const Json::exception& e) {
        return Result<ErrorEnvelope, ApiError>::err(
            Unrecoverable{std::string("Invalid error envelope: ") + e.what()});
    }
}

void to_json(Json& j, const ErrorEnvelope& envelope) {
    j = Json{
        {"errorMessage", envelope.error_message},
        {"errorType", envelope.error_type},
        {"stackTrace", envelope.stack_trace ? Json(*envelope.stack_trace) : Json(nullptr)}
    };
}

void from_json(const Json& j, ErrorEnvelope& envelope) {
    j.at("errorMessage").get_to(envelope.error_message);
    j.at("errorType").get_to(envelope.error_type);

    envelope.stack_trace.reset();
    if (auto it = j.find("stackTrace"); it != j.end() && !it->is_null()) {
        envelope.stack_trace = it->get<std::vector<std::string>>();
    }
}

}  // namespace rtclient::core
