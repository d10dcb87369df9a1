#include "rtclient/runtime/boundary.hpp"

#include <spdlog/spdlog.h>

namespace rtclient::runtime {

std::string_view disposition_to_string(Disposition disposition) {
    switch (disposition) {
        case Disposition::Retry: return "retry";
        case Disposition::Fail: return "fail";
    }
    return "fail";
}

FailureBoundary::FailureBoundary(FailureReporter& reporter)
    : reporter_(reporter)
{
}

Disposition FailureBoundary::on_init_error(const ApiError& error) {
    Disposition disposition = disposition_of(error);

    if (disposition == Disposition::Retry) {
        stats_.retries++;
        spdlog::warn("Retrying after recoverable error: {}", error.full_message());
        return disposition;
    }

    stats_.init_failures++;
    spdlog::error("Reporting initialization failure: {}", error.full_message());

    auto envelope = ErrorEnvelope::from_error(error);
    auto sent = reporter_.report_init_failure(envelope);
    if (sent.is_err()) {
        // A failed report leaves the disposition unchanged
        stats_.report_failures++;
        spdlog::error("Could not report initialization failure: {}", sent.error().full_message());
    }

    return disposition;
}

Result<void, ApiError> FailureBoundary::on_invocation_error(const RequestId& request_id,
                                                            const Failure& error) {
    stats_.invocation_errors++;
    spdlog::error("Invocation {} failed: {}", request_id, describe_chain(error));

    auto envelope = ErrorEnvelope::from_error(error);
    auto sent = reporter_.report_invocation_error(request_id, envelope);
    if (sent.is_err()) {
        stats_.report_failures++;
        spdlog::error("Could not report error for invocation {}: {}",
                      request_id, sent.error().full_message());
    }

    return sent;
}

}  // namespace rtclient::runtime
