#pragma once

#include "rtclient/core/envelope.hpp"
#include "rtclient/core/errors.hpp"
#include "rtclient/core/result.hpp"
#include "rtclient/core/types.hpp"

#include <string_view>

namespace rtclient::runtime {

using namespace rtclient::core;

// What the caller does next with a failed operation
enum class Disposition {
    Retry,
    Fail
};

std::string_view disposition_to_string(Disposition disposition);

inline Disposition disposition_of(const ApiError& error) {
    return error.is_recoverable() ? Disposition::Retry : Disposition::Fail;
}

// Sends error envelopes to the runtime API. Implemented by the HTTP client.
class FailureReporter {
public:
    virtual ~FailureReporter() = default;

    // Initialization failed; the runtime will not poll for events
    virtual Result<void, ApiError> report_init_failure(const ErrorEnvelope& envelope) = 0;

    // The handler failed on one invocation
    virtual Result<void, ApiError> report_invocation_error(const RequestId& request_id,
                                                           const ErrorEnvelope& envelope) = 0;
};

// Top-level decision point between a classified error and the runtime API.
//
// Recoverable errors are never reported; the caller retries. Unrecoverable
// errors are converted to an envelope and reported once.
class FailureBoundary {
public:
    explicit FailureBoundary(FailureReporter& reporter);

    // Error raised while setting up the runtime (or polling for events)
    Disposition on_init_error(const ApiError& error);

    // Uncaught application error from a handler. The error's own type tag is reported.
    Result<void, ApiError> on_invocation_error(const RequestId& request_id, const Failure& error);

    struct Stats {
        int retries = 0;
        int init_failures = 0;
        int invocation_errors = 0;
        int report_failures = 0;
    };
    Stats get_stats() const { return stats_; }
    void reset_stats() { stats_ = Stats{}; }

private:
    FailureReporter& reporter_;
    Stats stats_;
};

}  // namespace rtclient::runtime
