#include <catch2/catch_test_macros.hpp>
#include "rtclient/core/envelope.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

using namespace rtclient::core;

namespace {

struct TraceMode {
    explicit TraceMode(BacktraceMode mode) {
        BacktraceSettings settings;
        settings.mode = mode;
        Backtrace::configure(settings);
    }
    ~TraceMode() { Backtrace::configure(BacktraceSettings{}); }
};

// Reportable without deriving from Failure
struct PlainError {
    std::string display() const { return "plain failure"; }
    std::string error_type() const { return "PlainError"; }
    const Backtrace* backtrace() const { return nullptr; }
};

// Reportable whose trace was taken but holds no frames
struct EmptyTraceError {
    Backtrace trace{std::vector<std::string>{}};
    std::string display() const { return "empty trace"; }
    std::string error_type() const { return "EmptyTraceError"; }
    const Backtrace* backtrace() const { return &trace; }
};

// Routes the default logger into a string for the lifetime of the object
struct CapturedLog {
    std::ostringstream stream;
    std::shared_ptr<spdlog::logger> previous = spdlog::default_logger();

    CapturedLog() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
        auto logger = std::make_shared<spdlog::logger>("envelope_test", sink);
        logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(logger);
    }
    ~CapturedLog() { spdlog::set_default_logger(previous); }
};

}  // namespace

TEST_CASE("No stack trace when capture is disabled", "[envelope]") {
    ::unsetenv("RTCLIENT_BACKTRACE");
    Backtrace::configure(BacktraceSettings{});

    AppError err("Test error");
    auto envelope = ErrorEnvelope::from_error(err);

    REQUIRE(envelope.error_message == "Test error");
    REQUIRE(envelope.error_type == "RuntimeError");
    REQUIRE_FALSE(envelope.stack_trace.has_value());
}

TEST_CASE("Message is the display string verbatim", "[envelope]") {
    TraceMode off(BacktraceMode::Never);

    std::string message = "  multi\nline: message with trailing space ";
    AppError err(message, "CustomError");
    auto envelope = ErrorEnvelope::from_error(err);

    REQUIRE(envelope.error_message == err.display());
    REQUIRE(envelope.error_type == "CustomError");
}

TEST_CASE("ApiError envelopes use the fixed type tag", "[envelope]") {
    TraceMode off(BacktraceMode::Never);

    auto cause = make_failure<AppError>("bad handler config", "ConfigError");
    auto err = ApiError::with_cause(Unrecoverable{"init"}, cause);
    auto envelope = ErrorEnvelope::from_error(err);

    REQUIRE(envelope.error_message == "Unrecoverable API error: init");
    REQUIRE(envelope.error_type == "RuntimeApiError");
}

TEST_CASE("Any reportable type converts", "[envelope]") {
    auto envelope = ErrorEnvelope::from_error(PlainError{});

    REQUIRE(envelope.error_message == "plain failure");
    REQUIRE(envelope.error_type == "PlainError");
    REQUIRE_FALSE(envelope.stack_trace.has_value());
}

TEST_CASE("Stack trace has one element per trace line", "[envelope]") {
    Backtrace trace({"first_frame", "second_frame", "third_frame"});
    ErrorEnvelope envelope("traced", "RuntimeError", &trace);

    REQUIRE(envelope.stack_trace.has_value());
    REQUIRE(*envelope.stack_trace == trace.lines());
    REQUIRE(envelope.stack_trace->size() == 3);
    REQUIRE(envelope.stack_trace->front() == "   0: first_frame");
}

TEST_CASE("Captured traces reach the envelope", "[envelope]") {
    TraceMode on(BacktraceMode::Always);

    auto err = ApiError::unrecoverable("with trace");
    auto envelope = ErrorEnvelope::from_error(err);

    REQUIRE(err.backtrace() != nullptr);
    REQUIRE(envelope.stack_trace.has_value());
    REQUIRE(envelope.stack_trace->size() == err.backtrace()->size());
}

TEST_CASE("Converting twice gives the same envelope", "[envelope]") {
    SECTION("without trace") {
        TraceMode off(BacktraceMode::Never);
        auto err = ApiError::recoverable("again");
        auto first = ErrorEnvelope::from_error(err);
        auto second = ErrorEnvelope::from_error(err);
        REQUIRE(first == second);
    }

    SECTION("with trace") {
        TraceMode on(BacktraceMode::Always);
        auto err = ApiError::recoverable("again");
        auto first = ErrorEnvelope::from_error(err);
        auto second = ErrorEnvelope::from_error(err);
        REQUIRE(first.error_message == second.error_message);
        REQUIRE(first.error_type == second.error_type);
        REQUIRE(first.stack_trace.has_value() == second.stack_trace.has_value());
    }
}

TEST_CASE("Envelope serializes with wire field names", "[envelope]") {
    TraceMode off(BacktraceMode::Never);

    auto envelope = ErrorEnvelope::from_error(AppError("Test error"));

    REQUIRE(envelope.dump() ==
            R"({"errorMessage":"Test error","errorType":"RuntimeError","stackTrace":null})");

    Backtrace trace({"frame"});
    ErrorEnvelope traced("boom", "RuntimeError", &trace);
    Json j = traced.to_json();
    REQUIRE(j["stackTrace"].is_array());
    REQUIRE(j["stackTrace"][0] == "   0: frame");
}

TEST_CASE("Envelope parses from JSON", "[envelope]") {
    auto parsed = ErrorEnvelope::parse(
        R"({"errorMessage":"boom","errorType":"HandlerError","stackTrace":["a","b"]})");

    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().error_message == "boom");
    REQUIRE(parsed.value().error_type == "HandlerError");
    REQUIRE(parsed.value().stack_trace == std::vector<std::string>{"a", "b"});

    auto no_trace = ErrorEnvelope::parse(R"({"errorMessage":"m","errorType":"t"})");
    REQUIRE(no_trace.is_ok());
    REQUIRE_FALSE(no_trace.value().stack_trace.has_value());
}

TEST_CASE("Malformed envelopes are unrecoverable", "[envelope]") {
    TraceMode off(BacktraceMode::Never);

    auto missing = ErrorEnvelope::parse(R"({"errorMessage":"m"})");
    REQUIRE(missing.is_err());
    REQUIRE_FALSE(missing.error().is_recoverable());

    auto garbage = ErrorEnvelope::parse("not json");
    REQUIRE(garbage.is_err());
}

TEST_CASE("Empty traces are reported as absent", "[envelope]") {
    auto envelope = ErrorEnvelope::from_error(EmptyTraceError{});

    REQUIRE(envelope.error_type == "EmptyTraceError");
    REQUIRE_FALSE(envelope.stack_trace.has_value());
    REQUIRE(envelope.to_json()["stackTrace"].is_null());
}

TEST_CASE("Trace collection is logged at trace level", "[envelope]") {
    std::string output;
    {
        CapturedLog log;
        Backtrace trace({"frame"});
        ErrorEnvelope envelope("logged", "RuntimeError", &trace);
        spdlog::default_logger()->flush();
        output = log.stream.str();
    }

    auto begin = output.find("Begin backtrace collection");
    auto done = output.find("Completed backtrace collection");
    REQUIRE(begin != std::string::npos);
    REQUIRE(done != std::string::npos);
    REQUIRE(begin < done);
}

TEST_CASE("No trace means no collection log", "[envelope]") {
    std::string output;
    {
        CapturedLog log;
        ErrorEnvelope envelope("quiet", "RuntimeError", nullptr);
        spdlog::default_logger()->flush();
        output = log.stream.str();
    }

    REQUIRE(output.find("backtrace collection") == std::string::npos);
}
