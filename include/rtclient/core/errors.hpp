#pragma once

#include "backtrace.hpp"
#include "types.hpp"

#include <concepts>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace rtclient::core {

// Base for every error that can be reported to the runtime API
class Failure {
public:
    virtual ~Failure() = default;

    // Human-readable message, sent verbatim as errorMessage
    virtual std::string display() const = 0;

    // Stable category tag, sent as errorType
    virtual std::string error_type() const = 0;

    // Error that triggered this one, if any
    virtual const Failure* cause() const { return nullptr; }

    // Stack captured where the error was created, if tracing was enabled
    virtual const Backtrace* backtrace() const { return nullptr; }
};

using FailurePtr = std::shared_ptr<const Failure>;

// What ErrorEnvelope::from_error needs from an error value
template<typename E>
concept Reportable = requires(const E& e) {
    { e.display() } -> std::convertible_to<std::string>;
    { e.error_type() } -> std::convertible_to<std::string>;
    { e.backtrace() } -> std::convertible_to<const Backtrace*>;
};

// Generic application error
class AppError : public Failure {
public:
    explicit AppError(std::string message,
                      std::string type = std::string(kRuntimeErrorType));
    AppError(std::string message, std::string type, FailurePtr cause);

    static AppError from_exception(const std::exception& e);

    std::string display() const override { return message_; }
    std::string error_type() const override { return type_; }
    const Failure* cause() const override { return cause_.get(); }
    const Backtrace* backtrace() const override;

private:
    std::string message_;
    std::string type_;
    FailurePtr cause_;
    std::optional<Backtrace> backtrace_;
};

template<typename T, typename... Args>
FailurePtr make_failure(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// Error kinds

// Safe to retry the operation that produced it
struct Recoverable {
    std::string message;
    bool operator==(const Recoverable&) const = default;
};

// Must not be retried; report the failure and stop the current unit of work
struct Unrecoverable {
    std::string message;
    bool operator==(const Unrecoverable&) const = default;
};

using ErrorKind = std::variant<Recoverable, Unrecoverable>;

template<typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Every kind must be listed here. A new kind without an overload does not compile.
inline bool is_recoverable(const ErrorKind& kind) {
    return std::visit(overloaded{
        [](const Recoverable&) { return true; },
        [](const Unrecoverable&) { return false; },
    }, kind);
}

inline const std::string& kind_message(const ErrorKind& kind) {
    return std::visit([](const auto& k) -> const std::string& { return k.message; }, kind);
}

// "Recoverable API error: ..." / "Unrecoverable API error: ..."
std::string kind_to_string(const ErrorKind& kind);

// Classified error plus the chain that led to it
class ErrorContext {
public:
    explicit ErrorContext(ErrorKind kind);

    // Keeps the cause's backtrace when it has one, otherwise captures a new one
    ErrorContext(ErrorKind kind, FailurePtr cause);

    const ErrorKind& kind() const { return kind_; }
    const Failure* cause() const { return cause_.get(); }
    const FailurePtr& shared_cause() const { return cause_; }
    const Backtrace* backtrace() const;

    std::string display() const { return kind_to_string(kind_); }

private:
    ErrorKind kind_;
    FailurePtr cause_;
    std::optional<Backtrace> backtrace_;
};

// Error returned by the runtime API client
class ApiError : public Failure {
public:
    explicit ApiError(ErrorKind kind);

    // Adopt an existing chain as-is
    explicit ApiError(ErrorContext inner);

    static ApiError recoverable(std::string message);
    static ApiError unrecoverable(std::string message);
    static ApiError with_cause(ErrorKind kind, FailurePtr cause);
    static ApiError from_exception(ErrorKind kind, const std::exception& e);

    bool is_recoverable() const { return core::is_recoverable(inner_.kind()); }

    const ErrorKind& kind() const { return inner_.kind(); }
    const std::string& message() const { return kind_message(inner_.kind()); }
    const ErrorContext& context() const { return inner_; }

    std::string display() const override { return inner_.display(); }
    std::string error_type() const override { return std::string(kRuntimeApiErrorType); }
    const Failure* cause() const override { return inner_.cause(); }
    const Backtrace* backtrace() const override { return inner_.backtrace(); }

    // Display followed by each cause, for logging
    std::string full_message() const;

private:
    ErrorContext inner_;
};

// Render an error and its causes: "outer: caused by: inner"
std::string describe_chain(const Failure& failure);

}  // namespace rtclient::core
