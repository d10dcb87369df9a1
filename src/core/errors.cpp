#include "rtclient/core/errors.hpp"

namespace rtclient::core {

AppError::AppError(std::string message, std::string type)
    : message_(std::move(message))
    , type_(std::move(type))
    , backtrace_(Backtrace::capture())
{
}

AppError::AppError(std::string message, std::string type, FailurePtr cause)
    : message_(std::move(message))
    , type_(std::move(type))
    , cause_(std::move(cause))
{
    if (!cause_ || !cause_->backtrace()) {
        backtrace_ = Backtrace::capture();
    }
}

AppError AppError::from_exception(const std::exception& e) {
    return AppError(e.what());
}

const Backtrace* AppError::backtrace() const {
    if (backtrace_) {
        return &*backtrace_;
    }
    return cause_ ? cause_->backtrace() : nullptr;
}

std::string kind_to_string(const ErrorKind& kind) {
    return std::visit(overloaded{
        [](const Recoverable& k) { return "Recoverable API error: " + k.message; },
        [](const Unrecoverable& k) { return "Unrecoverable API error: " + k.message; },
    }, kind);
}

ErrorContext::ErrorContext(ErrorKind kind)
    : kind_(std::move(kind))
    , backtrace_(Backtrace::capture())
{
}

ErrorContext::ErrorContext(ErrorKind kind, FailurePtr cause)
    : kind_(std::move(kind))
    , cause_(std::move(cause))
{
    if (!cause_ || !cause_->backtrace()) {
        backtrace_ = Backtrace::capture();
    }
}

const Backtrace* ErrorContext::backtrace() const {
    if (backtrace_) {
        return &*backtrace_;
    }
    return cause_ ? cause_->backtrace() : nullptr;
}

ApiError::ApiError(ErrorKind kind)
    : inner_(std::move(kind))
{
}

ApiError::ApiError(ErrorContext inner)
    : inner_(std::move(inner))
{
}

ApiError ApiError::recoverable(std::string message) {
    return ApiError(ErrorKind{Recoverable{std::move(message)}});
}

ApiError ApiError::unrecoverable(std::string message) {
    return ApiError(ErrorKind{Unrecoverable{std::move(message)}});
}

ApiError ApiError::with_cause(ErrorKind kind, FailurePtr cause) {
    return ApiError(ErrorContext(std::move(kind), std::move(cause)));
}

ApiError ApiError::from_exception(ErrorKind kind, const std::exception& e) {
    return with_cause(std::move(kind), make_failure<AppError>(AppError::from_exception(e)));
}

std::string ApiError::full_message() const {
    return describe_chain(*this);
}

std::string describe_chain(const Failure& failure) {
    std::string result = failure.display();
    for (const Failure* cause = failure.cause(); cause; cause = cause->cause()) {
        result += ": caused by: " + cause->display();
    }
    return result;
}

}  // namespace rtclient::core
