#pragma once

#include "errors.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace rtclient::core {

// Outcome of a fallible operation. Failures carry an ApiError by default,
// so every error leaving an operation has already been classified.
template<typename T, typename E = ApiError>
class Result {
public:
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : data_(std::in_place_index<1>, error) {}
    Result(E&& error) : data_(std::in_place_index<1>, std::move(error)) {}

    static Result ok(T value) {
        return Result(std::move(value));
    }

    static Result err(E error) {
        return Result(std::move(error));
    }

    // Classify at the point of failure
    static Result err(ErrorKind kind) requires std::is_same_v<E, ApiError> {
        return Result(ApiError(std::move(kind)));
    }

    static Result err(ErrorKind kind, FailurePtr cause) requires std::is_same_v<E, ApiError> {
        return Result(ApiError::with_cause(std::move(kind), std::move(cause)));
    }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    // Throws std::logic_error when the other alternative is held
    T& value() & { return std::get<0>(checked(true)); }
    const T& value() const& { return std::get<0>(checked(true)); }
    T&& value() && { return std::get<0>(std::move(checked(true))); }

    E& error() & { return std::get<1>(checked(false)); }
    const E& error() const& { return std::get<1>(checked(false)); }
    E&& error() && { return std::get<1>(std::move(checked(false))); }

    template<typename F>
    auto map_err(F&& f) const -> Result<T, std::invoke_result_t<F, const E&>> {
        using Mapped = Result<T, std::invoke_result_t<F, const E&>>;
        if (is_ok()) {
            return Mapped::ok(std::get<0>(data_));
        }
        return Mapped::err(f(std::get<1>(data_)));
    }

    T unwrap_or(T fallback) const {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    // Throws std::runtime_error carrying the error chain
    T unwrap() const {
        if (is_err()) {
            throw std::runtime_error(describe(std::get<1>(data_)));
        }
        return std::get<0>(data_);
    }

private:
    std::variant<T, E> data_;

    std::variant<T, E>& checked(bool want_value) {
        if (is_ok() != want_value) {
            throw std::logic_error(want_value ? "Result holds an error" : "Result holds a value");
        }
        return data_;
    }

    const std::variant<T, E>& checked(bool want_value) const {
        if (is_ok() != want_value) {
            throw std::logic_error(want_value ? "Result holds an error" : "Result holds a value");
        }
        return data_;
    }

    static std::string describe(const E& error) {
        if constexpr (std::is_base_of_v<Failure, E>) {
            return describe_chain(error);
        } else {
            return "Result holds an error";
        }
    }
};

// Success carries nothing; an empty error slot means ok
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(const E& error) : error_(error) {}
    Result(E&& error) : error_(std::move(error)) {}

    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    static Result err(ErrorKind kind) requires std::is_same_v<E, ApiError> {
        return Result(ApiError(std::move(kind)));
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const E& error() const& {
        if (!error_) {
            throw std::logic_error("Result holds no error");
        }
        return *error_;
    }

    E&& error() && {
        if (!error_) {
            throw std::logic_error("Result holds no error");
        }
        return std::move(*error_);
    }

private:
    std::optional<E> error_;
};

// Early return on error; yields the value otherwise (GNU statement expression)
#define RTCLIENT_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (_result.is_err()) { \
            return std::move(_result).error(); \
        } \
        std::move(_result).value(); \
    })

#define RTCLIENT_TRY_VOID(expr) \
    do { \
        auto&& _result = (expr); \
        if (_result.is_err()) { \
            return std::move(_result).error(); \
        } \
    } while (0)

}  // namespace rtclient::core
