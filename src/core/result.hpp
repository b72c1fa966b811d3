/**
 * @file result.hpp
 * @brief Monadic error handling type for runbox.
 *
 * Result<T, E> is the error channel across the service boundary. Expected
 * outcomes (capacity rejections, invalid budgets, unsupported languages) are
 * returned as values carrying an ErrorCode rather than thrown.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace runbox {

/**
 * @brief Classification of an Error, used to pick the wire status.
 */
enum class ErrorCode : uint8_t {
    Internal,
    InvalidRequest,       ///< Malformed request payload
    InvalidBudget,        ///< A limit below the configured floor
    UnsupportedLanguage,
    CapacityExceeded,     ///< Queue full; retry later
    JobCancelled,         ///< Removed from the queue before dispatch
    ShuttingDown,
    NotFound,
    SandboxSetup,         ///< Isolation or limits could not be applied
    Io,
    Config
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Internal:            return "internal";
        case ErrorCode::InvalidRequest:      return "malformed_request";
        case ErrorCode::InvalidBudget:       return "invalid_budget";
        case ErrorCode::UnsupportedLanguage: return "unsupported_language";
        case ErrorCode::CapacityExceeded:    return "capacity_exceeded";
        case ErrorCode::JobCancelled:        return "cancelled";
        case ErrorCode::ShuttingDown:        return "shutting_down";
        case ErrorCode::NotFound:            return "not_found";
        case ErrorCode::SandboxSetup:        return "sandbox_setup";
        case ErrorCode::Io:                  return "io";
        case ErrorCode::Config:              return "config";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code{ErrorCode::Internal};
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>: holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that have no value on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace runbox
