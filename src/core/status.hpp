#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace riskwatch {

/// Failure categories, each with its own recovery policy
enum class ErrorKind {
    TransientIO,           // store temporarily unreachable: retry, keep marker
    Config,                // missing/invalid configuration: fatal at startup
    NotificationDelivery,  // channel rejected or unreachable: retry, then drop
    DataIntegrity,         // malformed record: skip and continue
    Internal               // unexpected failure inside the engine
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::TransientIO:          return "TransientIOError";
        case ErrorKind::Config:               return "ConfigError";
        case ErrorKind::NotificationDelivery: return "NotificationDeliveryError";
        case ErrorKind::DataIntegrity:        return "DataIntegrityError";
        case ErrorKind::Internal:             return "InternalError";
    }
    return "UnknownError";
}

/// Error value carried by Result
struct Error {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;

    [[nodiscard]] static Error transient_io(std::string msg) {
        return Error{ErrorKind::TransientIO, std::move(msg)};
    }
    [[nodiscard]] static Error config(std::string msg) {
        return Error{ErrorKind::Config, std::move(msg)};
    }
    [[nodiscard]] static Error delivery(std::string msg) {
        return Error{ErrorKind::NotificationDelivery, std::move(msg)};
    }
    [[nodiscard]] static Error data_integrity(std::string msg) {
        return Error{ErrorKind::DataIntegrity, std::move(msg)};
    }
    [[nodiscard]] static Error internal(std::string msg) {
        return Error{ErrorKind::Internal, std::move(msg)};
    }

    /// "KindName: message" for logging
    [[nodiscard]] std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

/// Result monad for error handling without exceptions
template <typename T, typename E = Error>
class Result {
public:
    /// Create a successful result
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /// Create an error result
    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Index-based so that T == E still works
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Get the value (throws if error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Get the error (throws if ok)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /// Move the value out (for move-only or large payloads)
    [[nodiscard]] T take_value() && {
        if (is_err()) {
            throw std::runtime_error("Called take_value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Transform the value if Ok, preserve error if Err
    template <typename F>
    [[nodiscard]] auto map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::Ok(func(std::get<0>(data_)));
        }
        return Result<U, E>::Err(std::get<1>(data_));
    }

    /// Chain operations that may fail
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
        using ResultType = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return func(std::get<0>(data_));
        }
        return ResultType::Err(std::get<1>(data_));
    }

private:
    template <size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

/// Result of an operation with no payload
using Status = Result<std::monostate, Error>;

[[nodiscard]] inline Status ok_status() {
    return Status::Ok(std::monostate{});
}

}  // namespace riskwatch
