/**
 * @file result.hpp
 * @brief Monadic error handling type and the router's error taxonomy.
 *
 * Result<T, E> is the only error-propagation mechanism across module
 * boundaries. Exceptions thrown by tool code are converted at the
 * executor boundary and never escape into the router.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace hybrid_router {

// ─────────────────────────────────────────────
// Error taxonomy
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    UnknownTool,            ///< No descriptor registered (caller bug)
    InvalidParameters,      ///< Parameters failed validation (caller bug)
    LocalTimeout,           ///< Local call exceeded its deadline
    LocalExecutionFailed,   ///< Local tool reported an error
    RemoteUnreachable,      ///< Backend endpoint could not be reached
    RemoteExecutionFailed,  ///< Backend ran the tool and it failed
    QueueExhausted,         ///< Job ran out of attempts
    QueueFull,              ///< Pending-job capacity reached
    JobNotFound,
    InvalidJobState,
    StorageError,
    ConfigError,
    ExportError
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnknownTool:           return "unknown_tool";
        case ErrorKind::InvalidParameters:     return "invalid_parameters";
        case ErrorKind::LocalTimeout:          return "local_timeout";
        case ErrorKind::LocalExecutionFailed:  return "local_execution_failed";
        case ErrorKind::RemoteUnreachable:     return "remote_unreachable";
        case ErrorKind::RemoteExecutionFailed: return "remote_execution_failed";
        case ErrorKind::QueueExhausted:        return "queue_exhausted";
        case ErrorKind::QueueFull:             return "queue_full";
        case ErrorKind::JobNotFound:           return "job_not_found";
        case ErrorKind::InvalidJobState:       return "invalid_job_state";
        case ErrorKind::StorageError:          return "storage_error";
        case ErrorKind::ConfigError:           return "config_error";
        case ErrorKind::ExportError:           return "export_error";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a classification and a descriptive message.
 */
struct Error {
    ErrorKind kind;
    std::string message;

    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// Transient infrastructure failures are absorbed by the router and queue.
    [[nodiscard]] bool is_transient() const noexcept {
        return kind == ErrorKind::LocalTimeout
            || kind == ErrorKind::LocalExecutionFailed
            || kind == ErrorKind::RemoteUnreachable
            || kind == ErrorKind::RemoteExecutionFailed;
    }
};

/**
 * @brief Result<T, E> — holds either a success value or an error.
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
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
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

    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations with no success value.
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

template <typename T>
Result<T> make_error(ErrorKind kind, std::string message) {
    return Result<T>(Error{kind, std::move(message)});
}

}  // namespace hybrid_router
