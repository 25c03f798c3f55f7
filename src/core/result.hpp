/**
 * @file result.hpp
 * @brief Monadic error handling type for the benchmark runner.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Wraps a
 * std::variant so configuration and loading failures travel as values from
 * the catalog up to the CLI without exceptions.
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

namespace automl_bench {

// ─────────────────────────────────────────────
// Error codes
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    Generic,
    // Configuration errors: abort the invocation before any job runs.
    UnknownTask,
    TaskDisabled,
    InvalidFoldSpec,
    FoldOutOfRange,
    NoTaskAvailable,
    UnknownFramework,
    ConfigParse,
    // Job-fatal errors raised while loading a dataset.
    UnsupportedDatasetShape,
    DatasetLoad,
    // Converted to NoResult by the executor.
    AdapterFailure,
    // Persistence / setup.
    Io,
    SetupFailure
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic:                 return "generic";
        case ErrorCode::UnknownTask:             return "unknown_task";
        case ErrorCode::TaskDisabled:            return "task_disabled";
        case ErrorCode::InvalidFoldSpec:         return "invalid_fold_spec";
        case ErrorCode::FoldOutOfRange:          return "fold_out_of_range";
        case ErrorCode::NoTaskAvailable:         return "no_task_available";
        case ErrorCode::UnknownFramework:        return "unknown_framework";
        case ErrorCode::ConfigParse:             return "config_parse";
        case ErrorCode::UnsupportedDatasetShape: return "unsupported_dataset_shape";
        case ErrorCode::DatasetLoad:             return "dataset_load";
        case ErrorCode::AdapterFailure:          return "adapter_failure";
        case ErrorCode::Io:                      return "io";
        case ErrorCode::SetupFailure:            return "setup_failure";
    }
    return "unknown";
}

/// True for the codes that must abort a whole invocation.
[[nodiscard]] constexpr bool is_configuration_error(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::UnknownTask:
        case ErrorCode::TaskDisabled:
        case ErrorCode::InvalidFoldSpec:
        case ErrorCode::FoldOutOfRange:
        case ErrorCode::NoTaskAvailable:
        case ErrorCode::UnknownFramework:
        case ErrorCode::ConfigParse:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::Generic;
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E> — a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

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

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
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

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace automl_bench
