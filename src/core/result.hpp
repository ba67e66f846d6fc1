/**
 * @file result.hpp
 * @brief Monadic error handling type for WorkflowOrchestrator.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Planning
 * and tracking operations report structural problems through it instead of
 * throwing, so callers can inspect the ErrorCode and decide.
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

namespace workflow_orchestrator {

/**
 * @brief Error categories surfaced by the planning and coordination layers.
 */
enum class ErrorCode : uint8_t {
    Generic,
    CyclicDependency,       ///< Subtask graph contains a cycle
    UnknownTaskReference,   ///< Dependency names an id outside the batch
    DuplicateTaskId,        ///< Two subtasks share an id
    TaskNotFound,           ///< Lookup on an id the tracker does not hold
    InvalidTransition,      ///< State machine guard rejected a transition
    InvalidState,           ///< Component used outside its lifecycle
    ConfigError             ///< Configuration file missing or malformed
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic:              return "generic";
        case ErrorCode::CyclicDependency:     return "cyclic_dependency";
        case ErrorCode::UnknownTaskReference: return "unknown_task_reference";
        case ErrorCode::DuplicateTaskId:      return "duplicate_task_id";
        case ErrorCode::TaskNotFound:         return "task_not_found";
        case ErrorCode::InvalidTransition:    return "invalid_transition";
        case ErrorCode::InvalidState:         return "invalid_state";
        case ErrorCode::ConfigError:          return "config_error";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a descriptive message and a category.
 */
struct Error {
    std::string message;
    ErrorCode code = ErrorCode::Generic;

    explicit Error(std::string msg, ErrorCode c = ErrorCode::Generic)
        : message(std::move(msg)), code(c) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    bool operator==(const Error&) const = default;
};

/**
 * @brief Result<T, E>: a monadic error type.
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
Result<T, E> make_error(std::string message, ErrorCode code = ErrorCode::Generic) {
    return Result<T, E>(E{std::move(message), code});
}

}  // namespace workflow_orchestrator
