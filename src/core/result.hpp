/**
 * @file result.hpp
 * @brief Monadic error handling type for Conductor.
 *
 * Every structural failure of the engine (duplicate id, unknown id,
 * illegal state edge, ...) is returned as a Result carrying a coded Error
 * rather than thrown. Operations that fail leave engine state untouched.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace conductor {

/**
 * @brief Error taxonomy of the orchestration engine.
 */
enum class ErrorCode : uint8_t {
    DuplicateTask,       ///< AddTask on an id that exists or was retired
    UnknownTask,         ///< Operation on an untracked id
    InvalidTransition,   ///< Illegal lifecycle edge
    NoViableWorker,      ///< No capability overlap with any candidate
    InvalidTask,         ///< Missing or malformed required fields
    CircularDependency,  ///< Cycle found where an acyclic graph is required
    InvalidConfig,       ///< Configuration or workload content rejected
    Io                   ///< File missing or unreadable
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::DuplicateTask:      return "duplicate_task";
        case ErrorCode::UnknownTask:        return "unknown_task";
        case ErrorCode::InvalidTransition:  return "invalid_transition";
        case ErrorCode::NoViableWorker:     return "no_viable_worker";
        case ErrorCode::InvalidTask:        return "invalid_task";
        case ErrorCode::CircularDependency: return "circular_dependency";
        case ErrorCode::InvalidConfig:      return "invalid_config";
        case ErrorCode::Io:                 return "io";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }
};

/**
 * @brief Result<T, E>: either a success value of type T or an error E.
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
        if (!has_value()) throw std::logic_error("Result holds an error: " + describe());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::logic_error("Result holds an error: " + describe());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::logic_error("Result holds an error: " + describe());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result holds a value");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

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
    [[nodiscard]] std::string describe() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return "error";
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations with no success payload.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result holds no error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

using Status = Result<void>;

/// Convenience factory for error results.
template <typename T = void>
Result<T> make_error(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

}  // namespace conductor
