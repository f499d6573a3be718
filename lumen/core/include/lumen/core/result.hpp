/**
 * @file result.hpp
 * @brief Result<T, E> for explicit error propagation
 *
 * Decode, upload and device operations in the frame loop report failure
 * through Result instead of throwing, so a missing frame degrades to an
 * empty layer without unwinding the tick.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "types.hpp"

namespace lumen {

// ============================================================================
// Error Type
// ============================================================================

/// Error code plus optional human-readable context
class Error {
public:
    Error() : m_code(ErrorCode::Unknown) {}

    explicit Error(ErrorCode code) : m_code(code) {}

    Error(ErrorCode code, std::string message)
        : m_code(code), m_message(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const { return m_code; }
    [[nodiscard]] const std::string& message() const { return m_message; }

    [[nodiscard]] const char* what() const {
        if (!m_message.empty()) {
            return m_message.c_str();
        }
        return errorCodeToString(m_code);
    }

    explicit operator bool() const { return m_code != ErrorCode::Ok; }

private:
    ErrorCode m_code;
    std::string m_message;
};

// ============================================================================
// Result<T, E> Template
// ============================================================================

/**
 * @brief Holds either a success value (T) or an error (E)
 *
 * Similar to C++23's std::expected. Accessing value() on an error throws,
 * which is a programming error, not a runtime condition to recover from.
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_data(std::move(value)) {}
    Result(E error) : m_data(std::move(error)) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    // ========== State Queries ==========

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool isError() const { return std::holds_alternative<E>(m_data); }

    explicit operator bool() const { return ok(); }

    // ========== Value Access ==========

    T& value() & {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(m_data);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(m_data);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(std::move(m_data));
    }

    /// Value or fallback (no throw)
    T valueOr(T fallback) const& {
        return ok() ? std::get<T>(m_data) : std::move(fallback);
    }

    T valueOr(T fallback) && {
        return ok() ? std::get<T>(std::move(m_data)) : std::move(fallback);
    }

    // ========== Error Access ==========

    const E& error() const& {
        if (ok()) {
            throw std::logic_error("Result::error() called on success value");
        }
        return std::get<E>(m_data);
    }

    // ========== Monadic Operations ==========

    template<typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (ok()) {
            return Result<U, E>(std::forward<F>(f)(std::get<T>(m_data)));
        }
        return Result<U, E>(std::get<E>(m_data));
    }

    /// Chain another Result-returning step
    template<typename F>
    auto andThen(F&& f) const -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (ok()) {
            return std::forward<F>(f)(std::get<T>(m_data));
        }
        return R(std::get<E>(m_data));
    }

private:
    std::variant<T, E> m_data;
};

// ============================================================================
// Result<void, E> Specialization
// ============================================================================

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool ok() const { return !m_error.has_value(); }
    [[nodiscard]] bool isError() const { return m_error.has_value(); }

    explicit operator bool() const { return ok(); }

    const E& error() const& {
        if (!m_error.has_value()) {
            throw std::logic_error("Result::error() called on success");
        }
        return *m_error;
    }

private:
    std::optional<E> m_error;
};

// ============================================================================
// Helper Factory Functions
// ============================================================================

template<typename T>
inline Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
inline Result<T> Err(ErrorCode code) {
    return Result<T>(Error(code));
}

template<typename T = void>
inline Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error(code, std::move(message)));
}

template<typename T = void>
inline Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

} // namespace lumen
