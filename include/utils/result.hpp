/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that fail in expected ways.
 *
 * Design:
 * - Distinguishes between success (T) and expected failures (E + message)
 * - Forces explicit error handling at call sites; no implicit bool conversion
 * - [[nodiscard]] factories and accessors prevent silently dropped failures
 * - Result<void, E> covers operations that only succeed or fail
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace elworkbench::utils
{

/**
 * @class Result
 * @tparam T Success value type
 * @tparam E Error enum type
 *
 * Usage:
 * @code
 * Result<double, ErrorKind> read_level() {
 *     if (!ready) return Result<double, ErrorKind>::error(ErrorKind::DeviceNotReady, "offline");
 *     return Result<double, ErrorKind>::ok(1.5);
 * }
 *
 * auto r = read_level();
 * if (r.is_ok()) use(r.content());
 * else LOGGER_WARN("{}", r.message());
 * @endcode
 *
 * Not thread-safe; a Result is a value handed from callee to caller.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    [[nodiscard]] static Result error(E err, std::string message = {})
    {
        Result result;
        result.m_data = ErrorData{err, std::move(message)};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, {}}) {}

    // Movable but not copyable
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @brief Access the success value.
     * @throws std::logic_error if the Result holds an error.
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
            throw std::logic_error("Result::content() called on error state: " + message());
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
            throw std::logic_error("Result::content() called on error state: " + message());
        return std::get<T>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
            throw std::logic_error("Result::content() called on error state: " + message());
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /**
     * @throws std::logic_error if the Result holds a value.
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
            throw std::logic_error("Result::error() called on success state");
        return std::get<ErrorData>(m_data).error_enum;
    }

    /// Human-readable failure description; empty on success.
    [[nodiscard]] std::string message() const
    {
        return is_ok() ? std::string{} : std::get<ErrorData>(m_data).message;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        std::string message;
    };

    std::variant<T, ErrorData> m_data;
};

/// Success carries no value.
template <typename E>
class Result<void, E>
{
  public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(true, E{}, {}); }

    [[nodiscard]] static Result error(E err, std::string message = {})
    {
        return Result(false, err, std::move(message));
    }

    Result() : Result(false, E{}, {}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return m_ok; }
    [[nodiscard]] bool is_error() const noexcept { return !m_ok; }

    [[nodiscard]] E error() const
    {
        if (m_ok)
            throw std::logic_error("Result::error() called on success state");
        return m_error;
    }

    [[nodiscard]] std::string message() const { return m_ok ? std::string{} : m_message; }

  private:
    Result(bool ok, E err, std::string message)
        : m_ok(ok), m_error(err), m_message(std::move(message))
    {
    }

    bool m_ok;
    E m_error;
    std::string m_message;
};

} // namespace elworkbench::utils
