/**
 * @file types.h
 * @brief Core type definitions for async_sftp
 */

#ifndef ASYNC_SFTP_CORE_TYPES_H
#define ASYNC_SFTP_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "async_sftp/core/error_codes.h"

namespace async_sftp {

/**
 * @brief Layer that produced a low-level failure
 */
enum class native_origin {
    none,
    session,  ///< SSH session library (transport, handshake, auth)
    sftp,     ///< SFTP status code returned by the server
    system,   ///< Operating system (socket, local file system)
};

[[nodiscard]] constexpr auto to_string(native_origin origin) noexcept -> std::string_view {
    switch (origin) {
        case native_origin::none: return "none";
        case native_origin::session: return "session";
        case native_origin::sftp: return "sftp";
        case native_origin::system: return "system";
    }
    return "none";
}

/**
 * @brief Low-level failure as reported by the session library or the OS
 */
struct native_error {
    native_origin origin;
    int64_t code;
    std::string message;

    native_error() : origin(native_origin::none), code(0) {}
    native_error(native_origin o, int64_t c, std::string msg = {})
        : origin(o), code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return origin != native_origin::none;
    }
};

/**
 * @brief Error type with code, message and optional underlying cause
 */
struct error {
    sftp_error_code code;
    std::string message;
    std::optional<native_error> native;

    error() : code(sftp_error_code::success) {}
    explicit error(sftp_error_code c) : code(c), message(to_string(c)) {}
    error(sftp_error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(sftp_error_code c, std::string msg, native_error cause)
        : code(c), message(std::move(msg)), native(std::move(cause)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != sftp_error_code::success;
    }

    [[nodiscard]] static constexpr auto domain() noexcept -> std::string_view {
        return error_domain;
    }
};

/**
 * @brief Wrapper for unexpected error (used with basic_result<T, E>)
 */
template <typename E>
struct basic_unexpected {
    E err;

    explicit basic_unexpected(E e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error of type E.
 */
template <typename T, typename E>
class basic_result {
public:
    basic_result() : value_(std::nullopt), error_{} {}

    basic_result(T value) : value_(std::move(value)), error_{} {}

    basic_result(basic_unexpected<E> u) : value_(std::nullopt), error_(std::move(u.err)) {}

    basic_result(const basic_result&) = default;
    basic_result(basic_result&&) noexcept = default;
    auto operator=(const basic_result&) -> basic_result& = default;
    auto operator=(basic_result&&) noexcept -> basic_result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const E& { return error_; }

private:
    std::optional<T> value_;
    E error_;
};

/**
 * @brief Specialization of basic_result for void return type
 */
template <typename E>
class basic_result<void, E> {
public:
    basic_result() : has_value_(true) {}

    basic_result(basic_unexpected<E> u) : has_value_(false), error_(std::move(u.err)) {}

    basic_result(const basic_result&) = default;
    basic_result(basic_result&&) noexcept = default;
    auto operator=(const basic_result&) -> basic_result& = default;
    auto operator=(basic_result&&) noexcept -> basic_result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const E& { return error_; }

private:
    bool has_value_;
    E error_;
};

/// Result of a public client operation
template <typename T>
using result = basic_result<T, error>;
using unexpected = basic_unexpected<error>;

/// Result of a session primitive, before mapping to an sftp_error_code
template <typename T>
using native_result = basic_result<T, native_error>;
using native_unexpected = basic_unexpected<native_error>;

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CORE_TYPES_H
