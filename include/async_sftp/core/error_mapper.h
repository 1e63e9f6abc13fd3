/**
 * @file error_mapper.h
 * @brief Translation of low-level failures into the sftp_error_code taxonomy
 */

#ifndef ASYNC_SFTP_CORE_ERROR_MAPPER_H
#define ASYNC_SFTP_CORE_ERROR_MAPPER_H

#include <exception>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "async_sftp/core/types.h"

namespace async_sftp {

/**
 * @brief Maps session, SFTP and OS failures to structured errors
 *
 * The operation decides the error kind; the mapper attaches the original
 * failure as native context and builds a readable message from it.
 *
 * @code
 * auto attrs = error_mapper::lift(session.stat(path), sftp_error_code::unable_to_stat_file);
 * if (!attrs) {
 *     return unexpected{attrs.error()};
 * }
 * @endcode
 */
class error_mapper {
public:
    /**
     * @brief Symbolic name of an SSH session library error code
     * @return Name such as "LIBSSH2_ERROR_TIMEOUT", or empty if unknown
     */
    [[nodiscard]] static auto session_error_name(int64_t code) -> std::string_view;

    /**
     * @brief Symbolic name of an SFTP status code
     * @return Name such as "SSH_FX_NO_SUCH_FILE", or empty if unknown
     */
    [[nodiscard]] static auto sftp_status_name(int64_t code) -> std::string_view;

    /**
     * @brief Human readable description of a native failure
     */
    [[nodiscard]] static auto describe(const native_error& native) -> std::string;

    /**
     * @brief Wrap a native failure into an error of the given kind
     */
    [[nodiscard]] static auto map(sftp_error_code kind, native_error native) -> error;

    /**
     * @brief Wrap an OS error code into an error of the given kind
     */
    [[nodiscard]] static auto map(sftp_error_code kind, const std::error_code& ec) -> error;

    /**
     * @brief Error of the given kind with an extra detail and no native cause
     */
    [[nodiscard]] static auto make(sftp_error_code kind, std::string_view detail) -> error;

    /**
     * @brief Convert an exception escaping a work item into an unknown error
     */
    [[nodiscard]] static auto from_exception(const std::exception& ex) -> error;

    /**
     * @brief Native error describing the current value of errno
     */
    [[nodiscard]] static auto last_system_error() -> native_error;

    /**
     * @brief Lift a session primitive result into a client result
     */
    template <typename T>
    [[nodiscard]] static auto lift(native_result<T>&& outcome, sftp_error_code kind)
        -> result<T> {
        if (!outcome.has_value()) {
            return unexpected{map(kind, outcome.error())};
        }
        if constexpr (std::is_void_v<T>) {
            return {};
        } else {
            return std::move(outcome).value();
        }
    }
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CORE_ERROR_MAPPER_H
