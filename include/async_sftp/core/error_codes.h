/**
 * @file error_codes.h
 * @brief Error codes for async_sftp (-800 to -899 range)
 * @version 0.1.0
 *
 * This file defines all error codes reported by the asynchronous SFTP client.
 * Error codes follow the range -800 to -899.
 */

#ifndef ASYNC_SFTP_CORE_ERROR_CODES_H
#define ASYNC_SFTP_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace async_sftp {

/**
 * @brief Error domain shared by every error produced by this library
 */
inline constexpr std::string_view error_domain = "async_sftp";

/**
 * @brief Error codes for SFTP client operations (-800 to -899)
 *
 * Error code ranges:
 * - -800 to -809: Argument and State Errors
 * - -810 to -819: Connection Errors
 * - -820 to -829: Directory Errors
 * - -830 to -849: File Errors
 * - -850 to -859: Transfer Control
 * - -899: Unknown
 */
enum class sftp_error_code : int32_t {
    success = 0,

    // Argument and State Errors (-800 to -809)
    invalid_arguments = -800,
    already_connected = -801,
    not_connected = -802,
    operation_in_progress = -803,

    // Connection Errors (-810 to -819)
    unable_to_connect = -810,
    unable_to_initialize_session = -811,
    handshake_failed = -812,
    authentication_failed = -813,
    unable_to_initialize_sftp = -814,
    unable_to_create_channel = -815,

    // Directory Errors (-820 to -829)
    unable_to_open_directory = -820,
    unable_to_read_directory = -821,
    unable_to_close_directory = -822,
    unable_to_make_directory = -823,
    unable_to_remove_directory = -824,

    // File Errors (-830 to -849)
    unable_to_open_file = -830,
    unable_to_close_file = -831,
    unable_to_read_file = -832,
    unable_to_write_file = -833,
    unable_to_stat_file = -834,
    unable_to_rename = -835,
    unable_to_remove_file = -836,
    unable_to_open_local_file_for_reading = -840,
    unable_to_open_local_file_for_writing = -841,

    // Transfer Control (-850 to -859)
    cancelled_by_user = -850,

    unknown = -899,
};

/**
 * @brief Convert sftp_error_code to string
 */
[[nodiscard]] constexpr auto to_string(sftp_error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case sftp_error_code::success:
            return "success";

        // Argument and State Errors
        case sftp_error_code::invalid_arguments:
            return "invalid arguments";
        case sftp_error_code::already_connected:
            return "already connected";
        case sftp_error_code::not_connected:
            return "not connected";
        case sftp_error_code::operation_in_progress:
            return "another operation is in progress";

        // Connection Errors
        case sftp_error_code::unable_to_connect:
            return "unable to connect to host";
        case sftp_error_code::unable_to_initialize_session:
            return "unable to initialize SSH session";
        case sftp_error_code::handshake_failed:
            return "SSH handshake failed";
        case sftp_error_code::authentication_failed:
            return "authentication failed";
        case sftp_error_code::unable_to_initialize_sftp:
            return "unable to initialize SFTP subsystem";
        case sftp_error_code::unable_to_create_channel:
            return "unable to create channel";

        // Directory Errors
        case sftp_error_code::unable_to_open_directory:
            return "unable to open directory";
        case sftp_error_code::unable_to_read_directory:
            return "unable to read directory";
        case sftp_error_code::unable_to_close_directory:
            return "unable to close directory";
        case sftp_error_code::unable_to_make_directory:
            return "unable to make directory";
        case sftp_error_code::unable_to_remove_directory:
            return "unable to remove directory";

        // File Errors
        case sftp_error_code::unable_to_open_file:
            return "unable to open remote file";
        case sftp_error_code::unable_to_close_file:
            return "unable to close remote file";
        case sftp_error_code::unable_to_read_file:
            return "unable to read file";
        case sftp_error_code::unable_to_write_file:
            return "unable to write file";
        case sftp_error_code::unable_to_stat_file:
            return "unable to stat file";
        case sftp_error_code::unable_to_rename:
            return "unable to rename";
        case sftp_error_code::unable_to_remove_file:
            return "unable to remove file";
        case sftp_error_code::unable_to_open_local_file_for_reading:
            return "unable to open local file for reading";
        case sftp_error_code::unable_to_open_local_file_for_writing:
            return "unable to open local file for writing";

        // Transfer Control
        case sftp_error_code::cancelled_by_user:
            return "cancelled by user";

        case sftp_error_code::unknown:
            return "unknown error";
    }
    return "unknown error";
}

/**
 * @brief Get the numeric value of an error code
 */
[[nodiscard]] constexpr auto to_int(sftp_error_code code) noexcept -> int32_t {
    return static_cast<int32_t>(code);
}

/**
 * @brief Check if error code is an argument or state violation
 *
 * These are reported before any protocol I/O is attempted.
 */
[[nodiscard]] constexpr auto is_state_error(sftp_error_code code) noexcept -> bool {
    auto value = to_int(code);
    return value <= -800 && value >= -809;
}

/**
 * @brief Check if error code belongs to the connect sequence
 */
[[nodiscard]] constexpr auto is_connection_error(sftp_error_code code) noexcept -> bool {
    auto value = to_int(code);
    return value <= -810 && value >= -819;
}

/**
 * @brief Check if error code is a directory error
 */
[[nodiscard]] constexpr auto is_directory_error(sftp_error_code code) noexcept -> bool {
    auto value = to_int(code);
    return value <= -820 && value >= -829;
}

/**
 * @brief Check if error code is a remote or local file error
 */
[[nodiscard]] constexpr auto is_file_error(sftp_error_code code) noexcept -> bool {
    auto value = to_int(code);
    return value <= -830 && value >= -849;
}

/**
 * @brief Check if error code signals a user initiated cancellation
 */
[[nodiscard]] constexpr auto is_cancellation(sftp_error_code code) noexcept -> bool {
    return code == sftp_error_code::cancelled_by_user;
}

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CORE_ERROR_CODES_H
