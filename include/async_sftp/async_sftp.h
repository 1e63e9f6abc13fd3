/**
 * @file async_sftp.h
 * @brief Main header for the async_sftp library
 * @version 0.1.0
 *
 * Include this header to access the asynchronous SFTP client.
 *
 * @code
 * #include <async_sftp/async_sftp.h>
 *
 * using namespace async_sftp;
 *
 * auto client = sftp_client::builder()
 *     .with_host("files.example.com")
 *     .with_credentials("alice", "secret")
 *     .build();
 * @endcode
 */

#ifndef ASYNC_SFTP_ASYNC_SFTP_H
#define ASYNC_SFTP_ASYNC_SFTP_H

#include <cstdint>
#include <string>

// Core types
#include "async_sftp/core/cancellation_token.h"
#include "async_sftp/core/error_codes.h"
#include "async_sftp/core/file_metadata.h"
#include "async_sftp/core/types.h"

// Session backends
#include "async_sftp/session/libssh2_session.h"
#include "async_sftp/session/memory_session.h"
#include "async_sftp/session/session_interface.h"

// Client
#include "async_sftp/client/client_types.h"
#include "async_sftp/client/sftp_client.h"

namespace async_sftp {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_ASYNC_SFTP_H
