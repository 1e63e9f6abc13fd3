/**
 * @file client_types.h
 * @brief Client-related type definitions for async_sftp
 */

#ifndef ASYNC_SFTP_CLIENT_CLIENT_TYPES_H
#define ASYNC_SFTP_CLIENT_CLIENT_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "async_sftp/core/file_metadata.h"
#include "async_sftp/core/types.h"

namespace async_sftp {

/**
 * @brief Connection state enumeration
 */
enum class connection_state {
    disconnected,
    connecting,
    connected,
    disconnecting
};

/**
 * @brief Convert connection_state to string
 */
[[nodiscard]] constexpr auto to_string(connection_state state) -> const char* {
    switch (state) {
        case connection_state::disconnected: return "disconnected";
        case connection_state::connecting: return "connecting";
        case connection_state::connected: return "connected";
        case connection_state::disconnecting: return "disconnecting";
        default: return "unknown";
    }
}

/**
 * @brief Direction of a file transfer
 */
enum class transfer_direction {
    upload,
    download
};

[[nodiscard]] constexpr auto to_string(transfer_direction direction) noexcept -> const char* {
    switch (direction) {
        case transfer_direction::upload: return "upload";
        case transfer_direction::download: return "download";
        default: return "unknown";
    }
}

/// Default SSH port
inline constexpr uint16_t default_sftp_port = 22;
/// Default timeout for the connect sequence and every blocking call
inline constexpr std::chrono::milliseconds default_connect_timeout{60000};
/// Default transfer chunk size (32KB)
inline constexpr std::size_t default_chunk_size = 32 * 1024;
/// Smallest accepted chunk size (1KB)
inline constexpr std::size_t min_chunk_size = 1024;
/// Largest accepted chunk size (4MB)
inline constexpr std::size_t max_chunk_size = 4 * 1024 * 1024;
/// Default minimum interval between two progress deliveries
inline constexpr std::chrono::milliseconds default_progress_interval{50};

/**
 * @brief Connection configuration
 */
struct connection_config {
    std::string host;
    uint16_t port = default_sftp_port;
    std::string username;
    std::string password;
    std::chrono::milliseconds connect_timeout = default_connect_timeout;
    std::size_t chunk_size = default_chunk_size;
    std::chrono::milliseconds progress_interval = default_progress_interval;
};

/**
 * @brief Result of a completed transfer
 */
struct transfer_result {
    file_metadata file;                                   ///< Remote file after the transfer
    std::chrono::system_clock::time_point started_at;     ///< Transfer start
    std::chrono::system_clock::time_point finished_at;    ///< Transfer finish
    uint64_t bytes_transferred = 0;                       ///< Total bytes moved

    [[nodiscard]] auto duration() const -> std::chrono::milliseconds {
        return std::chrono::duration_cast<std::chrono::milliseconds>(finished_at - started_at);
    }
};

/**
 * @brief Transfer progress callback
 *
 * Receives the bytes transferred so far and the total size. Returning false
 * cancels the transfer at the next chunk boundary.
 */
using progress_callback = std::function<bool(uint64_t bytes_done, uint64_t bytes_total)>;

/**
 * @brief Completion callback, invoked on the delivery context
 */
template <typename T>
using completion_callback = std::function<void(const result<T>&)>;

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CLIENT_CLIENT_TYPES_H
