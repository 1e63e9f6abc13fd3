/**
 * @file transfer_engine.h
 * @brief Chunked upload and download over a session
 */

#ifndef ASYNC_SFTP_CLIENT_TRANSFER_ENGINE_H
#define ASYNC_SFTP_CLIENT_TRANSFER_ENGINE_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "async_sftp/adapters/executor_adapter.h"
#include "async_sftp/client/client_types.h"
#include "async_sftp/core/cancellation_token.h"
#include "async_sftp/session/session_interface.h"

namespace async_sftp {

/**
 * @brief Streams files between the local file system and a session
 *
 * Runs on the connection's worker. The total size is fixed from a stat call
 * before the first chunk and bytes transferred never exceeds it. The token
 * is checked before every chunk and once after the last one; a cancelled
 * transfer fails with cancelled_by_user. Both file handles are released on
 * every exit path.
 */
class transfer_engine {
public:
    /**
     * @param chunk_size Bytes per read/write call
     * @param progress_interval Minimum time between two progress deliveries
     * @param delivery Executor that runs progress callbacks
     */
    transfer_engine(std::size_t chunk_size,
                    std::chrono::milliseconds progress_interval,
                    std::shared_ptr<adapters::serial_executor_interface> delivery);

    /**
     * @brief Copy a remote file to a local path
     *
     * The local file is created or truncated. A cancelled download removes
     * the partial local file.
     */
    [[nodiscard]] auto download(session_interface& session,
                                const std::string& remote_path,
                                const std::filesystem::path& local_path,
                                const progress_callback& progress,
                                const cancellation_token& token) -> result<transfer_result>;

    /**
     * @brief Copy a local file to a remote path
     *
     * The remote file is created with mode 0644 or truncated.
     */
    [[nodiscard]] auto upload(session_interface& session,
                              const std::string& remote_path,
                              const std::filesystem::path& local_path,
                              const progress_callback& progress,
                              const cancellation_token& token) -> result<transfer_result>;

    [[nodiscard]] auto chunk_size() const -> std::size_t;

private:
    std::size_t chunk_size_;
    std::chrono::milliseconds progress_interval_;
    std::shared_ptr<adapters::serial_executor_interface> delivery_;
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CLIENT_TRANSFER_ENGINE_H
