/**
 * @file sftp_client.h
 * @brief Asynchronous SFTP client
 */

#ifndef ASYNC_SFTP_CLIENT_SFTP_CLIENT_H
#define ASYNC_SFTP_CLIENT_SFTP_CLIENT_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "async_sftp/client/client_types.h"
#include "async_sftp/core/cancellation_token.h"
#include "async_sftp/core/file_metadata.h"
#include "async_sftp/core/types.h"
#include "async_sftp/session/session_interface.h"

namespace async_sftp {

/**
 * @brief Asynchronous SFTP client over one blocking session
 *
 * Every asynchronous operation returns a future and optionally takes a
 * completion callback. Only one operation runs at a time; an operation
 * issued while another one is active resolves with operation_in_progress.
 * Protocol calls run on a dedicated worker thread, and callbacks run on a
 * separate delivery thread, the completion callback before the future
 * becomes ready.
 *
 * The client must not be destroyed from inside one of its own callbacks.
 *
 * @code
 * auto client = sftp_client::builder()
 *     .with_host("files.example.com")
 *     .with_credentials("alice", "secret")
 *     .build();
 * if (client && client.value().connect().get()) {
 *     auto files = client.value().list_files("/srv/data").get();
 * }
 * @endcode
 */
class sftp_client {
public:
    using session_factory = std::function<std::unique_ptr<session_interface>()>;

    /**
     * @brief Builder for sftp_client
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the server host name or address
         */
        auto with_host(std::string host) -> builder&;

        /**
         * @brief Set the server port
         * @param port SSH port (default: 22)
         */
        auto with_port(uint16_t port) -> builder&;

        /**
         * @brief Set password credentials
         */
        auto with_credentials(std::string username, std::string password) -> builder&;

        /**
         * @brief Set connection timeout
         * @param timeout Timeout for connecting and for every blocking call (default: 60s)
         */
        auto with_connect_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Set chunk size for transfers
         * @param size Chunk size in bytes (default: 32KB, 1KB to 4MB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Set minimum interval between progress callbacks
         * @param interval Interval (default: 50ms)
         */
        auto with_progress_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Use the given session backend
         */
        auto with_session(std::unique_ptr<session_interface> session) -> builder&;

        /**
         * @brief Create the session backend from a factory when building
         */
        auto with_session_factory(session_factory factory) -> builder&;

        /**
         * @brief Build the client instance
         * @return Result containing the client or an error
         */
        [[nodiscard]] auto build() -> result<sftp_client>;

    private:
        connection_config config_;
        std::unique_ptr<session_interface> session_;
        session_factory factory_;
    };

    ~sftp_client();

    sftp_client(const sftp_client&) = delete;
    auto operator=(const sftp_client&) -> sftp_client& = delete;
    sftp_client(sftp_client&&) noexcept;
    auto operator=(sftp_client&&) noexcept -> sftp_client&;

    /**
     * @brief Connect and authenticate
     *
     * Fails with invalid_arguments for an empty host, username or password,
     * and with already_connected when a connection exists.
     */
    [[nodiscard]] auto connect(completion_callback<void> on_complete = nullptr)
        -> std::future<result<void>>;

    /**
     * @brief Close the connection
     *
     * Cancels a running transfer and waits until it has stopped. Idempotent,
     * safe in any state, and never fails.
     */
    void disconnect();

    [[nodiscard]] auto is_connected() const -> bool;
    [[nodiscard]] auto state() const -> connection_state;

    /**
     * @brief List a directory in server order, without "." and ".."
     */
    [[nodiscard]] auto list_files(
        const std::string& path,
        completion_callback<std::vector<file_metadata>> on_complete = nullptr)
        -> std::future<result<std::vector<file_metadata>>>;

    [[nodiscard]] auto make_directory(const std::string& path,
                                      completion_callback<file_metadata> on_complete = nullptr)
        -> std::future<result<file_metadata>>;

    /**
     * @brief Rename a remote item; never overwrites an existing target
     */
    [[nodiscard]] auto rename(const std::string& old_path,
                              const std::string& new_path,
                              completion_callback<file_metadata> on_complete = nullptr)
        -> std::future<result<file_metadata>>;

    [[nodiscard]] auto remove_file(const std::string& path,
                                   completion_callback<void> on_complete = nullptr)
        -> std::future<result<void>>;

    [[nodiscard]] auto remove_directory(const std::string& path,
                                        completion_callback<void> on_complete = nullptr)
        -> std::future<result<void>>;

    [[nodiscard]] auto stat(const std::string& path,
                            completion_callback<file_metadata> on_complete = nullptr)
        -> std::future<result<file_metadata>>;

    /**
     * @brief Download a remote file
     * @param remote_path Remote source
     * @param local_path Local destination, created or truncated
     * @param progress Optional progress callback; returning false cancels
     * @param on_complete Optional completion callback
     * @param token Token that cancels this transfer when set
     */
    [[nodiscard]] auto download(const std::string& remote_path,
                                const std::filesystem::path& local_path,
                                progress_callback progress = nullptr,
                                completion_callback<transfer_result> on_complete = nullptr,
                                cancellation_token token = {})
        -> std::future<result<transfer_result>>;

    /**
     * @brief Upload a local file
     * @param remote_path Remote destination, created with mode 0644 or truncated
     * @param local_path Local source
     * @param progress Optional progress callback; returning false cancels
     * @param on_complete Optional completion callback
     * @param token Token that cancels this transfer when set
     */
    [[nodiscard]] auto upload(const std::string& remote_path,
                              const std::filesystem::path& local_path,
                              progress_callback progress = nullptr,
                              completion_callback<transfer_result> on_complete = nullptr,
                              cancellation_token token = {})
        -> std::future<result<transfer_result>>;

    /**
     * @brief Cancel the running transfer; no-op when none is running
     */
    void cancel_transfer();

    [[nodiscard]] auto config() const -> const connection_config&;

private:
    sftp_client(connection_config config, std::unique_ptr<session_interface> session);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CLIENT_SFTP_CLIENT_H
