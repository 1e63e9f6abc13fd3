/**
 * @file connection_manager.h
 * @brief Connection state machine over an exclusively owned session
 */

#ifndef ASYNC_SFTP_CLIENT_CONNECTION_MANAGER_H
#define ASYNC_SFTP_CLIENT_CONNECTION_MANAGER_H

#include <atomic>
#include <memory>

#include "async_sftp/client/client_types.h"
#include "async_sftp/session/session_interface.h"

namespace async_sftp {

/**
 * @brief Drives a session through connect and teardown
 *
 * State moves disconnected -> connecting -> connected only when every stage
 * of the connect sequence succeeds. A failing stage tears down what was
 * already built before the failure is returned.
 *
 * establish(), teardown() and session() must only be called from the
 * connection's worker. state() and is_connected() may be read from any
 * thread.
 */
class connection_manager {
public:
    connection_manager(connection_config config, std::unique_ptr<session_interface> session);
    ~connection_manager();

    connection_manager(const connection_manager&) = delete;
    auto operator=(const connection_manager&) -> connection_manager& = delete;

    /**
     * @brief Check host, port and credentials without touching the session
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Run the connect sequence
     *
     * Fails with already_connected when connected or connecting, otherwise
     * with the error kind of the first stage that fails.
     */
    [[nodiscard]] auto establish() -> result<void>;

    /**
     * @brief Release channel, session and socket and move to disconnected
     *
     * Safe in any state and idempotent.
     */
    void teardown() noexcept;

    /**
     * @brief Fail with not_connected unless the connection is connected
     */
    [[nodiscard]] auto require_connected() const -> result<void>;

    [[nodiscard]] auto state() const -> connection_state;
    [[nodiscard]] auto is_connected() const -> bool;
    [[nodiscard]] auto config() const -> const connection_config&;

    /**
     * @brief The owned session; only valid after require_connected() succeeds
     */
    [[nodiscard]] auto session() -> session_interface&;

private:
    void release_all() noexcept;

    connection_config config_;
    std::unique_ptr<session_interface> session_;
    std::atomic<connection_state> state_{connection_state::disconnected};
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CLIENT_CONNECTION_MANAGER_H
