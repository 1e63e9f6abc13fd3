/**
 * @file libssh2_session.h
 * @brief session_interface implementation on top of blocking libssh2
 */

#ifndef ASYNC_SFTP_SESSION_LIBSSH2_SESSION_H
#define ASYNC_SFTP_SESSION_LIBSSH2_SESSION_H

#include "async_sftp/config/feature_flags.h"

#if ASYNC_SFTP_HAS_LIBSSH2

#include <memory>

#include "async_sftp/session/session_interface.h"

namespace async_sftp {

/**
 * @brief SSH session, SFTP channel and TCP socket managed through libssh2
 *
 * The session runs in blocking mode with the connect timeout applied to
 * every libssh2 call. Password authentication falls back to
 * keyboard-interactive, answering every prompt with the password.
 *
 * Not thread-safe: the owner must drive it from one thread at a time.
 */
class libssh2_session : public session_interface {
public:
    libssh2_session();
    ~libssh2_session() override;

    [[nodiscard]] auto open_socket(const std::string& host,
                                   uint16_t port,
                                   std::chrono::milliseconds timeout)
        -> native_result<void> override;
    [[nodiscard]] auto init_session() -> native_result<void> override;
    [[nodiscard]] auto handshake() -> native_result<void> override;
    [[nodiscard]] auto authenticate(const std::string& username,
                                    const std::string& password)
        -> native_result<void> override;
    [[nodiscard]] auto init_sftp() -> native_result<void> override;

    void release_sftp() noexcept override;
    void release_session() noexcept override;
    void release_socket() noexcept override;

    [[nodiscard]] auto stat(const std::string& path) -> native_result<remote_attributes> override;
    [[nodiscard]] auto mkdir(const std::string& path, uint32_t mode)
        -> native_result<void> override;
    [[nodiscard]] auto rename(const std::string& from, const std::string& to)
        -> native_result<void> override;
    [[nodiscard]] auto unlink(const std::string& path) -> native_result<void> override;
    [[nodiscard]] auto rmdir(const std::string& path) -> native_result<void> override;

    [[nodiscard]] auto open_directory(const std::string& path)
        -> native_result<std::unique_ptr<remote_directory>> override;
    [[nodiscard]] auto open_file(const std::string& path, open_mode flags, uint32_t mode)
        -> native_result<std::unique_ptr<remote_file>> override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_HAS_LIBSSH2

#endif  // ASYNC_SFTP_SESSION_LIBSSH2_SESSION_H
