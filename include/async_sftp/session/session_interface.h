/**
 * @file session_interface.h
 * @brief Abstract blocking SFTP session primitives
 *
 * The session is driven from one thread at a time only. Callers above this
 * layer (connection_manager and the operation helpers) guarantee that.
 */

#ifndef ASYNC_SFTP_SESSION_SESSION_INTERFACE_H
#define ASYNC_SFTP_SESSION_SESSION_INTERFACE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "async_sftp/core/file_metadata.h"
#include "async_sftp/core/types.h"

namespace async_sftp {

/**
 * @brief Flags used when opening a remote file
 */
enum class open_mode : uint32_t {
    read = 1 << 0,
    write = 1 << 1,
    create = 1 << 2,
    truncate = 1 << 3,
};

[[nodiscard]] constexpr auto operator|(open_mode a, open_mode b) -> open_mode {
    return static_cast<open_mode>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

[[nodiscard]] constexpr auto has_flag(open_mode flags, open_mode flag) -> bool {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

/// Permission bits for directories created by make_directory
inline constexpr uint32_t default_directory_mode = 0755;
/// Permission bits for files created by upload
inline constexpr uint32_t default_file_mode = 0644;

/**
 * @brief Open remote file handle
 *
 * Closing is idempotent; the destructor closes a handle that is still open
 * and discards any error.
 */
class remote_file {
public:
    virtual ~remote_file() = default;

    remote_file(const remote_file&) = delete;
    auto operator=(const remote_file&) -> remote_file& = delete;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Number of bytes read, 0 at end of file
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> native_result<std::size_t> = 0;

    /**
     * @brief Write bytes at the current position
     * @return Number of bytes accepted, which may be less than data.size()
     */
    [[nodiscard]] virtual auto write(std::span<const std::byte> data)
        -> native_result<std::size_t> = 0;

    /**
     * @brief Attributes of the open file
     */
    [[nodiscard]] virtual auto fstat() -> native_result<remote_attributes> = 0;

    [[nodiscard]] virtual auto close() -> native_result<void> = 0;

protected:
    remote_file() = default;
};

/**
 * @brief Open remote directory handle
 */
class remote_directory {
public:
    virtual ~remote_directory() = default;

    remote_directory(const remote_directory&) = delete;
    auto operator=(const remote_directory&) -> remote_directory& = delete;

    /**
     * @brief Next entry in server order
     * @return Entry, or std::nullopt after the last entry
     */
    [[nodiscard]] virtual auto read_entry() -> native_result<std::optional<directory_entry>> = 0;

    [[nodiscard]] virtual auto close() -> native_result<void> = 0;

protected:
    remote_directory() = default;
};

/**
 * @brief Blocking session primitives supplied by an SSH/SFTP library
 *
 * The connect sequence is open_socket, init_session, handshake,
 * authenticate, init_sftp. Release calls are idempotent and never fail.
 */
class session_interface {
public:
    virtual ~session_interface() = default;

    session_interface(const session_interface&) = delete;
    auto operator=(const session_interface&) -> session_interface& = delete;

    // Connect sequence
    [[nodiscard]] virtual auto open_socket(const std::string& host,
                                           uint16_t port,
                                           std::chrono::milliseconds timeout)
        -> native_result<void> = 0;
    [[nodiscard]] virtual auto init_session() -> native_result<void> = 0;
    [[nodiscard]] virtual auto handshake() -> native_result<void> = 0;
    [[nodiscard]] virtual auto authenticate(const std::string& username,
                                            const std::string& password)
        -> native_result<void> = 0;
    [[nodiscard]] virtual auto init_sftp() -> native_result<void> = 0;

    // Teardown, in reverse order of acquisition
    virtual void release_sftp() noexcept = 0;
    virtual void release_session() noexcept = 0;
    virtual void release_socket() noexcept = 0;

    // Metadata
    [[nodiscard]] virtual auto stat(const std::string& path)
        -> native_result<remote_attributes> = 0;
    [[nodiscard]] virtual auto mkdir(const std::string& path, uint32_t mode)
        -> native_result<void> = 0;
    /// Fails if @p to already exists
    [[nodiscard]] virtual auto rename(const std::string& from, const std::string& to)
        -> native_result<void> = 0;
    [[nodiscard]] virtual auto unlink(const std::string& path) -> native_result<void> = 0;
    [[nodiscard]] virtual auto rmdir(const std::string& path) -> native_result<void> = 0;

    // Handles
    [[nodiscard]] virtual auto open_directory(const std::string& path)
        -> native_result<std::unique_ptr<remote_directory>> = 0;
    [[nodiscard]] virtual auto open_file(const std::string& path, open_mode flags, uint32_t mode)
        -> native_result<std::unique_ptr<remote_file>> = 0;

protected:
    session_interface() = default;
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_SESSION_SESSION_INTERFACE_H
