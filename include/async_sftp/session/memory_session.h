/**
 * @file memory_session.h
 * @brief In-process session_interface backed by an in-memory file tree
 *
 * Used by the unit tests, the benchmarks and the offline example. Besides
 * implementing the primitives it can inject failures at any stage or call,
 * run a hook at the start of every call, and report how many calls ran at
 * the same time and how many handles are still open.
 */

#ifndef ASYNC_SFTP_SESSION_MEMORY_SESSION_H
#define ASYNC_SFTP_SESSION_MEMORY_SESSION_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "async_sftp/session/session_interface.h"

namespace async_sftp {

/**
 * @brief SFTP status codes produced by memory_filesystem
 */
namespace sftp_status {
inline constexpr int64_t ok = 0;
inline constexpr int64_t no_such_file = 2;
inline constexpr int64_t permission_denied = 3;
inline constexpr int64_t failure = 4;
inline constexpr int64_t file_already_exists = 11;
inline constexpr int64_t dir_not_empty = 18;
inline constexpr int64_t not_a_directory = 19;
}  // namespace sftp_status

/**
 * @brief Thread-safe in-memory file tree
 *
 * Paths are absolute and '/' separated. Directory entries are listed in
 * creation order, preceded by "." and "..".
 */
class memory_filesystem {
public:
    memory_filesystem();

    /**
     * @brief Create a directory and any missing parents
     */
    auto add_directory(const std::string& path, uint32_t mode = default_directory_mode) -> bool;

    /**
     * @brief Create or replace a file, creating missing parent directories
     */
    auto add_file(const std::string& path, std::vector<std::byte> content,
                  uint32_t mode = default_file_mode) -> bool;
    auto add_file(const std::string& path, std::string_view content,
                  uint32_t mode = default_file_mode) -> bool;

    [[nodiscard]] auto read_file(const std::string& path) const
        -> std::optional<std::vector<std::byte>>;
    [[nodiscard]] auto exists(const std::string& path) const -> bool;
    [[nodiscard]] auto is_directory(const std::string& path) const -> bool;

    // Primitive operations; status values come from sftp_status
    [[nodiscard]] auto stat(const std::string& path) const -> std::optional<remote_attributes>;
    [[nodiscard]] auto make_directory(const std::string& path, uint32_t mode) -> int64_t;
    [[nodiscard]] auto rename(const std::string& from, const std::string& to) -> int64_t;
    [[nodiscard]] auto remove_file(const std::string& path) -> int64_t;
    [[nodiscard]] auto remove_directory(const std::string& path) -> int64_t;
    [[nodiscard]] auto list(const std::string& path, std::vector<directory_entry>& entries) const
        -> int64_t;
    [[nodiscard]] auto open(const std::string& path, open_mode flags, uint32_t mode) -> int64_t;
    [[nodiscard]] auto read_at(const std::string& path, uint64_t offset, std::span<std::byte> buffer,
                               std::size_t& count) const -> int64_t;
    [[nodiscard]] auto write_at(const std::string& path, uint64_t offset,
                                std::span<const std::byte> data) -> int64_t;

    [[nodiscard]] static auto normalize(std::string_view path) -> std::string;

private:
    struct node {
        bool directory{false};
        std::vector<std::byte> content;
        uint32_t permissions{0};
        int64_t modified_time{0};
        std::vector<std::string> children;
    };

    auto add_directory_locked(const std::string& path, uint32_t mode) -> bool;
    void link_child(const std::string& path);
    void unlink_child(const std::string& path);
    [[nodiscard]] auto attributes_of(const node& entry) const -> remote_attributes;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, node> nodes_;
};

/**
 * @brief Primitive calls observable and injectable on memory_session
 */
enum class memory_operation {
    open_socket,
    init_session,
    handshake,
    authenticate,
    init_sftp,
    stat,
    mkdir,
    rename,
    unlink,
    rmdir,
    open_directory,
    read_directory,
    close_directory,
    open_file,
    read_file,
    write_file,
    fstat_file,
    close_file,
};

[[nodiscard]] auto to_string(memory_operation operation) -> std::string_view;

/**
 * @brief Behavior settings for memory_session
 */
struct memory_session_options {
    std::string username = "user";
    std::string password = "password";
    /// Upper bound on bytes accepted per write call (0 = unlimited)
    std::size_t max_write_size = 0;
};

/**
 * @brief session_interface implementation over memory_filesystem
 */
class memory_session : public session_interface {
public:
    using call_hook = std::function<void(memory_operation)>;

    explicit memory_session(std::shared_ptr<memory_filesystem> filesystem,
                            memory_session_options options = {});
    ~memory_session() override;

    // session_interface implementation
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

    /**
     * @brief Make a later call of @p operation fail once
     * @param operation Call to fail
     * @param successful_calls Calls of that kind allowed to succeed first
     * @param failure Native error to report (a typical one if omitted)
     */
    void inject_failure(memory_operation operation,
                        std::size_t successful_calls = 0,
                        std::optional<native_error> failure = std::nullopt);

    void clear_failures();

    /**
     * @brief Install a hook run at the start of every primitive call
     *
     * The hook runs on the calling thread while the call counts as active.
     */
    void set_call_hook(call_hook hook);

    [[nodiscard]] auto call_count(memory_operation operation) const -> std::size_t;
    [[nodiscard]] auto max_concurrent_calls() const -> std::size_t;
    [[nodiscard]] auto open_handles() const -> std::size_t;

    [[nodiscard]] auto is_socket_open() const -> bool;
    [[nodiscard]] auto is_session_open() const -> bool;
    [[nodiscard]] auto is_sftp_open() const -> bool;

    /// Number of times a held resource was actually released
    [[nodiscard]] auto socket_releases() const -> std::size_t;
    [[nodiscard]] auto session_releases() const -> std::size_t;
    [[nodiscard]] auto sftp_releases() const -> std::size_t;

    [[nodiscard]] auto filesystem() const -> std::shared_ptr<memory_filesystem>;

    [[nodiscard]] static auto default_failure(memory_operation operation) -> native_error;

    struct state;

private:
    std::shared_ptr<state> state_;
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_SESSION_MEMORY_SESSION_H
