/**
 * @file file_metadata.h
 * @brief Remote file attributes and the metadata snapshot handed to callers
 */

#ifndef ASYNC_SFTP_CORE_FILE_METADATA_H
#define ASYNC_SFTP_CORE_FILE_METADATA_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace async_sftp {

/**
 * @brief Attribute block as reported by a stat, fstat or readdir call
 *
 * Every field is optional on the wire; absent fields stay empty.
 */
struct remote_attributes {
    std::optional<uint64_t> size;
    std::optional<uint32_t> permissions;
    std::optional<int64_t> modified_time;  ///< seconds since epoch
    std::optional<int64_t> access_time;    ///< seconds since epoch
    std::optional<uint32_t> uid;
    std::optional<uint32_t> gid;

    /**
     * @brief Check the file type bits for a directory
     */
    [[nodiscard]] auto is_directory() const noexcept -> bool {
        return permissions && (*permissions & 0170000U) == 0040000U;
    }
};

/**
 * @brief Entry returned while iterating a remote directory
 */
struct directory_entry {
    std::string name;
    remote_attributes attributes;
};

/**
 * @brief Immutable snapshot of a remote file or directory
 *
 * Not kept in sync with the remote item after it is returned.
 */
struct file_metadata {
    std::string name;
    std::string remote_path;
    uint64_t size;
    uint32_t permissions;
    std::chrono::system_clock::time_point modified_at;
    std::optional<std::chrono::system_clock::time_point> accessed_at;
    std::optional<uint32_t> uid;
    std::optional<uint32_t> gid;
    bool is_directory;

    file_metadata() : size(0), permissions(0), is_directory(false) {}

    /**
     * @brief Build a snapshot from a remote path and its attributes
     */
    [[nodiscard]] static auto from_attributes(std::string path,
                                              const remote_attributes& attributes)
        -> file_metadata;

    /**
     * @brief Permission bits rendered like `ls -l` (e.g. "drwxr-xr-x")
     */
    [[nodiscard]] auto permission_string() const -> std::string;
};

/**
 * @brief Last component of a remote path ("/a/b/" -> "b", "/" -> "/")
 */
[[nodiscard]] auto remote_basename(std::string_view path) -> std::string;

/**
 * @brief Join a remote directory and an entry name with a single '/'
 */
[[nodiscard]] auto join_remote_path(std::string_view directory, std::string_view name)
    -> std::string;

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CORE_FILE_METADATA_H
