/**
 * @file metadata_operations.h
 * @brief Rename, removal and stat of remote items
 */

#ifndef ASYNC_SFTP_CLIENT_METADATA_OPERATIONS_H
#define ASYNC_SFTP_CLIENT_METADATA_OPERATIONS_H

#include <string>

#include "async_sftp/core/file_metadata.h"
#include "async_sftp/core/types.h"
#include "async_sftp/session/session_interface.h"

namespace async_sftp {

/**
 * @brief Metadata requests executed on the worker
 */
class metadata_operations {
public:
    explicit metadata_operations(session_interface& session);

    /**
     * @brief Rename without overwriting, then stat the new path
     *
     * Fails with unable_to_rename when the target exists or the server
     * rejects the rename, and with unable_to_stat_file when the new path
     * cannot be stat'ed afterwards.
     */
    [[nodiscard]] auto rename(const std::string& old_path, const std::string& new_path)
        -> result<file_metadata>;

    [[nodiscard]] auto remove_file(const std::string& path) -> result<void>;

    /**
     * @brief Remove an empty directory
     */
    [[nodiscard]] auto remove_directory(const std::string& path) -> result<void>;

    [[nodiscard]] auto stat(const std::string& path) -> result<file_metadata>;

private:
    session_interface& session_;
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CLIENT_METADATA_OPERATIONS_H
