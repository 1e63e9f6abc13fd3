/**
 * @file directory_operations.h
 * @brief Listing and creation of remote directories
 */

#ifndef ASYNC_SFTP_CLIENT_DIRECTORY_OPERATIONS_H
#define ASYNC_SFTP_CLIENT_DIRECTORY_OPERATIONS_H

#include <string>
#include <vector>

#include "async_sftp/core/file_metadata.h"
#include "async_sftp/core/types.h"
#include "async_sftp/session/session_interface.h"

namespace async_sftp {

/**
 * @brief Directory requests executed on the worker
 */
class directory_operations {
public:
    explicit directory_operations(session_interface& session);

    /**
     * @brief Entries of a directory in server order
     *
     * "." and ".." are skipped. When reading an entry fails the directory is
     * closed and the read error is returned; a close failure at that point
     * is ignored.
     */
    [[nodiscard]] auto list_files(const std::string& path) -> result<std::vector<file_metadata>>;

    /**
     * @brief Create a directory with mode 0755 and return its metadata
     */
    [[nodiscard]] auto make_directory(const std::string& path) -> result<file_metadata>;

private:
    session_interface& session_;
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CLIENT_DIRECTORY_OPERATIONS_H
