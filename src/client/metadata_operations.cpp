/**
 * @file metadata_operations.cpp
 * @brief Implementation of rename, removal and stat
 */

#include "async_sftp/client/metadata_operations.h"

#include "async_sftp/core/error_mapper.h"
#include "async_sftp/core/logging.h"

namespace async_sftp {

metadata_operations::metadata_operations(session_interface& session) : session_(session) {}

auto metadata_operations::rename(const std::string& old_path, const std::string& new_path)
    -> result<file_metadata> {
    auto renamed = error_mapper::lift(session_.rename(old_path, new_path),
                                      sftp_error_code::unable_to_rename);
    if (!renamed) {
        SFTP_LOG_ERROR(log_category::directory,
            "Cannot rename " + old_path + " to " + new_path + ": " + renamed.error().message);
        return unexpected{renamed.error()};
    }

    auto attrs = error_mapper::lift(session_.stat(new_path), sftp_error_code::unable_to_stat_file);
    if (!attrs) {
        return unexpected{attrs.error()};
    }

    SFTP_LOG_INFO(log_category::directory, "Renamed " + old_path + " to " + new_path);
    return file_metadata::from_attributes(new_path, attrs.value());
}

auto metadata_operations::remove_file(const std::string& path) -> result<void> {
    auto removed = error_mapper::lift(session_.unlink(path), sftp_error_code::unable_to_remove_file);
    if (!removed) {
        SFTP_LOG_ERROR(log_category::directory,
            "Cannot remove file " + path + ": " + removed.error().message);
        return removed;
    }
    SFTP_LOG_INFO(log_category::directory, "Removed file " + path);
    return {};
}

auto metadata_operations::remove_directory(const std::string& path) -> result<void> {
    auto removed = error_mapper::lift(session_.rmdir(path),
                                      sftp_error_code::unable_to_remove_directory);
    if (!removed) {
        SFTP_LOG_ERROR(log_category::directory,
            "Cannot remove directory " + path + ": " + removed.error().message);
        return removed;
    }
    SFTP_LOG_INFO(log_category::directory, "Removed directory " + path);
    return {};
}

auto metadata_operations::stat(const std::string& path) -> result<file_metadata> {
    auto attrs = error_mapper::lift(session_.stat(path), sftp_error_code::unable_to_stat_file);
    if (!attrs) {
        return unexpected{attrs.error()};
    }
    return file_metadata::from_attributes(path, attrs.value());
}

}  // namespace async_sftp
