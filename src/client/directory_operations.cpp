/**
 * @file directory_operations.cpp
 * @brief Implementation of directory listing and creation
 */

#include "async_sftp/client/directory_operations.h"

#include "async_sftp/core/error_mapper.h"
#include "async_sftp/core/logging.h"

namespace async_sftp {

directory_operations::directory_operations(session_interface& session) : session_(session) {}

auto directory_operations::list_files(const std::string& path)
    -> result<std::vector<file_metadata>> {
    auto opened = error_mapper::lift(session_.open_directory(path),
                                     sftp_error_code::unable_to_open_directory);
    if (!opened) {
        SFTP_LOG_ERROR(log_category::directory,
            "Cannot open " + path + ": " + opened.error().message);
        return unexpected{opened.error()};
    }
    auto directory = std::move(opened).value();

    std::vector<file_metadata> files;
    for (;;) {
        auto entry = error_mapper::lift(directory->read_entry(),
                                        sftp_error_code::unable_to_read_directory);
        if (!entry) {
            auto closed = directory->close();
            if (!closed) {
                SFTP_LOG_DEBUG(log_category::directory,
                    "Ignoring close failure after read error on " + path);
            }
            SFTP_LOG_ERROR(log_category::directory,
                "Cannot read " + path + ": " + entry.error().message);
            return unexpected{entry.error()};
        }
        if (!entry.value()) {
            break;
        }

        const auto& item = *entry.value();
        if (item.name == "." || item.name == "..") {
            continue;
        }
        files.push_back(file_metadata::from_attributes(join_remote_path(path, item.name),
                                                       item.attributes));
    }

    auto closed = error_mapper::lift(directory->close(),
                                     sftp_error_code::unable_to_close_directory);
    if (!closed) {
        return unexpected{closed.error()};
    }

    SFTP_LOG_DEBUG(log_category::directory,
        "Listed " + std::to_string(files.size()) + " entries in " + path);
    return files;
}

auto directory_operations::make_directory(const std::string& path) -> result<file_metadata> {
    auto created = error_mapper::lift(session_.mkdir(path, default_directory_mode),
                                      sftp_error_code::unable_to_make_directory);
    if (!created) {
        SFTP_LOG_ERROR(log_category::directory,
            "Cannot create " + path + ": " + created.error().message);
        return unexpected{created.error()};
    }

    auto attrs = error_mapper::lift(session_.stat(path), sftp_error_code::unable_to_make_directory);
    if (!attrs) {
        return unexpected{attrs.error()};
    }

    SFTP_LOG_INFO(log_category::directory, "Created directory " + path);
    return file_metadata::from_attributes(path, attrs.value());
}

}  // namespace async_sftp
