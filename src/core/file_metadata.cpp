/**
 * @file file_metadata.cpp
 * @brief Implementation of remote metadata helpers
 */

#include "async_sftp/core/file_metadata.h"

namespace async_sftp {

namespace {

auto to_time_point(int64_t seconds) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

}  // namespace

auto file_metadata::from_attributes(std::string path,
                                    const remote_attributes& attributes)
    -> file_metadata {
    file_metadata metadata;
    metadata.name = remote_basename(path);
    metadata.remote_path = std::move(path);
    metadata.size = attributes.size.value_or(0);
    metadata.permissions = attributes.permissions.value_or(0);
    if (attributes.modified_time) {
        metadata.modified_at = to_time_point(*attributes.modified_time);
    }
    if (attributes.access_time) {
        metadata.accessed_at = to_time_point(*attributes.access_time);
    }
    metadata.uid = attributes.uid;
    metadata.gid = attributes.gid;
    metadata.is_directory = attributes.is_directory();
    return metadata;
}

auto file_metadata::permission_string() const -> std::string {
    std::string text(10, '-');
    switch (permissions & 0170000U) {
        case 0040000U: text[0] = 'd'; break;
        case 0120000U: text[0] = 'l'; break;
        case 0020000U: text[0] = 'c'; break;
        case 0060000U: text[0] = 'b'; break;
        case 0010000U: text[0] = 'p'; break;
        case 0140000U: text[0] = 's'; break;
        default:
            if (is_directory) text[0] = 'd';
            break;
    }

    static constexpr char flags[] = {'r', 'w', 'x'};
    for (int bit = 0; bit < 9; ++bit) {
        if (permissions & (0400U >> bit)) {
            text[static_cast<std::size_t>(bit) + 1] = flags[bit % 3];
        }
    }
    return text;
}

auto remote_basename(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    if (path == "/") {
        return std::string(path);
    }
    auto slash = path.find_last_of('/');
    if (slash == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(slash + 1));
}

auto join_remote_path(std::string_view directory, std::string_view name) -> std::string {
    std::string joined(directory);
    if (joined.empty()) {
        return std::string(name);
    }
    if (joined.back() != '/') {
        joined.push_back('/');
    }
    joined.append(name);
    return joined;
}

}  // namespace async_sftp
