/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>

namespace async_sftp::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() /
                    ("async_sftp_benchmarks_" + std::to_string(std::random_device{}()));
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_random_file(const std::string& name, std::size_t size,
                                           uint32_t seed) -> std::filesystem::path {
    auto data = generate_random_data(size, seed);
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

// memory client

auto make_memory_client(std::size_t chunk_size) -> memory_client {
    // Per-transfer INFO records would dominate the measurement
    get_logger().set_level(log_level::warn);

    memory_client setup;
    setup.remote = std::make_shared<memory_filesystem>();
    setup.remote->add_directory("/bench");

    auto session = std::make_unique<memory_session>(setup.remote);
    auto* session_ptr = session.get();

    auto built = sftp_client::builder()
                     .with_host("bench.local")
                     .with_credentials("user", "password")
                     .with_chunk_size(chunk_size)
                     .with_session(std::move(session))
                     .build();
    if (!built) {
        return setup;
    }

    auto client = std::make_unique<sftp_client>(std::move(built.value()));
    if (!client->connect().get()) {
        return setup;
    }

    setup.session = session_ptr;
    setup.client = std::move(client);
    return setup;
}

}  // namespace async_sftp::benchmark
