/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef ASYNC_SFTP_BENCHMARKS_BENCHMARK_HELPERS_H
#define ASYNC_SFTP_BENCHMARKS_BENCHMARK_HELPERS_H

#include <async_sftp/async_sftp.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace async_sftp::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     * @param name File name
     * @param size File size
     * @param seed Random seed
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Connected client over an in-memory server
 *
 * The session pointer stays valid while the client lives.
 */
struct memory_client {
    std::shared_ptr<memory_filesystem> remote;
    memory_session* session = nullptr;
    std::unique_ptr<sftp_client> client;
};

/**
 * @brief Build and connect a client backed by memory_session
 * @return Client, or an empty client member on failure
 */
auto make_memory_client(std::size_t chunk_size) -> memory_client;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;    // 100 KB
constexpr std::size_t medium_file = 10 * MB;    // 10 MB
}  // namespace sizes

}  // namespace async_sftp::benchmark

#endif  // ASYNC_SFTP_BENCHMARKS_BENCHMARK_HELPERS_H
