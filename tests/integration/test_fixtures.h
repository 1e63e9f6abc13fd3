/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef ASYNC_SFTP_TEST_FIXTURES_H
#define ASYNC_SFTP_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <async_sftp/async_sftp.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <memory>
#include <random>
#include <thread>
#include <vector>

namespace async_sftp::test {

/**
 * @brief Test data sizes
 */
namespace test_data {
    constexpr std::size_t chunk_size = 1024;                   // 1KB
    constexpr std::size_t small_file_size = 1024;              // 1KB
    constexpr std::size_t medium_file_size = 256 * 1024;       // 256KB
    constexpr std::size_t large_file_size = 4 * 1024 * 1024;   // 4MB
}

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("async_sftp_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        download_dir_ = test_dir_ / "downloads";
        std::filesystem::create_directories(download_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::vector<std::byte> {
        std::ifstream file(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
        std::vector<std::byte> content(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i) {
            content[i] = static_cast<std::byte>(raw[i]);
        }
        return content;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path download_dir_;
};

/**
 * @brief Test fixture with a client wired to an in-memory SFTP server
 *
 * session_ stays valid for the fixture's lifetime because the client owns
 * the session and is destroyed in TearDown.
 */
class ClientFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        remote_ = std::make_shared<memory_filesystem>();
        remote_->add_directory("/upload");
        build_client(memory_session_options{});
    }

    void TearDown() override {
        if (client_) {
            client_->disconnect();
        }
        client_.reset();
        session_ = nullptr;
        TempDirectoryFixture::TearDown();
    }

    void build_client(memory_session_options options,
                      std::size_t chunk_size = test_data::chunk_size) {
        if (client_) {
            client_->disconnect();
            client_.reset();
        }

        auto session = std::make_unique<memory_session>(remote_, std::move(options));
        session_ = session.get();

        auto client_result = sftp_client::builder()
            .with_host("sftp.example.com")
            .with_credentials("user", "password")
            .with_chunk_size(chunk_size)
            .with_progress_interval(std::chrono::milliseconds(0))
            .with_session(std::move(session))
            .build();

        ASSERT_TRUE(client_result.has_value()) << "Failed to create client";
        client_ = std::make_unique<sftp_client>(std::move(client_result.value()));
    }

    auto connect_client() -> bool {
        auto result = client_->connect().get();
        return result.has_value();
    }

    template <typename T>
    static auto wait_ready(std::future<T>& future) -> bool {
        return future.wait_for(std::chrono::seconds(10)) == std::future_status::ready;
    }

    std::shared_ptr<memory_filesystem> remote_;
    memory_session* session_{nullptr};
    std::unique_ptr<sftp_client> client_;
};

}  // namespace async_sftp::test

#endif  // ASYNC_SFTP_TEST_FIXTURES_H
