/**
 * @file test_transfer_engine.cpp
 * @brief Unit tests for chunked upload and download
 */

#include <gtest/gtest.h>

#include <async_sftp/adapters/executor_adapter.h>
#include <async_sftp/client/transfer_engine.h>
#include <async_sftp/session/memory_session.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <thread>
#include <utility>
#include <vector>

namespace async_sftp::test {

class TransferEngineTest : public ::testing::Test {
protected:
    static constexpr std::size_t chunk = 1024;

    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("async_sftp_engine_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);

        fs_ = std::make_shared<memory_filesystem>();
        fs_->add_directory("/remote");
        open_session(memory_session_options{});

        delivery_ = std::make_shared<adapters::dedicated_thread_executor>("engine_delivery");
        engine_ = std::make_unique<transfer_engine>(chunk, std::chrono::milliseconds(0), delivery_);
    }

    void TearDown() override {
        delivery_->shutdown();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void open_session(memory_session_options options) {
        session_ = std::make_unique<memory_session>(fs_, std::move(options));
        ASSERT_TRUE(session_->open_socket("localhost", 22, std::chrono::seconds(1)));
        ASSERT_TRUE(session_->init_session());
        ASSERT_TRUE(session_->handshake());
        ASSERT_TRUE(session_->authenticate("user", "password"));
        ASSERT_TRUE(session_->init_sftp());
    }

    static auto make_content(std::size_t size) -> std::vector<std::byte> {
        std::mt19937 gen(42);
        std::uniform_int_distribution<> dis(0, 255);
        std::vector<std::byte> content(size);
        for (auto& b : content) {
            b = static_cast<std::byte>(dis(gen));
        }
        return content;
    }

    auto write_local(const std::string& name, const std::vector<std::byte>& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        return path;
    }

    static auto read_local(const std::filesystem::path& path) -> std::vector<std::byte> {
        std::ifstream file(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
        std::vector<std::byte> content(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i) {
            content[i] = static_cast<std::byte>(raw[i]);
        }
        return content;
    }

    auto recording_progress(bool keep_going = true) -> progress_callback {
        return [this, keep_going](uint64_t done, uint64_t total) {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_.emplace_back(done, total);
            return keep_going;
        };
    }

    auto progress() -> std::vector<std::pair<uint64_t, uint64_t>> {
        delivery_->shutdown();
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_;
    }

    std::filesystem::path test_dir_;
    std::shared_ptr<memory_filesystem> fs_;
    std::unique_ptr<memory_session> session_;
    std::shared_ptr<adapters::dedicated_thread_executor> delivery_;
    std::unique_ptr<transfer_engine> engine_;

    std::mutex mutex_;
    std::vector<std::pair<uint64_t, uint64_t>> progress_;
};

// ============================================================================
// Download
// ============================================================================

TEST_F(TransferEngineTest, DownloadCopiesContent) {
    auto content = make_content(5000);
    fs_->add_file("/remote/data.bin", content);
    auto local = test_dir_ / "data.bin";

    auto outcome = engine_->download(*session_, "/remote/data.bin", local, recording_progress(),
                                     cancellation_token{});

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value().bytes_transferred, 5000u);
    EXPECT_EQ(outcome.value().file.name, "data.bin");
    EXPECT_EQ(outcome.value().file.size, 5000u);
    EXPECT_LE(outcome.value().started_at, outcome.value().finished_at);
    EXPECT_EQ(read_local(local), content);

    EXPECT_EQ(session_->call_count(memory_operation::read_file), 5u);
    EXPECT_EQ(session_->open_handles(), 0u);

    auto seen = progress();
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back(), std::make_pair(uint64_t{5000}, uint64_t{5000}));
    for (const auto& [done, total] : seen) {
        EXPECT_LE(done, total);
        EXPECT_EQ(total, 5000u);
    }
}

TEST_F(TransferEngineTest, DownloadEmptyFile) {
    fs_->add_file("/remote/empty", std::vector<std::byte>{});
    auto local = test_dir_ / "empty";

    auto outcome = engine_->download(*session_, "/remote/empty", local, recording_progress(),
                                     cancellation_token{});

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().bytes_transferred, 0u);
    EXPECT_TRUE(std::filesystem::exists(local));
    EXPECT_EQ(std::filesystem::file_size(local), 0u);
    EXPECT_EQ(session_->call_count(memory_operation::read_file), 0u);

    auto seen = progress();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], std::make_pair(uint64_t{0}, uint64_t{0}));
}

TEST_F(TransferEngineTest, DownloadMissingRemoteFile) {
    auto local = test_dir_ / "missing";
    auto outcome = engine_->download(*session_, "/remote/missing", local, nullptr,
                                     cancellation_token{});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unable_to_open_file);
    ASSERT_TRUE(outcome.error().native.has_value());
    EXPECT_EQ(outcome.error().native->code, sftp_status::no_such_file);
    EXPECT_FALSE(std::filesystem::exists(local));
}

TEST_F(TransferEngineTest, DownloadIntoMissingDirectory) {
    fs_->add_file("/remote/a", std::string_view("abc"));
    auto local = test_dir_ / "no_such_dir" / "a";

    auto outcome = engine_->download(*session_, "/remote/a", local, nullptr, cancellation_token{});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unable_to_open_local_file_for_writing);
    EXPECT_EQ(session_->open_handles(), 0u);
}

TEST_F(TransferEngineTest, DownloadStatFailure) {
    fs_->add_file("/remote/a", std::string_view("abc"));
    session_->inject_failure(memory_operation::fstat_file);

    auto outcome = engine_->download(*session_, "/remote/a", test_dir_ / "a", nullptr,
                                     cancellation_token{});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unable_to_stat_file);
    EXPECT_EQ(session_->open_handles(), 0u);
}

TEST_F(TransferEngineTest, DownloadReadFailureReleasesHandle) {
    fs_->add_file("/remote/data.bin", make_content(4096));
    session_->inject_failure(memory_operation::read_file, 2);

    auto outcome = engine_->download(*session_, "/remote/data.bin", test_dir_ / "data.bin",
                                     nullptr, cancellation_token{});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unable_to_read_file);
    EXPECT_EQ(session_->open_handles(), 0u);
}

TEST_F(TransferEngineTest, DownloadCancelledBeforeFirstChunk) {
    fs_->add_file("/remote/data.bin", make_content(4096));
    auto local = test_dir_ / "data.bin";
    cancellation_token token;
    token.cancel();

    auto outcome = engine_->download(*session_, "/remote/data.bin", local, nullptr, token);

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::cancelled_by_user);
    EXPECT_EQ(session_->call_count(memory_operation::read_file), 0u);
    EXPECT_EQ(session_->open_handles(), 0u);
    EXPECT_FALSE(std::filesystem::exists(local));
}

TEST_F(TransferEngineTest, DownloadCancelledMidway) {
    fs_->add_file("/remote/data.bin", make_content(10 * chunk));
    auto local = test_dir_ / "data.bin";
    cancellation_token token;

    std::atomic<int> reads{0};
    session_->set_call_hook([&](memory_operation op) {
        if (op == memory_operation::read_file && ++reads == 3) {
            token.cancel();
        }
    });

    auto outcome = engine_->download(*session_, "/remote/data.bin", local, nullptr, token);

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::cancelled_by_user);
    EXPECT_EQ(session_->call_count(memory_operation::read_file), 3u);
    EXPECT_EQ(session_->open_handles(), 0u);
    EXPECT_FALSE(std::filesystem::exists(local));
}

TEST_F(TransferEngineTest, ProgressCallbackReturningFalseCancels) {
    fs_->add_file("/remote/data.bin", make_content(4 * chunk));
    cancellation_token token;

    // Hold the second read until the first progress delivery has cancelled
    std::atomic<int> reads{0};
    session_->set_call_hook([&](memory_operation op) {
        if (op == memory_operation::read_file && ++reads == 2) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (!token.is_cancelled() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
    });

    auto outcome = engine_->download(*session_, "/remote/data.bin", test_dir_ / "data.bin",
                                     recording_progress(false), token);

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::cancelled_by_user);
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(session_->open_handles(), 0u);
}

// ============================================================================
// Upload
// ============================================================================

TEST_F(TransferEngineTest, UploadCopiesContent) {
    auto content = make_content(3000);
    auto local = write_local("up.bin", content);

    auto outcome = engine_->upload(*session_, "/remote/up.bin", local, recording_progress(),
                                   cancellation_token{});

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value().bytes_transferred, 3000u);
    EXPECT_EQ(outcome.value().file.size, 3000u);
    EXPECT_EQ(outcome.value().file.remote_path, "/remote/up.bin");

    auto stored = fs_->read_file("/remote/up.bin");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, content);

    auto attrs = fs_->stat("/remote/up.bin");
    ASSERT_TRUE(attrs.has_value());
    ASSERT_TRUE(attrs->permissions.has_value());
    EXPECT_EQ(*attrs->permissions & 0777u, 0644u);
    EXPECT_EQ(session_->open_handles(), 0u);

    auto seen = progress();
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back(), std::make_pair(uint64_t{3000}, uint64_t{3000}));
}

TEST_F(TransferEngineTest, UploadTruncatesExistingFile) {
    fs_->add_file("/remote/up.txt", std::string_view("a much longer previous content"));
    auto local = write_local("up.txt", {std::byte{'n'}, std::byte{'e'}, std::byte{'w'}});

    auto outcome = engine_->upload(*session_, "/remote/up.txt", local, nullptr,
                                   cancellation_token{});

    ASSERT_TRUE(outcome.has_value());
    auto stored = fs_->read_file("/remote/up.txt");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->size(), 3u);
}

TEST_F(TransferEngineTest, UploadHandlesPartialWrites) {
    memory_session_options options;
    options.max_write_size = 100;
    open_session(options);

    auto content = make_content(2500);
    auto local = write_local("partial.bin", content);

    auto outcome = engine_->upload(*session_, "/remote/partial.bin", local, nullptr,
                                   cancellation_token{});

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value().bytes_transferred, 2500u);
    EXPECT_EQ(session_->call_count(memory_operation::write_file), 27u);
    EXPECT_EQ(*fs_->read_file("/remote/partial.bin"), content);
}

TEST_F(TransferEngineTest, UploadMissingLocalFile) {
    auto outcome = engine_->upload(*session_, "/remote/x", test_dir_ / "does_not_exist", nullptr,
                                   cancellation_token{});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unable_to_open_local_file_for_reading);
    EXPECT_EQ(session_->call_count(memory_operation::open_file), 0u);
    EXPECT_FALSE(fs_->exists("/remote/x"));
}

TEST_F(TransferEngineTest, UploadIntoMissingRemoteDirectory) {
    auto local = write_local("a.bin", make_content(10));
    auto outcome = engine_->upload(*session_, "/nowhere/a.bin", local, nullptr,
                                   cancellation_token{});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unable_to_open_file);
}

TEST_F(TransferEngineTest, UploadWriteFailureReleasesHandle) {
    auto local = write_local("a.bin", make_content(4 * chunk));
    session_->inject_failure(memory_operation::write_file, 1);

    auto outcome = engine_->upload(*session_, "/remote/a.bin", local, nullptr,
                                   cancellation_token{});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unable_to_write_file);
    ASSERT_TRUE(outcome.error().native.has_value());
    EXPECT_EQ(outcome.error().native->origin, native_origin::session);
    EXPECT_EQ(session_->open_handles(), 0u);
}

TEST_F(TransferEngineTest, UploadCloseFailure) {
    auto local = write_local("a.bin", make_content(10));
    session_->inject_failure(memory_operation::close_file);

    auto outcome = engine_->upload(*session_, "/remote/a.bin", local, nullptr,
                                   cancellation_token{});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unable_to_close_file);
    EXPECT_EQ(session_->open_handles(), 0u);
}

TEST_F(TransferEngineTest, UploadCancelledMidway) {
    auto local = write_local("a.bin", make_content(8 * chunk));
    cancellation_token token;

    session_->set_call_hook([&](memory_operation op) {
        if (op == memory_operation::write_file) {
            token.cancel();
        }
    });

    auto outcome = engine_->upload(*session_, "/remote/a.bin", local, nullptr, token);

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::cancelled_by_user);
    EXPECT_EQ(session_->call_count(memory_operation::write_file), 1u);
    EXPECT_EQ(session_->open_handles(), 0u);
    EXPECT_TRUE(std::filesystem::exists(local));
}

}  // namespace async_sftp::test
