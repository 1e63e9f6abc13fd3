/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <async_sftp/core/logging.h>

#include <mutex>
#include <string>
#include <vector>

namespace async_sftp::test {

// =============================================================================
// Masking tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input = "Uploading /home/alice/secret.txt to files.example.com";
    EXPECT_EQ(masker.mask(input), input);
    EXPECT_EQ(masker.mask_host("files.example.com"), "files.example.com");
}

TEST_F(SensitiveInfoMaskerTest, MaskHostKeepsTopLevelDomain) {
    sensitive_info_masker masker(masking_config::all_masked());
    auto masked = masker.mask_host("files.example.com");
    EXPECT_EQ(masked, "*************.com");
}

TEST_F(SensitiveInfoMaskerTest, MaskPathKeepsFileName) {
    sensitive_info_masker masker(masking_config::all_masked());
    auto masked = masker.mask_path("/home/alice/secret.txt");
    EXPECT_NE(masked.find("secret.txt"), std::string::npos);
    EXPECT_EQ(masked.find("alice"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInText) {
    sensitive_info_masker masker(masking_config::all_masked());
    auto masked = masker.mask("Cannot open /srv/private/data.bin: denied");
    EXPECT_EQ(masked.find("/srv/private"), std::string::npos);
    EXPECT_NE(masked.find("data.bin"), std::string::npos);
    EXPECT_NE(masked.find("denied"), std::string::npos);
}

// =============================================================================
// Log context tests
// =============================================================================

class LogContextTest : public ::testing::Test {};

TEST_F(LogContextTest, EmptyContext) {
    sftp_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(LogContextTest, TransferContext) {
    sftp_log_context ctx;
    ctx.host = "files.example.com";
    ctx.port = 22;
    ctx.operation = "download";
    ctx.remote_path = "/srv/a.bin";
    ctx.bytes_transferred = 512;
    ctx.bytes_total = 1024;

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"host\":\"files.example.com\""), std::string::npos);
    EXPECT_NE(json.find("\"port\":22"), std::string::npos);
    EXPECT_NE(json.find("\"operation\":\"download\""), std::string::npos);
    EXPECT_NE(json.find("\"bytes_transferred\":512"), std::string::npos);
    EXPECT_NE(json.find("\"bytes_total\":1024"), std::string::npos);
}

TEST_F(LogContextTest, ErrorFieldsAreEscaped) {
    sftp_log_context ctx;
    ctx.error_code = -835;
    ctx.error_message = "target \"b\" exists";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"error_code\":-835"), std::string::npos);
    EXPECT_NE(json.find("\\\"b\\\""), std::string::npos);
}

// =============================================================================
// Logger tests
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = get_logger();
        previous_level_ = logger.get_level();
        logger.set_console_output(false);
        logger.set_callback([this](log_level level, std::string_view category,
                                   std::string_view message, const sftp_log_context*) {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.push_back({level, std::string(category), std::string(message)});
        });
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_json_callback(nullptr);
        logger.set_output_format(log_output_format::text);
        logger.set_masking_config(masking_config::none());
        logger.set_level(previous_level_);
        logger.set_console_output(true);
    }

    struct record {
        log_level level;
        std::string category;
        std::string message;
    };

    std::mutex mutex_;
    std::vector<record> records_;
    log_level previous_level_{log_level::info};
};

TEST_F(LoggerTest, LevelFilter) {
    get_logger().set_level(log_level::warn);

    SFTP_LOG_INFO(log_category::connection, "hidden");
    SFTP_LOG_WARN(log_category::connection, "shown");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "shown");
    EXPECT_EQ(records_[0].level, log_level::warn);
}

TEST_F(LoggerTest, CategoryIsForwarded) {
    get_logger().set_level(log_level::trace);
    SFTP_LOG_DEBUG(log_category::transfer, "chunk");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].category, "async_sftp.transfer");
}

TEST_F(LoggerTest, JsonOutputIncludesContext) {
    auto& logger = get_logger();
    logger.set_level(log_level::info);
    logger.set_output_format(log_output_format::json);

    std::string captured;
    logger.set_json_callback([&captured](const structured_log_entry&, const std::string& json) {
        captured = json;
    });

    sftp_log_context ctx;
    ctx.remote_path = "/srv/a.bin";
    SFTP_LOG_INFO_CTX(log_category::transfer, "Download completed", ctx);

    EXPECT_NE(captured.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(captured.find("\"category\":\"async_sftp.transfer\""), std::string::npos);
    EXPECT_NE(captured.find("\"remote_path\":\"/srv/a.bin\""), std::string::npos);
    EXPECT_NE(captured.find("\"source\""), std::string::npos);
}

TEST_F(LoggerTest, JsonOutputMasksPaths) {
    auto& logger = get_logger();
    logger.set_output_format(log_output_format::json);
    logger.set_masking_config(masking_config::all_masked());

    std::string captured;
    logger.set_json_callback([&captured](const structured_log_entry&, const std::string& json) {
        captured = json;
    });

    sftp_log_context ctx;
    ctx.remote_path = "/srv/private/a.bin";
    SFTP_LOG_INFO_CTX(log_category::transfer, "Upload started", ctx);

    EXPECT_EQ(captured.find("/srv/private"), std::string::npos);
    EXPECT_NE(captured.find("a.bin"), std::string::npos);
}

TEST_F(LoggerTest, InitializeIsIdempotent) {
    auto& logger = get_logger();
    logger.initialize();
    logger.initialize();
    EXPECT_TRUE(logger.is_initialized());
}

}  // namespace async_sftp::test
