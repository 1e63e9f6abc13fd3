/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <async_sftp/async_sftp.h>

namespace async_sftp::test {

class VersionTest : public ::testing::Test {};

TEST_F(VersionTest, VersionNumbers) {
    EXPECT_EQ(version::major, 0);
    EXPECT_EQ(version::minor, 1);
    EXPECT_EQ(version::patch, 0);
}

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

TEST_F(VersionTest, ErrorDomain) {
    EXPECT_EQ(error::domain(), "async_sftp");
}

}  // namespace async_sftp::test
