/**
 * @file test_file_metadata.cpp
 * @brief Unit tests for remote attributes, metadata snapshots and path helpers
 */

#include <gtest/gtest.h>

#include <async_sftp/core/file_metadata.h>

#include <chrono>

namespace async_sftp::test {

class FileMetadataTest : public ::testing::Test {
protected:
    static auto file_attributes() -> remote_attributes {
        remote_attributes attrs;
        attrs.size = 1234;
        attrs.permissions = 0100644;
        attrs.modified_time = 1700000000;
        attrs.access_time = 1700000100;
        attrs.uid = 1000;
        attrs.gid = 100;
        return attrs;
    }
};

TEST_F(FileMetadataTest, DirectoryTypeBits) {
    remote_attributes attrs;
    EXPECT_FALSE(attrs.is_directory());

    attrs.permissions = 0040755;
    EXPECT_TRUE(attrs.is_directory());

    attrs.permissions = 0100755;
    EXPECT_FALSE(attrs.is_directory());
}

TEST_F(FileMetadataTest, FromAttributes) {
    auto metadata = file_metadata::from_attributes("/srv/data/report.csv", file_attributes());

    EXPECT_EQ(metadata.name, "report.csv");
    EXPECT_EQ(metadata.remote_path, "/srv/data/report.csv");
    EXPECT_EQ(metadata.size, 1234u);
    EXPECT_EQ(metadata.permissions, 0100644u);
    EXPECT_FALSE(metadata.is_directory);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(
                  metadata.modified_at.time_since_epoch()).count(),
              1700000000);
    ASSERT_TRUE(metadata.accessed_at.has_value());
    ASSERT_TRUE(metadata.uid.has_value());
    EXPECT_EQ(*metadata.uid, 1000u);
    ASSERT_TRUE(metadata.gid.has_value());
    EXPECT_EQ(*metadata.gid, 100u);
}

TEST_F(FileMetadataTest, MissingAttributesDefaultToZero) {
    auto metadata = file_metadata::from_attributes("/empty", remote_attributes{});
    EXPECT_EQ(metadata.size, 0u);
    EXPECT_EQ(metadata.permissions, 0u);
    EXPECT_FALSE(metadata.accessed_at.has_value());
    EXPECT_FALSE(metadata.uid.has_value());
}

TEST_F(FileMetadataTest, PermissionString) {
    auto file = file_metadata::from_attributes("/a", file_attributes());
    EXPECT_EQ(file.permission_string(), "-rw-r--r--");

    remote_attributes dir_attrs;
    dir_attrs.permissions = 0040755;
    auto dir = file_metadata::from_attributes("/d", dir_attrs);
    EXPECT_TRUE(dir.is_directory);
    EXPECT_EQ(dir.permission_string(), "drwxr-xr-x");
}

// ============================================================================
// Path helpers
// ============================================================================

TEST_F(FileMetadataTest, RemoteBasename) {
    EXPECT_EQ(remote_basename("/a/b/c.txt"), "c.txt");
    EXPECT_EQ(remote_basename("/a/b/"), "b");
    EXPECT_EQ(remote_basename("/"), "/");
    EXPECT_EQ(remote_basename("plain"), "plain");
}

TEST_F(FileMetadataTest, JoinRemotePath) {
    EXPECT_EQ(join_remote_path("/srv", "file"), "/srv/file");
    EXPECT_EQ(join_remote_path("/srv/", "file"), "/srv/file");
    EXPECT_EQ(join_remote_path("/", "file"), "/file");
    EXPECT_EQ(join_remote_path("", "file"), "file");
}

}  // namespace async_sftp::test
