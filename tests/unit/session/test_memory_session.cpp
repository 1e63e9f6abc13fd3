/**
 * @file test_memory_session.cpp
 * @brief Unit tests for the in-memory session backend
 */

#include <gtest/gtest.h>

#include <async_sftp/session/memory_session.h>

#include <memory>
#include <string>
#include <vector>

namespace async_sftp::test {

namespace {

auto text_of(const std::vector<std::byte>& bytes) -> std::string {
    std::string text;
    for (auto b : bytes) {
        text.push_back(static_cast<char>(b));
    }
    return text;
}

auto bytes_of(std::string_view text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes;
    for (char c : text) {
        bytes.push_back(static_cast<std::byte>(c));
    }
    return bytes;
}

}  // namespace

// ============================================================================
// memory_filesystem
// ============================================================================

class MemoryFilesystemTest : public ::testing::Test {
protected:
    memory_filesystem fs_;
};

TEST_F(MemoryFilesystemTest, NormalizePaths) {
    EXPECT_EQ(memory_filesystem::normalize("/a//b/"), "/a/b");
    EXPECT_EQ(memory_filesystem::normalize("a/b"), "/a/b");
    EXPECT_EQ(memory_filesystem::normalize("/"), "/");
    EXPECT_EQ(memory_filesystem::normalize(""), "/");
}

TEST_F(MemoryFilesystemTest, AddFileCreatesParents) {
    ASSERT_TRUE(fs_.add_file("/srv/data/a.txt", std::string_view("hello")));
    EXPECT_TRUE(fs_.is_directory("/srv"));
    EXPECT_TRUE(fs_.is_directory("/srv/data"));

    auto content = fs_.read_file("/srv/data/a.txt");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(text_of(*content), "hello");
}

TEST_F(MemoryFilesystemTest, ListingKeepsCreationOrder) {
    fs_.add_file("/d/zeta", std::string_view("z"));
    fs_.add_file("/d/alpha", std::string_view("a"));
    fs_.add_directory("/d/mid");

    std::vector<directory_entry> entries;
    ASSERT_EQ(fs_.list("/d", entries), sftp_status::ok);
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_EQ(entries[0].name, ".");
    EXPECT_EQ(entries[1].name, "..");
    EXPECT_EQ(entries[2].name, "zeta");
    EXPECT_EQ(entries[3].name, "alpha");
    EXPECT_EQ(entries[4].name, "mid");
    EXPECT_TRUE(entries[4].attributes.is_directory());
}

TEST_F(MemoryFilesystemTest, RenameRefusesExistingTarget) {
    fs_.add_file("/a", std::string_view("1"));
    fs_.add_file("/b", std::string_view("2"));
    EXPECT_EQ(fs_.rename("/a", "/b"), sftp_status::file_already_exists);
    EXPECT_EQ(text_of(*fs_.read_file("/b")), "2");
}

TEST_F(MemoryFilesystemTest, RenameMovesDirectoryTree) {
    fs_.add_file("/old/inner/file", std::string_view("x"));
    ASSERT_EQ(fs_.rename("/old", "/new"), sftp_status::ok);
    EXPECT_FALSE(fs_.exists("/old"));
    EXPECT_TRUE(fs_.exists("/new/inner/file"));
}

TEST_F(MemoryFilesystemTest, RemoveDirectoryRequiresEmpty) {
    fs_.add_file("/d/f", std::string_view("x"));
    EXPECT_EQ(fs_.remove_directory("/d"), sftp_status::dir_not_empty);
    EXPECT_EQ(fs_.remove_file("/d/f"), sftp_status::ok);
    EXPECT_EQ(fs_.remove_directory("/d"), sftp_status::ok);
    EXPECT_FALSE(fs_.exists("/d"));
}

TEST_F(MemoryFilesystemTest, OpenWithoutCreateFailsForMissingFile) {
    EXPECT_EQ(fs_.open("/missing", open_mode::read, 0), sftp_status::no_such_file);
    EXPECT_EQ(fs_.open("/missing", open_mode::write | open_mode::create, 0644), sftp_status::ok);
    EXPECT_TRUE(fs_.exists("/missing"));
}

// ============================================================================
// memory_session
// ============================================================================

class MemorySessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs_ = std::make_shared<memory_filesystem>();
        session_ = std::make_unique<memory_session>(fs_);
    }

    void connect() {
        ASSERT_TRUE(session_->open_socket("localhost", 22, std::chrono::seconds(1)));
        ASSERT_TRUE(session_->init_session());
        ASSERT_TRUE(session_->handshake());
        ASSERT_TRUE(session_->authenticate("user", "password"));
        ASSERT_TRUE(session_->init_sftp());
    }

    std::shared_ptr<memory_filesystem> fs_;
    std::unique_ptr<memory_session> session_;
};

TEST_F(MemorySessionTest, ConnectSequence) {
    connect();
    EXPECT_TRUE(session_->is_socket_open());
    EXPECT_TRUE(session_->is_session_open());
    EXPECT_TRUE(session_->is_sftp_open());
}

TEST_F(MemorySessionTest, StagesMustRunInOrder) {
    EXPECT_FALSE(session_->init_session());
    EXPECT_FALSE(session_->init_sftp());
}

TEST_F(MemorySessionTest, WrongPasswordFailsAuthentication) {
    ASSERT_TRUE(session_->open_socket("localhost", 22, std::chrono::seconds(1)));
    ASSERT_TRUE(session_->init_session());
    ASSERT_TRUE(session_->handshake());

    auto auth = session_->authenticate("user", "wrong");
    ASSERT_FALSE(auth);
    EXPECT_EQ(auth.error().origin, native_origin::session);
    EXPECT_EQ(auth.error().code, -18);
}

TEST_F(MemorySessionTest, OperationsNeedSftpChannel) {
    auto attrs = session_->stat("/");
    ASSERT_FALSE(attrs);
    EXPECT_EQ(attrs.error().origin, native_origin::session);
}

TEST_F(MemorySessionTest, ReleaseIsCountedOnce) {
    connect();
    session_->release_sftp();
    session_->release_sftp();
    session_->release_session();
    session_->release_socket();
    session_->release_socket();

    EXPECT_EQ(session_->sftp_releases(), 1u);
    EXPECT_EQ(session_->session_releases(), 1u);
    EXPECT_EQ(session_->socket_releases(), 1u);
    EXPECT_FALSE(session_->is_sftp_open());
}

TEST_F(MemorySessionTest, FileHandleReadWrite) {
    connect();
    {
        auto opened = session_->open_file("/f", open_mode::write | open_mode::create, 0644);
        ASSERT_TRUE(opened);
        auto file = std::move(opened).value();
        EXPECT_EQ(session_->open_handles(), 1u);

        auto data = bytes_of("payload");
        auto written = file->write(data);
        ASSERT_TRUE(written);
        EXPECT_EQ(written.value(), data.size());
        ASSERT_TRUE(file->close());
        EXPECT_EQ(session_->open_handles(), 0u);
    }

    auto opened = session_->open_file("/f", open_mode::read, 0);
    ASSERT_TRUE(opened);
    auto file = std::move(opened).value();
    std::vector<std::byte> buffer(4);
    auto first = file->read(buffer);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value(), 4u);
    auto second = file->read(buffer);
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value(), 3u);
    auto eof = file->read(buffer);
    ASSERT_TRUE(eof);
    EXPECT_EQ(eof.value(), 0u);
}

TEST_F(MemorySessionTest, DestroyedHandleIsReleased) {
    connect();
    fs_->add_file("/f", std::string_view("x"));
    {
        auto opened = session_->open_file("/f", open_mode::read, 0);
        ASSERT_TRUE(opened);
        EXPECT_EQ(session_->open_handles(), 1u);
    }
    EXPECT_EQ(session_->open_handles(), 0u);
}

TEST_F(MemorySessionTest, PartialWrites) {
    session_ = std::make_unique<memory_session>(fs_, memory_session_options{"user", "password", 3});
    connect();

    auto opened = session_->open_file("/f", open_mode::write | open_mode::create, 0644);
    ASSERT_TRUE(opened);
    auto file = std::move(opened).value();
    auto data = bytes_of("abcdefg");
    auto written = file->write(data);
    ASSERT_TRUE(written);
    EXPECT_EQ(written.value(), 3u);
}

TEST_F(MemorySessionTest, InjectedFailureAfterSuccesses) {
    connect();
    session_->inject_failure(memory_operation::stat, 1);

    EXPECT_TRUE(session_->stat("/"));
    auto failed = session_->stat("/");
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().origin, native_origin::sftp);
    EXPECT_EQ(failed.error().code, sftp_status::failure);
    EXPECT_TRUE(session_->stat("/"));
    EXPECT_EQ(session_->call_count(memory_operation::stat), 3u);
}

TEST_F(MemorySessionTest, InjectedStageFailureUsesTypicalError) {
    session_->inject_failure(memory_operation::handshake);
    ASSERT_TRUE(session_->open_socket("localhost", 22, std::chrono::seconds(1)));
    ASSERT_TRUE(session_->init_session());
    auto shake = session_->handshake();
    ASSERT_FALSE(shake);
    EXPECT_EQ(shake.error().code, -5);
}

TEST_F(MemorySessionTest, CallHookSeesEveryCall) {
    std::vector<memory_operation> seen;
    session_->set_call_hook([&seen](memory_operation op) { seen.push_back(op); });
    connect();
    (void)session_->stat("/");

    ASSERT_EQ(seen.size(), 6u);
    EXPECT_EQ(seen.front(), memory_operation::open_socket);
    EXPECT_EQ(seen.back(), memory_operation::stat);
    EXPECT_EQ(to_string(seen.back()), "stat");
}

TEST_F(MemorySessionTest, DirectoryHandleIteratesEntries) {
    connect();
    fs_->add_file("/d/a", std::string_view("1"));

    auto opened = session_->open_directory("/d");
    ASSERT_TRUE(opened);
    auto directory = std::move(opened).value();

    std::vector<std::string> names;
    for (;;) {
        auto entry = directory->read_entry();
        ASSERT_TRUE(entry);
        if (!entry.value()) {
            break;
        }
        names.push_back(entry.value()->name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{".", "..", "a"}));
    EXPECT_TRUE(directory->close());
    EXPECT_TRUE(directory->close());
    EXPECT_EQ(session_->open_handles(), 0u);
}

}  // namespace async_sftp::test
