/**
 * @file libssh2_session.cpp
 * @brief Blocking libssh2 implementation of session_interface
 */

#include "async_sftp/session/libssh2_session.h"

#if ASYNC_SFTP_HAS_LIBSSH2

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string_view>
#include <system_error>
#include <utility>

#include "async_sftp/core/error_mapper.h"
#include "async_sftp/core/logging.h"

namespace async_sftp {

namespace {

std::once_flag library_init_flag;
int library_init_rc = 0;

auto ensure_library() -> native_result<void> {
    std::call_once(library_init_flag, [] { library_init_rc = libssh2_init(0); });
    if (library_init_rc != 0) {
        return native_unexpected{native_error{
            native_origin::session, library_init_rc, "libssh2_init failed"}};
    }
    return {};
}

auto session_error(LIBSSH2_SESSION* session) -> native_error {
    if (session == nullptr) {
        return native_error{native_origin::session, LIBSSH2_ERROR_BAD_USE,
                            "SSH session is not initialized"};
    }
    char* message = nullptr;
    int length = 0;
    int code = libssh2_session_last_error(session, &message, &length, 0);
    std::string text;
    if (message != nullptr && length > 0) {
        text.assign(message, static_cast<std::size_t>(length));
    }
    return native_error{native_origin::session, code, std::move(text)};
}

// SFTP protocol failures carry the server's status code
auto last_error(LIBSSH2_SESSION* session, LIBSSH2_SFTP* sftp) -> native_error {
    auto native = session_error(session);
    if (sftp != nullptr && native.code == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        auto status = libssh2_sftp_last_error(sftp);
        return native_error{native_origin::sftp, static_cast<int64_t>(status),
                            std::move(native.message)};
    }
    return native;
}

auto to_attributes(const LIBSSH2_SFTP_ATTRIBUTES& attrs) -> remote_attributes {
    remote_attributes out;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
        out.size = static_cast<uint64_t>(attrs.filesize);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        out.uid = static_cast<uint32_t>(attrs.uid);
        out.gid = static_cast<uint32_t>(attrs.gid);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        out.permissions = static_cast<uint32_t>(attrs.permissions);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
        out.access_time = static_cast<int64_t>(attrs.atime);
        out.modified_time = static_cast<int64_t>(attrs.mtime);
    }
    return out;
}

auto connect_with_timeout(int fd, const sockaddr* address, socklen_t length,
                          std::chrono::milliseconds timeout) -> native_result<void> {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return native_unexpected{error_mapper::last_system_error()};
    }

    if (::connect(fd, address, length) != 0) {
        if (errno != EINPROGRESS) {
            return native_unexpected{error_mapper::last_system_error()};
        }

        pollfd descriptor{fd, POLLOUT, 0};
        int wait_ms = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;
        int ready = ::poll(&descriptor, 1, wait_ms);
        if (ready < 0) {
            return native_unexpected{error_mapper::last_system_error()};
        }
        if (ready == 0) {
            return native_unexpected{native_error{
                native_origin::system, ETIMEDOUT, std::generic_category().message(ETIMEDOUT)}};
        }

        int so_error = 0;
        socklen_t so_length = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_length) != 0) {
            return native_unexpected{error_mapper::last_system_error()};
        }
        if (so_error != 0) {
            return native_unexpected{native_error{
                native_origin::system, so_error, std::generic_category().message(so_error)}};
        }
    }

    // libssh2 drives the socket in blocking mode
    if (::fcntl(fd, F_SETFL, flags) < 0) {
        return native_unexpected{error_mapper::last_system_error()};
    }
    return {};
}

struct keyboard_interactive_context {
    std::string password;
};

// Every prompt is answered with the password
LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC(answer_with_password) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    (void)prompts;

    if (abstract == nullptr || *abstract == nullptr) {
        return;
    }
    const auto* context = static_cast<const keyboard_interactive_context*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (context->password.empty()) {
            continue;
        }
        auto* copy = static_cast<char*>(std::malloc(context->password.size() + 1));
        if (copy == nullptr) {
            continue;
        }
        std::memcpy(copy, context->password.data(), context->password.size());
        copy[context->password.size()] = '\0';
        responses[i].text = copy;
        responses[i].length = static_cast<unsigned int>(context->password.size());
    }
}

/**
 * @brief Open SFTP file handle
 */
class libssh2_file : public remote_file {
public:
    libssh2_file(LIBSSH2_SESSION* session, LIBSSH2_SFTP* sftp, LIBSSH2_SFTP_HANDLE* handle)
        : session_(session), sftp_(sftp), handle_(handle) {}

    ~libssh2_file() override {
        if (handle_ != nullptr) {
            libssh2_sftp_close_handle(handle_);
        }
    }

    auto read(std::span<std::byte> buffer) -> native_result<std::size_t> override {
        if (handle_ == nullptr) {
            return native_unexpected{closed_handle()};
        }
        auto count = libssh2_sftp_read(handle_, reinterpret_cast<char*>(buffer.data()),
                                       buffer.size());
        if (count < 0) {
            return native_unexpected{last_error(session_, sftp_)};
        }
        return static_cast<std::size_t>(count);
    }

    auto write(std::span<const std::byte> data) -> native_result<std::size_t> override {
        if (handle_ == nullptr) {
            return native_unexpected{closed_handle()};
        }
        auto count = libssh2_sftp_write(handle_, reinterpret_cast<const char*>(data.data()),
                                        data.size());
        if (count < 0) {
            return native_unexpected{last_error(session_, sftp_)};
        }
        return static_cast<std::size_t>(count);
    }

    auto fstat() -> native_result<remote_attributes> override {
        if (handle_ == nullptr) {
            return native_unexpected{closed_handle()};
        }
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        if (libssh2_sftp_fstat(handle_, &attrs) != 0) {
            return native_unexpected{last_error(session_, sftp_)};
        }
        return to_attributes(attrs);
    }

    auto close() -> native_result<void> override {
        auto* handle = std::exchange(handle_, nullptr);
        if (handle == nullptr) {
            return {};
        }
        if (libssh2_sftp_close_handle(handle) != 0) {
            return native_unexpected{last_error(session_, sftp_)};
        }
        return {};
    }

private:
    static auto closed_handle() -> native_error {
        return native_error{native_origin::session, LIBSSH2_ERROR_BAD_USE, "file handle is closed"};
    }

    LIBSSH2_SESSION* session_;
    LIBSSH2_SFTP* sftp_;
    LIBSSH2_SFTP_HANDLE* handle_;
};

/**
 * @brief Open SFTP directory handle
 */
class libssh2_directory : public remote_directory {
public:
    libssh2_directory(LIBSSH2_SESSION* session, LIBSSH2_SFTP* sftp, LIBSSH2_SFTP_HANDLE* handle)
        : session_(session), sftp_(sftp), handle_(handle) {}

    ~libssh2_directory() override {
        if (handle_ != nullptr) {
            libssh2_sftp_close_handle(handle_);
        }
    }

    auto read_entry() -> native_result<std::optional<directory_entry>> override {
        if (handle_ == nullptr) {
            return native_unexpected{native_error{
                native_origin::session, LIBSSH2_ERROR_BAD_USE, "directory handle is closed"}};
        }
        char name[1024];
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        int length = libssh2_sftp_readdir(handle_, name, sizeof(name), &attrs);
        if (length < 0) {
            return native_unexpected{last_error(session_, sftp_)};
        }
        if (length == 0) {
            return std::optional<directory_entry>{};
        }
        directory_entry entry;
        entry.name.assign(name, static_cast<std::size_t>(length));
        entry.attributes = to_attributes(attrs);
        return std::optional<directory_entry>{std::move(entry)};
    }

    auto close() -> native_result<void> override {
        auto* handle = std::exchange(handle_, nullptr);
        if (handle == nullptr) {
            return {};
        }
        if (libssh2_sftp_closedir(handle) != 0) {
            return native_unexpected{last_error(session_, sftp_)};
        }
        return {};
    }

private:
    LIBSSH2_SESSION* session_;
    LIBSSH2_SFTP* sftp_;
    LIBSSH2_SFTP_HANDLE* handle_;
};

}  // namespace

struct libssh2_session::impl {
    int socket{-1};
    LIBSSH2_SESSION* session{nullptr};
    LIBSSH2_SFTP* sftp{nullptr};
    std::chrono::milliseconds timeout{0};
    keyboard_interactive_context credentials;

    [[nodiscard]] auto require_sftp() const -> native_result<void> {
        if (sftp == nullptr) {
            return native_unexpected{native_error{
                native_origin::session, LIBSSH2_ERROR_BAD_USE, "SFTP channel is not open"}};
        }
        return {};
    }
};

libssh2_session::libssh2_session() : impl_(std::make_unique<impl>()) {}

libssh2_session::~libssh2_session() {
    release_sftp();
    release_session();
    release_socket();
}

auto libssh2_session::open_socket(const std::string& host,
                                  uint16_t port,
                                  std::chrono::milliseconds timeout) -> native_result<void> {
    release_socket();
    impl_->timeout = timeout;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* found = nullptr;
    auto port_text = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), port_text.c_str(), &hints, &found);
    if (rc != 0) {
        return native_unexpected{native_error{native_origin::system, rc, ::gai_strerror(rc)}};
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(found, &::freeaddrinfo);

    native_error failure{native_origin::system, EHOSTUNREACH, "no usable address"};
    for (auto* candidate = addresses.get(); candidate != nullptr; candidate = candidate->ai_next) {
        int fd = ::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);
        if (fd < 0) {
            failure = error_mapper::last_system_error();
            continue;
        }
        auto connected = connect_with_timeout(fd, candidate->ai_addr, candidate->ai_addrlen, timeout);
        if (connected) {
            impl_->socket = fd;
            return {};
        }
        failure = connected.error();
        ::close(fd);
    }

    SFTP_LOG_DEBUG(log_category::session,
        "TCP connect to " + host + ":" + port_text + " failed: " + failure.message);
    return native_unexpected{std::move(failure)};
}

auto libssh2_session::init_session() -> native_result<void> {
    auto ready = ensure_library();
    if (!ready) {
        return ready;
    }

    release_session();
    impl_->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, &impl_->credentials);
    if (impl_->session == nullptr) {
        return native_unexpected{native_error{
            native_origin::session, LIBSSH2_ERROR_ALLOC, "libssh2_session_init failed"}};
    }

    libssh2_session_set_blocking(impl_->session, 1);
    libssh2_session_set_timeout(impl_->session, static_cast<long>(impl_->timeout.count()));
    return {};
}

auto libssh2_session::handshake() -> native_result<void> {
    if (impl_->session == nullptr || impl_->socket < 0) {
        return native_unexpected{session_error(impl_->session)};
    }
    if (libssh2_session_handshake(impl_->session, impl_->socket) != 0) {
        return native_unexpected{session_error(impl_->session)};
    }
    return {};
}

auto libssh2_session::authenticate(const std::string& username,
                                   const std::string& password) -> native_result<void> {
    if (impl_->session == nullptr) {
        return native_unexpected{session_error(nullptr)};
    }

    int rc = libssh2_userauth_password(impl_->session, username.c_str(), password.c_str());
    if (rc == 0) {
        return {};
    }
    auto password_failure = session_error(impl_->session);

    // The server dropped the connection; nothing else can succeed
    if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc == LIBSSH2_ERROR_SOCKET_SEND ||
        rc == LIBSSH2_ERROR_SOCKET_RECV) {
        return native_unexpected{std::move(password_failure)};
    }

    const char* methods = libssh2_userauth_list(
        impl_->session, username.c_str(), static_cast<unsigned int>(username.size()));
    if (methods == nullptr ||
        std::string_view(methods).find("keyboard-interactive") == std::string_view::npos) {
        return native_unexpected{std::move(password_failure)};
    }

    SFTP_LOG_DEBUG(log_category::session,
        "Password authentication rejected, trying keyboard-interactive");
    impl_->credentials.password = password;
    rc = libssh2_userauth_keyboard_interactive(impl_->session, username.c_str(),
                                               &answer_with_password);
    impl_->credentials.password.clear();
    if (rc != 0) {
        return native_unexpected{session_error(impl_->session)};
    }
    return {};
}

auto libssh2_session::init_sftp() -> native_result<void> {
    if (impl_->session == nullptr) {
        return native_unexpected{session_error(nullptr)};
    }
    release_sftp();
    impl_->sftp = libssh2_sftp_init(impl_->session);
    if (impl_->sftp == nullptr) {
        return native_unexpected{session_error(impl_->session)};
    }
    return {};
}

void libssh2_session::release_sftp() noexcept {
    if (impl_->sftp != nullptr) {
        libssh2_sftp_shutdown(impl_->sftp);
        impl_->sftp = nullptr;
    }
}

void libssh2_session::release_session() noexcept {
    if (impl_->session != nullptr) {
        libssh2_session_disconnect(impl_->session, "Normal shutdown");
        libssh2_session_free(impl_->session);
        impl_->session = nullptr;
    }
}

void libssh2_session::release_socket() noexcept {
    if (impl_->socket >= 0) {
        ::close(impl_->socket);
        impl_->socket = -1;
    }
}

auto libssh2_session::stat(const std::string& path) -> native_result<remote_attributes> {
    auto ready = impl_->require_sftp();
    if (!ready) {
        return native_unexpected{ready.error()};
    }
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    if (libssh2_sftp_stat(impl_->sftp, path.c_str(), &attrs) != 0) {
        return native_unexpected{last_error(impl_->session, impl_->sftp)};
    }
    return to_attributes(attrs);
}

auto libssh2_session::mkdir(const std::string& path, uint32_t mode) -> native_result<void> {
    auto ready = impl_->require_sftp();
    if (!ready) {
        return ready;
    }
    if (libssh2_sftp_mkdir(impl_->sftp, path.c_str(), static_cast<long>(mode)) != 0) {
        return native_unexpected{last_error(impl_->session, impl_->sftp)};
    }
    return {};
}

auto libssh2_session::rename(const std::string& from, const std::string& to)
    -> native_result<void> {
    auto ready = impl_->require_sftp();
    if (!ready) {
        return ready;
    }
    // No LIBSSH2_SFTP_RENAME_OVERWRITE: an existing target makes the rename fail
    int rc = libssh2_sftp_rename_ex(impl_->sftp,
                                    from.c_str(), static_cast<unsigned int>(from.size()),
                                    to.c_str(), static_cast<unsigned int>(to.size()),
                                    LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE);
    if (rc != 0) {
        return native_unexpected{last_error(impl_->session, impl_->sftp)};
    }
    return {};
}

auto libssh2_session::unlink(const std::string& path) -> native_result<void> {
    auto ready = impl_->require_sftp();
    if (!ready) {
        return ready;
    }
    if (libssh2_sftp_unlink(impl_->sftp, path.c_str()) != 0) {
        return native_unexpected{last_error(impl_->session, impl_->sftp)};
    }
    return {};
}

auto libssh2_session::rmdir(const std::string& path) -> native_result<void> {
    auto ready = impl_->require_sftp();
    if (!ready) {
        return ready;
    }
    if (libssh2_sftp_rmdir(impl_->sftp, path.c_str()) != 0) {
        return native_unexpected{last_error(impl_->session, impl_->sftp)};
    }
    return {};
}

auto libssh2_session::open_directory(const std::string& path)
    -> native_result<std::unique_ptr<remote_directory>> {
    auto ready = impl_->require_sftp();
    if (!ready) {
        return native_unexpected{ready.error()};
    }
    auto* handle = libssh2_sftp_opendir(impl_->sftp, path.c_str());
    if (handle == nullptr) {
        return native_unexpected{last_error(impl_->session, impl_->sftp)};
    }
    std::unique_ptr<remote_directory> directory =
        std::make_unique<libssh2_directory>(impl_->session, impl_->sftp, handle);
    return directory;
}

auto libssh2_session::open_file(const std::string& path, open_mode flags, uint32_t mode)
    -> native_result<std::unique_ptr<remote_file>> {
    auto ready = impl_->require_sftp();
    if (!ready) {
        return native_unexpected{ready.error()};
    }

    unsigned long native_flags = 0;
    if (has_flag(flags, open_mode::read)) native_flags |= LIBSSH2_FXF_READ;
    if (has_flag(flags, open_mode::write)) native_flags |= LIBSSH2_FXF_WRITE;
    if (has_flag(flags, open_mode::create)) native_flags |= LIBSSH2_FXF_CREAT;
    if (has_flag(flags, open_mode::truncate)) native_flags |= LIBSSH2_FXF_TRUNC;

    auto* handle = libssh2_sftp_open(impl_->sftp, path.c_str(), native_flags,
                                     static_cast<long>(mode));
    if (handle == nullptr) {
        return native_unexpected{last_error(impl_->session, impl_->sftp)};
    }
    std::unique_ptr<remote_file> file =
        std::make_unique<libssh2_file>(impl_->session, impl_->sftp, handle);
    return file;
}

}  // namespace async_sftp

#endif  // ASYNC_SFTP_HAS_LIBSSH2
