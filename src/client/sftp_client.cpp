/**
 * @file sftp_client.cpp
 * @brief Implementation of sftp_client
 */

#include "async_sftp/client/sftp_client.h"

#include "async_sftp/adapters/executor_adapter.h"
#include "async_sftp/client/connection_manager.h"
#include "async_sftp/client/directory_operations.h"
#include "async_sftp/client/metadata_operations.h"
#include "async_sftp/client/operation_dispatcher.h"
#include "async_sftp/client/transfer_engine.h"
#include "async_sftp/config/feature_flags.h"
#include "async_sftp/core/error_mapper.h"
#include "async_sftp/core/logging.h"

#if ASYNC_SFTP_HAS_LIBSSH2
#include "async_sftp/session/libssh2_session.h"
#endif

namespace async_sftp {

namespace {

/**
 * @brief Run work against the session once the connection is up
 */
template <typename T, typename Work>
auto when_connected(connection_manager& connection, Work&& work) -> result<T> {
    if (auto ready = connection.require_connected(); !ready) {
        return unexpected{ready.error()};
    }
    return work(connection.session());
}

auto invalid_argument(const std::string& detail) -> error {
    return error_mapper::make(sftp_error_code::invalid_arguments, detail);
}

}  // namespace

// ============================================================================
// sftp_client::impl
// ============================================================================

struct sftp_client::impl {
    impl(connection_config config, std::unique_ptr<session_interface> session)
        : connection(config, std::move(session)),
          worker(adapters::executor_factory::create("async_sftp_worker")),
          delivery(adapters::executor_factory::create("async_sftp_delivery")),
          dispatcher(worker, delivery),
          engine(config.chunk_size, config.progress_interval, delivery) {}

    connection_manager connection;
    std::shared_ptr<adapters::serial_executor_interface> worker;
    std::shared_ptr<adapters::serial_executor_interface> delivery;
    operation_dispatcher dispatcher;
    transfer_engine engine;
};

// ============================================================================
// sftp_client::builder
// ============================================================================

sftp_client::builder::builder() = default;

auto sftp_client::builder::with_host(std::string host) -> builder& {
    config_.host = std::move(host);
    return *this;
}

auto sftp_client::builder::with_port(uint16_t port) -> builder& {
    config_.port = port;
    return *this;
}

auto sftp_client::builder::with_credentials(std::string username, std::string password)
    -> builder& {
    config_.username = std::move(username);
    config_.password = std::move(password);
    return *this;
}

auto sftp_client::builder::with_connect_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.connect_timeout = timeout;
    return *this;
}

auto sftp_client::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto sftp_client::builder::with_progress_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.progress_interval = interval;
    return *this;
}

auto sftp_client::builder::with_session(std::unique_ptr<session_interface> session) -> builder& {
    session_ = std::move(session);
    return *this;
}

auto sftp_client::builder::with_session_factory(session_factory factory) -> builder& {
    factory_ = std::move(factory);
    return *this;
}

auto sftp_client::builder::build() -> result<sftp_client> {
    if (config_.chunk_size < min_chunk_size || config_.chunk_size > max_chunk_size) {
        return unexpected{error{sftp_error_code::invalid_arguments,
                                "Chunk size must be between 1KB and 4MB"}};
    }
    if (config_.connect_timeout.count() <= 0) {
        return unexpected{error{sftp_error_code::invalid_arguments,
                                "Connect timeout must be positive"}};
    }
    if (config_.progress_interval.count() < 0) {
        return unexpected{error{sftp_error_code::invalid_arguments,
                                "Progress interval must not be negative"}};
    }

    auto session = std::move(session_);
    if (!session && factory_) {
        session = factory_();
    }
    if (!session) {
#if ASYNC_SFTP_HAS_LIBSSH2
        session = std::make_unique<libssh2_session>();
#else
        return unexpected{error{sftp_error_code::invalid_arguments,
                                "No session backend: libssh2 support is not built in"}};
#endif
    }

    return sftp_client{std::move(config_), std::move(session)};
}

// ============================================================================
// sftp_client implementation
// ============================================================================

sftp_client::sftp_client(connection_config config, std::unique_ptr<session_interface> session)
    : impl_(std::make_unique<impl>(std::move(config), std::move(session))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

sftp_client::sftp_client(sftp_client&&) noexcept = default;
auto sftp_client::operator=(sftp_client&& other) noexcept -> sftp_client& {
    if (this != &other) {
        if (impl_) {
            disconnect();
            impl_->dispatcher.shutdown();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

sftp_client::~sftp_client() {
    if (impl_) {
        disconnect();
        impl_->dispatcher.shutdown();
    }
}

auto sftp_client::connect(completion_callback<void> on_complete)
    -> std::future<result<void>> {
    if (auto valid = impl_->connection.validate(); !valid) {
        return impl_->dispatcher.reject<void>("connect", valid.error(), std::move(on_complete));
    }

    auto* self = impl_.get();
    return self->dispatcher.dispatch<void>(
        "connect", [self]() { return self->connection.establish(); }, std::move(on_complete));
}

void sftp_client::disconnect() {
    if (!impl_) {
        return;
    }
    if (impl_->connection.state() == connection_state::disconnected &&
        !impl_->dispatcher.is_busy()) {
        return;
    }

    auto* self = impl_.get();
    self->dispatcher.run_exclusive("disconnect", [self]() { self->connection.teardown(); });
}

auto sftp_client::is_connected() const -> bool {
    return impl_ && impl_->connection.is_connected();
}

auto sftp_client::state() const -> connection_state {
    return impl_ ? impl_->connection.state() : connection_state::disconnected;
}

auto sftp_client::list_files(const std::string& path,
                             completion_callback<std::vector<file_metadata>> on_complete)
    -> std::future<result<std::vector<file_metadata>>> {
    using value_type = std::vector<file_metadata>;
    if (path.empty()) {
        return impl_->dispatcher.reject<value_type>("list_files", invalid_argument("path is empty"),
                                                    std::move(on_complete));
    }

    auto* self = impl_.get();
    return self->dispatcher.dispatch<value_type>(
        "list_files",
        [self, path]() {
            return when_connected<value_type>(self->connection, [&](session_interface& session) {
                return directory_operations(session).list_files(path);
            });
        },
        std::move(on_complete));
}

auto sftp_client::make_directory(const std::string& path,
                                 completion_callback<file_metadata> on_complete)
    -> std::future<result<file_metadata>> {
    if (path.empty()) {
        return impl_->dispatcher.reject<file_metadata>(
            "make_directory", invalid_argument("path is empty"), std::move(on_complete));
    }

    auto* self = impl_.get();
    return self->dispatcher.dispatch<file_metadata>(
        "make_directory",
        [self, path]() {
            return when_connected<file_metadata>(self->connection, [&](session_interface& session) {
                return directory_operations(session).make_directory(path);
            });
        },
        std::move(on_complete));
}

auto sftp_client::rename(const std::string& old_path,
                         const std::string& new_path,
                         completion_callback<file_metadata> on_complete)
    -> std::future<result<file_metadata>> {
    if (old_path.empty() || new_path.empty()) {
        return impl_->dispatcher.reject<file_metadata>(
            "rename", invalid_argument("source and target paths are required"),
            std::move(on_complete));
    }

    auto* self = impl_.get();
    return self->dispatcher.dispatch<file_metadata>(
        "rename",
        [self, old_path, new_path]() {
            return when_connected<file_metadata>(self->connection, [&](session_interface& session) {
                return metadata_operations(session).rename(old_path, new_path);
            });
        },
        std::move(on_complete));
}

auto sftp_client::remove_file(const std::string& path, completion_callback<void> on_complete)
    -> std::future<result<void>> {
    if (path.empty()) {
        return impl_->dispatcher.reject<void>("remove_file", invalid_argument("path is empty"),
                                              std::move(on_complete));
    }

    auto* self = impl_.get();
    return self->dispatcher.dispatch<void>(
        "remove_file",
        [self, path]() {
            return when_connected<void>(self->connection, [&](session_interface& session) {
                return metadata_operations(session).remove_file(path);
            });
        },
        std::move(on_complete));
}

auto sftp_client::remove_directory(const std::string& path,
                                   completion_callback<void> on_complete)
    -> std::future<result<void>> {
    if (path.empty()) {
        return impl_->dispatcher.reject<void>("remove_directory", invalid_argument("path is empty"),
                                              std::move(on_complete));
    }

    auto* self = impl_.get();
    return self->dispatcher.dispatch<void>(
        "remove_directory",
        [self, path]() {
            return when_connected<void>(self->connection, [&](session_interface& session) {
                return metadata_operations(session).remove_directory(path);
            });
        },
        std::move(on_complete));
}

auto sftp_client::stat(const std::string& path, completion_callback<file_metadata> on_complete)
    -> std::future<result<file_metadata>> {
    if (path.empty()) {
        return impl_->dispatcher.reject<file_metadata>("stat", invalid_argument("path is empty"),
                                                       std::move(on_complete));
    }

    auto* self = impl_.get();
    return self->dispatcher.dispatch<file_metadata>(
        "stat",
        [self, path]() {
            return when_connected<file_metadata>(self->connection, [&](session_interface& session) {
                return metadata_operations(session).stat(path);
            });
        },
        std::move(on_complete));
}

auto sftp_client::download(const std::string& remote_path,
                           const std::filesystem::path& local_path,
                           progress_callback progress,
                           completion_callback<transfer_result> on_complete,
                           cancellation_token token)
    -> std::future<result<transfer_result>> {
    if (remote_path.empty() || local_path.empty()) {
        return impl_->dispatcher.reject<transfer_result>(
            "download", invalid_argument("remote and local paths are required"),
            std::move(on_complete));
    }

    auto* self = impl_.get();
    return self->dispatcher.dispatch<transfer_result>(
        "download",
        [self, remote_path, local_path, progress = std::move(progress), token]() {
            return when_connected<transfer_result>(
                self->connection, [&](session_interface& session) {
                    return self->engine.download(session, remote_path, local_path, progress,
                                                 token);
                });
        },
        std::move(on_complete), token);
}

auto sftp_client::upload(const std::string& remote_path,
                         const std::filesystem::path& local_path,
                         progress_callback progress,
                         completion_callback<transfer_result> on_complete,
                         cancellation_token token)
    -> std::future<result<transfer_result>> {
    if (remote_path.empty() || local_path.empty()) {
        return impl_->dispatcher.reject<transfer_result>(
            "upload", invalid_argument("remote and local paths are required"),
            std::move(on_complete));
    }

    auto* self = impl_.get();
    return self->dispatcher.dispatch<transfer_result>(
        "upload",
        [self, remote_path, local_path, progress = std::move(progress), token]() {
            return when_connected<transfer_result>(
                self->connection, [&](session_interface& session) {
                    return self->engine.upload(session, remote_path, local_path, progress, token);
                });
        },
        std::move(on_complete), token);
}

void sftp_client::cancel_transfer() {
    if (impl_) {
        impl_->dispatcher.cancel_active();
    }
}

auto sftp_client::config() const -> const connection_config& {
    return impl_->connection.config();
}

}  // namespace async_sftp
