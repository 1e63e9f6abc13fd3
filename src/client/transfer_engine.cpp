/**
 * @file transfer_engine.cpp
 * @brief Implementation of chunked upload and download
 */

#include "async_sftp/client/transfer_engine.h"

#include <algorithm>
#include <fstream>
#include <span>
#include <system_error>
#include <vector>

#include "async_sftp/client/progress_reporter.h"
#include "async_sftp/core/error_mapper.h"
#include "async_sftp/core/logging.h"

namespace async_sftp {

namespace {

/**
 * @brief State of one transfer call
 */
struct transfer_context {
    transfer_direction direction;
    std::string remote_path;
    std::filesystem::path local_path;
    uint64_t bytes_transferred{0};
    uint64_t bytes_total{0};
    cancellation_token token;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;

    [[nodiscard]] auto log_context() const -> sftp_log_context {
        sftp_log_context ctx;
        ctx.operation = to_string(direction);
        ctx.remote_path = remote_path;
        ctx.local_path = local_path.string();
        ctx.bytes_transferred = bytes_transferred;
        ctx.bytes_total = bytes_total;
        return ctx;
    }

    [[nodiscard]] auto make_result(const remote_attributes& attrs) -> transfer_result {
        finished_at = std::chrono::system_clock::now();
        transfer_result result;
        result.file = file_metadata::from_attributes(remote_path, attrs);
        result.started_at = started_at;
        result.finished_at = finished_at;
        result.bytes_transferred = bytes_transferred;
        return result;
    }
};

void close_quietly(remote_file& file, const transfer_context& ctx) {
    auto closed = file.close();
    if (!closed) {
        SFTP_LOG_DEBUG(log_category::transfer,
            "Ignoring close failure on " + ctx.remote_path + ": " +
                error_mapper::describe(closed.error()));
    }
}

auto fail(const transfer_context& ctx, error failure) -> result<transfer_result> {
    auto log_ctx = ctx.log_context();
    log_ctx.error_code = to_int(failure.code);
    log_ctx.error_message = failure.message;
    if (failure.code == sftp_error_code::cancelled_by_user) {
        SFTP_LOG_INFO_CTX(log_category::transfer, "Transfer cancelled", log_ctx);
    } else {
        SFTP_LOG_ERROR_CTX(log_category::transfer, "Transfer failed", log_ctx);
    }
    return unexpected{std::move(failure)};
}

auto cancelled() -> error {
    return error{sftp_error_code::cancelled_by_user};
}

}  // namespace

transfer_engine::transfer_engine(std::size_t chunk_size,
                                 std::chrono::milliseconds progress_interval,
                                 std::shared_ptr<adapters::serial_executor_interface> delivery)
    : chunk_size_(chunk_size),
      progress_interval_(progress_interval),
      delivery_(std::move(delivery)) {}

auto transfer_engine::chunk_size() const -> std::size_t {
    return chunk_size_;
}

// ============================================================================
// Download
// ============================================================================

auto transfer_engine::download(session_interface& session,
                               const std::string& remote_path,
                               const std::filesystem::path& local_path,
                               const progress_callback& progress,
                               const cancellation_token& token) -> result<transfer_result> {
    transfer_context ctx{transfer_direction::download, remote_path, local_path};
    ctx.token = token;
    ctx.started_at = std::chrono::system_clock::now();

    auto opened = error_mapper::lift(session.open_file(remote_path, open_mode::read, 0),
                                     sftp_error_code::unable_to_open_file);
    if (!opened) {
        return fail(ctx, opened.error());
    }
    auto remote = std::move(opened).value();

    auto attrs = error_mapper::lift(remote->fstat(), sftp_error_code::unable_to_stat_file);
    if (!attrs) {
        close_quietly(*remote, ctx);
        return fail(ctx, attrs.error());
    }
    if (!attrs.value().size) {
        close_quietly(*remote, ctx);
        return fail(ctx, error_mapper::make(sftp_error_code::unable_to_stat_file,
                                            "server did not report a size"));
    }
    ctx.bytes_total = *attrs.value().size;

    std::ofstream local(local_path, std::ios::binary | std::ios::trunc);
    if (!local) {
        close_quietly(*remote, ctx);
        return fail(ctx, error_mapper::map(sftp_error_code::unable_to_open_local_file_for_writing,
                                           error_mapper::last_system_error()));
    }

    auto abandon = [&](error failure) {
        close_quietly(*remote, ctx);
        local.close();
        if (failure.code == sftp_error_code::cancelled_by_user) {
            std::error_code ec;
            std::filesystem::remove(local_path, ec);
        }
        return fail(ctx, std::move(failure));
    };

    auto start_ctx = ctx.log_context();
    SFTP_LOG_INFO_CTX(log_category::transfer, "Download started", start_ctx);

    progress_reporter reporter(delivery_, progress, token, progress_interval_);
    std::vector<std::byte> buffer(chunk_size_);

    while (ctx.bytes_transferred < ctx.bytes_total) {
        if (token.is_cancelled()) {
            return abandon(cancelled());
        }

        auto wanted = static_cast<std::size_t>(
            std::min<uint64_t>(chunk_size_, ctx.bytes_total - ctx.bytes_transferred));
        auto read = error_mapper::lift(remote->read(std::span<std::byte>(buffer.data(), wanted)),
                                       sftp_error_code::unable_to_read_file);
        if (!read) {
            return abandon(read.error());
        }
        if (read.value() == 0) {
            return abandon(error_mapper::make(sftp_error_code::unable_to_read_file,
                                            "unexpected end of file at " +
                                                std::to_string(ctx.bytes_transferred)));
        }

        local.write(reinterpret_cast<const char*>(buffer.data()),
                    static_cast<std::streamsize>(read.value()));
        if (!local) {
            return abandon(error_mapper::map(sftp_error_code::unable_to_write_file,
                                           error_mapper::last_system_error()));
        }

        ctx.bytes_transferred += read.value();
        reporter.report(ctx.bytes_transferred, ctx.bytes_total);
    }

    if (token.is_cancelled()) {
        return abandon(cancelled());
    }

    local.close();
    if (!local) {
        return abandon(error_mapper::map(sftp_error_code::unable_to_write_file,
                                       error_mapper::last_system_error()));
    }

    auto closed = error_mapper::lift(remote->close(), sftp_error_code::unable_to_close_file);
    if (!closed) {
        return fail(ctx, closed.error());
    }

    reporter.finish(ctx.bytes_transferred, ctx.bytes_total);
    auto outcome = ctx.make_result(attrs.value());

    auto log_ctx = ctx.log_context();
    log_ctx.duration_ms = static_cast<uint64_t>(outcome.duration().count());
    SFTP_LOG_INFO_CTX(log_category::transfer, "Download completed", log_ctx);
    return outcome;
}

// ============================================================================
// Upload
// ============================================================================

auto transfer_engine::upload(session_interface& session,
                             const std::string& remote_path,
                             const std::filesystem::path& local_path,
                             const progress_callback& progress,
                             const cancellation_token& token) -> result<transfer_result> {
    transfer_context ctx{transfer_direction::upload, remote_path, local_path};
    ctx.token = token;
    ctx.started_at = std::chrono::system_clock::now();

    std::ifstream local(local_path, std::ios::binary);
    if (!local) {
        return fail(ctx, error_mapper::map(sftp_error_code::unable_to_open_local_file_for_reading,
                                           error_mapper::last_system_error()));
    }

    std::error_code ec;
    auto local_size = std::filesystem::file_size(local_path, ec);
    if (ec) {
        return fail(ctx, error_mapper::map(sftp_error_code::unable_to_stat_file, ec));
    }
    ctx.bytes_total = static_cast<uint64_t>(local_size);

    auto opened = error_mapper::lift(
        session.open_file(remote_path, open_mode::write | open_mode::create | open_mode::truncate,
                          default_file_mode),
        sftp_error_code::unable_to_open_file);
    if (!opened) {
        return fail(ctx, opened.error());
    }
    auto remote = std::move(opened).value();

    auto abandon = [&](error failure) {
        close_quietly(*remote, ctx);
        return fail(ctx, std::move(failure));
    };

    auto start_ctx = ctx.log_context();
    SFTP_LOG_INFO_CTX(log_category::transfer, "Upload started", start_ctx);

    progress_reporter reporter(delivery_, progress, token, progress_interval_);
    std::vector<std::byte> buffer(chunk_size_);

    while (ctx.bytes_transferred < ctx.bytes_total) {
        if (token.is_cancelled()) {
            return abandon(cancelled());
        }

        auto wanted = static_cast<std::size_t>(
            std::min<uint64_t>(chunk_size_, ctx.bytes_total - ctx.bytes_transferred));
        local.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(wanted));
        auto bytes_read = static_cast<std::size_t>(local.gcount());
        if (bytes_read == 0) {
            return abandon(error_mapper::make(sftp_error_code::unable_to_read_file,
                                            "local file ended at " +
                                                std::to_string(ctx.bytes_transferred)));
        }

        // A write may accept fewer bytes than offered
        std::size_t offset = 0;
        while (offset < bytes_read) {
            auto written = error_mapper::lift(
                remote->write(std::span<const std::byte>(buffer.data() + offset,
                                                         bytes_read - offset)),
                sftp_error_code::unable_to_write_file);
            if (!written) {
                return abandon(written.error());
            }
            if (written.value() == 0) {
                return abandon(error_mapper::make(sftp_error_code::unable_to_write_file,
                                                "server accepted no data"));
            }
            offset += written.value();
        }

        ctx.bytes_transferred += bytes_read;
        reporter.report(ctx.bytes_transferred, ctx.bytes_total);
    }

    if (token.is_cancelled()) {
        return abandon(cancelled());
    }

    auto attrs = error_mapper::lift(remote->fstat(), sftp_error_code::unable_to_stat_file);
    if (!attrs) {
        return abandon(attrs.error());
    }

    auto closed = error_mapper::lift(remote->close(), sftp_error_code::unable_to_close_file);
    if (!closed) {
        return fail(ctx, closed.error());
    }

    reporter.finish(ctx.bytes_transferred, ctx.bytes_total);
    auto outcome = ctx.make_result(attrs.value());

    auto log_ctx = ctx.log_context();
    log_ctx.duration_ms = static_cast<uint64_t>(outcome.duration().count());
    SFTP_LOG_INFO_CTX(log_category::transfer, "Upload completed", log_ctx);
    return outcome;
}

}  // namespace async_sftp
