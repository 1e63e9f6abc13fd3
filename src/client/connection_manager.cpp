/**
 * @file connection_manager.cpp
 * @brief Implementation of the connection state machine
 */

#include "async_sftp/client/connection_manager.h"

#include <array>
#include <chrono>
#include <functional>

#include "async_sftp/core/error_mapper.h"
#include "async_sftp/core/logging.h"

namespace async_sftp {

namespace {

struct connect_stage {
    const char* name;
    sftp_error_code kind;
    std::function<native_result<void>()> run;
};

}  // namespace

connection_manager::connection_manager(connection_config config,
                                       std::unique_ptr<session_interface> session)
    : config_(std::move(config)), session_(std::move(session)) {}

connection_manager::~connection_manager() {
    teardown();
}

auto connection_manager::validate() const -> result<void> {
    if (config_.host.empty()) {
        return unexpected{error_mapper::make(sftp_error_code::invalid_arguments, "host is empty")};
    }
    if (config_.port == 0) {
        return unexpected{error_mapper::make(sftp_error_code::invalid_arguments, "port is 0")};
    }
    if (config_.username.empty()) {
        return unexpected{
            error_mapper::make(sftp_error_code::invalid_arguments, "username is empty")};
    }
    if (config_.password.empty()) {
        return unexpected{
            error_mapper::make(sftp_error_code::invalid_arguments, "password is empty")};
    }
    if (!session_) {
        return unexpected{
            error_mapper::make(sftp_error_code::invalid_arguments, "no session backend")};
    }
    return {};
}

auto connection_manager::establish() -> result<void> {
    if (auto valid = validate(); !valid) {
        return valid;
    }

    auto current = state_.load();
    if (current == connection_state::connected || current == connection_state::connecting) {
        SFTP_LOG_WARN(log_category::connection,
            std::string("Connect rejected, connection is ") + to_string(current));
        return unexpected{error{sftp_error_code::already_connected}};
    }

    state_.store(connection_state::connecting);

    sftp_log_context ctx;
    ctx.host = config_.host;
    ctx.port = config_.port;
    ctx.operation = "connect";
    SFTP_LOG_INFO_CTX(log_category::connection, "Connecting", ctx);

    auto started = std::chrono::steady_clock::now();
    const std::array<connect_stage, 5> stages{{
        {"open_socket", sftp_error_code::unable_to_connect,
         [this] {
             return session_->open_socket(config_.host, config_.port, config_.connect_timeout);
         }},
        {"init_session", sftp_error_code::unable_to_initialize_session,
         [this] { return session_->init_session(); }},
        {"handshake", sftp_error_code::handshake_failed,
         [this] { return session_->handshake(); }},
        {"authenticate", sftp_error_code::authentication_failed,
         [this] { return session_->authenticate(config_.username, config_.password); }},
        {"init_sftp", sftp_error_code::unable_to_initialize_sftp,
         [this] { return session_->init_sftp(); }},
    }};

    for (const auto& stage : stages) {
        auto outcome = stage.run();
        if (!outcome) {
            auto failure = error_mapper::map(stage.kind, outcome.error());
            ctx.error_code = to_int(failure.code);
            ctx.error_message = failure.message;
            SFTP_LOG_ERROR_CTX(log_category::connection,
                std::string("Connect failed at stage ") + stage.name, ctx);
            release_all();
            state_.store(connection_state::disconnected);
            return unexpected{std::move(failure)};
        }
        SFTP_LOG_DEBUG(log_category::connection, std::string("Stage done: ") + stage.name);
    }

    state_.store(connection_state::connected);
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)
            .count());
    SFTP_LOG_INFO_CTX(log_category::connection, "Connected", ctx);
    return {};
}

void connection_manager::teardown() noexcept {
    auto previous = state_.exchange(connection_state::disconnecting);
    if (previous == connection_state::disconnected) {
        state_.store(connection_state::disconnected);
        return;
    }
    release_all();
    state_.store(connection_state::disconnected);
    SFTP_LOG_INFO(log_category::connection, "Disconnected from " + config_.host);
}

void connection_manager::release_all() noexcept {
    if (!session_) {
        return;
    }
    session_->release_sftp();
    session_->release_session();
    session_->release_socket();
}

auto connection_manager::require_connected() const -> result<void> {
    if (state_.load() != connection_state::connected) {
        return unexpected{error{sftp_error_code::not_connected}};
    }
    return {};
}

auto connection_manager::state() const -> connection_state {
    return state_.load();
}

auto connection_manager::is_connected() const -> bool {
    return state_.load() == connection_state::connected;
}

auto connection_manager::config() const -> const connection_config& {
    return config_;
}

auto connection_manager::session() -> session_interface& {
    return *session_;
}

}  // namespace async_sftp
