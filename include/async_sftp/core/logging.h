// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "async_sftp/config/feature_flags.h"

#if ASYNC_SFTP_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace async_sftp {

/**
 * @brief Log categories for the SFTP client
 */
struct log_category {
    static constexpr std::string_view connection = "async_sftp.connection";
    static constexpr std::string_view dispatcher = "async_sftp.dispatcher";
    static constexpr std::string_view transfer = "async_sftp.transfer";
    static constexpr std::string_view directory = "async_sftp.directory";
    static constexpr std::string_view session = "async_sftp.session";
    static constexpr std::string_view executor = "async_sftp.executor";
};

/**
 * @brief Log levels for the SFTP client
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for masking sensitive values in log output
 */
struct masking_config {
    bool mask_hosts = false;
    bool mask_paths = false;
    std::string mask_char = "*";

    static masking_config all_masked() {
        return {true, true, "*"};
    }

    static masking_config none() {
        return {false, false, "*"};
    }
};

/**
 * @brief Masks host names and remote paths in log records
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask_host(const std::string& host) const -> std::string {
        if (!config_.mask_hosts || host.empty()) {
            return host;
        }
        auto last_dot = host.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(host.size(), config_.mask_char[0]);
        }
        return std::string(last_dot, config_.mask_char[0]) + host.substr(last_dot);
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last_sep = path.find_last_of('/');
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char[0]) + path.substr(last_sep);
    }

    /**
     * @brief Mask absolute paths appearing inside free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths) {
            return input;
        }
        static const std::regex path_pattern(R"((?:\/[a-zA-Z0-9._-]+)+)");

        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;
        std::size_t last_pos = 0;
        for (; it != end; ++it) {
            out += input.substr(last_pos, static_cast<std::size_t>(it->position()) - last_pos);
            out += mask_path(it->str());
            last_pos = static_cast<std::size_t>(it->position() + it->length());
        }
        out += input.substr(last_pos);
        return out;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = std::move(config); }

private:
    masking_config config_;
};

/**
 * @brief Structured context attached to connection and transfer log records
 */
struct sftp_log_context {
    std::string host;
    std::optional<uint16_t> port;
    std::string operation;
    std::string remote_path;
    std::string local_path;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> bytes_total;
    std::optional<uint64_t> duration_ms;
    std::optional<int32_t> error_code;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!host.empty()) add_field("host", masker ? masker->mask_host(host) : host);
        if (port) add_int("port", *port);
        if (!operation.empty()) add_field("operation", operation);
        if (!remote_path.empty()) {
            add_field("remote_path", masker ? masker->mask_path(remote_path) : remote_path);
        }
        if (!local_path.empty()) {
            add_field("local_path", masker ? masker->mask_path(local_path) : local_path);
        }
        if (bytes_transferred) add_int("bytes_transferred", static_cast<int64_t>(*bytes_transferred));
        if (bytes_total) add_int("bytes_total", static_cast<int64_t>(*bytes_total));
        if (duration_ms) add_int("duration_ms", static_cast<int64_t>(*duration_ms));
        if (error_code) add_int("error_code", *error_code);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<sftp_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto make_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Logger used by every component of the client
 *
 * Writes to stderr, or forwards to logger_system when it is linked in.
 * Callbacks receive every record above the level filter regardless of sink.
 */
class sftp_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const sftp_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    sftp_logger() = default;
    ~sftp_logger() = default;

    sftp_logger(const sftp_logger&) = delete;
    sftp_logger& operator=(const sftp_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called when an sftp_client is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if ASYNC_SFTP_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (built) {
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#if ASYNC_SFTP_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if ASYNC_SFTP_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    /**
     * @brief Suppress the stderr sink (callbacks still fire)
     */
    void set_console_output(bool enable) { console_output_.store(enable); }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const sftp_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = structured_log_entry::make_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;

            std::string json_str = entry.to_json_with_masking(&masker);
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                if (json_callback_) {
                    json_callback_(entry, json_str);
                }
            }
            emit(level, json_str, file, line, function);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            emit(level, oss.str(), file, line, function);
        }
    }

    void flush() {
#if ASYNC_SFTP_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit(log_level level,
              const std::string& text,
              [[maybe_unused]] const char* file,
              [[maybe_unused]] int line,
              [[maybe_unused]] const char* function) {
#if ASYNC_SFTP_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
            return;
        }
#endif
        if (!console_output_.load()) {
            return;
        }
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << get_timestamp() << " [" << log_level_to_string(level) << "] "
                  << text << "\n";
    }

#if ASYNC_SFTP_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline sftp_logger& get_logger() {
    static sftp_logger instance;
    return instance;
}

#define SFTP_LOG(level, category, message) \
    async_sftp::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define SFTP_LOG_CTX(level, category, message, context) \
    async_sftp::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define SFTP_LOG_TRACE(category, message) \
    SFTP_LOG(async_sftp::log_level::trace, category, message)

#define SFTP_LOG_DEBUG(category, message) \
    SFTP_LOG(async_sftp::log_level::debug, category, message)

#define SFTP_LOG_INFO(category, message) \
    SFTP_LOG(async_sftp::log_level::info, category, message)

#define SFTP_LOG_WARN(category, message) \
    SFTP_LOG(async_sftp::log_level::warn, category, message)

#define SFTP_LOG_ERROR(category, message) \
    SFTP_LOG(async_sftp::log_level::error, category, message)

#define SFTP_LOG_DEBUG_CTX(category, message, ctx) \
    SFTP_LOG_CTX(async_sftp::log_level::debug, category, message, ctx)

#define SFTP_LOG_INFO_CTX(category, message, ctx) \
    SFTP_LOG_CTX(async_sftp::log_level::info, category, message, ctx)

#define SFTP_LOG_WARN_CTX(category, message, ctx) \
    SFTP_LOG_CTX(async_sftp::log_level::warn, category, message, ctx)

#define SFTP_LOG_ERROR_CTX(category, message, ctx) \
    SFTP_LOG_CTX(async_sftp::log_level::error, category, message, ctx)

}  // namespace async_sftp
