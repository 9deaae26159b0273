// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/cloud_sync/config/feature_flags.h"

// logger_system integration requires common_system
#if KCENON_WITH_LOGGER_SYSTEM
#define CLOUD_SYNC_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::cloud_sync {

/**
 * @brief Log categories for the sync engine
 */
struct log_category {
    static constexpr std::string_view engine = "cloud_sync.engine";
    static constexpr std::string_view index = "cloud_sync.index";
    static constexpr std::string_view registry = "cloud_sync.registry";
    static constexpr std::string_view transfer = "cloud_sync.transfer";
    static constexpr std::string_view watchdog = "cloud_sync.watchdog";
    static constexpr std::string_view gather = "cloud_sync.gather";
    static constexpr std::string_view structural = "cloud_sync.structural";
    static constexpr std::string_view backend = "cloud_sync.backend";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

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

/**
 * @brief Output format for log lines
 */
enum class log_format {
    text,   ///< Timestamp, level, category, message, context as JSON
    json    ///< One JSON object per line
};

/**
 * @brief Logger settings applied when an engine is built
 */
struct log_settings {
    log_level level = log_level::info;
    log_format format = log_format::text;

    /// Item paths are user data. When set, only their last component is
    /// written out, in contexts and in quoted spans of messages.
    bool mask_paths = false;
};

// Replaces every directory component with "***", keeping the last one:
// "Documents/tax/return.pdf" becomes "***/***/return.pdf".
inline auto mask_path(std::string_view path) -> std::string {
    auto last_sep = path.find_last_of('/');
    if (last_sep == std::string_view::npos) {
        return std::string(path);
    }

    std::string out;
    std::size_t start = 0;
    while (start <= last_sep) {
        auto sep = path.find('/', start);
        out += sep == start ? "" : "***";
        out += '/';
        start = sep + 1;
    }
    out += path.substr(last_sep + 1);
    return out;
}

/**
 * @brief Mask the paths engine messages carry between single quotes
 */
inline auto mask_quoted_paths(std::string_view message) -> std::string {
    std::string out;
    std::size_t pos = 0;
    while (pos < message.size()) {
        auto open = message.find('\'', pos);
        if (open == std::string_view::npos) {
            break;
        }
        auto close = message.find('\'', open + 1);
        if (close == std::string_view::npos) {
            break;
        }
        out += message.substr(pos, open + 1 - pos);
        out += mask_path(message.substr(open + 1, close - open - 1));
        out += '\'';
        pos = close + 1;
    }
    out += message.substr(pos);
    return out;
}

namespace detail {

inline void append_json_string(std::ostringstream& oss, std::string_view value) {
    oss << '"';
    for (char c : value) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n";  break;
            case '\r': oss << "\\r";  break;
            case '\t': oss << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    oss << buf;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
}

}  // namespace detail

/**
 * @brief Structured log context for sync operations
 */
struct sync_log_context {
    std::string operation_id;
    std::string path;
    std::optional<std::string> operation;       ///< "download", "upload", "gather", ...
    std::optional<uint32_t> attempt;
    std::optional<uint32_t> max_attempts;
    std::optional<uint64_t> duration_ms;
    std::optional<uint64_t> item_count;
    std::optional<std::string> error_code;
    std::optional<std::string> error_message;

    /**
     * @brief Write the set fields as JSON members, without braces
     */
    void append_members(std::ostringstream& oss, bool mask, bool leading_comma) const {
        bool first = !leading_comma;
        auto key = [&](const char* name) {
            if (!first) oss << ",";
            oss << '"' << name << "\":";
            first = false;
        };

        if (!operation_id.empty()) { key("operation_id"); detail::append_json_string(oss, operation_id); }
        if (!path.empty()) { key("path"); detail::append_json_string(oss, mask ? mask_path(path) : path); }
        if (operation) { key("operation"); detail::append_json_string(oss, *operation); }
        if (attempt) { key("attempt"); oss << *attempt; }
        if (max_attempts) { key("max_attempts"); oss << *max_attempts; }
        if (duration_ms) { key("duration_ms"); oss << *duration_ms; }
        if (item_count) { key("item_count"); oss << *item_count; }
        if (error_code) { key("error_code"); detail::append_json_string(oss, *error_code); }
        if (error_message) {
            key("error_message");
            detail::append_json_string(oss, mask ? mask_quoted_paths(*error_message)
                                                 : *error_message);
        }
    }

    [[nodiscard]] auto to_json(bool mask = false) const -> std::string {
        std::ostringstream oss;
        oss << "{";
        append_members(oss, mask, false);
        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Sync engine logging facility
 *
 * Writes to kcenon logger_system when it is integrated, otherwise to stderr.
 * A callback, when set, receives every formatted line as well.
 */
class sync_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view category,
                                            const std::string& line)>;

    sync_logger() = default;
    ~sync_logger() = default;

    sync_logger(const sync_logger&) = delete;
    sync_logger& operator=(const sync_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     * Called when an engine instance is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef CLOUD_SYNC_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#ifdef CLOUD_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void configure(const log_settings& settings) {
        set_level(settings.level);
        format_.store(settings.format);
        mask_paths_.store(settings.mask_paths);
    }

    [[nodiscard]] auto settings() const -> log_settings {
        return log_settings{min_level_.load(), format_.load(), mask_paths_.load()};
    }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef CLOUD_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const sync_log_context* context = nullptr) {
        if (!is_enabled(level)) return;

        auto line = format(level, category, message, context);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, line);
            }
        }

#ifdef CLOUD_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), line);
        }
#else
        output_to_stderr(line);
#endif
    }

    void flush() {
#ifdef CLOUD_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    auto format(log_level level,
                std::string_view category,
                std::string_view message,
                const sync_log_context* context) const -> std::string {
        const bool mask = mask_paths_.load();
        const std::string text = mask ? mask_quoted_paths(message) : std::string(message);

        std::ostringstream oss;
        if (format_.load() == log_format::json) {
            oss << "{\"timestamp\":";
            detail::append_json_string(oss, get_timestamp());
            oss << ",\"level\":\"" << log_level_to_string(level) << "\""
                << ",\"category\":\"" << category << "\",\"message\":";
            detail::append_json_string(oss, text);
            if (context) {
                context->append_members(oss, mask, true);
            }
            oss << "}";
            return oss.str();
        }

#ifndef CLOUD_SYNC_USE_LOGGER_SYSTEM
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << text;
        if (context) {
            oss << " " << context->to_json(mask);
        }
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#ifdef CLOUD_SYNC_USE_LOGGER_SYSTEM
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
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<log_format> format_{log_format::text};
    std::atomic<bool> mask_paths_{false};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;
};

inline sync_logger& get_logger() {
    static sync_logger instance;
    return instance;
}

#define CS_LOG(level, category, message) \
    kcenon::cloud_sync::get_logger().log(level, category, message)

#define CS_LOG_WITH(level, category, message, context) \
    kcenon::cloud_sync::get_logger().log(level, category, message, &context)

#define CS_LOG_TRACE(category, message) \
    CS_LOG(kcenon::cloud_sync::log_level::trace, category, message)

#define CS_LOG_DEBUG(category, message) \
    CS_LOG(kcenon::cloud_sync::log_level::debug, category, message)

#define CS_LOG_INFO(category, message) \
    CS_LOG(kcenon::cloud_sync::log_level::info, category, message)

#define CS_LOG_WARN(category, message) \
    CS_LOG(kcenon::cloud_sync::log_level::warn, category, message)

#define CS_LOG_ERROR(category, message) \
    CS_LOG(kcenon::cloud_sync::log_level::error, category, message)

#define CS_LOG_DEBUG_CTX(category, message, ctx) \
    CS_LOG_WITH(kcenon::cloud_sync::log_level::debug, category, message, ctx)

#define CS_LOG_INFO_CTX(category, message, ctx) \
    CS_LOG_WITH(kcenon::cloud_sync::log_level::info, category, message, ctx)

#define CS_LOG_WARN_CTX(category, message, ctx) \
    CS_LOG_WITH(kcenon::cloud_sync::log_level::warn, category, message, ctx)

#define CS_LOG_ERROR_CTX(category, message, ctx) \
    CS_LOG_WITH(kcenon::cloud_sync::log_level::error, category, message, ctx)

}  // namespace kcenon::cloud_sync
