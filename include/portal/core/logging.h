/**
 * @file logging.h
 * @brief Structured logging for portal sessions
 */

#ifndef PORTAL_CORE_LOGGING_H
#define PORTAL_CORE_LOGGING_H

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

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define PORTAL_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace portal {

/**
 * @brief Log categories
 */
struct log_category {
    static constexpr std::string_view server = "portal.server";
    static constexpr std::string_view session = "portal.session";
    static constexpr std::string_view sender = "portal.sender";
    static constexpr std::string_view receiver = "portal.receiver";
    static constexpr std::string_view codec = "portal.codec";
    static constexpr std::string_view transport = "portal.transport";
    static constexpr std::string_view guard = "portal.guard";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline auto log_level_to_string(log_level level) -> std::string_view {
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

[[nodiscard]] inline auto escape_json(std::string_view input) -> std::string {
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
 * @brief Structured context attached to a log record
 */
struct transfer_log_context {
    std::string session_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_written;
    std::optional<uint64_t> duration_ms;
    std::optional<double> rate_mbps;
    std::optional<std::string> error_message;
    std::optional<std::string> peer_address;

    /**
     * @brief Render the populated fields as one JSON object
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, std::string_view value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!session_id.empty()) add_field("session_id", session_id);
        if (!filename.empty()) add_field("filename", filename);
        if (file_size) add_uint("size", *file_size);
        if (bytes_written) add_uint("bytes_written", *bytes_written);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (rate_mbps) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2) << "\"rate_mbps\":" << *rate_mbps;
            first = false;
        }
        if (error_message) add_field("error_message", *error_message);
        if (peer_address) add_field("peer_address", *peer_address);

        oss << "}";
        return oss.str();
    }
};

enum class log_output_format {
    text,   ///< Human readable single line
    json    ///< One JSON object per line
};

class portal_logger;

portal_logger& get_logger();

/**
 * @brief Process-wide logger
 *
 * Writes to stderr, or to logger_system when the build enables it.
 * A callback sees every record that passes the level filter.
 */
class portal_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    portal_logger() = default;
    ~portal_logger() = default;

    portal_logger(const portal_logger&) = delete;
    portal_logger& operator=(const portal_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Servers and channels call it on construction.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef PORTAL_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (built) {
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#ifdef PORTAL_USE_LOGGER_SYSTEM
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
#ifdef PORTAL_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        output_format_.store(format);
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        return output_format_.load();
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Suppress stderr output while keeping the callback
     */
    void set_quiet(bool quiet) { quiet_.store(quiet); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
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

        if (quiet_.load()) return;

        std::string rendered = output_format_.load() == log_output_format::json
            ? render_json(level, category, message, context, file, line, function)
            : render_text(level, category, message, context);

#ifdef PORTAL_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), rendered, file, line, function);
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        output_to_stderr(rendered);
    }

    void flush() {
#ifdef PORTAL_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
        std::cerr.flush();
    }

private:
    static auto render_text(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << timestamp(false) << " [" << log_level_to_string(level) << "] ["
            << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto render_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context,
                            const char* file,
                            int line,
                            const char* function) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp(true) << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\"" << detail::escape_json(message) << "\"";

        if (context) {
            auto ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(file) << "\"";
            if (line > 0) {
                oss << ",\"line\":" << line;
            }
            if (function) {
                oss << ",\"function\":\"" << function << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    // UTC ISO 8601 for JSON, local time for text
    static auto timestamp(bool utc) -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        if (utc) {
            gmtime_r(&time_t_val, &tm_buf);
        } else {
            localtime_r(&time_t_val, &tm_buf);
        }

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        if (utc) {
            oss << 'Z';
        }
        return oss.str();
    }

#ifdef PORTAL_USE_LOGGER_SYSTEM
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

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<log_output_format> output_format_{log_output_format::text};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> quiet_{false};
    log_callback callback_;
    std::mutex callback_mutex_;
};

inline portal_logger& get_logger() {
    static portal_logger instance;
    return instance;
}

#define PORTAL_LOG(level, category, message) \
    ::portal::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define PORTAL_LOG_CTX(level, category, message, context) \
    ::portal::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define PORTAL_LOG_TRACE(category, message) \
    PORTAL_LOG(::portal::log_level::trace, category, message)

#define PORTAL_LOG_DEBUG(category, message) \
    PORTAL_LOG(::portal::log_level::debug, category, message)

#define PORTAL_LOG_INFO(category, message) \
    PORTAL_LOG(::portal::log_level::info, category, message)

#define PORTAL_LOG_WARN(category, message) \
    PORTAL_LOG(::portal::log_level::warn, category, message)

#define PORTAL_LOG_ERROR(category, message) \
    PORTAL_LOG(::portal::log_level::error, category, message)

#define PORTAL_LOG_FATAL(category, message) \
    PORTAL_LOG(::portal::log_level::fatal, category, message)

#define PORTAL_LOG_DEBUG_CTX(category, message, ctx) \
    PORTAL_LOG_CTX(::portal::log_level::debug, category, message, ctx)

#define PORTAL_LOG_INFO_CTX(category, message, ctx) \
    PORTAL_LOG_CTX(::portal::log_level::info, category, message, ctx)

#define PORTAL_LOG_WARN_CTX(category, message, ctx) \
    PORTAL_LOG_CTX(::portal::log_level::warn, category, message, ctx)

#define PORTAL_LOG_ERROR_CTX(category, message, ctx) \
    PORTAL_LOG_CTX(::portal::log_level::error, category, message, ctx)

}  // namespace portal

#endif  // PORTAL_CORE_LOGGING_H
