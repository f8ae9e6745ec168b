// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
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
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/resumable_upload/config/feature_flags.h"

#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::resumable_upload {

/**
 * @brief Log categories for the resumable upload library
 */
struct log_category {
    static constexpr std::string_view uploader = "resumable_upload.uploader";
    static constexpr std::string_view chunk = "resumable_upload.chunk";
    static constexpr std::string_view retry = "resumable_upload.retry";
    static constexpr std::string_view network = "resumable_upload.network";
    static constexpr std::string_view progress = "resumable_upload.progress";
    static constexpr std::string_view transport = "resumable_upload.transport";
    static constexpr std::string_view scheduler = "resumable_upload.scheduler";
};

/**
 * @brief Log levels
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

/**
 * @brief Configuration for sensitive information masking
 *
 * Signed upload URLs carry their credentials in the query string, so URL
 * masking is enabled by default.
 */
struct masking_config {
    bool mask_urls = true;
    bool mask_paths = false;
    bool mask_filenames = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, false, "*", 4};
    }
};

/**
 * @brief Masks signed URL credentials and local paths in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    /**
     * @brief Mask sensitive information in a free-form string
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_urls && !config_.mask_paths && !config_.mask_filenames) {
            return input;
        }

        std::string result = input;

        if (config_.mask_urls) {
            result = mask_url_queries(result);
        }

        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }

        return result;
    }

    /**
     * @brief Strip the query string of a signed URL
     *
     * "https://host/bucket/object?X-Goog-Signature=..." becomes
     * "https://host/bucket/object?<redacted>".
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        if (!config_.mask_urls || url.empty()) {
            return url;
        }

        auto query = url.find('?');
        if (query == std::string::npos) {
            return url;
        }
        return url.substr(0, query) + "?<redacted>";
    }

    /**
     * @brief Mask a file path, keeping the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return mask_filename(path);
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        std::string filename = path.substr(last_sep + 1);

        if (config_.mask_filenames) {
            filename = mask_filename(filename);
        }

        return masked_dir + "/" + filename;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (filename.size() <= config_.visible_chars) {
            return filename;
        }

        auto dot_pos = filename.find_last_of('.');
        if (dot_pos != std::string::npos && dot_pos > 0) {
            std::string name = filename.substr(0, dot_pos);
            std::string ext = filename.substr(dot_pos);

            if (name.size() <= config_.visible_chars) {
                return filename;
            }

            std::string visible = name.substr(0, config_.visible_chars);
            std::string masked(name.size() - config_.visible_chars, config_.mask_char[0]);
            return visible + masked + ext;
        }

        std::string visible = filename.substr(0, config_.visible_chars);
        std::string masked(filename.size() - config_.visible_chars, config_.mask_char[0]);
        return visible + masked;
    }

    [[nodiscard]] auto mask_url_queries(const std::string& input) const -> std::string {
        static const std::regex url_pattern(R"(https?://[^\s?#"]+\?[^\s#"]*)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), url_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_url(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        // URLs are left to mask_url_queries
        static const std::regex path_pattern(
            R"((?:^|\s)((?:\/[a-zA-Z0-9._-]+)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            auto pos = static_cast<size_t>(it->position(1));
            result += input.substr(last_pos, pos - last_pos);
            result += mask_path(it->str(1));
            last_pos = pos + static_cast<size_t>(it->length(1));
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

namespace detail {

[[nodiscard]] inline auto escape_json_string(const std::string& input) -> std::string {
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
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string upload_url;
    std::string file_path;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_sent;
    std::optional<uint32_t> chunk_index;
    std::optional<uint32_t> total_chunks;
    std::optional<uint32_t> attempt;
    std::optional<uint32_t> remaining_attempts;
    std::optional<int> status_code;
    std::optional<double> progress_percent;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!upload_url.empty()) {
            add_field("upload_url", masker ? masker->mask_url(upload_url) : upload_url);
        }
        if (!file_path.empty()) {
            add_field("file_path", masker ? masker->mask_path(file_path) : file_path);
        }
        if (file_size) add_int("file_size", static_cast<int64_t>(*file_size));
        if (bytes_sent) add_int("bytes_sent", static_cast<int64_t>(*bytes_sent));
        if (chunk_index) add_int("chunk_index", *chunk_index);
        if (total_chunks) add_int("total_chunks", *total_chunks);
        if (attempt) add_int("attempt", *attempt);
        if (remaining_attempts) add_int("remaining_attempts", *remaining_attempts);
        if (status_code) add_int("status_code", *status_code);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (duration_ms) add_int("duration_ms", static_cast<int64_t>(*duration_ms));
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
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
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
};

/**
 * @brief Builder class for creating structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::warn)
 *     .with_category(log_category::retry)
 *     .with_message("Retrying chunk")
 *     .with_chunk(3, 10)
 *     .with_attempt(1, 2)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_upload_url(std::string_view url) -> log_entry_builder& {
        ensure_context();
        entry_.context->upload_url = std::string(url);
        return *this;
    }

    auto with_file(std::string_view path, uint64_t size) -> log_entry_builder& {
        ensure_context();
        entry_.context->file_path = std::string(path);
        entry_.context->file_size = size;
        return *this;
    }

    auto with_chunk(uint32_t index, uint32_t total) -> log_entry_builder& {
        ensure_context();
        entry_.context->chunk_index = index;
        entry_.context->total_chunks = total;
        return *this;
    }

    auto with_attempt(uint32_t attempt, uint32_t remaining) -> log_entry_builder& {
        ensure_context();
        entry_.context->attempt = attempt;
        entry_.context->remaining_attempts = remaining;
        return *this;
    }

    auto with_status_code(int status) -> log_entry_builder& {
        ensure_context();
        entry_.context->status_code = status;
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context();
        entry_.context->duration_ms = duration;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const upload_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

    [[nodiscard]] auto build_json_masked(const sensitive_info_masker& masker) const -> std::string {
        return entry_.to_json_with_masking(&masker);
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = upload_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
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

    structured_log_entry entry_;
};

class upload_logger;

/**
 * @brief Global logger accessor
 */
upload_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Process-wide logger for the resumable upload library
 */
class upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const upload_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called automatically when an uploader is
     * built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
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
#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
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

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Set custom log callback
     *
     * The callback receives the unmasked message.
     */
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
             const upload_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
            log_json(level, category, message, context, file, line, function, current_masker);
        } else {
            log_text(level, category, message, context, current_masker);
        }
    }

    void flush() {
#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const upload_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }

        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

        write(level, json_str);
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const upload_log_context* context,
                  const sensitive_info_masker& masker) {
        std::ostringstream oss;
#if !RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }

        write(level, oss.str());
    }

    void write([[maybe_unused]] log_level level, const std::string& line) {
#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), line);
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line << "\n";
    }

#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
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
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

#define RU_LOG(level, category, message) \
    kcenon::resumable_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define RU_LOG_CTX(level, category, message, context) \
    kcenon::resumable_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define RU_LOG_TRACE(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::trace, category, message)

#define RU_LOG_DEBUG(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::debug, category, message)

#define RU_LOG_INFO(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::info, category, message)

#define RU_LOG_WARN(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::warn, category, message)

#define RU_LOG_ERROR(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::error, category, message)

#define RU_LOG_DEBUG_CTX(category, message, ctx) \
    RU_LOG_CTX(kcenon::resumable_upload::log_level::debug, category, message, ctx)

#define RU_LOG_INFO_CTX(category, message, ctx) \
    RU_LOG_CTX(kcenon::resumable_upload::log_level::info, category, message, ctx)

#define RU_LOG_WARN_CTX(category, message, ctx) \
    RU_LOG_CTX(kcenon::resumable_upload::log_level::warn, category, message, ctx)

#define RU_LOG_ERROR_CTX(category, message, ctx) \
    RU_LOG_CTX(kcenon::resumable_upload::log_level::error, category, message, ctx)

} // namespace kcenon::resumable_upload
