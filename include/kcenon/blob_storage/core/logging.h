// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <memory>
#include <functional>
#include <sstream>
#include <iomanip>
#include <atomic>
#include <mutex>
#include <iostream>
#include <regex>
#include <algorithm>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define BLOB_STORAGE_LOGGER_BACKEND 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::blob_storage {

/**
 * @brief Log categories for blob storage system
 */
struct log_category {
    static constexpr std::string_view pipeline = "blob_storage.pipeline";
    static constexpr std::string_view retry = "blob_storage.retry";
    static constexpr std::string_view auth = "blob_storage.auth";
    static constexpr std::string_view sas = "blob_storage.sas";
    static constexpr std::string_view transport = "blob_storage.transport";
};

/**
 * @brief Log levels for blob storage system
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
 * @brief Configuration for sensitive information masking
 *
 * SAS signatures and Authorization header values grant access to storage
 * resources, so both are masked by default.
 */
struct masking_config {
    bool mask_signatures = true;
    bool mask_authorization = true;
    bool mask_account_names = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    /**
     * @brief Create config with all masking enabled
     */
    static masking_config all_masked() {
        return {true, true, true, "*", 4};
    }

    /**
     * @brief Create config with no masking
     */
    static masking_config none() {
        return {false, false, false, "*", 4};
    }
};

/**
 * @brief Utility class for masking secrets in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    /**
     * @brief Mask sensitive information in a string
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_signatures && !config_.mask_authorization) {
            return input;
        }

        std::string result = input;

        if (config_.mask_signatures) {
            result = mask_sas_signatures(result);
        }

        if (config_.mask_authorization) {
            result = mask_authorization_values(result);
        }

        return result;
    }

    /**
     * @brief Mask an account name, keeping the first visible characters
     */
    [[nodiscard]] auto mask_account(const std::string& account) const -> std::string {
        if (!config_.mask_account_names || account.size() <= config_.visible_chars) {
            return account;
        }
        return account.substr(0, config_.visible_chars) +
               std::string(account.size() - config_.visible_chars, config_.mask_char[0]);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_sas_signatures(const std::string& input) const -> std::string {
        static const std::regex sig_pattern(R"(([?&]sig=)([^&\s]+))", std::regex::icase);
        return std::regex_replace(input, sig_pattern, "$1" + std::string(3, config_.mask_char[0]));
    }

    [[nodiscard]] auto mask_authorization_values(const std::string& input) const -> std::string {
        static const std::regex shared_key_pattern(R"((SharedKey\s+[^:\s]+:)(\S+))");
        static const std::regex bearer_pattern(R"((Bearer\s+)(\S+))");
        std::string masked(3, config_.mask_char[0]);
        std::string result = std::regex_replace(input, shared_key_pattern, "$1" + masked);
        return std::regex_replace(result, bearer_pattern, "$1" + masked);
    }

    masking_config config_;
};

/**
 * @brief Structured log context for a pipeline request
 */
struct request_log_context {
    std::string request_id;
    std::string method;
    std::string url;
    std::optional<uint32_t> try_number;
    std::optional<int> status_code;
    std::optional<uint64_t> try_duration_ms;
    std::optional<uint64_t> operation_duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    /**
     * @brief Convert context to JSON string with optional masking
     */
    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_number = [&](const char* name, auto value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!request_id.empty()) add_field("request_id", request_id);
        if (!method.empty()) add_field("method", method);
        if (!url.empty()) add_field("url", masker ? masker->mask(url) : url);
        if (try_number) add_number("try_number", *try_number);
        if (status_code) add_number("status_code", *status_code);
        if (try_duration_ms) add_number("try_duration_ms", *try_duration_ms);
        if (operation_duration_ms) add_number("operation_duration_ms", *operation_duration_ms);
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
    std::optional<request_log_context> context;
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
 * Example usage:
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::pipeline)
 *     .with_message("Successfully Received Response")
 *     .with_request_id("0f8fad5b-d9cb-469f-a165-70867728950e")
 *     .with_try_number(2)
 *     .with_status_code(200)
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

    auto with_request_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->request_id = std::string(id);
        return *this;
    }

    auto with_method(std::string_view method) -> log_entry_builder& {
        ensure_context();
        entry_.context->method = std::string(method);
        return *this;
    }

    auto with_url(std::string_view url) -> log_entry_builder& {
        ensure_context();
        entry_.context->url = std::string(url);
        return *this;
    }

    auto with_try_number(uint32_t try_number) -> log_entry_builder& {
        ensure_context();
        entry_.context->try_number = try_number;
        return *this;
    }

    auto with_status_code(int status) -> log_entry_builder& {
        ensure_context();
        entry_.context->status_code = status;
        return *this;
    }

    auto with_try_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context();
        entry_.context->try_duration_ms = duration;
        return *this;
    }

    auto with_operation_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context();
        entry_.context->operation_duration_ms = duration;
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

    auto with_context(const request_log_context& ctx) -> log_entry_builder& {
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
            entry_.context = request_log_context{};
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

// Forward declaration
class blob_storage_logger;

/**
 * @brief Global logger accessor
 */
blob_storage_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Blob storage logging interface
 */
class blob_storage_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const request_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    blob_storage_logger() = default;
    ~blob_storage_logger() = default;

    blob_storage_logger(const blob_storage_logger&) = delete;
    blob_storage_logger& operator=(const blob_storage_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     * Called when a pipeline is created.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef BLOB_STORAGE_LOGGER_BACKEND
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
#ifdef BLOB_STORAGE_LOGGER_BACKEND
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
#ifdef BLOB_STORAGE_LOGGER_BACKEND
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
     * The callback receives the unmasked message; masking applies to the
     * text and JSON sinks only.
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

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const request_log_context* context = nullptr,
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
            log_text(level, category, message, context, file, line, function, current_masker);
        }
    }

    void flush() {
#ifdef BLOB_STORAGE_LOGGER_BACKEND
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const request_log_context* context,
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

#ifdef BLOB_STORAGE_LOGGER_BACKEND
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), json_str, file, line, function);
            } else {
                logger_->log(to_logger_level(level), json_str);
            }
        }
#else
        output_to_stderr(json_str);
#endif
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const request_log_context* context,
                  [[maybe_unused]] const char* file,
                  [[maybe_unused]] int line,
                  [[maybe_unused]] const char* function,
                  const sensitive_info_masker& masker) {

#ifdef BLOB_STORAGE_LOGGER_BACKEND
        if (logger_) {
            std::string full_message = format_message(category, message, context, masker);
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), full_message, file, line, function);
            } else {
                logger_->log(to_logger_level(level), full_message);
            }
        }
#else
        std::ostringstream oss;
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] "
            << format_message(category, message, context, masker);

        output_to_stderr(oss.str());
#endif
    }

    static auto format_message(std::string_view category,
                               std::string_view message,
                               const request_log_context* context,
                               const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#ifdef BLOB_STORAGE_LOGGER_BACKEND
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

/**
 * @brief Get global logger instance
 */
inline blob_storage_logger& get_logger() {
    static blob_storage_logger instance;
    return instance;
}

// Logging macros for convenience
#define BS_LOG(level, category, message) \
    kcenon::blob_storage::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BS_LOG_CTX(level, category, message, context) \
    kcenon::blob_storage::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BS_LOG_TRACE(category, message) \
    BS_LOG(kcenon::blob_storage::log_level::trace, category, message)

#define BS_LOG_DEBUG(category, message) \
    BS_LOG(kcenon::blob_storage::log_level::debug, category, message)

#define BS_LOG_INFO(category, message) \
    BS_LOG(kcenon::blob_storage::log_level::info, category, message)

#define BS_LOG_WARN(category, message) \
    BS_LOG(kcenon::blob_storage::log_level::warn, category, message)

#define BS_LOG_ERROR(category, message) \
    BS_LOG(kcenon::blob_storage::log_level::error, category, message)

#define BS_LOG_FATAL(category, message) \
    BS_LOG(kcenon::blob_storage::log_level::fatal, category, message)

#define BS_LOG_INFO_CTX(category, message, ctx) \
    BS_LOG_CTX(kcenon::blob_storage::log_level::info, category, message, ctx)

#define BS_LOG_WARN_CTX(category, message, ctx) \
    BS_LOG_CTX(kcenon::blob_storage::log_level::warn, category, message, ctx)

#define BS_LOG_ERROR_CTX(category, message, ctx) \
    BS_LOG_CTX(kcenon::blob_storage::log_level::error, category, message, ctx)

} // namespace kcenon::blob_storage
