// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
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

#include <nlohmann/json.hpp>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define TRANSFER_ADAPTER_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::transfer_adapter {

/**
 * @brief Log categories for transfer adapter system
 */
struct log_category {
    static constexpr std::string_view registry = "transfer_adapter.registry";
    static constexpr std::string_view adapter = "transfer_adapter.adapter";
    static constexpr std::string_view worker = "transfer_adapter.worker";
    static constexpr std::string_view protocol = "transfer_adapter.protocol";
    static constexpr std::string_view transfer = "transfer_adapter.transfer";
};

/**
 * @brief Log levels for transfer adapter system
 */
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
 * @brief Configuration for sensitive information masking
 *
 * Protocol traces carry local object paths and action headers; the latter
 * usually hold bearer tokens.
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_credentials = false;
    std::string mask_char = "*";

    static masking_config all_masked() {
        return {true, true, "*"};
    }

    static masking_config none() {
        return {false, false, "*"};
    }
};

/**
 * @brief Masks sensitive information in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string out = input;
        if (config_.mask_credentials) {
            out = mask_credential_values(out);
        }
        if (config_.mask_paths) {
            out = mask_file_paths(out);
        }
        return out;
    }

    /**
     * @brief Mask the directory part of a path, keeping the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char[0]) + path.substr(last_sep);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    // "Authorization":"Basic abc" style pairs as they appear in action headers
    [[nodiscard]] auto mask_credential_values(const std::string& input) const -> std::string {
        static const std::regex credential_pattern(
            R"re(("(?:[Aa]uthorization|[Xx]-[A-Za-z-]*[Tt]oken)"\s*:\s*")([^"]*)("))re");
        return std::regex_replace(input, credential_pattern,
                                  "$1" + std::string(3, config_.mask_char[0]) + "$3");
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
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

    masking_config config_;
};

/**
 * @brief Structured log context for adapter and transfer events
 */
struct transfer_log_context {
    std::string adapter;
    std::string oid;
    std::optional<int> worker_id;
    std::optional<int64_t> pid;
    std::optional<int64_t> size;
    std::optional<int64_t> bytes_so_far;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        return to_object(masker).dump();
    }

    [[nodiscard]] auto to_object(const sensitive_info_masker* masker) const -> nlohmann::json {
        nlohmann::json j = nlohmann::json::object();
        if (!adapter.empty()) j["adapter"] = adapter;
        if (!oid.empty()) j["oid"] = oid;
        if (worker_id) j["worker_id"] = *worker_id;
        if (pid) j["pid"] = *pid;
        if (size) j["size"] = *size;
        if (bytes_so_far) j["bytes_so_far"] = *bytes_so_far;
        if (duration_ms) j["duration_ms"] = *duration_ms;
        if (error_message) {
            j["error_message"] = masker ? masker->mask(*error_message) : *error_message;
        }
        return j;
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
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        nlohmann::json j;
        j["timestamp"] = timestamp;
        j["level"] = std::string(log_level_to_string(level));
        j["category"] = category;
        j["message"] = masker ? masker->mask(message) : message;

        if (context) {
            j.update(context->to_object(masker));
        }

        if (source_file) {
            nlohmann::json source;
            source["file"] = masker ? masker->mask_path(*source_file) : *source_file;
            if (source_line) source["line"] = *source_line;
            if (function_name) source["function"] = *function_name;
            j["source"] = std::move(source);
        }

        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};

/**
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::transfer)
 *     .with_message("Upload completed")
 *     .with_adapter("testagent")
 *     .with_oid("abc123")
 *     .with_size(1048576)
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

    auto with_adapter(std::string_view name) -> log_entry_builder& {
        ensure_context();
        entry_.context->adapter = std::string(name);
        return *this;
    }

    auto with_oid(std::string_view oid) -> log_entry_builder& {
        ensure_context();
        entry_.context->oid = std::string(oid);
        return *this;
    }

    auto with_worker_id(int id) -> log_entry_builder& {
        ensure_context();
        entry_.context->worker_id = id;
        return *this;
    }

    auto with_size(int64_t size) -> log_entry_builder& {
        ensure_context();
        entry_.context->size = size;
        return *this;
    }

    auto with_error_message(std::string_view message) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(message);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the transfer adapter system
 */
class transfer_adapter_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    transfer_adapter_logger() = default;
    ~transfer_adapter_logger() = default;

    transfer_adapter_logger(const transfer_adapter_logger&) = delete;
    transfer_adapter_logger& operator=(const transfer_adapter_logger&) = delete;

    /**
     * @brief Initialize the logger backend
     *
     * Safe to call multiple times; later calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef TRANSFER_ADAPTER_USE_LOGGER_SYSTEM
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
#ifdef TRANSFER_ADAPTER_USE_LOGGER_SYSTEM
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
#ifdef TRANSFER_ADAPTER_USE_LOGGER_SYSTEM
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

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

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

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        if (format == log_output_format::json) {
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
            auto json_str = entry.to_json_with_masking(&masker);

            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                if (json_callback_) {
                    json_callback_(entry, json_str);
                }
            }
            write(level, json_str, file, line, function);
            return;
        }

        std::ostringstream oss;
#ifndef TRANSFER_ADAPTER_USE_LOGGER_SYSTEM
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }
        write(level, oss.str(), file, line, function);
    }

    void flush() {
#ifdef TRANSFER_ADAPTER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write(log_level level,
               const std::string& text,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line,
               [[maybe_unused]] const char* function) {
#ifdef TRANSFER_ADAPTER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
        }
#else
        (void)level;
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << text << "\n";
#endif
    }

#ifdef TRANSFER_ADAPTER_USE_LOGGER_SYSTEM
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
inline transfer_adapter_logger& get_logger() {
    static transfer_adapter_logger instance;
    return instance;
}

#define TA_LOG(level, category, message) \
    kcenon::transfer_adapter::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define TA_LOG_CTX(level, category, message, context) \
    kcenon::transfer_adapter::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define TA_LOG_TRACE(category, message) \
    TA_LOG(kcenon::transfer_adapter::log_level::trace, category, message)

#define TA_LOG_DEBUG(category, message) \
    TA_LOG(kcenon::transfer_adapter::log_level::debug, category, message)

#define TA_LOG_INFO(category, message) \
    TA_LOG(kcenon::transfer_adapter::log_level::info, category, message)

#define TA_LOG_WARN(category, message) \
    TA_LOG(kcenon::transfer_adapter::log_level::warn, category, message)

#define TA_LOG_ERROR(category, message) \
    TA_LOG(kcenon::transfer_adapter::log_level::error, category, message)

#define TA_LOG_FATAL(category, message) \
    TA_LOG(kcenon::transfer_adapter::log_level::fatal, category, message)

#define TA_LOG_TRACE_CTX(category, message, ctx) \
    TA_LOG_CTX(kcenon::transfer_adapter::log_level::trace, category, message, ctx)

#define TA_LOG_DEBUG_CTX(category, message, ctx) \
    TA_LOG_CTX(kcenon::transfer_adapter::log_level::debug, category, message, ctx)

#define TA_LOG_INFO_CTX(category, message, ctx) \
    TA_LOG_CTX(kcenon::transfer_adapter::log_level::info, category, message, ctx)

#define TA_LOG_WARN_CTX(category, message, ctx) \
    TA_LOG_CTX(kcenon::transfer_adapter::log_level::warn, category, message, ctx)

#define TA_LOG_ERROR_CTX(category, message, ctx) \
    TA_LOG_CTX(kcenon::transfer_adapter::log_level::error, category, message, ctx)

#define TA_LOG_FATAL_CTX(category, message, ctx) \
    TA_LOG_CTX(kcenon::transfer_adapter::log_level::fatal, category, message, ctx)

} // namespace kcenon::transfer_adapter
