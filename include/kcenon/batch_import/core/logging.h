// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for batch_import
 *
 * Messages are forwarded to logger_system when the library is built with
 * BUILD_WITH_LOGGER_SYSTEM and BUILD_WITH_COMMON_SYSTEM, and written to
 * stderr otherwise. Password values must never be passed to the logger.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::batch_import {

/**
 * @brief Log categories for batch import
 */
struct log_category {
    static constexpr std::string_view controller = "batch_import.controller";
    static constexpr std::string_view worker = "batch_import.worker";
    static constexpr std::string_view channel = "batch_import.channel";
    static constexpr std::string_view policy = "batch_import.policy";
    static constexpr std::string_view driver = "batch_import.driver";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

[[nodiscard]] auto log_level_to_string(log_level level) -> std::string_view;

/**
 * @brief Masking of keystore locations in log output
 *
 * Keystore paths reveal where wallets live on disk, so deployments that
 * ship logs off-host can hide the directory part and most of the name.
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_filenames = false;
    char mask_char = '*';
    std::size_t visible_chars = 4;

    static auto all_masked() -> masking_config { return {true, true, '*', 4}; }
    static auto none() -> masking_config { return {false, false, '*', 4}; }
};

class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    /**
     * @brief Mask every path found in a free-form message
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string;

    /**
     * @brief Mask a single path
     *
     * With filenames masked too, "/home/user/keys/wallet-alpha.json"
     * keeps only "wall" of its filename and the ".json" extension; every
     * other character becomes mask_char.
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string;

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }
    void set_config(masking_config config) { config_ = config; }

private:
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string;

    masking_config config_;
};

/**
 * @brief Structured context attached to import log records
 */
struct import_log_context {
    std::string filename;
    std::optional<std::string> phase;
    std::optional<int> processed_files;
    std::optional<int> total_files;
    std::optional<double> progress_percent;
    std::optional<int> attempt;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string;
};

/**
 * @brief One fully-formed log record
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<import_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string;
};

/**
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::warn)
 *     .with_category(log_category::controller)
 *     .with_message("progress snapshot rejected")
 *     .with_progress(5, 3)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder();

    auto with_level(log_level level) -> log_entry_builder&;
    auto with_category(std::string_view category) -> log_entry_builder&;
    auto with_message(std::string_view message) -> log_entry_builder&;
    auto with_filename(std::string_view filename) -> log_entry_builder&;
    auto with_phase(std::string_view phase) -> log_entry_builder&;
    auto with_progress(int processed, int total) -> log_entry_builder&;
    auto with_attempt(int attempt) -> log_entry_builder&;
    auto with_error_message(std::string_view error) -> log_entry_builder&;
    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder&;
    auto with_context(const import_log_context& ctx) -> log_entry_builder&;

    [[nodiscard]] auto build() const -> structured_log_entry { return entry_; }
    [[nodiscard]] auto build_json() const -> std::string { return entry_.to_json(); }

private:
    auto context() -> import_log_context&;

    structured_log_entry entry_;
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for batch import components
 *
 * Thread-safe. Observers registered with set_callback() see every record
 * that passes the level filter, which is how tests assert on warnings.
 */
class import_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const import_log_context*)>;
    using json_log_callback =
        std::function<void(const structured_log_entry&, const std::string&)>;

    import_logger();
    ~import_logger();

    import_logger(const import_logger&) = delete;
    import_logger& operator=(const import_logger&) = delete;

    /**
     * @brief Attach the logger_system backend when available
     *
     * Safe to call multiple times.
     */
    void initialize();
    void shutdown();
    [[nodiscard]] auto is_initialized() const -> bool;

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level;
    [[nodiscard]] auto is_enabled(log_level level) const -> bool;

    void set_output_format(log_output_format format);
    [[nodiscard]] auto get_output_format() const -> log_output_format;

    void set_masking_config(masking_config config);
    [[nodiscard]] auto get_masking_config() const -> masking_config;

    void set_callback(log_callback callback);
    void set_json_callback(json_log_callback callback);

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const import_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr);

    void flush();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Get global logger instance
 */
auto get_logger() -> import_logger&;

#define BI_LOG(level, category, message) \
    kcenon::batch_import::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BI_LOG_CTX(level, category, message, context) \
    kcenon::batch_import::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BI_LOG_TRACE(category, message) \
    BI_LOG(kcenon::batch_import::log_level::trace, category, message)

#define BI_LOG_DEBUG(category, message) \
    BI_LOG(kcenon::batch_import::log_level::debug, category, message)

#define BI_LOG_INFO(category, message) \
    BI_LOG(kcenon::batch_import::log_level::info, category, message)

#define BI_LOG_WARN(category, message) \
    BI_LOG(kcenon::batch_import::log_level::warn, category, message)

#define BI_LOG_ERROR(category, message) \
    BI_LOG(kcenon::batch_import::log_level::error, category, message)

#define BI_LOG_FATAL(category, message) \
    BI_LOG(kcenon::batch_import::log_level::fatal, category, message)

#define BI_LOG_DEBUG_CTX(category, message, ctx) \
    BI_LOG_CTX(kcenon::batch_import::log_level::debug, category, message, ctx)

#define BI_LOG_INFO_CTX(category, message, ctx) \
    BI_LOG_CTX(kcenon::batch_import::log_level::info, category, message, ctx)

#define BI_LOG_WARN_CTX(category, message, ctx) \
    BI_LOG_CTX(kcenon::batch_import::log_level::warn, category, message, ctx)

#define BI_LOG_ERROR_CTX(category, message, ctx) \
    BI_LOG_CTX(kcenon::batch_import::log_level::error, category, message, ctx)

}  // namespace kcenon::batch_import
