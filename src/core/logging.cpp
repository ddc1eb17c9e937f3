// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.cpp
 * @brief Implementation of batch_import logging
 */

#include "kcenon/batch_import/core/logging.h"

#include "kcenon/batch_import/config/feature_flags.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <regex>
#include <sstream>

#if BATCH_IMPORT_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::batch_import {

namespace {

auto escape_json(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
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

auto format_time(bool utc) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    if (utc) {
        gmtime_s(&tm_buf, &time_t_val);
    } else {
        localtime_s(&tm_buf, &time_t_val);
    }
#else
    if (utc) {
        gmtime_r(&time_t_val, &tm_buf);
    } else {
        localtime_r(&time_t_val, &tm_buf);
    }
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

void output_to_stderr(const std::string& msg) {
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << msg << "\n";
}

}  // namespace

auto log_level_to_string(log_level level) -> std::string_view {
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

// ============================================================================
// sensitive_info_masker
// ============================================================================

auto sensitive_info_masker::mask(const std::string& input) const -> std::string {
    if (!config_.mask_paths) {
        return input;
    }

    static const std::regex path_pattern(R"((?:\/[a-zA-Z0-9._-]+)+)");

    std::string out;
    std::sregex_iterator it(input.begin(), input.end(), path_pattern);
    std::sregex_iterator end;

    std::size_t last_pos = 0;
    for (; it != end; ++it) {
        out += input.substr(last_pos, it->position() - last_pos);
        out += mask_path(it->str());
        last_pos = it->position() + it->length();
    }
    out += input.substr(last_pos);
    return out;
}

auto sensitive_info_masker::mask_path(const std::string& path) const -> std::string {
    if (!config_.mask_paths || path.empty()) {
        return path;
    }

    auto last_sep = path.find_last_of("/\\");
    if (last_sep == std::string::npos) {
        return config_.mask_filenames ? mask_filename(path) : path;
    }

    std::string filename = path.substr(last_sep + 1);
    if (config_.mask_filenames) {
        filename = mask_filename(filename);
    }
    return std::string(last_sep, config_.mask_char) + "/" + filename;
}

auto sensitive_info_masker::mask_filename(const std::string& filename) const -> std::string {
    auto dot_pos = filename.find_last_of('.');
    std::string name = filename;
    std::string ext;
    if (dot_pos != std::string::npos && dot_pos > 0) {
        name = filename.substr(0, dot_pos);
        ext = filename.substr(dot_pos);
    }

    if (name.size() <= config_.visible_chars) {
        return filename;
    }
    return name.substr(0, config_.visible_chars) +
           std::string(name.size() - config_.visible_chars, config_.mask_char) + ext;
}

// ============================================================================
// import_log_context / structured_log_entry
// ============================================================================

auto import_log_context::to_json(const sensitive_info_masker* masker) const -> std::string {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    auto add_field = [&](const char* name, const std::string& value) {
        if (!first) oss << ",";
        oss << "\"" << name << "\":\"" << escape_json(value) << "\"";
        first = false;
    };
    auto add_int = [&](const char* name, long long value) {
        if (!first) oss << ",";
        oss << "\"" << name << "\":" << value;
        first = false;
    };

    if (!filename.empty()) {
        add_field("filename", masker ? masker->mask_path(filename) : filename);
    }
    if (phase) add_field("phase", *phase);
    if (processed_files) add_int("processed_files", *processed_files);
    if (total_files) add_int("total_files", *total_files);
    if (progress_percent) {
        if (!first) oss << ",";
        oss << std::fixed << std::setprecision(2)
            << "\"progress_percent\":" << *progress_percent;
        first = false;
    }
    if (attempt) add_int("attempt", *attempt);
    if (duration_ms) add_int("duration_ms", static_cast<long long>(*duration_ms));
    if (error_message) {
        add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
    }

    oss << "}";
    return oss.str();
}

auto structured_log_entry::to_json(const sensitive_info_masker* masker) const -> std::string {
    std::ostringstream oss;
    oss << "{\"timestamp\":\"" << timestamp << "\""
        << ",\"level\":\"" << log_level_to_string(level) << "\""
        << ",\"category\":\"" << category << "\""
        << ",\"message\":\"" << escape_json(masker ? masker->mask(message) : message) << "\"";

    if (context) {
        auto ctx_json = context->to_json(masker);
        if (ctx_json.size() > 2) {
            oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
        }
    }

    if (source_file) {
        oss << ",\"source\":{\"file\":\"" << escape_json(*source_file) << "\"";
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

// ============================================================================
// log_entry_builder
// ============================================================================

log_entry_builder::log_entry_builder() {
    entry_.timestamp = format_time(true);
}

auto log_entry_builder::with_level(log_level level) -> log_entry_builder& {
    entry_.level = level;
    return *this;
}

auto log_entry_builder::with_category(std::string_view category) -> log_entry_builder& {
    entry_.category = std::string(category);
    return *this;
}

auto log_entry_builder::with_message(std::string_view message) -> log_entry_builder& {
    entry_.message = std::string(message);
    return *this;
}

auto log_entry_builder::with_filename(std::string_view filename) -> log_entry_builder& {
    context().filename = std::string(filename);
    return *this;
}

auto log_entry_builder::with_phase(std::string_view phase) -> log_entry_builder& {
    context().phase = std::string(phase);
    return *this;
}

auto log_entry_builder::with_progress(int processed, int total) -> log_entry_builder& {
    auto& ctx = context();
    ctx.processed_files = processed;
    ctx.total_files = total;
    return *this;
}

auto log_entry_builder::with_attempt(int attempt) -> log_entry_builder& {
    context().attempt = attempt;
    return *this;
}

auto log_entry_builder::with_error_message(std::string_view error) -> log_entry_builder& {
    context().error_message = std::string(error);
    return *this;
}

auto log_entry_builder::with_source_location(const char* file, int line, const char* function)
    -> log_entry_builder& {
    if (file) entry_.source_file = file;
    if (line > 0) entry_.source_line = line;
    if (function) entry_.function_name = function;
    return *this;
}

auto log_entry_builder::with_context(const import_log_context& ctx) -> log_entry_builder& {
    entry_.context = ctx;
    return *this;
}

auto log_entry_builder::context() -> import_log_context& {
    if (!entry_.context) {
        entry_.context = import_log_context{};
    }
    return *entry_.context;
}

// ============================================================================
// import_logger
// ============================================================================

struct import_logger::impl {
    std::atomic<log_level> min_level{log_level::info};
    std::atomic<bool> initialized{false};

    std::mutex callback_mutex;
    log_callback callback;
    json_log_callback json_callback;

    mutable std::mutex config_mutex;
    log_output_format output_format{log_output_format::text};
    sensitive_info_masker masker;

#if BATCH_IMPORT_USE_LOGGER_SYSTEM
    std::unique_ptr<kcenon::logger::logger> backend;

    static auto to_backend_level(log_level level) -> kcenon::logger::log_level {
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
#endif

    void emit(log_level level, const std::string& line,
              const char* file, int src_line, const char* function) {
#if BATCH_IMPORT_USE_LOGGER_SYSTEM
        if (backend) {
            if (file && src_line > 0 && function) {
                backend->log(to_backend_level(level), line, file, src_line, function);
            } else {
                backend->log(to_backend_level(level), line);
            }
            return;
        }
#else
        (void)level;
        (void)file;
        (void)src_line;
        (void)function;
#endif
        output_to_stderr(line);
    }
};

import_logger::import_logger() : impl_(std::make_unique<impl>()) {}

import_logger::~import_logger() = default;

void import_logger::initialize() {
    bool expected = false;
    if (!impl_->initialized.compare_exchange_strong(expected, true)) {
        return;
    }

#if BATCH_IMPORT_USE_LOGGER_SYSTEM
    auto built = kcenon::logger::logger_builder()
                     .with_async(true)
                     .with_min_level(impl::to_backend_level(impl_->min_level.load()))
                     .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
                     .build();
    if (built) {
        impl_->backend = std::move(built.value());
    }
#endif
}

void import_logger::shutdown() {
#if BATCH_IMPORT_USE_LOGGER_SYSTEM
    if (impl_->backend) {
        impl_->backend->flush();
        impl_->backend->stop();
        impl_->backend.reset();
    }
#endif
    impl_->initialized = false;
}

auto import_logger::is_initialized() const -> bool {
    return impl_->initialized.load();
}

void import_logger::set_level(log_level level) {
    impl_->min_level.store(level);
#if BATCH_IMPORT_USE_LOGGER_SYSTEM
    if (impl_->backend) {
        impl_->backend->set_min_level(impl::to_backend_level(level));
    }
#endif
}

auto import_logger::get_level() const -> log_level {
    return impl_->min_level.load();
}

auto import_logger::is_enabled(log_level level) const -> bool {
    return static_cast<int>(level) >= static_cast<int>(impl_->min_level.load());
}

void import_logger::set_output_format(log_output_format format) {
    std::lock_guard<std::mutex> lock(impl_->config_mutex);
    impl_->output_format = format;
}

auto import_logger::get_output_format() const -> log_output_format {
    std::lock_guard<std::mutex> lock(impl_->config_mutex);
    return impl_->output_format;
}

void import_logger::set_masking_config(masking_config config) {
    std::lock_guard<std::mutex> lock(impl_->config_mutex);
    impl_->masker.set_config(config);
}

auto import_logger::get_masking_config() const -> masking_config {
    std::lock_guard<std::mutex> lock(impl_->config_mutex);
    return impl_->masker.get_config();
}

void import_logger::set_callback(log_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->callback = std::move(callback);
}

void import_logger::set_json_callback(json_log_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->json_callback = std::move(callback);
}

void import_logger::log(log_level level,
                        std::string_view category,
                        std::string_view message,
                        const import_log_context* context,
                        const char* file,
                        int line,
                        const char* function) {
    if (!is_enabled(level)) return;

    {
        std::lock_guard<std::mutex> lock(impl_->callback_mutex);
        if (impl_->callback) {
            impl_->callback(level, category, message, context);
        }
    }

    log_output_format format;
    sensitive_info_masker masker;
    {
        std::lock_guard<std::mutex> lock(impl_->config_mutex);
        format = impl_->output_format;
        masker = impl_->masker;
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
        auto json = entry.to_json(&masker);
        {
            std::lock_guard<std::mutex> lock(impl_->callback_mutex);
            if (impl_->json_callback) {
                impl_->json_callback(entry, json);
            }
        }
        impl_->emit(level, json, file, line, function);
        return;
    }

    std::ostringstream oss;
    oss << format_time(false) << " [" << log_level_to_string(level) << "] ["
        << category << "] " << masker.mask(std::string(message));
    if (context) {
        oss << " " << context->to_json(&masker);
    }
    impl_->emit(level, oss.str(), file, line, function);
}

void import_logger::flush() {
#if BATCH_IMPORT_USE_LOGGER_SYSTEM
    if (impl_->backend) {
        impl_->backend->flush();
    }
#endif
}

auto get_logger() -> import_logger& {
    static import_logger instance;
    return instance;
}

}  // namespace kcenon::batch_import
