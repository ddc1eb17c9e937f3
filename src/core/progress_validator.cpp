/**
 * @file progress_validator.cpp
 * @brief Implementation of progress snapshot validation
 */

#include <kcenon/batch_import/core/progress_validator.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace kcenon::batch_import {

namespace {

auto invalid(const std::string& message) -> result<void> {
    return unexpected(error{error_code::invalid_progress, message});
}

auto format_percent(double value) -> std::string {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

}  // namespace

auto progress_validator::expected_percentage(int processed, int total) -> double {
    if (total <= 0) {
        return 0.0;
    }
    if (processed == total) {
        return 100.0;
    }
    return static_cast<double>(processed) / static_cast<double>(total) * 100.0;
}

auto progress_validator::validate(const import_progress& progress) -> result<void> {
    if (progress.total_files <= 0) {
        return invalid("total files must be positive: " +
                       std::to_string(progress.total_files));
    }

    if (progress.processed_files < 0) {
        return invalid("processed files cannot be negative: " +
                       std::to_string(progress.processed_files));
    }

    if (progress.processed_files > progress.total_files) {
        return invalid("processed files exceeds total: " +
                       std::to_string(progress.processed_files) + " > " +
                       std::to_string(progress.total_files));
    }

    if (std::isnan(progress.percentage) || progress.percentage < 0.0 ||
        progress.percentage > 100.0) {
        return invalid("percentage out of range: " + format_percent(progress.percentage));
    }

    auto expected = expected_percentage(progress.processed_files, progress.total_files);
    if (std::fabs(progress.percentage - expected) > percentage_tolerance) {
        return invalid("percentage inconsistent: " + format_percent(progress.percentage) +
                       " vs expected " + format_percent(expected));
    }

    return {};
}

auto progress_validator::validate(const import_progress& progress,
                                  const import_progress& previous) -> result<void> {
    auto standalone = validate(progress);
    if (!standalone) {
        return standalone;
    }

    if (previous.total_files <= 0) {
        return {};
    }

    if (progress.total_files != previous.total_files) {
        return invalid("total files changed during import: " +
                       std::to_string(previous.total_files) + " -> " +
                       std::to_string(progress.total_files));
    }

    if (progress.processed_files < previous.processed_files &&
        progress.processed_files != 0) {
        return invalid("processed files decreased: " +
                       std::to_string(previous.processed_files) + " -> " +
                       std::to_string(progress.processed_files));
    }

    return {};
}

}  // namespace kcenon::batch_import
