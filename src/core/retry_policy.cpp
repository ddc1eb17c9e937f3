/**
 * @file retry_policy.cpp
 * @brief Implementation of result classification and retry planning
 */

#include <kcenon/batch_import/core/retry_policy.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace kcenon::batch_import {

namespace {

auto to_lower(std::string_view input) -> std::string {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto contains_any(const std::string& haystack, std::initializer_list<std::string_view> needles)
    -> bool {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

auto path_of(const import_result& result) -> std::string {
    return result.job.keystore_path.string();
}

}  // namespace

auto parse_retry_strategy(std::string_view name) -> std::optional<retry_strategy> {
    if (name == "retry_failed") return retry_strategy::retry_failed;
    if (name == "retry_skipped") return retry_strategy::retry_skipped;
    if (name == "retry_all") return retry_strategy::retry_all;
    if (name == "manual_passwords") return retry_strategy::manual_passwords;
    if (name == "retry_specific") return retry_strategy::retry_specific;
    return std::nullopt;
}

auto completion_report::summary_text() const -> std::string {
    std::ostringstream oss;
    oss << "Total files: " << summary.total_files
        << ", Successful: " << summary.successful_imports;
    if (summary.failed_imports > 0) {
        oss << ", Failed: " << summary.failed_imports;
    }
    if (summary.skipped_imports > 0) {
        oss << ", Skipped: " << summary.skipped_imports;
    }
    oss << " (" << (elapsed.count() / 1000) << "s)";
    return oss.str();
}

// ============================================================================
// Classification
// ============================================================================

auto retry_policy::is_retryable(std::string_view message) -> bool {
    if (message.empty()) {
        return false;
    }
    auto lowered = to_lower(message);
    return contains_any(lowered, {"password", "incorrect", "invalid", "decrypt"}) ||
           contains_any(lowered, {"permission", "access"}) ||
           contains_any(lowered, {"timeout", "timed out"});
}

auto retry_policy::is_retryable(const import_result& result) -> bool {
    if (result.success || result.skipped || !result.failure) {
        return false;
    }
    return is_retryable(result.failure->message);
}

auto retry_policy::is_retryable(const import_error& entry) -> bool {
    return !entry.skipped && is_retryable(entry.cause.message);
}

auto retry_policy::categorize(const error& err) -> error_category {
    switch (err.code) {
        case error_code::password_input_cancelled:
        case error_code::password_input_skipped:
        case error_code::password_input_timeout:
        case error_code::import_interrupted:
            return error_category::user_action;
        case error_code::password_input_invalid:
        case error_code::password_max_attempts:
        case error_code::password_file_empty:
        case error_code::password_file_invalid:
        case error_code::password_file_oversized:
        case error_code::password_file_corrupted:
            return error_category::password;
        case error_code::internal_error:
        case error_code::invalid_configuration:
            return error_category::system;
        default:
            break;
    }

    if (is_file_error(err.code) || err.code == error_code::password_file_not_found ||
        err.code == error_code::password_file_unreadable) {
        return err.code == error_code::invalid_keystore ? error_category::validation
                                                        : error_category::file_system;
    }
    if (is_job_error(err.code) || err.code == error_code::duplicate_keystore) {
        return error_category::validation;
    }
    if (is_channel_error(err.code)) {
        return error_category::system;
    }

    auto lowered = to_lower(err.message);
    if (contains_any(lowered, {"password", "decrypt", "incorrect"})) {
        return error_category::password;
    }
    if (contains_any(lowered, {"permission", "access", "not found", "directory"})) {
        return error_category::file_system;
    }
    if (contains_any(lowered, {"invalid", "format", "corrupt"})) {
        return error_category::validation;
    }
    if (contains_any(lowered, {"cancelled", "skipped"})) {
        return error_category::user_action;
    }
    return error_category::unknown;
}

// ============================================================================
// Summaries and file lists
// ============================================================================

auto retry_policy::build_summary(const std::vector<import_result>& results) -> import_summary {
    import_summary summary;
    summary.total_files = static_cast<int>(results.size());

    for (const auto& r : results) {
        if (r.success) {
            ++summary.successful_imports;
            continue;
        }

        if (r.skipped) {
            ++summary.skipped_imports;
        } else {
            ++summary.failed_imports;
        }
        summary.errors.push_back(import_error{
            path_of(r),
            r.failure.value_or(error{error_code::keystore_import_failed}),
            r.skipped});
    }
    return summary;
}

auto retry_policy::failed_files(const std::vector<import_result>& results)
    -> std::vector<std::string> {
    std::vector<std::string> files;
    for (const auto& r : results) {
        if (!r.success && !r.skipped) files.push_back(path_of(r));
    }
    return files;
}

auto retry_policy::skipped_files(const std::vector<import_result>& results)
    -> std::vector<std::string> {
    std::vector<std::string> files;
    for (const auto& r : results) {
        if (r.skipped) files.push_back(path_of(r));
    }
    return files;
}

auto retry_policy::retryable_files(const std::vector<import_result>& results)
    -> std::vector<std::string> {
    std::vector<std::string> files;
    for (const auto& r : results) {
        if (is_retryable(r)) files.push_back(path_of(r));
    }
    return files;
}

auto retry_policy::files_for_strategy(const std::vector<import_result>& results,
                                      retry_strategy strategy) -> std::vector<std::string> {
    switch (strategy) {
        case retry_strategy::retry_failed:
        case retry_strategy::manual_passwords:
            return failed_files(results);
        case retry_strategy::retry_skipped:
            return skipped_files(results);
        case retry_strategy::retry_all: {
            std::vector<std::string> files;
            for (const auto& r : results) {
                if (!r.success) files.push_back(path_of(r));
            }
            return files;
        }
        case retry_strategy::retry_specific:
        default:
            return {};
    }
}

auto retry_policy::create_retry_jobs(const std::vector<import_job>& jobs,
                                     const std::vector<std::string>& files,
                                     retry_strategy strategy) -> std::vector<import_job> {
    std::unordered_set<std::string> wanted(files.begin(), files.end());

    std::vector<import_job> retry_jobs;
    for (const auto& job : jobs) {
        if (wanted.count(job.keystore_path.string()) == 0) {
            continue;
        }

        auto copy = job;
        if (strategy == retry_strategy::manual_passwords) {
            copy.password_path.clear();
            copy.manual_password.reset();
            copy.requires_input = true;
        }
        retry_jobs.push_back(std::move(copy));
    }
    return retry_jobs;
}

// ============================================================================
// Completion screen helpers
// ============================================================================

auto retry_policy::skip_reason(const error& err) -> std::string {
    if (!err) {
        return "User chose to skip";
    }

    auto lowered = to_lower(err.message);
    if (lowered.find("cancelled") != std::string::npos) {
        return "User cancelled password input";
    }
    if (lowered.find("skipped") != std::string::npos) {
        return "User chose to skip this file";
    }
    if (lowered.find("timeout") != std::string::npos) {
        return "Password input timed out";
    }
    return "User action required";
}

auto retry_policy::recovery_suggestions(const error& err) -> std::vector<std::string> {
    if (!err) {
        return {"Try the operation again"};
    }

    auto lowered = to_lower(err.message);
    std::vector<std::string> suggestions;

    if (contains_any(lowered, {"password", "decrypt"})) {
        suggestions.emplace_back("Verify the password is correct");
        suggestions.emplace_back("Check if a .pwd file exists with the correct password");
        suggestions.emplace_back("Try entering the password manually");
    }
    if (contains_any(lowered, {"permission", "access"})) {
        suggestions.emplace_back("Check file permissions");
        suggestions.emplace_back("Ensure the file is not locked by another process");
    }
    if (lowered.find("not found") != std::string::npos) {
        suggestions.emplace_back("Verify the file path is correct");
        suggestions.emplace_back("Ensure the file exists and is accessible");
    }
    if (contains_any(lowered, {"format", "invalid"})) {
        suggestions.emplace_back("Verify the file is a valid keystore");
        suggestions.emplace_back("Check if the file is corrupted");
    }
    if (err.code == error_code::duplicate_keystore) {
        suggestions.emplace_back("Remove the duplicate keystore from the selection");
    }

    if (suggestions.empty()) {
        suggestions.emplace_back("Review the error message and try again");
    }
    return suggestions;
}

auto retry_policy::available_actions(const import_summary& summary)
    -> std::vector<completion_action> {
    std::vector<completion_action> actions{completion_action::return_to_menu};

    bool retryable = std::any_of(summary.errors.begin(), summary.errors.end(),
                                 [](const import_error& e) { return is_retryable(e); });
    if (retryable) {
        actions.push_back(completion_action::retry_failed);
        actions.push_back(completion_action::retry_with_manual_passwords);
    }

    if (!summary.errors.empty()) {
        actions.push_back(completion_action::view_error_details);
    }

    actions.push_back(completion_action::select_different_files);
    return actions;
}

auto retry_policy::build_report(const std::vector<import_result>& results,
                                std::chrono::milliseconds elapsed) -> completion_report {
    completion_report report;
    report.summary = build_summary(results);
    report.failed_files = failed_files(results);
    report.skipped_files = skipped_files(results);
    report.retryable_files = retryable_files(results);
    report.actions = available_actions(report.summary);
    report.elapsed = elapsed;
    return report;
}

}  // namespace kcenon::batch_import
