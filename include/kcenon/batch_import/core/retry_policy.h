/**
 * @file retry_policy.h
 * @brief Classification of import results and construction of retry plans
 */

#ifndef KCENON_BATCH_IMPORT_CORE_RETRY_POLICY_H
#define KCENON_BATCH_IMPORT_CORE_RETRY_POLICY_H

#include <kcenon/batch_import/core/import_types.h>
#include <kcenon/batch_import/core/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::batch_import {

/**
 * @brief Broad cause of an import failure
 */
enum class error_category {
    file_system,
    validation,
    password,
    user_action,
    system,
    unknown,
};

[[nodiscard]] constexpr auto to_string(error_category category) -> const char* {
    switch (category) {
        case error_category::file_system:
            return "file_system";
        case error_category::validation:
            return "validation";
        case error_category::password:
            return "password";
        case error_category::user_action:
            return "user_action";
        case error_category::system:
            return "system";
        default:
            return "unknown";
    }
}

/**
 * @brief Which files a retry should cover
 */
enum class retry_strategy {
    retry_failed,      ///< Failed, not skipped
    retry_skipped,     ///< Skipped by the user
    retry_all,         ///< Everything that did not succeed
    manual_passwords,  ///< Same files as retry_failed, forcing interactive input
    retry_specific,    ///< A single file chosen by path
};

[[nodiscard]] constexpr auto to_string(retry_strategy strategy) -> const char* {
    switch (strategy) {
        case retry_strategy::retry_failed:
            return "retry_failed";
        case retry_strategy::retry_skipped:
            return "retry_skipped";
        case retry_strategy::retry_all:
            return "retry_all";
        case retry_strategy::manual_passwords:
            return "manual_passwords";
        case retry_strategy::retry_specific:
            return "retry_specific";
        default:
            return "unknown";
    }
}

[[nodiscard]] auto parse_retry_strategy(std::string_view name) -> std::optional<retry_strategy>;

/**
 * @brief Actions offered once a batch has completed
 */
enum class completion_action {
    return_to_menu,
    retry_failed,
    retry_with_manual_passwords,
    view_error_details,
    select_different_files,
};

[[nodiscard]] constexpr auto to_string(completion_action action) -> const char* {
    switch (action) {
        case completion_action::return_to_menu:
            return "Return to Menu";
        case completion_action::retry_failed:
            return "Retry Failed Imports";
        case completion_action::retry_with_manual_passwords:
            return "Retry with Manual Passwords";
        case completion_action::view_error_details:
            return "View Error Details";
        case completion_action::select_different_files:
            return "Select Different Files";
        default:
            return "Unknown Action";
    }
}

/**
 * @brief Everything the completion screen needs, computed once
 */
struct completion_report {
    import_summary summary;
    std::vector<std::string> failed_files;
    std::vector<std::string> skipped_files;
    std::vector<std::string> retryable_files;
    std::vector<completion_action> actions;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto has_retryable_errors() const -> bool { return !retryable_files.empty(); }

    /**
     * @brief One-paragraph summary, e.g. "Total files: 3, Successful: 2, Failed: 1"
     */
    [[nodiscard]] auto summary_text() const -> std::string;
};

/**
 * @brief Stateless retry and completion policy
 *
 * Retryability is decided on the error text, case-insensitively: password
 * problems, permission or access problems and timeouts are worth another
 * attempt. Skipped and successful results are never retryable.
 */
class retry_policy {
public:
    [[nodiscard]] static auto is_retryable(std::string_view message) -> bool;
    [[nodiscard]] static auto is_retryable(const import_result& result) -> bool;
    [[nodiscard]] static auto is_retryable(const import_error& entry) -> bool;

    [[nodiscard]] static auto categorize(const error& err) -> error_category;

    /**
     * @brief Count results and collect the error list
     *
     * Skipped results appear in the error list with skipped set.
     */
    [[nodiscard]] static auto build_summary(const std::vector<import_result>& results)
        -> import_summary;

    [[nodiscard]] static auto failed_files(const std::vector<import_result>& results)
        -> std::vector<std::string>;
    [[nodiscard]] static auto skipped_files(const std::vector<import_result>& results)
        -> std::vector<std::string>;
    [[nodiscard]] static auto retryable_files(const std::vector<import_result>& results)
        -> std::vector<std::string>;

    /**
     * @brief Files covered by a strategy
     *
     * retry_specific needs a path and always yields an empty list here;
     * use retry_policy::create_retry_jobs with a single file instead.
     */
    [[nodiscard]] static auto files_for_strategy(const std::vector<import_result>& results,
                                                 retry_strategy strategy)
        -> std::vector<std::string>;

    /**
     * @brief Build the jobs for a retry run
     *
     * Jobs whose keystore path is not in @p files are dropped. For
     * manual_passwords the password file and any manual password are
     * cleared so the worker asks interactively.
     */
    [[nodiscard]] static auto create_retry_jobs(const std::vector<import_job>& jobs,
                                                const std::vector<std::string>& files,
                                                retry_strategy strategy)
        -> std::vector<import_job>;

    [[nodiscard]] static auto skip_reason(const error& err) -> std::string;
    [[nodiscard]] static auto recovery_suggestions(const error& err) -> std::vector<std::string>;
    [[nodiscard]] static auto available_actions(const import_summary& summary)
        -> std::vector<completion_action>;

    [[nodiscard]] static auto build_report(const std::vector<import_result>& results,
                                           std::chrono::milliseconds elapsed)
        -> completion_report;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_CORE_RETRY_POLICY_H
