/**
 * @file import_types.h
 * @brief Job, result, progress and handshake types for batch import
 */

#ifndef KCENON_BATCH_IMPORT_CORE_IMPORT_TYPES_H
#define KCENON_BATCH_IMPORT_CORE_IMPORT_TYPES_H

#include <kcenon/batch_import/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::batch_import {

/**
 * @brief Phase of the import orchestration state machine
 */
enum class import_phase {
    file_selection,
    importing,
    password_input,
    complete,
    cancelled,
};

[[nodiscard]] constexpr auto to_string(import_phase phase) -> const char* {
    switch (phase) {
        case import_phase::file_selection:
            return "File Selection";
        case import_phase::importing:
            return "Importing";
        case import_phase::password_input:
            return "Password Input";
        case import_phase::complete:
            return "Complete";
        case import_phase::cancelled:
            return "Cancelled";
        default:
            return "Unknown";
    }
}

/**
 * @brief One unit of import work
 *
 * Jobs are produced by the importer and not modified once handed to the
 * controller. Recovery jobs are built as new copies.
 */
struct import_job {
    std::filesystem::path keystore_path;
    std::filesystem::path password_path;        ///< Empty when no .pwd file was found
    std::optional<std::string> manual_password;  ///< Overrides the password file
    std::string wallet_name;
    bool requires_input = false;
};

/**
 * @brief Outcome of one job, created exactly once by the worker
 */
struct import_result {
    import_job job;
    bool success = false;
    bool skipped = false;
    std::optional<error> failure;
    std::string wallet_id;    ///< Identifier returned by the decryptor on success
    std::string source_hash;  ///< Hex SHA-256 of the keystore contents

    [[nodiscard]] auto error_message() const -> std::string {
        return failure ? failure->message : std::string{};
    }
};

/**
 * @brief Per-file error entry carried in progress snapshots and summaries
 */
struct import_error {
    std::string file;
    error cause;
    bool skipped = false;
};

/**
 * @brief Point-in-time progress report from the worker
 */
struct import_progress {
    std::string current_file;
    int total_files = 0;
    int processed_files = 0;
    double percentage = 0.0;
    std::vector<import_error> errors;
    bool pending_password = false;
    std::string pending_file;
    std::chrono::system_clock::time_point start_time{};
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Aggregate counts derived from a result list
 */
struct import_summary {
    int total_files = 0;
    int successful_imports = 0;
    int failed_imports = 0;
    int skipped_imports = 0;
    std::vector<import_error> errors;
};

/**
 * @brief Request for interactive password input, consumed exactly once
 */
struct password_request {
    std::string keystore_file;
    int attempt_count = 1;
    bool is_retry = false;
    std::optional<std::string> error_message;
    std::uint64_t request_id = 0;  ///< Echoed by the matching response
};

/**
 * @brief Answer to a password_request, consumed exactly once by the worker
 */
struct password_response {
    std::string password;
    bool cancelled = false;
    bool skip = false;
    std::uint64_t request_id = 0;  ///< Id of the request being answered

    [[nodiscard]] auto operator==(const password_response&) const -> bool = default;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_CORE_IMPORT_TYPES_H
