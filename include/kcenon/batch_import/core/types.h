/**
 * @file types.h
 * @brief Core error and result types for batch_import
 */

#ifndef KCENON_BATCH_IMPORT_CORE_TYPES_H
#define KCENON_BATCH_IMPORT_CORE_TYPES_H

#include <optional>
#include <string>
#include <utility>

namespace kcenon::batch_import {

/**
 * @brief Error codes for batch import operations
 */
enum class error_code {
    success = 0,

    // Phase errors (-100 to -119)
    invalid_phase_transition = -100,
    invalid_phase = -101,
    no_selection = -102,

    // Job errors (-120 to -139)
    job_creation_failed = -120,
    job_validation_failed = -121,
    no_jobs = -122,
    empty_keystore_path = -123,
    empty_wallet_name = -124,

    // Channel errors (-140 to -159)
    channel_unavailable = -140,
    channel_closed = -141,
    channel_timeout = -142,
    invalid_progress = -143,

    // File errors (-160 to -179)
    file_not_found = -160,
    file_access_denied = -161,
    directory_not_found = -162,
    not_a_directory = -163,
    no_keystores_found = -164,
    invalid_keystore = -165,

    // Password file errors (-180 to -199)
    password_file_not_found = -180,
    password_file_unreadable = -181,
    password_file_empty = -182,
    password_file_invalid = -183,
    password_file_oversized = -184,
    password_file_corrupted = -185,

    // Password input errors (-200 to -219)
    password_input_cancelled = -200,
    password_input_skipped = -201,
    password_input_timeout = -202,
    password_input_invalid = -203,
    password_max_attempts = -204,

    // Import errors (-220 to -239)
    keystore_import_failed = -220,
    duplicate_keystore = -221,
    import_interrupted = -222,

    // Configuration and internal errors (-240 to -259)
    invalid_configuration = -240,
    internal_error = -241,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_phase_transition:
            return "invalid phase transition";
        case error_code::invalid_phase:
            return "operation not allowed in current phase";
        case error_code::no_selection:
            return "no files or directory selected for import";
        case error_code::job_creation_failed:
            return "failed to create import jobs";
        case error_code::job_validation_failed:
            return "import job validation failed";
        case error_code::no_jobs:
            return "no import jobs provided";
        case error_code::empty_keystore_path:
            return "keystore path cannot be empty";
        case error_code::empty_wallet_name:
            return "wallet name cannot be empty";
        case error_code::channel_unavailable:
            return "channel unavailable";
        case error_code::channel_closed:
            return "channel closed";
        case error_code::channel_timeout:
            return "channel timeout";
        case error_code::invalid_progress:
            return "invalid progress snapshot";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::directory_not_found:
            return "directory not found";
        case error_code::not_a_directory:
            return "path is not a directory";
        case error_code::no_keystores_found:
            return "no valid keystore files found";
        case error_code::invalid_keystore:
            return "invalid keystore file";
        case error_code::password_file_not_found:
            return "password file not found";
        case error_code::password_file_unreadable:
            return "password file unreadable";
        case error_code::password_file_empty:
            return "password file is empty";
        case error_code::password_file_invalid:
            return "password file invalid";
        case error_code::password_file_oversized:
            return "password file too large";
        case error_code::password_file_corrupted:
            return "password file corrupted";
        case error_code::password_input_cancelled:
            return "password input cancelled by user";
        case error_code::password_input_skipped:
            return "import skipped by user";
        case error_code::password_input_timeout:
            return "password input timeout";
        case error_code::password_input_invalid:
            return "invalid password";
        case error_code::password_max_attempts:
            return "maximum password attempts exceeded";
        case error_code::keystore_import_failed:
            return "keystore import failed";
        case error_code::duplicate_keystore:
            return "duplicate keystore";
        case error_code::import_interrupted:
            return "import interrupted";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

[[nodiscard]] constexpr auto is_phase_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -100 && v >= -119;
}

[[nodiscard]] constexpr auto is_job_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -120 && v >= -139;
}

[[nodiscard]] constexpr auto is_channel_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -140 && v >= -159;
}

[[nodiscard]] constexpr auto is_file_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -160 && v >= -179;
}

[[nodiscard]] constexpr auto is_password_file_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -180 && v >= -199;
}

[[nodiscard]] constexpr auto is_password_input_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -200 && v >= -219;
}

/**
 * @brief Check whether a password file error can be recovered from
 *
 * Missing, unreadable and empty password files fall back to interactive
 * input. Oversized, invalid and corrupted files are reported as-is.
 */
[[nodiscard]] constexpr auto is_recoverable(error_code code) -> bool {
    switch (code) {
        case error_code::password_file_not_found:
        case error_code::password_file_unreadable:
        case error_code::password_file_empty:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    /**
     * @brief Return a copy whose message is prefixed with context
     *
     * The code is preserved so callers can still branch on the cause.
     */
    [[nodiscard]] auto wrap(const std::string& context) const -> error {
        return error{code, context + ": " + message};
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_CORE_TYPES_H
