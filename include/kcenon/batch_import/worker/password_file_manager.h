/**
 * @file password_file_manager.h
 * @brief Lookup and validation of .pwd files stored beside keystores
 */

#ifndef KCENON_BATCH_IMPORT_WORKER_PASSWORD_FILE_MANAGER_H
#define KCENON_BATCH_IMPORT_WORKER_PASSWORD_FILE_MANAGER_H

#include <kcenon/batch_import/core/import_config.h>
#include <kcenon/batch_import/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string>

namespace kcenon::batch_import {

/**
 * @brief Password file manager
 *
 * A keystore "dir/wallet.json" is paired with "dir/wallet.pwd". The file
 * must be a regular file no larger than max_password_file_size bytes, hold
 * valid UTF-8, and contain a non-blank password once surrounding
 * whitespace is trimmed.
 */
class password_file_manager {
public:
    explicit password_file_manager(const import_config& config = {});

    /**
     * @brief Locate the password file paired with a keystore
     * @return Path of an existing password file, or password_file_not_found
     */
    [[nodiscard]] auto find_password_file(const std::filesystem::path& keystore_path) const
        -> result<std::filesystem::path>;

    /**
     * @brief Check file type and size without reading the contents
     */
    [[nodiscard]] auto validate_password_file(const std::filesystem::path& password_path) const
        -> result<void>;

    /**
     * @brief Read, decode and trim the password
     */
    [[nodiscard]] auto read_password_file(const std::filesystem::path& password_path) const
        -> result<std::string>;

    [[nodiscard]] auto validate_password_length(const std::string& password) const
        -> result<void>;

    /**
     * @brief True when no usable password file exists for the keystore
     */
    [[nodiscard]] auto requires_manual_password(const std::filesystem::path& keystore_path) const
        -> bool;

    [[nodiscard]] static auto is_valid_utf8(const std::string& data) -> bool;

private:
    std::string extension_;
    std::size_t max_file_size_;
    std::size_t max_password_length_;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_WORKER_PASSWORD_FILE_MANAGER_H
