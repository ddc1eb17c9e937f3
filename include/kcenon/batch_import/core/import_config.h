/**
 * @file import_config.h
 * @brief Tunables for the import controller and reference worker
 */

#ifndef KCENON_BATCH_IMPORT_CORE_IMPORT_CONFIG_H
#define KCENON_BATCH_IMPORT_CORE_IMPORT_CONFIG_H

#include <chrono>
#include <cstddef>
#include <string>

namespace kcenon::batch_import {

/**
 * @brief Import configuration
 *
 * The password request and response channels always hold a single item
 * and are not configurable.
 */
struct import_config {
    std::size_t progress_channel_capacity = 500;
    std::chrono::milliseconds progress_send_timeout{500};
    std::chrono::milliseconds progress_poll_timeout{1000};
    std::chrono::milliseconds password_poll_timeout{100};
    std::chrono::milliseconds password_response_timeout{std::chrono::minutes{5}};
    int max_password_attempts = 3;

    std::string password_file_extension = ".pwd";
    std::size_t max_password_file_size = 1024;
    std::size_t max_password_length = 256;
    std::string keystore_extension = ".json";
    bool detect_duplicates = true;

    [[nodiscard]] auto is_valid() const -> bool {
        return progress_channel_capacity > 0 &&
               progress_send_timeout.count() >= 0 &&
               progress_poll_timeout.count() > 0 &&
               password_poll_timeout.count() > 0 &&
               password_response_timeout.count() > 0 &&
               max_password_attempts > 0 &&
               !password_file_extension.empty() &&
               max_password_file_size > 0 &&
               max_password_length > 0 &&
               max_password_length <= max_password_file_size &&
               !keystore_extension.empty();
    }
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_CORE_IMPORT_CONFIG_H
