/**
 * @file checksum.h
 * @brief Content hashing used to detect duplicate keystores
 */

#ifndef KCENON_BATCH_IMPORT_CORE_CHECKSUM_H
#define KCENON_BATCH_IMPORT_CORE_CHECKSUM_H

#include <kcenon/batch_import/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::batch_import {

/**
 * @brief SHA-256 helpers backed by OpenSSL EVP
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of a file
     * @return Lowercase hex digest, or file_not_found / internal_error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Calculate SHA-256 hash of data
     * @return Lowercase hex digest, or internal_error if OpenSSL fails
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> result<std::string>;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_CORE_CHECKSUM_H
