/**
 * @file keystore_decryptor.h
 * @brief Boundary to the cryptographic keystore import
 */

#ifndef KCENON_BATCH_IMPORT_WORKER_KEYSTORE_DECRYPTOR_H
#define KCENON_BATCH_IMPORT_WORKER_KEYSTORE_DECRYPTOR_H

#include <kcenon/batch_import/core/types.h>

#include <filesystem>
#include <string>

namespace kcenon::batch_import {

/**
 * @brief Decrypts and stores keystores on behalf of the reference importer
 *
 * Implementations own the cryptography and the wallet store. They are
 * called from the worker thread only, one keystore at a time.
 */
class keystore_decryptor {
public:
    virtual ~keystore_decryptor() = default;

    /**
     * @brief Cheap structural check used while scanning directories
     * @return invalid_keystore describing the problem when rejected
     */
    [[nodiscard]] virtual auto inspect(const std::filesystem::path& keystore_path) const
        -> result<void> = 0;

    /**
     * @brief Check a password without importing
     */
    [[nodiscard]] virtual auto verify_password(const std::filesystem::path& keystore_path,
                                               const std::string& password) const -> bool = 0;

    /**
     * @brief Decrypt the keystore and store it under @p wallet_name
     * @return Identifier of the stored wallet (for example its address)
     */
    [[nodiscard]] virtual auto import_keystore(const std::filesystem::path& keystore_path,
                                               const std::string& password,
                                               const std::string& wallet_name)
        -> result<std::string> = 0;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_WORKER_KEYSTORE_DECRYPTOR_H
