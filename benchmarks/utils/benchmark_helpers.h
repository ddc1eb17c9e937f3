/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for batch import benchmarks
 */

#ifndef KCENON_BATCH_IMPORT_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_BATCH_IMPORT_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/batch_import/worker/keystore_decryptor.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::batch_import::benchmark {

/**
 * @brief Decryptor accepting keystores written by keystore_set
 *
 * The expected password is the keystore's "id" field; no real
 * cryptography is performed, so timings cover orchestration only.
 */
class plaintext_decryptor : public keystore_decryptor {
public:
    auto inspect(const std::filesystem::path& keystore_path) const -> result<void> override;

    auto verify_password(const std::filesystem::path& keystore_path,
                         const std::string& password) const -> bool override;

    auto import_keystore(const std::filesystem::path& keystore_path,
                         const std::string& password,
                         const std::string& wallet_name) -> result<std::string> override;
};

/**
 * @brief Directory of generated keystores, removed on destruction
 */
class keystore_set {
public:
    /**
     * @param count Number of keystores
     * @param with_password_files Write a .pwd file beside each keystore
     */
    keystore_set(std::size_t count, bool with_password_files);
    ~keystore_set();

    keystore_set(const keystore_set&) = delete;
    auto operator=(const keystore_set&) -> keystore_set& = delete;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return dir_; }
    [[nodiscard]] auto files() const -> const std::vector<std::filesystem::path>& {
        return files_;
    }

private:
    std::filesystem::path dir_;
    std::vector<std::filesystem::path> files_;
};

}  // namespace kcenon::batch_import::benchmark

#endif  // KCENON_BATCH_IMPORT_BENCHMARKS_BENCHMARK_HELPERS_H
