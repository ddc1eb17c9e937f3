/**
 * @file keystore_batch_importer.h
 * @brief Reference batch worker importing keystore files
 */

#ifndef KCENON_BATCH_IMPORT_WORKER_KEYSTORE_BATCH_IMPORTER_H
#define KCENON_BATCH_IMPORT_WORKER_KEYSTORE_BATCH_IMPORTER_H

#include <kcenon/batch_import/core/import_config.h>
#include <kcenon/batch_import/core/retry_policy.h>
#include <kcenon/batch_import/worker/batch_importer_interface.h>
#include <kcenon/batch_import/worker/keystore_decryptor.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace kcenon::batch_import {

/**
 * @brief Outcome of the last directory scan
 */
struct discovery_report {
    std::filesystem::path directory;
    int valid_keystores = 0;
    int invalid_files = 0;
    int password_files_found = 0;
    std::vector<import_error> scan_errors;
};

/**
 * @brief Sequential keystore importer
 *
 * Processes jobs in order. For each job the password comes from the job's
 * manual password, then from its .pwd file, then from the user through the
 * password handshake (up to max_password_attempts tries). Keystores whose
 * contents hash to an already-imported file in the same batch are rejected
 * as duplicates.
 *
 * @code
 * auto importer = keystore_batch_importer::builder()
 *     .with_decryptor(std::make_shared<my_decryptor>())
 *     .build();
 * @endcode
 */
class keystore_batch_importer : public batch_importer_interface {
public:
    class builder;

    ~keystore_batch_importer() override;

    keystore_batch_importer(const keystore_batch_importer&) = delete;
    auto operator=(const keystore_batch_importer&) -> keystore_batch_importer& = delete;

    keystore_batch_importer(keystore_batch_importer&&) noexcept;
    auto operator=(keystore_batch_importer&&) noexcept -> keystore_batch_importer&;

    [[nodiscard]] auto create_import_jobs_from_files(
        const std::vector<std::filesystem::path>& files)
        -> result<std::vector<import_job>> override;

    [[nodiscard]] auto create_import_jobs_from_directory(const std::filesystem::path& directory)
        -> result<std::vector<import_job>> override;

    [[nodiscard]] auto validate_import_jobs(std::vector<import_job>& jobs)
        -> result<void> override;

    auto import_batch(const std::vector<import_job>& jobs,
                      channel_sender<import_progress> progress,
                      channel_sender<password_request> requests,
                      channel_receiver<password_response> responses)
        -> std::vector<import_result> override;

    [[nodiscard]] auto get_import_summary(const std::vector<import_result>& results) const
        -> import_summary override;

    /**
     * @brief Jobs for retrying the given failed results
     */
    [[nodiscard]] auto create_recovery_jobs(const std::vector<import_result>& failed,
                                            retry_strategy strategy) const
        -> std::vector<import_job>;

    [[nodiscard]] auto last_discovery_report() const -> discovery_report;

    [[nodiscard]] auto config() const -> const import_config&;

private:
    struct impl;
    explicit keystore_batch_importer(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

class keystore_batch_importer::builder {
public:
    builder();

    auto with_decryptor(std::shared_ptr<keystore_decryptor> decryptor) -> builder&;
    auto with_config(const import_config& config) -> builder&;

    /**
     * @return invalid_configuration when no decryptor is set or the
     *         configuration is invalid
     */
    [[nodiscard]] auto build() -> result<keystore_batch_importer>;

private:
    std::shared_ptr<keystore_decryptor> decryptor_;
    import_config config_;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_WORKER_KEYSTORE_BATCH_IMPORTER_H
