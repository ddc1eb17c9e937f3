/**
 * @file batch_importer_interface.h
 * @brief Contract between the import controller and the batch worker
 */

#ifndef KCENON_BATCH_IMPORT_WORKER_BATCH_IMPORTER_INTERFACE_H
#define KCENON_BATCH_IMPORT_WORKER_BATCH_IMPORTER_INTERFACE_H

#include <kcenon/batch_import/core/bounded_channel.h>
#include <kcenon/batch_import/core/import_types.h>
#include <kcenon/batch_import/core/types.h>

#include <filesystem>
#include <vector>

namespace kcenon::batch_import {

/**
 * @brief Batch import worker
 *
 * Job creation and validation run on the controller's caller thread.
 * import_batch() runs on a separate task and talks to the controller only
 * through the three channel handles it receives:
 *
 * - progress: snapshots; intermediate sends may be dropped, the last
 *   snapshot of a batch must be delivered.
 * - requests: at most one outstanding password_request at a time.
 * - responses: after each request the worker blocks here for exactly one
 *   password_response. A closed channel means the controller was
 *   cancelled; the worker must stop asking and finish the batch.
 *
 * import_batch() returns one import_result per input job, in job order.
 */
class batch_importer_interface {
public:
    virtual ~batch_importer_interface() = default;

    [[nodiscard]] virtual auto create_import_jobs_from_files(
        const std::vector<std::filesystem::path>& files) -> result<std::vector<import_job>> = 0;

    [[nodiscard]] virtual auto create_import_jobs_from_directory(
        const std::filesystem::path& directory) -> result<std::vector<import_job>> = 0;

    /**
     * @brief Validate jobs before a run
     *
     * May demote a job to interactive input (clearing its password file)
     * instead of failing when only the password file is unusable.
     */
    [[nodiscard]] virtual auto validate_import_jobs(std::vector<import_job>& jobs)
        -> result<void> = 0;

    virtual auto import_batch(const std::vector<import_job>& jobs,
                              channel_sender<import_progress> progress,
                              channel_sender<password_request> requests,
                              channel_receiver<password_response> responses)
        -> std::vector<import_result> = 0;

    [[nodiscard]] virtual auto get_import_summary(
        const std::vector<import_result>& results) const -> import_summary = 0;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_WORKER_BATCH_IMPORTER_INTERFACE_H
