/**
 * @file progress_validator.h
 * @brief Consistency checks for worker progress snapshots
 */

#ifndef KCENON_BATCH_IMPORT_CORE_PROGRESS_VALIDATOR_H
#define KCENON_BATCH_IMPORT_CORE_PROGRESS_VALIDATOR_H

#include <kcenon/batch_import/core/import_types.h>
#include <kcenon/batch_import/core/types.h>

namespace kcenon::batch_import {

/**
 * @brief Validates progress snapshots before they reach the display
 *
 * A snapshot is rejected when its counts are out of range, its percentage
 * disagrees with processed/total by more than percentage_tolerance, or it
 * moves backwards relative to the last accepted snapshot. Going back to
 * zero processed files is an explicit reset and is accepted.
 */
class progress_validator {
public:
    static constexpr double percentage_tolerance = 1.0;

    /**
     * @brief Validate a snapshot on its own
     */
    [[nodiscard]] static auto validate(const import_progress& progress) -> result<void>;

    /**
     * @brief Validate a snapshot against the last accepted one
     *
     * @p previous is ignored when its total_files is not positive, which is
     * the state before any batch has been started.
     */
    [[nodiscard]] static auto validate(const import_progress& progress,
                                       const import_progress& previous) -> result<void>;

    /**
     * @brief Percentage implied by the counts of a snapshot
     */
    [[nodiscard]] static auto expected_percentage(int processed, int total) -> double;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_CORE_PROGRESS_VALIDATOR_H
