/**
 * @file batch_import.h
 * @brief Main header for the batch_import library
 * @version 0.1.0
 *
 * @code
 * #include <kcenon/batch_import/batch_import.h>
 *
 * using namespace kcenon::batch_import;
 *
 * auto importer = keystore_batch_importer::builder()
 *     .with_decryptor(decryptor)
 *     .build();
 *
 * auto controller = import_controller::builder()
 *     .with_importer(std::make_shared<keystore_batch_importer>(std::move(importer.value())))
 *     .build();
 * @endcode
 */

#ifndef KCENON_BATCH_IMPORT_BATCH_IMPORT_H
#define KCENON_BATCH_IMPORT_BATCH_IMPORT_H

#include <string>

// Core
#include "kcenon/batch_import/core/types.h"
#include "kcenon/batch_import/core/import_types.h"
#include "kcenon/batch_import/core/import_config.h"
#include "kcenon/batch_import/core/bounded_channel.h"
#include "kcenon/batch_import/core/checksum.h"
#include "kcenon/batch_import/core/progress_validator.h"
#include "kcenon/batch_import/core/retry_policy.h"
#include "kcenon/batch_import/core/logging.h"

// Worker
#include "kcenon/batch_import/worker/batch_importer_interface.h"
#include "kcenon/batch_import/worker/keystore_decryptor.h"
#include "kcenon/batch_import/worker/keystore_batch_importer.h"
#include "kcenon/batch_import/worker/password_file_manager.h"

// Controller
#include "kcenon/batch_import/controller/import_events.h"
#include "kcenon/batch_import/controller/import_controller.h"

// Driver
#include "kcenon/batch_import/adapters/thread_pool_adapter.h"
#include "kcenon/batch_import/driver/import_session.h"

namespace kcenon::batch_import {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_BATCH_IMPORT_H
