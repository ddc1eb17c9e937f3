/**
 * @file import_events.h
 * @brief Lifecycle events emitted by the import controller
 */

#ifndef KCENON_BATCH_IMPORT_CONTROLLER_IMPORT_EVENTS_H
#define KCENON_BATCH_IMPORT_CONTROLLER_IMPORT_EVENTS_H

#include <kcenon/batch_import/core/import_types.h>
#include <kcenon/batch_import/core/retry_policy.h>

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kcenon::batch_import {

enum class listener_kind {
    progress,
    password_request,
};

/**
 * @brief The worker finished; carries one result per job
 */
struct batch_complete_event {
    std::vector<import_result> results;
};

struct progress_update_event {
    import_progress progress;
};

struct password_request_event {
    password_request request;
};

/**
 * @brief A listener timed out without data and should be issued again
 */
struct continue_listening_event {
    listener_kind listener = listener_kind::progress;
};

struct return_to_selection_event {};

struct return_to_menu_event {};

struct retry_request_event {
    retry_strategy strategy = retry_strategy::retry_failed;
    std::vector<std::string> files;
};

using import_event = std::variant<batch_complete_event,
                                  progress_update_event,
                                  password_request_event,
                                  continue_listening_event,
                                  return_to_selection_event,
                                  return_to_menu_event,
                                  retry_request_event>;

/**
 * @brief Deferred unit of work producing at most one event
 *
 * Commands may block (on a channel or on the whole batch) and are meant
 * to run on a pool thread. An empty optional means nothing further to do.
 */
using import_command = std::function<std::optional<import_event>()>;

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_CONTROLLER_IMPORT_EVENTS_H
