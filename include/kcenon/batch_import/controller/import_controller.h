/**
 * @file import_controller.h
 * @brief Import phase state machine and channel owner
 */

#ifndef KCENON_BATCH_IMPORT_CONTROLLER_IMPORT_CONTROLLER_H
#define KCENON_BATCH_IMPORT_CONTROLLER_IMPORT_CONTROLLER_H

#include <kcenon/batch_import/controller/import_events.h>
#include <kcenon/batch_import/core/bounded_channel.h>
#include <kcenon/batch_import/core/import_config.h>
#include <kcenon/batch_import/core/import_types.h>
#include <kcenon/batch_import/core/retry_policy.h>
#include <kcenon/batch_import/core/types.h>
#include <kcenon/batch_import/worker/batch_importer_interface.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::batch_import {

/**
 * @brief Optional file picker capability
 *
 * Reset when the controller returns to file selection.
 */
class file_selection_component {
public:
    virtual ~file_selection_component() = default;
    virtual void reset() = 0;
};

/**
 * @brief Optional progress display capability
 */
class progress_display {
public:
    virtual ~progress_display() = default;

    virtual void reset(int total_files) = 0;

    /**
     * @param paused True while the worker waits for a password
     * @param last_error Message of the most recent error, empty if none
     */
    virtual void update(const import_progress& progress,
                        bool paused,
                        const std::string& last_error) = 0;

    virtual void finish() = 0;
};

/**
 * @brief Data for the password popup shown in PasswordInput
 */
struct password_prompt {
    std::string keystore_file;
    int attempt = 1;
    int max_attempts = 3;
    bool is_retry = false;
    std::optional<std::string> error_message;  ///< Set only for retries with a message
};

/**
 * @brief Diagnostic snapshot of the controller
 */
struct import_state_info {
    import_phase phase = import_phase::file_selection;
    std::size_t selected_files = 0;
    std::string selected_directory;
    std::size_t import_jobs = 0;
    std::size_t results = 0;
    bool showing_popup = false;
    bool pending_password = false;
    bool completed = false;
    bool cancelled = false;
    std::string error_message;

    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief The worker's half of the controller channels
 */
struct worker_channels {
    channel_sender<import_progress> progress;
    channel_sender<password_request> requests;
    channel_receiver<password_response> responses;
};

/**
 * @brief Import orchestration state machine
 *
 * Phases and allowed transitions:
 *
 * | From           | To                                   |
 * |----------------|--------------------------------------|
 * | file_selection | importing, cancelled                 |
 * | importing      | password_input, complete, cancelled  |
 * | password_input | importing, complete, cancelled       |
 * | complete       | file_selection, cancelled            |
 * | cancelled      | file_selection                       |
 *
 * Every phase may transition to itself, which re-runs its setup. Setup runs
 * under the same writer lock that guards the phase, so no transition is
 * observable half-applied. Failed operations leave the controller exactly
 * as it was.
 *
 * The controller owns three channels: progress (bounded), password
 * requests (one slot) and password responses (one slot). The worker only
 * ever sees worker_channels(). Cancelling closes all three, which unblocks
 * a worker waiting for a password. Entering Complete closes them too;
 * every new run gets fresh channels.
 *
 * @note Thread-safe. Cleanup callbacks, file_selection_component and
 *       progress_display are invoked while the controller lock is held and
 *       must not call back into the controller.
 *
 * @code
 * auto controller = import_controller::builder()
 *     .with_importer(importer)
 *     .with_config(config)
 *     .build();
 * @endcode
 */
class import_controller {
public:
    class builder;

    ~import_controller();

    import_controller(const import_controller&) = delete;
    auto operator=(const import_controller&) -> import_controller& = delete;

    import_controller(import_controller&&) noexcept;
    auto operator=(import_controller&&) noexcept -> import_controller&;

    // ========================================================================
    // Phase management
    // ========================================================================

    [[nodiscard]] auto current_phase() const -> import_phase;

    [[nodiscard]] static auto can_transition(import_phase from, import_phase to) -> bool;

    /**
     * @brief Move to @p to and run its setup
     * @return invalid_phase_transition if the table above forbids it
     */
    [[nodiscard]] auto transition_to(import_phase to) -> result<void>;

    // ========================================================================
    // Selection
    // ========================================================================

    void set_selected_files(std::vector<std::filesystem::path> files);
    void set_selected_directory(std::filesystem::path directory);
    [[nodiscard]] auto selected_files() const -> std::vector<std::filesystem::path>;
    [[nodiscard]] auto selected_directory() const -> std::filesystem::path;

    // ========================================================================
    // Import lifecycle
    // ========================================================================

    /**
     * @brief Build and validate jobs, then enter Importing
     *
     * Only valid in FileSelection. A selected directory takes precedence
     * over selected files. Importer failures are returned with context and
     * the phase is left unchanged. Fresh channels are created for the run.
     * The importer is called without the controller lock held; the call
     * fails with invalid_phase if another thread changed the phase or the
     * selection meanwhile.
     */
    [[nodiscard]] auto start_import() -> result<void>;

    /**
     * @brief Re-run part of the last batch
     *
     * Valid in Complete. Returns to FileSelection with @p files selected and
     * starts a run over the matching jobs of the previous batch, adjusted for
     * @p strategy.
     */
    [[nodiscard]] auto start_retry(retry_strategy strategy,
                                   const std::vector<std::string>& files) -> result<void>;

    /**
     * @brief Command that runs the worker over the current jobs
     *
     * Yields batch_complete_event. Run it on a separate task.
     */
    [[nodiscard]] auto process_import_batch() -> import_command;

    /**
     * @brief Store the request and enter PasswordInput
     *
     * Has no phase precondition of its own; fails only if the transition to
     * PasswordInput is not allowed from the current phase.
     */
    [[nodiscard]] auto handle_password_request(const password_request& request) -> result<void>;

    /**
     * @brief Answer the pending request and resume Importing
     * The answer carries the pending request's id and is handed over only
     * while the worker is blocked waiting for a response.
     * @return invalid_phase outside PasswordInput, channel_unavailable if
     *         no worker is waiting or the response slot is taken
     */
    [[nodiscard]] auto submit_password(const std::string& password) -> result<void>;
    [[nodiscard]] auto cancel_password_input() -> result<void>;
    [[nodiscard]] auto skip_password_input() -> result<void>;

    [[nodiscard]] auto complete_import(std::vector<import_result> results) -> result<void>;

    /**
     * @brief Enter Cancelled from any phase
     *
     * Runs registered cleanups once and closes the channels. Always succeeds.
     */
    auto cancel_import() -> result<void>;

    /**
     * @brief Apply a progress snapshot if it passes validation
     *
     * Rejected snapshots are dropped and logged as warnings. Never changes
     * the phase.
     * @return true when the snapshot was applied
     */
    auto update_progress(const import_progress& progress) -> bool;

    // ========================================================================
    // Listening
    // ========================================================================

    /**
     * @brief Command waiting up to progress_poll_timeout for a snapshot
     *
     * Yields progress_update_event, or continue_listening_event on timeout
     * while a batch is running. Yields nothing once the channel is closed or
     * the batch is over.
     */
    [[nodiscard]] auto listen_for_progress() const -> import_command;

    /**
     * @brief Command waiting up to password_poll_timeout for a request
     */
    [[nodiscard]] auto listen_for_password_requests() const -> import_command;

    [[nodiscard]] auto progress_channel() const -> channel_receiver<import_progress>;
    [[nodiscard]] auto password_request_channel() const -> channel_receiver<password_request>;
    [[nodiscard]] auto worker_channels() const -> struct worker_channels;

    // ========================================================================
    // Completion handling
    // ========================================================================

    [[nodiscard]] auto retry_import(retry_strategy strategy) const -> import_event;
    [[nodiscard]] auto retry_specific_file(const std::string& file) const -> import_event;

    /**
     * @brief Map a completion screen action to the event it triggers
     *
     * view_error_details has no event.
     */
    [[nodiscard]] auto handle_completion_action(completion_action action) const
        -> std::optional<import_event>;

    /**
     * @brief Leave Complete for FileSelection with @p files preselected
     */
    [[nodiscard]] auto restart_with_files(std::vector<std::filesystem::path> files)
        -> result<void>;

    // ========================================================================
    // Cleanup
    // ========================================================================

    /**
     * @brief Register a callback run once when the import is cancelled
     * @note Cleanups run while the controller holds its lock; they must not
     *       call back into the controller.
     */
    void add_cleanup(std::function<void()> cleanup);

    /**
     * @brief Run outstanding cleanups and close the channels
     */
    void cleanup();

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto jobs() const -> std::vector<import_job>;
    [[nodiscard]] auto results() const -> std::vector<import_result>;
    [[nodiscard]] auto summary() const -> import_summary;
    [[nodiscard]] auto completion() const -> std::optional<completion_report>;
    [[nodiscard]] auto current_progress() const -> import_progress;
    [[nodiscard]] auto pending_password_request() const -> std::optional<password_request>;
    [[nodiscard]] auto prompt() const -> std::optional<password_prompt>;
    [[nodiscard]] auto state_info() const -> import_state_info;
    [[nodiscard]] auto is_completed() const -> bool;
    [[nodiscard]] auto is_cancelled() const -> bool;
    [[nodiscard]] auto is_showing_popup() const -> bool;
    [[nodiscard]] auto last_error() const -> std::string;
    [[nodiscard]] auto config() const -> const import_config&;

private:
    struct impl;
    explicit import_controller(std::shared_ptr<impl> impl);

    std::shared_ptr<impl> impl_;
};

class import_controller::builder {
public:
    builder();

    auto with_importer(std::shared_ptr<batch_importer_interface> importer) -> builder&;
    auto with_config(const import_config& config) -> builder&;

    /// May be null.
    auto with_file_selection(std::shared_ptr<file_selection_component> component) -> builder&;

    /// May be null.
    auto with_progress_display(std::shared_ptr<progress_display> display) -> builder&;

    /**
     * @return invalid_configuration without an importer or with an invalid
     *         configuration
     */
    [[nodiscard]] auto build() -> result<import_controller>;

private:
    std::shared_ptr<batch_importer_interface> importer_;
    std::shared_ptr<file_selection_component> file_selection_;
    std::shared_ptr<progress_display> progress_display_;
    import_config config_;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_CONTROLLER_IMPORT_CONTROLLER_H
