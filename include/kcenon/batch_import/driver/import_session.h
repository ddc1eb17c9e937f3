/**
 * @file import_session.h
 * @brief Headless driver running import commands and dispatching their events
 */

#ifndef KCENON_BATCH_IMPORT_DRIVER_IMPORT_SESSION_H
#define KCENON_BATCH_IMPORT_DRIVER_IMPORT_SESSION_H

#include <kcenon/batch_import/adapters/thread_pool_adapter.h>
#include <kcenon/batch_import/controller/import_controller.h>
#include <kcenon/batch_import/controller/import_events.h>
#include <kcenon/batch_import/core/types.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::batch_import {

/**
 * @brief Answers password prompts on behalf of the user
 *
 * Called on the driver thread; may block.
 */
class password_provider {
public:
    virtual ~password_provider() = default;

    [[nodiscard]] virtual auto answer(const password_prompt& prompt) -> password_response = 0;
};

/**
 * @brief password_provider backed by a callable
 */
class callback_password_provider : public password_provider {
public:
    using callback = std::function<password_response(const password_prompt&)>;

    explicit callback_password_provider(callback fn) : fn_(std::move(fn)) {}

    [[nodiscard]] auto answer(const password_prompt& prompt) -> password_response override {
        return fn_ ? fn_(prompt) : password_response{{}, true, false};
    }

private:
    callback fn_;
};

/**
 * @brief Thread-safe event mailbox between pool tasks and the driver thread
 */
class import_event_queue {
public:
    void push(import_event event);

    /**
     * @brief Take every queued event, oldest first
     */
    [[nodiscard]] auto pop_all() -> std::vector<import_event>;

    /**
     * @brief Block until an event is queued or @p timeout elapses
     * @return true if events are waiting
     */
    auto wait_for(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<import_event> events_;
};

/**
 * @brief Runs one import at a time the way an interactive UI would
 *
 * The batch command and both listener commands run on the pool; the events
 * they yield are queued and applied to the controller by pump() on the
 * calling thread. Listeners are re-issued while the batch is running.
 * Password requests are answered by the provider when one is set;
 * otherwise the caller answers through the controller directly.
 *
 * @note The controller must outlive the session. pump(), run_until_done()
 *       and the start functions must be called from one thread.
 *
 * @code
 * import_session session(controller, provider);
 * controller.set_selected_directory(dir);
 * if (auto started = session.start(); started) {
 *     auto finished = session.run_until_done(std::chrono::minutes(10));
 * }
 * @endcode
 */
class import_session {
public:
    /**
     * @param pool Defaults to adapters::import_pool_factory::create()
     */
    import_session(import_controller& controller,
                   std::shared_ptr<password_provider> provider = nullptr,
                   std::shared_ptr<adapters::import_thread_pool_interface> pool = nullptr);

    /**
     * @brief Cancels an unfinished import and waits for outstanding tasks
     */
    ~import_session();

    import_session(const import_session&) = delete;
    auto operator=(const import_session&) -> import_session& = delete;

    /**
     * @brief start_import() on the controller, then launch the commands
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief start_retry() on the controller, then launch the commands
     */
    [[nodiscard]] auto start_retry(retry_strategy strategy, const std::vector<std::string>& files)
        -> result<void>;

    /**
     * @brief Apply a completion screen action
     *
     * Retry actions start a retry run; selection and menu actions return the
     * controller to file selection.
     */
    [[nodiscard]] auto apply_completion_action(completion_action action) -> result<void>;

    /**
     * @brief Queue an event for the next pump()
     */
    void post(import_event event);

    /**
     * @brief Dispatch every queued event
     * @return Number of events dispatched
     */
    auto pump() -> std::size_t;

    /**
     * @brief Pump until the batch result has been applied
     * @return The first task failure, or internal_error on timeout
     */
    [[nodiscard]] auto run_until_done(std::chrono::milliseconds timeout) -> result<void>;

    /**
     * @brief Cancel through the controller; the batch still reports back
     */
    void cancel();

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto is_done() const -> bool;

    /**
     * @brief Controller errors raised while dispatching events
     */
    [[nodiscard]] auto dispatch_errors() const -> std::vector<error>;

    [[nodiscard]] auto pool() const -> std::shared_ptr<adapters::import_thread_pool_interface>;

private:
    void launch();
    void submit(const std::string& stage, import_command command);
    void dispatch(import_event& event);
    void on_batch_complete(batch_complete_event& event);
    void on_progress(progress_update_event& event);
    void on_password_request(password_request_event& event);
    void on_continue(const continue_listening_event& event);
    void on_retry(const retry_request_event& event);
    void on_return_to_selection();
    void record(const error& err, const char* what);
    void reap(bool wait);
    void shutdown();

    import_controller& controller_;
    std::shared_ptr<password_provider> provider_;
    std::shared_ptr<adapters::import_thread_pool_interface> pool_;
    import_event_queue events_;

    mutable std::mutex tasks_mutex_;
    std::vector<std::future<void>> tasks_;

    bool running_ = false;
    bool done_ = false;
    std::optional<error> failure_;
    std::vector<error> dispatch_errors_;
};

}  // namespace kcenon::batch_import

#endif  // KCENON_BATCH_IMPORT_DRIVER_IMPORT_SESSION_H
