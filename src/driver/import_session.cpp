/**
 * @file import_session.cpp
 * @brief Implementation of the headless import driver
 */

#include <kcenon/batch_import/driver/import_session.h>

#include <kcenon/batch_import/core/logging.h>

#include <exception>
#include <utility>
#include <variant>

namespace kcenon::batch_import {

namespace {

constexpr auto stage_batch = "import_batch";
constexpr auto stage_progress = "progress_listener";
constexpr auto stage_password = "password_listener";

constexpr auto pump_interval = std::chrono::milliseconds(50);

}  // namespace

// ============================================================================
// import_event_queue
// ============================================================================

void import_event_queue::push(import_event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

auto import_event_queue::pop_all() -> std::vector<import_event> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<import_event> out;
    out.swap(events_);
    return out;
}

auto import_event_queue::wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !events_.empty(); });
}

auto import_event_queue::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

// ============================================================================
// import_session
// ============================================================================

import_session::import_session(import_controller& controller,
                               std::shared_ptr<password_provider> provider,
                               std::shared_ptr<adapters::import_thread_pool_interface> pool)
    : controller_(controller), provider_(std::move(provider)), pool_(std::move(pool)) {
    if (!pool_) {
        pool_ = adapters::import_pool_factory::create();
    }
}

import_session::~import_session() {
    shutdown();
}

auto import_session::start() -> result<void> {
    if (running_) {
        return unexpected(error{error_code::invalid_phase, "an import is already running"});
    }

    auto started = controller_.start_import();
    if (!started) {
        return started;
    }
    launch();
    return {};
}

auto import_session::start_retry(retry_strategy strategy, const std::vector<std::string>& files)
    -> result<void> {
    if (running_) {
        return unexpected(error{error_code::invalid_phase, "an import is already running"});
    }

    // Listeners from the previous run may still be parked on the old channels.
    reap(true);
    auto stale = events_.pop_all();
    if (!stale.empty()) {
        BI_LOG_DEBUG(log_category::driver,
                     std::to_string(stale.size()) + " events from the previous run dropped");
    }

    auto started = controller_.start_retry(strategy, files);
    if (!started) {
        return started;
    }
    launch();
    return {};
}

auto import_session::apply_completion_action(completion_action action) -> result<void> {
    auto event = controller_.handle_completion_action(action);
    if (!event) {
        return {};
    }

    if (auto* retry = std::get_if<retry_request_event>(&*event)) {
        return start_retry(retry->strategy, retry->files);
    }
    return controller_.transition_to(import_phase::file_selection);
}

void import_session::post(import_event event) {
    events_.push(std::move(event));
}

auto import_session::pump() -> std::size_t {
    reap(false);

    auto batch = events_.pop_all();
    for (auto& event : batch) {
        dispatch(event);
    }
    return batch.size();
}

auto import_session::run_until_done(std::chrono::milliseconds timeout) -> result<void> {
    if (!running_ && !done_) {
        return unexpected(error{error_code::invalid_phase, "no import has been started"});
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done_) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return unexpected(error{error_code::internal_error,
                                    "import did not finish within " +
                                        std::to_string(timeout.count()) + " ms"});
        }
        events_.wait_for(pump_interval);
        pump();
    }

    // Listeners see the closed channels now; apply what they picked up last.
    reap(true);
    pump();

    if (failure_) {
        return unexpected(*failure_);
    }
    return {};
}

void import_session::cancel() {
    auto cancelled = controller_.cancel_import();
    if (!cancelled) {
        record(cancelled.error(), "cancel");
    }
}

auto import_session::is_running() const -> bool {
    return running_;
}

auto import_session::is_done() const -> bool {
    return done_;
}

auto import_session::dispatch_errors() const -> std::vector<error> {
    return dispatch_errors_;
}

auto import_session::pool() const -> std::shared_ptr<adapters::import_thread_pool_interface> {
    return pool_;
}

// ============================================================================
// Task management
// ============================================================================

void import_session::launch() {
    running_ = true;
    done_ = false;
    failure_.reset();

    submit(stage_batch, controller_.process_import_batch());
    submit(stage_progress, controller_.listen_for_progress());
    submit(stage_password, controller_.listen_for_password_requests());
}

void import_session::submit(const std::string& stage, import_command command) {
    auto future = pool_->submit_to_stage(
        [this, command = std::move(command)]() {
            if (auto event = command()) {
                events_.push(std::move(*event));
            }
        },
        stage);

    std::lock_guard<std::mutex> lock(tasks_mutex_);
    tasks_.push_back(std::move(future));
}

void import_session::reap(bool wait) {
    std::vector<std::future<void>> finished;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.begin();
        while (it != tasks_.end()) {
            if (wait || it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                finished.push_back(std::move(*it));
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& task : finished) {
        try {
            task.get();
        } catch (const std::exception& e) {
            BI_LOG_ERROR(log_category::driver, std::string("import task failed: ") + e.what());
            if (!failure_) {
                failure_ = error{error_code::internal_error,
                                 std::string("import task failed: ") + e.what()};
            }
            if (running_) {
                running_ = false;
                done_ = true;
            }
        }
    }
}

void import_session::shutdown() {
    if (running_) {
        BI_LOG_INFO(log_category::driver, "session closing with an import in progress");
        cancel();
    }
    reap(true);
    auto dropped = events_.pop_all();
    if (!dropped.empty()) {
        BI_LOG_DEBUG(log_category::driver,
                     std::to_string(dropped.size()) + " undispatched events dropped");
    }
    running_ = false;
}

// ============================================================================
// Dispatch
// ============================================================================

void import_session::dispatch(import_event& event) {
    if (auto* complete = std::get_if<batch_complete_event>(&event)) {
        on_batch_complete(*complete);
    } else if (auto* progress = std::get_if<progress_update_event>(&event)) {
        on_progress(*progress);
    } else if (auto* request = std::get_if<password_request_event>(&event)) {
        on_password_request(*request);
    } else if (auto* again = std::get_if<continue_listening_event>(&event)) {
        on_continue(*again);
    } else if (auto* retry = std::get_if<retry_request_event>(&event)) {
        on_retry(*retry);
    } else {
        on_return_to_selection();
    }
}

void import_session::on_batch_complete(batch_complete_event& event) {
    // Apply snapshots the progress listener has not picked up yet.
    auto pending = controller_.progress_channel();
    while (auto snapshot = pending.try_receive()) {
        controller_.update_progress(*snapshot);
    }

    running_ = false;
    done_ = true;

    auto completed = controller_.complete_import(std::move(event.results));
    if (!completed) {
        if (controller_.is_cancelled()) {
            BI_LOG_INFO(log_category::driver, "batch finished after cancellation");
        } else {
            record(completed.error(), "complete import");
        }
    }
}

void import_session::on_progress(progress_update_event& event) {
    if (!running_) {
        // Picked up by the listener before the batch result was applied.
        if (event.progress.processed_files >= controller_.current_progress().processed_files) {
            controller_.update_progress(event.progress);
        } else {
            BI_LOG_DEBUG(log_category::driver, "stale progress update ignored");
        }
        return;
    }

    controller_.update_progress(event.progress);
    submit(stage_progress, controller_.listen_for_progress());
}

void import_session::on_password_request(password_request_event& event) {
    if (!running_) {
        BI_LOG_DEBUG(log_category::driver, "password request after batch completion ignored");
        return;
    }

    auto handled = controller_.handle_password_request(event.request);
    if (!handled) {
        record(handled.error(), "handle password request");
    } else if (provider_) {
        auto prompt = controller_.prompt().value_or(
            password_prompt{event.request.keystore_file, event.request.attempt_count,
                            controller_.config().max_password_attempts,
                            event.request.is_retry, event.request.error_message});

        auto response = provider_->answer(prompt);
        auto answered = response.cancelled ? controller_.cancel_password_input()
                        : response.skip    ? controller_.skip_password_input()
                                           : controller_.submit_password(response.password);
        if (!answered) {
            record(answered.error(), "answer password request");
        }
    }

    submit(stage_password, controller_.listen_for_password_requests());
}

void import_session::on_continue(const continue_listening_event& event) {
    if (!running_) {
        return;
    }

    if (event.listener == listener_kind::progress) {
        submit(stage_progress, controller_.listen_for_progress());
    } else {
        submit(stage_password, controller_.listen_for_password_requests());
    }
}

void import_session::on_retry(const retry_request_event& event) {
    auto started = start_retry(event.strategy, event.files);
    if (!started) {
        record(started.error(), "start retry");
    }
}

void import_session::on_return_to_selection() {
    auto moved = controller_.transition_to(import_phase::file_selection);
    if (!moved) {
        record(moved.error(), "return to file selection");
    }
}

void import_session::record(const error& err, const char* what) {
    BI_LOG_WARN(log_category::driver, std::string(what) + " failed: " + err.message);
    dispatch_errors_.push_back(err);
}

}  // namespace kcenon::batch_import
