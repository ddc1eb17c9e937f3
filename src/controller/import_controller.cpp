/**
 * @file import_controller.cpp
 * @brief Implementation of the import phase state machine
 */

#include <kcenon/batch_import/controller/import_controller.h>

#include <kcenon/batch_import/core/logging.h>
#include <kcenon/batch_import/core/progress_validator.h>

#include <mutex>
#include <shared_mutex>
#include <sstream>

namespace kcenon::batch_import {

namespace {

auto phase_error(const std::string& action, import_phase phase) -> unexpected {
    return unexpected(error{error_code::invalid_phase,
                            "cannot " + action + " in phase " + to_string(phase)});
}

auto elapsed_since(std::chrono::system_clock::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - start);
}

}  // namespace

auto import_state_info::to_string() const -> std::string {
    std::ostringstream oss;
    oss << std::boolalpha
        << "phase=" << batch_import::to_string(phase)
        << " selected_files=" << selected_files
        << " selected_directory=" << (selected_directory.empty() ? "-" : selected_directory)
        << " jobs=" << import_jobs
        << " results=" << results
        << " popup=" << showing_popup
        << " pending_password=" << pending_password
        << " completed=" << completed
        << " cancelled=" << cancelled;
    if (!error_message.empty()) {
        oss << " error=\"" << error_message << "\"";
    }
    return oss.str();
}

// ============================================================================
// impl
// ============================================================================

struct import_controller::impl {
    std::shared_ptr<batch_importer_interface> importer;
    std::shared_ptr<file_selection_component> file_selection;
    std::shared_ptr<progress_display> display;
    import_config config;

    mutable std::shared_mutex mutex;

    import_phase phase = import_phase::file_selection;
    std::vector<std::filesystem::path> selected_files;
    std::filesystem::path selected_directory;
    std::vector<import_job> jobs;
    std::vector<import_result> results;

    bool completed = false;
    bool cancelled = false;
    bool showing_popup = false;
    std::optional<password_request> pending;
    std::optional<password_prompt> prompt;
    std::optional<completion_report> report;
    import_progress progress;
    std::string last_error;

    std::chrono::system_clock::time_point batch_started;
    std::vector<std::function<void()>> cleanups;

    std::shared_ptr<bounded_channel<import_progress>> progress_ch;
    std::shared_ptr<bounded_channel<password_request>> request_ch;
    std::shared_ptr<bounded_channel<password_response>> response_ch;

    // All members below expect the caller to hold the writer lock.

    void open_channels() {
        close_channels();
        progress_ch = std::make_shared<bounded_channel<import_progress>>(
            config.progress_channel_capacity);
        request_ch = std::make_shared<bounded_channel<password_request>>(1);
        response_ch = std::make_shared<bounded_channel<password_response>>(1);
    }

    void close_channels() {
        if (progress_ch) progress_ch->close();
        if (request_ch) request_ch->close();
        if (response_ch) response_ch->close();
    }

    void run_cleanups() {
        auto pending_cleanups = std::move(cleanups);
        cleanups.clear();
        for (auto& fn : pending_cleanups) {
            if (fn) fn();
        }
    }

    [[nodiscard]] auto batch_running() const -> bool {
        std::shared_lock lock(mutex);
        return phase == import_phase::importing || phase == import_phase::password_input;
    }

    auto transition(import_phase to) -> result<void> {
        if (!can_transition(phase, to)) {
            return unexpected(error{error_code::invalid_phase_transition,
                                    std::string("invalid phase transition from ") +
                                        to_string(phase) + " to " + to_string(to)});
        }

        auto from = phase;
        phase = to;
        switch (to) {
            case import_phase::file_selection:
                setup_file_selection();
                break;
            case import_phase::importing:
                setup_importing();
                break;
            case import_phase::password_input:
                setup_password_input();
                break;
            case import_phase::complete:
                setup_complete();
                break;
            case import_phase::cancelled:
                setup_cancelled();
                break;
        }

        BI_LOG_DEBUG(log_category::controller,
                     std::string("phase ") + to_string(from) + " -> " + to_string(to));
        return {};
    }

    void setup_file_selection() {
        selected_files.clear();
        selected_directory.clear();
        jobs.clear();
        results.clear();
        completed = false;
        cancelled = false;
        showing_popup = false;
        pending.reset();
        prompt.reset();
        report.reset();
        last_error.clear();
        progress = import_progress{};
        if (file_selection) {
            file_selection->reset();
        }
    }

    void setup_importing() {
        showing_popup = false;
        prompt.reset();

        progress = import_progress{};
        progress.total_files = static_cast<int>(jobs.size());
        progress.start_time = std::chrono::system_clock::now();
        if (display) {
            display->reset(progress.total_files);
        }
    }

    void setup_password_input() {
        showing_popup = true;
        prompt.reset();
        if (!pending) {
            return;
        }

        password_prompt p;
        p.keystore_file = pending->keystore_file;
        p.attempt = pending->attempt_count;
        p.max_attempts = config.max_password_attempts;
        p.is_retry = pending->is_retry;
        if (pending->is_retry && pending->error_message && !pending->error_message->empty()) {
            p.error_message = pending->error_message;
        }
        prompt = std::move(p);
    }

    void setup_complete() {
        completed = true;
        showing_popup = false;
        pending.reset();
        prompt.reset();
        if (display) {
            display->finish();
        }
        // The worker is done; wake listeners still parked on the channels.
        close_channels();

        if (results.empty()) {
            return;
        }

        auto r = retry_policy::build_report(results, elapsed_since(batch_started));
        r.summary = importer->get_import_summary(results);
        r.actions = retry_policy::available_actions(r.summary);
        report = std::move(r);
    }

    void setup_cancelled() {
        cancelled = true;
        showing_popup = false;
        pending.reset();
        prompt.reset();
        run_cleanups();
        close_channels();
    }

    auto respond(password_response response, const std::string& action,
                 const std::string& failure) -> result<void> {
        if (phase != import_phase::password_input) {
            return phase_error(action, phase);
        }
        if (pending) {
            response.request_id = pending->request_id;
        }

        // Only a worker blocked on this request may take the answer.
        auto status = response_ch ? response_ch->try_handoff(std::move(response))
                                  : channel_status::closed;
        if (status != channel_status::ok) {
            BI_LOG_WARN(log_category::channel,
                        failure + " (" + to_string(status) + ")");
            return unexpected(error{error_code::channel_unavailable, failure});
        }

        pending.reset();
        return transition(import_phase::importing);
    }
};

// ============================================================================
// Construction
// ============================================================================

import_controller::import_controller(std::shared_ptr<impl> impl) : impl_(std::move(impl)) {}

import_controller::~import_controller() = default;

import_controller::import_controller(import_controller&&) noexcept = default;

auto import_controller::operator=(import_controller&&) noexcept -> import_controller& = default;

import_controller::builder::builder() = default;

auto import_controller::builder::with_importer(std::shared_ptr<batch_importer_interface> importer)
    -> builder& {
    importer_ = std::move(importer);
    return *this;
}

auto import_controller::builder::with_config(const import_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto import_controller::builder::with_file_selection(
    std::shared_ptr<file_selection_component> component) -> builder& {
    file_selection_ = std::move(component);
    return *this;
}

auto import_controller::builder::with_progress_display(std::shared_ptr<progress_display> display)
    -> builder& {
    progress_display_ = std::move(display);
    return *this;
}

auto import_controller::builder::build() -> result<import_controller> {
    if (!importer_) {
        return unexpected(error{error_code::invalid_configuration, "importer is required"});
    }
    if (!config_.is_valid()) {
        return unexpected(error{error_code::invalid_configuration, "invalid import configuration"});
    }

    auto state = std::make_shared<impl>();
    state->importer = importer_;
    state->file_selection = file_selection_;
    state->display = progress_display_;
    state->config = config_;
    state->open_channels();

    return import_controller(std::move(state));
}

// ============================================================================
// Phase management
// ============================================================================

auto import_controller::current_phase() const -> import_phase {
    std::shared_lock lock(impl_->mutex);
    return impl_->phase;
}

auto import_controller::can_transition(import_phase from, import_phase to) -> bool {
    if (from == to) {
        return true;
    }

    switch (from) {
        case import_phase::file_selection:
            return to == import_phase::importing || to == import_phase::cancelled;
        case import_phase::importing:
            return to == import_phase::password_input || to == import_phase::complete ||
                   to == import_phase::cancelled;
        case import_phase::password_input:
            return to == import_phase::importing || to == import_phase::complete ||
                   to == import_phase::cancelled;
        case import_phase::complete:
            return to == import_phase::file_selection || to == import_phase::cancelled;
        case import_phase::cancelled:
            return to == import_phase::file_selection;
    }
    return false;
}

auto import_controller::transition_to(import_phase to) -> result<void> {
    std::unique_lock lock(impl_->mutex);
    return impl_->transition(to);
}

// ============================================================================
// Selection
// ============================================================================

void import_controller::set_selected_files(std::vector<std::filesystem::path> files) {
    std::unique_lock lock(impl_->mutex);
    impl_->selected_files = std::move(files);
}

void import_controller::set_selected_directory(std::filesystem::path directory) {
    std::unique_lock lock(impl_->mutex);
    impl_->selected_directory = std::move(directory);
}

auto import_controller::selected_files() const -> std::vector<std::filesystem::path> {
    std::shared_lock lock(impl_->mutex);
    return impl_->selected_files;
}

auto import_controller::selected_directory() const -> std::filesystem::path {
    std::shared_lock lock(impl_->mutex);
    return impl_->selected_directory;
}

// ============================================================================
// Import lifecycle
// ============================================================================

auto import_controller::start_import() -> result<void> {
    std::filesystem::path directory;
    std::vector<std::filesystem::path> files;
    std::shared_ptr<batch_importer_interface> importer;
    {
        std::shared_lock lock(impl_->mutex);
        if (impl_->phase != import_phase::file_selection) {
            return unexpected(error{error_code::invalid_phase,
                                    std::string("cannot start import from phase ") +
                                        to_string(impl_->phase)});
        }
        if (impl_->selected_directory.empty() && impl_->selected_files.empty()) {
            return unexpected(
                error{error_code::no_selection, "no files or directory selected for import"});
        }
        directory = impl_->selected_directory;
        files = impl_->selected_files;
        importer = impl_->importer;
    }

    // Scanning and validation touch the filesystem; readers stay unblocked.
    auto created = !directory.empty() ? importer->create_import_jobs_from_directory(directory)
                                      : importer->create_import_jobs_from_files(files);
    if (!created) {
        return unexpected(created.error().wrap("failed to create import jobs"));
    }

    auto jobs = std::move(created).value();
    auto validated = importer->validate_import_jobs(jobs);
    if (!validated) {
        return unexpected(validated.error().wrap("import job validation failed"));
    }

    std::unique_lock lock(impl_->mutex);
    if (impl_->phase != import_phase::file_selection) {
        return unexpected(error{error_code::invalid_phase,
                                std::string("cannot start import from phase ") +
                                    to_string(impl_->phase)});
    }
    if (impl_->selected_directory != directory || impl_->selected_files != files) {
        return unexpected(error{error_code::invalid_phase,
                                "selection changed while creating import jobs"});
    }

    impl_->jobs = std::move(jobs);
    impl_->results.clear();
    impl_->batch_started = std::chrono::system_clock::now();
    impl_->open_channels();

    import_log_context ctx;
    ctx.total_files = static_cast<int>(impl_->jobs.size());
    BI_LOG_INFO_CTX(log_category::controller, "starting import", ctx);

    return impl_->transition(import_phase::importing);
}

auto import_controller::start_retry(retry_strategy strategy, const std::vector<std::string>& files)
    -> result<void> {
    std::unique_lock lock(impl_->mutex);

    if (impl_->phase != import_phase::complete) {
        return phase_error("start a retry", impl_->phase);
    }

    auto jobs = retry_policy::create_retry_jobs(impl_->jobs, files, strategy);
    if (jobs.empty()) {
        return unexpected(error{error_code::no_jobs, "no files to retry"});
    }

    auto validated = impl_->importer->validate_import_jobs(jobs);
    if (!validated) {
        return unexpected(validated.error().wrap("import job validation failed"));
    }

    // Cannot fail from Complete.
    auto reset = impl_->transition(import_phase::file_selection);
    if (!reset) {
        return reset;
    }

    impl_->selected_files.assign(files.begin(), files.end());
    impl_->jobs = std::move(jobs);
    impl_->batch_started = std::chrono::system_clock::now();
    impl_->open_channels();

    import_log_context ctx;
    ctx.total_files = static_cast<int>(impl_->jobs.size());
    BI_LOG_INFO_CTX(log_category::controller,
                    std::string("starting retry: ") + to_string(strategy), ctx);

    return impl_->transition(import_phase::importing);
}

auto import_controller::process_import_batch() -> import_command {
    std::shared_lock lock(impl_->mutex);

    auto importer = impl_->importer;
    auto jobs = impl_->jobs;
    channel_sender<import_progress> progress(impl_->progress_ch);
    channel_sender<password_request> requests(impl_->request_ch);
    channel_receiver<password_response> responses(impl_->response_ch);

    return [importer, jobs, progress, requests, responses]() -> std::optional<import_event> {
        auto results = importer->import_batch(jobs, progress, requests, responses);
        return import_event{batch_complete_event{std::move(results)}};
    };
}

auto import_controller::handle_password_request(const password_request& request) -> result<void> {
    std::unique_lock lock(impl_->mutex);

    if (!can_transition(impl_->phase, import_phase::password_input)) {
        return unexpected(error{error_code::invalid_phase_transition,
                                std::string("invalid phase transition from ") +
                                    to_string(impl_->phase) + " to " +
                                    to_string(import_phase::password_input)});
    }

    import_log_context ctx;
    ctx.filename = request.keystore_file;
    ctx.attempt = request.attempt_count;
    BI_LOG_INFO_CTX(log_category::controller, "password requested", ctx);

    impl_->pending = request;
    return impl_->transition(import_phase::password_input);
}

auto import_controller::submit_password(const std::string& password) -> result<void> {
    std::unique_lock lock(impl_->mutex);
    return impl_->respond(password_response{password, false, false, 0}, "submit password",
                          "failed to send password response - channel unavailable");
}

auto import_controller::cancel_password_input() -> result<void> {
    std::unique_lock lock(impl_->mutex);
    return impl_->respond(password_response{{}, true, false, 0}, "cancel password input",
                          "failed to send cancel response - channel unavailable");
}

auto import_controller::skip_password_input() -> result<void> {
    std::unique_lock lock(impl_->mutex);
    return impl_->respond(password_response{{}, false, true, 0}, "skip password input",
                          "failed to send skip response - channel unavailable");
}

auto import_controller::complete_import(std::vector<import_result> results) -> result<void> {
    std::unique_lock lock(impl_->mutex);

    if (!can_transition(impl_->phase, import_phase::complete)) {
        return unexpected(error{error_code::invalid_phase_transition,
                                std::string("invalid phase transition from ") +
                                    to_string(impl_->phase) + " to " +
                                    to_string(import_phase::complete)});
    }

    impl_->results = std::move(results);
    for (auto it = impl_->results.rbegin(); it != impl_->results.rend(); ++it) {
        if (!it->success && it->failure) {
            impl_->last_error = it->failure->message;
            break;
        }
    }

    auto moved = impl_->transition(import_phase::complete);
    if (moved && impl_->report) {
        BI_LOG_INFO(log_category::controller,
                    "import complete: " + impl_->report->summary_text());
    }
    return moved;
}

auto import_controller::cancel_import() -> result<void> {
    std::unique_lock lock(impl_->mutex);
    BI_LOG_INFO(log_category::controller,
                std::string("import cancelled in phase ") + to_string(impl_->phase));
    return impl_->transition(import_phase::cancelled);
}

auto import_controller::update_progress(const import_progress& progress) -> bool {
    std::unique_lock lock(impl_->mutex);

    auto valid = progress_validator::validate(progress, impl_->progress);
    if (!valid) {
        import_log_context ctx;
        ctx.filename = progress.current_file;
        ctx.processed_files = progress.processed_files;
        ctx.total_files = progress.total_files;
        ctx.progress_percent = progress.percentage;
        ctx.error_message = valid.error().message;
        BI_LOG_WARN_CTX(log_category::controller, "progress snapshot rejected", ctx);
        return false;
    }

    impl_->progress = progress;
    if (!progress.errors.empty()) {
        impl_->last_error = progress.errors.back().cause.message;
    }
    if (impl_->display) {
        std::string last = progress.errors.empty() ? std::string{}
                                                   : progress.errors.back().cause.message;
        impl_->display->update(progress, progress.pending_password, last);
    }
    return true;
}

// ============================================================================
// Listening
// ============================================================================

auto import_controller::listen_for_progress() const -> import_command {
    std::shared_lock lock(impl_->mutex);

    channel_receiver<import_progress> receiver(impl_->progress_ch);
    auto timeout = impl_->config.progress_poll_timeout;
    std::weak_ptr<impl> weak = impl_;

    return [receiver, timeout, weak]() -> std::optional<import_event> {
        auto received = receiver.receive_for(timeout);
        if (received.item) {
            return import_event{progress_update_event{std::move(*received.item)}};
        }
        if (received.status == channel_status::closed) {
            return std::nullopt;
        }

        auto self = weak.lock();
        if (!self || !self->batch_running()) {
            return std::nullopt;
        }
        return import_event{continue_listening_event{listener_kind::progress}};
    };
}

auto import_controller::listen_for_password_requests() const -> import_command {
    std::shared_lock lock(impl_->mutex);

    channel_receiver<password_request> receiver(impl_->request_ch);
    auto timeout = impl_->config.password_poll_timeout;
    std::weak_ptr<impl> weak = impl_;

    return [receiver, timeout, weak]() -> std::optional<import_event> {
        auto received = receiver.receive_for(timeout);
        if (received.item) {
            return import_event{password_request_event{std::move(*received.item)}};
        }
        if (received.status == channel_status::closed) {
            return std::nullopt;
        }

        auto self = weak.lock();
        if (!self || !self->batch_running()) {
            return std::nullopt;
        }
        return import_event{continue_listening_event{listener_kind::password_request}};
    };
}

auto import_controller::progress_channel() const -> channel_receiver<import_progress> {
    std::shared_lock lock(impl_->mutex);
    return channel_receiver<import_progress>(impl_->progress_ch);
}

auto import_controller::password_request_channel() const -> channel_receiver<password_request> {
    std::shared_lock lock(impl_->mutex);
    return channel_receiver<password_request>(impl_->request_ch);
}

auto import_controller::worker_channels() const -> struct worker_channels {
    std::shared_lock lock(impl_->mutex);
    struct worker_channels endpoints;
    endpoints.progress = channel_sender<import_progress>(impl_->progress_ch);
    endpoints.requests = channel_sender<password_request>(impl_->request_ch);
    endpoints.responses = channel_receiver<password_response>(impl_->response_ch);
    return endpoints;
}

// ============================================================================
// Completion handling
// ============================================================================

auto import_controller::retry_import(retry_strategy strategy) const -> import_event {
    std::shared_lock lock(impl_->mutex);
    return retry_request_event{strategy,
                               retry_policy::files_for_strategy(impl_->results, strategy)};
}

auto import_controller::retry_specific_file(const std::string& file) const -> import_event {
    return retry_request_event{retry_strategy::retry_specific, {file}};
}

auto import_controller::handle_completion_action(completion_action action) const
    -> std::optional<import_event> {
    switch (action) {
        case completion_action::retry_failed:
            return retry_import(retry_strategy::retry_failed);
        case completion_action::retry_with_manual_passwords:
            return retry_import(retry_strategy::manual_passwords);
        case completion_action::select_different_files:
            return import_event{return_to_selection_event{}};
        case completion_action::return_to_menu:
            return import_event{return_to_menu_event{}};
        case completion_action::view_error_details:
        default:
            return std::nullopt;
    }
}

auto import_controller::restart_with_files(std::vector<std::filesystem::path> files)
    -> result<void> {
    std::unique_lock lock(impl_->mutex);

    auto moved = impl_->transition(import_phase::file_selection);
    if (!moved) {
        return moved;
    }
    impl_->selected_files = std::move(files);
    return {};
}

// ============================================================================
// Cleanup
// ============================================================================

void import_controller::add_cleanup(std::function<void()> cleanup) {
    std::unique_lock lock(impl_->mutex);
    impl_->cleanups.push_back(std::move(cleanup));
}

void import_controller::cleanup() {
    std::unique_lock lock(impl_->mutex);
    impl_->run_cleanups();
    impl_->close_channels();
}

// ============================================================================
// Accessors
// ============================================================================

auto import_controller::jobs() const -> std::vector<import_job> {
    std::shared_lock lock(impl_->mutex);
    return impl_->jobs;
}

auto import_controller::results() const -> std::vector<import_result> {
    std::shared_lock lock(impl_->mutex);
    return impl_->results;
}

auto import_controller::summary() const -> import_summary {
    std::shared_lock lock(impl_->mutex);
    return impl_->importer->get_import_summary(impl_->results);
}

auto import_controller::completion() const -> std::optional<completion_report> {
    std::shared_lock lock(impl_->mutex);
    return impl_->report;
}

auto import_controller::current_progress() const -> import_progress {
    std::shared_lock lock(impl_->mutex);
    return impl_->progress;
}

auto import_controller::pending_password_request() const -> std::optional<password_request> {
    std::shared_lock lock(impl_->mutex);
    return impl_->pending;
}

auto import_controller::prompt() const -> std::optional<password_prompt> {
    std::shared_lock lock(impl_->mutex);
    return impl_->prompt;
}

auto import_controller::state_info() const -> import_state_info {
    std::shared_lock lock(impl_->mutex);

    import_state_info info;
    info.phase = impl_->phase;
    info.selected_files = impl_->selected_files.size();
    info.selected_directory = impl_->selected_directory.string();
    info.import_jobs = impl_->jobs.size();
    info.results = impl_->results.size();
    info.showing_popup = impl_->showing_popup;
    info.pending_password = impl_->pending.has_value();
    info.completed = impl_->completed;
    info.cancelled = impl_->cancelled;
    info.error_message = impl_->last_error;
    return info;
}

auto import_controller::is_completed() const -> bool {
    std::shared_lock lock(impl_->mutex);
    return impl_->completed;
}

auto import_controller::is_cancelled() const -> bool {
    std::shared_lock lock(impl_->mutex);
    return impl_->cancelled;
}

auto import_controller::is_showing_popup() const -> bool {
    std::shared_lock lock(impl_->mutex);
    return impl_->showing_popup;
}

auto import_controller::last_error() const -> std::string {
    std::shared_lock lock(impl_->mutex);
    return impl_->last_error;
}

auto import_controller::config() const -> const import_config& {
    return impl_->config;
}

}  // namespace kcenon::batch_import
