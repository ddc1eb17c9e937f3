/**
 * @file test_import_controller.cpp
 * @brief Unit tests for the import phase state machine
 */

#include <gtest/gtest.h>

#include <kcenon/batch_import/controller/import_controller.h>

#include "test_doubles.h"

#include <array>
#include <chrono>
#include <future>
#include <memory>

namespace kcenon::batch_import::test {

using namespace std::chrono_literals;

namespace {

class recording_display : public progress_display {
public:
    void reset(int total_files) override {
        ++resets;
        last_total = total_files;
    }

    void update(const import_progress& progress, bool paused,
                const std::string& last_error) override {
        ++updates;
        last_processed = progress.processed_files;
        last_paused = paused;
        last_message = last_error;
    }

    void finish() override { ++finishes; }

    int resets = 0;
    int updates = 0;
    int finishes = 0;
    int last_total = -1;
    int last_processed = -1;
    bool last_paused = false;
    std::string last_message;
};

class recording_selection : public file_selection_component {
public:
    void reset() override { ++resets; }
    int resets = 0;
};

constexpr std::array<import_phase, 5> all_phases = {
    import_phase::file_selection, import_phase::importing, import_phase::password_input,
    import_phase::complete, import_phase::cancelled};

}  // namespace

class ImportControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        importer_ = std::make_shared<scripted_importer>();
        display_ = std::make_shared<recording_display>();
        selection_ = std::make_shared<recording_selection>();
        config_.progress_poll_timeout = 20ms;
        config_.password_poll_timeout = 20ms;

        auto built = import_controller::builder()
                         .with_importer(importer_)
                         .with_config(config_)
                         .with_progress_display(display_)
                         .with_file_selection(selection_)
                         .build();
        ASSERT_TRUE(built.has_value());
        controller_ = std::make_unique<import_controller>(std::move(built.value()));
    }

    void start_with(std::vector<std::filesystem::path> files) {
        controller_->set_selected_files(std::move(files));
        ASSERT_TRUE(controller_->start_import().has_value());
    }

    static auto request_for(const std::string& file, int attempt = 1) -> password_request {
        password_request r;
        r.keystore_file = file;
        r.attempt_count = attempt;
        r.is_retry = attempt > 1;
        if (r.is_retry) {
            r.error_message = "Incorrect password. Please try again.";
        }
        return r;
    }

    /**
     * @brief Block a stand-in worker on the response channel
     *
     * Returns once the worker counts as waiting; the future yields what it
     * received.
     */
    static auto park_worker(const struct worker_channels& worker)
        -> std::future<receive_result<password_response>> {
        auto parked = std::make_shared<std::promise<void>>();
        auto ready = parked->get_future();
        auto waiting = std::async(std::launch::async, [responses = worker.responses, parked] {
            return responses.receive_after(
                [&parked] {
                    parked->set_value();
                    return channel_status::ok;
                },
                2s);
        });
        ready.wait();
        return waiting;
    }

    static auto snapshot(int processed, int total) -> import_progress {
        import_progress p;
        p.processed_files = processed;
        p.total_files = total;
        p.percentage = total > 0 ? 100.0 * processed / total : 0.0;
        return p;
    }

    void drive_to_complete(std::vector<import_result> results) {
        start_with({"/keys/a.json", "/keys/b.json", "/keys/c.json"});
        ASSERT_TRUE(controller_->complete_import(std::move(results)).has_value());
    }

    std::shared_ptr<scripted_importer> importer_;
    std::shared_ptr<recording_display> display_;
    std::shared_ptr<recording_selection> selection_;
    import_config config_;
    std::unique_ptr<import_controller> controller_;
};

// ============================================================================
// Builder
// ============================================================================

TEST_F(ImportControllerTest, BuilderRequiresImporter) {
    auto built = import_controller::builder().build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
    EXPECT_EQ(built.error().message, "importer is required");
}

TEST_F(ImportControllerTest, BuilderRejectsInvalidConfig) {
    import_config bad;
    bad.progress_channel_capacity = 0;

    auto built = import_controller::builder().with_importer(importer_).with_config(bad).build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(ImportControllerTest, InitialState) {
    EXPECT_EQ(controller_->current_phase(), import_phase::file_selection);
    EXPECT_FALSE(controller_->is_completed());
    EXPECT_FALSE(controller_->is_cancelled());
    EXPECT_FALSE(controller_->is_showing_popup());
    EXPECT_FALSE(controller_->completion().has_value());
    EXPECT_EQ(controller_->state_info().to_string(),
              "phase=File Selection selected_files=0 selected_directory=- jobs=0 results=0 "
              "popup=false pending_password=false completed=false cancelled=false");
}

// ============================================================================
// Transition table
// ============================================================================

TEST_F(ImportControllerTest, TransitionTable) {
    auto allowed = [](import_phase from, import_phase to) {
        if (from == to) return true;
        switch (from) {
            case import_phase::file_selection:
                return to == import_phase::importing || to == import_phase::cancelled;
            case import_phase::importing:
            case import_phase::password_input:
                return to != import_phase::file_selection;
            case import_phase::complete:
                return to == import_phase::file_selection || to == import_phase::cancelled;
            case import_phase::cancelled:
                return to == import_phase::file_selection;
        }
        return false;
    };

    for (auto from : all_phases) {
        for (auto to : all_phases) {
            EXPECT_EQ(import_controller::can_transition(from, to), allowed(from, to))
                << to_string(from) << " -> " << to_string(to);
        }
    }
}

TEST_F(ImportControllerTest, InvalidTransitionLeavesStateUntouched) {
    controller_->set_selected_files({"/keys/a.json"});

    auto moved = controller_->transition_to(import_phase::complete);

    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().code, error_code::invalid_phase_transition);
    EXPECT_EQ(moved.error().message,
              "invalid phase transition from File Selection to Complete");
    EXPECT_EQ(controller_->current_phase(), import_phase::file_selection);
    EXPECT_EQ(controller_->selected_files().size(), 1u);
}

TEST_F(ImportControllerTest, FileSelectionSetupClearsState) {
    start_with({"/keys/a.json"});
    ASSERT_TRUE(controller_->complete_import({make_result("/keys/a.json", true)}).has_value());
    ASSERT_TRUE(controller_->completion().has_value());

    ASSERT_TRUE(controller_->transition_to(import_phase::file_selection).has_value());

    EXPECT_TRUE(controller_->selected_files().empty());
    EXPECT_TRUE(controller_->jobs().empty());
    EXPECT_TRUE(controller_->results().empty());
    EXPECT_FALSE(controller_->is_completed());
    EXPECT_FALSE(controller_->completion().has_value());
    EXPECT_EQ(selection_->resets, 1);
}

// ============================================================================
// start_import
// ============================================================================

TEST_F(ImportControllerTest, StartImportRequiresSelection) {
    auto started = controller_->start_import();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::no_selection);
    EXPECT_EQ(controller_->current_phase(), import_phase::file_selection);
}

TEST_F(ImportControllerTest, StartImportFromFiles) {
    start_with({"/keys/a.json", "/keys/b.json"});

    EXPECT_EQ(controller_->current_phase(), import_phase::importing);
    EXPECT_EQ(controller_->jobs().size(), 2u);
    EXPECT_EQ(importer_->validate_calls, 1);
    EXPECT_EQ(display_->resets, 1);
    EXPECT_EQ(display_->last_total, 2);
    EXPECT_EQ(controller_->current_progress().total_files, 2);
}

TEST_F(ImportControllerTest, DirectoryTakesPrecedence) {
    importer_->directory_files = {"/keys/dir/x.json"};
    controller_->set_selected_files({"/keys/a.json", "/keys/b.json"});
    controller_->set_selected_directory("/keys/dir");

    ASSERT_TRUE(controller_->start_import().has_value());

    EXPECT_EQ(importer_->last_directory.string(), "/keys/dir");
    ASSERT_EQ(controller_->jobs().size(), 1u);
    EXPECT_EQ(controller_->jobs()[0].wallet_name, "x");
}

TEST_F(ImportControllerTest, StartImportWrapsCreationError) {
    importer_->creation_error = error{error_code::file_not_found, "keystore file not found: x"};
    controller_->set_selected_files({"/keys/x.json"});

    auto started = controller_->start_import();

    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::file_not_found);
    EXPECT_EQ(started.error().message,
              "failed to create import jobs: keystore file not found: x");
    EXPECT_EQ(controller_->current_phase(), import_phase::file_selection);
    EXPECT_TRUE(controller_->jobs().empty());
}

TEST_F(ImportControllerTest, StartImportWrapsValidationError) {
    importer_->validation_error = error{error_code::empty_wallet_name, "job 0: wallet name"};
    controller_->set_selected_files({"/keys/x.json"});

    auto started = controller_->start_import();

    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().message, "import job validation failed: job 0: wallet name");
    EXPECT_EQ(controller_->current_phase(), import_phase::file_selection);
}

TEST_F(ImportControllerTest, ReadersAvailableWhileJobsAreBuilt) {
    import_phase seen = import_phase::cancelled;
    std::size_t selected = 0;
    importer_->on_validate = [&] {
        seen = controller_->current_phase();
        selected = controller_->state_info().selected_files;
    };
    controller_->set_selected_files({"/keys/a.json", "/keys/b.json"});

    ASSERT_TRUE(controller_->start_import().has_value());

    EXPECT_EQ(seen, import_phase::file_selection);
    EXPECT_EQ(selected, 2u);
    EXPECT_EQ(controller_->current_phase(), import_phase::importing);
}

TEST_F(ImportControllerTest, SelectionChangedDuringStartRejected) {
    importer_->on_validate = [&] { controller_->set_selected_files({"/keys/other.json"}); };
    controller_->set_selected_files({"/keys/a.json"});

    auto started = controller_->start_import();

    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::invalid_phase);
    EXPECT_EQ(started.error().message, "selection changed while creating import jobs");
    EXPECT_EQ(controller_->current_phase(), import_phase::file_selection);
    EXPECT_TRUE(controller_->jobs().empty());
}

TEST_F(ImportControllerTest, StartImportOnlyFromFileSelection) {
    start_with({"/keys/a.json"});

    auto again = controller_->start_import();

    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::invalid_phase);
    EXPECT_EQ(again.error().message, "cannot start import from phase Importing");
}

// ============================================================================
// Password handshake
// ============================================================================

TEST_F(ImportControllerTest, PasswordRequestShowsPrompt) {
    start_with({"/keys/a.json"});

    ASSERT_TRUE(controller_->handle_password_request(request_for("/keys/a.json", 2)).has_value());

    EXPECT_EQ(controller_->current_phase(), import_phase::password_input);
    EXPECT_TRUE(controller_->is_showing_popup());
    ASSERT_TRUE(controller_->pending_password_request().has_value());

    auto prompt = controller_->prompt();
    ASSERT_TRUE(prompt.has_value());
    EXPECT_EQ(prompt->keystore_file, "/keys/a.json");
    EXPECT_EQ(prompt->attempt, 2);
    EXPECT_EQ(prompt->max_attempts, 3);
    EXPECT_TRUE(prompt->is_retry);
    EXPECT_EQ(prompt->error_message, "Incorrect password. Please try again.");
}

TEST_F(ImportControllerTest, FirstAttemptPromptHasNoError) {
    start_with({"/keys/a.json"});
    ASSERT_TRUE(controller_->handle_password_request(request_for("/keys/a.json")).has_value());

    auto prompt = controller_->prompt();
    ASSERT_TRUE(prompt.has_value());
    EXPECT_FALSE(prompt->is_retry);
    EXPECT_FALSE(prompt->error_message.has_value());
}

TEST_F(ImportControllerTest, PasswordRequestRejectedInFileSelection) {
    auto handled = controller_->handle_password_request(request_for("/keys/a.json"));

    ASSERT_FALSE(handled.has_value());
    EXPECT_EQ(handled.error().code, error_code::invalid_phase_transition);
    EXPECT_FALSE(controller_->pending_password_request().has_value());
}

TEST_F(ImportControllerTest, SubmitPasswordReachesWorker) {
    start_with({"/keys/a.json"});
    auto worker = controller_->worker_channels();
    auto request = request_for("/keys/a.json");
    request.request_id = 7;
    ASSERT_TRUE(controller_->handle_password_request(request).has_value());
    auto waiting = park_worker(worker);

    ASSERT_TRUE(controller_->submit_password("hunter2").has_value());

    EXPECT_EQ(controller_->current_phase(), import_phase::importing);
    EXPECT_FALSE(controller_->is_showing_popup());
    EXPECT_FALSE(controller_->pending_password_request().has_value());
    EXPECT_FALSE(controller_->prompt().has_value());

    auto response = waiting.get();
    ASSERT_TRUE(response.has_item());
    EXPECT_EQ(response.item->password, "hunter2");
    EXPECT_EQ(response.item->request_id, 7u);
    EXPECT_FALSE(response.item->cancelled);
    EXPECT_FALSE(response.item->skip);
}

TEST_F(ImportControllerTest, CancelAndSkipResponses) {
    start_with({"/keys/a.json", "/keys/b.json"});
    auto worker = controller_->worker_channels();

    ASSERT_TRUE(controller_->handle_password_request(request_for("/keys/a.json")).has_value());
    auto first = park_worker(worker);
    ASSERT_TRUE(controller_->cancel_password_input().has_value());
    auto cancel = first.get();
    ASSERT_TRUE(cancel.has_item());
    EXPECT_TRUE(cancel.item->cancelled);
    EXPECT_TRUE(cancel.item->password.empty());

    ASSERT_TRUE(controller_->handle_password_request(request_for("/keys/b.json")).has_value());
    auto second = park_worker(worker);
    ASSERT_TRUE(controller_->skip_password_input().has_value());
    auto skip = second.get();
    ASSERT_TRUE(skip.has_item());
    EXPECT_TRUE(skip.item->skip);
    EXPECT_FALSE(skip.item->cancelled);

    EXPECT_EQ(controller_->current_phase(), import_phase::importing);
}

TEST_F(ImportControllerTest, ResponsesRequirePasswordInput) {
    start_with({"/keys/a.json"});

    auto submitted = controller_->submit_password("x");
    ASSERT_FALSE(submitted.has_value());
    EXPECT_EQ(submitted.error().code, error_code::invalid_phase);
    EXPECT_EQ(submitted.error().message, "cannot submit password in phase Importing");

    EXPECT_FALSE(controller_->skip_password_input().has_value());
    EXPECT_FALSE(controller_->cancel_password_input().has_value());
}

TEST_F(ImportControllerTest, AnswerWithoutWaitingWorkerFailsFast) {
    start_with({"/keys/a.json"});
    auto worker = controller_->worker_channels();
    ASSERT_TRUE(controller_->handle_password_request(request_for("/keys/a.json")).has_value());

    // The worker already gave up on this request.
    auto late = controller_->submit_password("too-late");

    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().code, error_code::channel_unavailable);
    EXPECT_EQ(late.error().message, "failed to send password response - channel unavailable");
    EXPECT_EQ(controller_->current_phase(), import_phase::password_input);
    EXPECT_TRUE(controller_->pending_password_request().has_value());
    EXPECT_EQ(worker.responses.size(), 0u);

    auto skipped = controller_->skip_password_input();
    ASSERT_FALSE(skipped.has_value());
    EXPECT_EQ(skipped.error().message, "failed to send skip response - channel unavailable");
    EXPECT_EQ(worker.responses.size(), 0u);

    auto waiting = park_worker(worker);
    ASSERT_TRUE(controller_->submit_password("on-time").has_value());
    auto response = waiting.get();
    ASSERT_TRUE(response.has_item());
    EXPECT_EQ(response.item->password, "on-time");
}

TEST_F(ImportControllerTest, SecondAnswerAfterHandoffFailsFast) {
    start_with({"/keys/a.json", "/keys/b.json"});
    auto worker = controller_->worker_channels();

    ASSERT_TRUE(controller_->handle_password_request(request_for("/keys/a.json")).has_value());
    auto waiting = park_worker(worker);
    ASSERT_TRUE(controller_->submit_password("first").has_value());
    ASSERT_TRUE(waiting.get().has_item());

    // No worker is blocked on the channel for the second prompt.
    ASSERT_TRUE(controller_->handle_password_request(request_for("/keys/b.json")).has_value());
    auto second = controller_->submit_password("second");

    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::channel_unavailable);
    EXPECT_EQ(worker.responses.size(), 0u);
}

// ============================================================================
// Cancellation and cleanup
// ============================================================================

TEST_F(ImportControllerTest, CancelRunsCleanupsOnce) {
    int calls = 0;
    controller_->add_cleanup([&] { ++calls; });
    start_with({"/keys/a.json"});
    auto worker = controller_->worker_channels();

    EXPECT_TRUE(controller_->cancel_import().has_value());
    EXPECT_TRUE(controller_->cancel_import().has_value());

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(controller_->current_phase(), import_phase::cancelled);
    EXPECT_TRUE(controller_->is_cancelled());
    EXPECT_TRUE(worker.responses.is_closed());
    EXPECT_TRUE(worker.requests.is_closed());
    EXPECT_TRUE(worker.progress.is_closed());
}

TEST_F(ImportControllerTest, CancelDuringPasswordInputUnblocksWorker) {
    start_with({"/keys/a.json"});
    auto worker = controller_->worker_channels();
    ASSERT_TRUE(controller_->handle_password_request(request_for("/keys/a.json")).has_value());

    controller_->cancel_import();

    auto waited = worker.responses.receive_for(1s);
    EXPECT_EQ(waited.status, channel_status::closed);
    EXPECT_FALSE(controller_->is_showing_popup());
    EXPECT_FALSE(controller_->pending_password_request().has_value());
}

TEST_F(ImportControllerTest, CompleteAfterCancelRejected) {
    start_with({"/keys/a.json"});
    controller_->cancel_import();

    auto completed = controller_->complete_import({make_result("/keys/a.json", true)});

    ASSERT_FALSE(completed.has_value());
    EXPECT_EQ(completed.error().code, error_code::invalid_phase_transition);
    EXPECT_TRUE(controller_->results().empty());
}

TEST_F(ImportControllerTest, ExplicitCleanup) {
    int calls = 0;
    controller_->add_cleanup([&] { ++calls; });
    auto worker = controller_->worker_channels();

    controller_->cleanup();
    controller_->cleanup();

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(worker.progress.is_closed());
}

TEST_F(ImportControllerTest, NewRunGetsFreshChannels) {
    start_with({"/keys/a.json"});
    auto first = controller_->worker_channels();
    controller_->cancel_import();
    ASSERT_TRUE(controller_->transition_to(import_phase::file_selection).has_value());

    start_with({"/keys/b.json"});
    auto second = controller_->worker_channels();

    EXPECT_TRUE(first.progress.is_closed());
    EXPECT_FALSE(second.progress.is_closed());
    EXPECT_FALSE(second.responses.is_closed());
}

// ============================================================================
// Progress
// ============================================================================

TEST_F(ImportControllerTest, ProgressAboveTotalRejected) {
    log_capture logs;
    start_with({"/keys/a.json", "/keys/b.json", "/keys/c.json"});

    EXPECT_FALSE(controller_->update_progress(snapshot(5, 3)));

    EXPECT_EQ(controller_->current_progress().processed_files, 0);
    EXPECT_EQ(logs.count(log_level::warn, "progress snapshot rejected"), 1);
    EXPECT_EQ(controller_->current_phase(), import_phase::importing);
}

TEST_F(ImportControllerTest, ProgressMustNotDecrease) {
    start_with({"/keys/a.json", "/keys/b.json", "/keys/c.json"});

    for (int i = 0; i <= 3; ++i) {
        EXPECT_TRUE(controller_->update_progress(snapshot(i, 3))) << "step " << i;
    }
    EXPECT_FALSE(controller_->update_progress(snapshot(1, 3)));
    EXPECT_EQ(controller_->current_progress().processed_files, 3);
    EXPECT_EQ(display_->updates, 4);
    EXPECT_EQ(display_->last_processed, 3);
}

TEST_F(ImportControllerTest, ProgressCarriesLastError) {
    start_with({"/keys/a.json", "/keys/b.json"});

    auto p = snapshot(1, 2);
    p.errors.push_back(import_error{"/keys/a.json",
                                    error{error_code::keystore_import_failed, "file corrupted"},
                                    false});
    p.pending_password = true;
    p.pending_file = "b.json";

    ASSERT_TRUE(controller_->update_progress(p));
    EXPECT_EQ(controller_->last_error(), "file corrupted");
    EXPECT_EQ(display_->last_message, "file corrupted");
    EXPECT_TRUE(display_->last_paused);
}

// ============================================================================
// Listeners
// ============================================================================

TEST_F(ImportControllerTest, ProgressListenerDeliversSnapshot) {
    start_with({"/keys/a.json"});
    auto worker = controller_->worker_channels();
    ASSERT_EQ(worker.progress.try_send(snapshot(1, 1)), channel_status::ok);

    auto event = controller_->listen_for_progress()();

    ASSERT_TRUE(event.has_value());
    auto* update = std::get_if<progress_update_event>(&*event);
    ASSERT_NE(update, nullptr);
    EXPECT_EQ(update->progress.processed_files, 1);
}

TEST_F(ImportControllerTest, ListenersRearmWhileRunning) {
    start_with({"/keys/a.json"});

    auto progress = controller_->listen_for_progress()();
    ASSERT_TRUE(progress.has_value());
    auto* cont = std::get_if<continue_listening_event>(&*progress);
    ASSERT_NE(cont, nullptr);
    EXPECT_EQ(cont->listener, listener_kind::progress);

    auto password = controller_->listen_for_password_requests()();
    ASSERT_TRUE(password.has_value());
    auto* cont2 = std::get_if<continue_listening_event>(&*password);
    ASSERT_NE(cont2, nullptr);
    EXPECT_EQ(cont2->listener, listener_kind::password_request);
}

TEST_F(ImportControllerTest, PasswordListenerDeliversRequest) {
    start_with({"/keys/a.json"});
    auto worker = controller_->worker_channels();
    ASSERT_EQ(worker.requests.try_send(request_for("/keys/a.json")), channel_status::ok);

    auto event = controller_->listen_for_password_requests()();

    ASSERT_TRUE(event.has_value());
    auto* request = std::get_if<password_request_event>(&*event);
    ASSERT_NE(request, nullptr);
    EXPECT_EQ(request->request.keystore_file, "/keys/a.json");
}

TEST_F(ImportControllerTest, ListenersStopWhenIdleOrClosed) {
    // Not running: a timeout ends the listener.
    EXPECT_FALSE(controller_->listen_for_progress()().has_value());

    start_with({"/keys/a.json"});
    auto listener = controller_->listen_for_password_requests();
    controller_->cancel_import();

    EXPECT_FALSE(listener().has_value());
}

// ============================================================================
// Batch command and completion
// ============================================================================

TEST_F(ImportControllerTest, ProcessBatchYieldsResults) {
    start_with({"/keys/a.json", "/keys/b.json"});

    auto event = controller_->process_import_batch()();

    ASSERT_TRUE(event.has_value());
    auto* done = std::get_if<batch_complete_event>(&*event);
    ASSERT_NE(done, nullptr);
    EXPECT_EQ(done->results.size(), 2u);
    EXPECT_EQ(importer_->last_jobs.size(), 2u);
}

TEST_F(ImportControllerTest, CompleteBuildsReport) {
    drive_to_complete({
        make_result("/keys/a.json", true),
        make_result("/keys/b.json", false, false,
                    error{error_code::password_max_attempts, "incorrect password after 3 attempts"}),
        make_result("/keys/c.json", false, true,
                    error{error_code::password_input_skipped, "import skipped by user"}),
    });

    EXPECT_EQ(controller_->current_phase(), import_phase::complete);
    EXPECT_TRUE(controller_->is_completed());
    EXPECT_EQ(display_->finishes, 1);
    EXPECT_EQ(controller_->last_error(), "import skipped by user");

    auto report = controller_->completion();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->summary.total_files, 3);
    EXPECT_EQ(report->summary.successful_imports, 1);
    EXPECT_EQ(report->summary.failed_imports, 1);
    EXPECT_EQ(report->summary.skipped_imports, 1);
    EXPECT_TRUE(report->has_retryable_errors());
    EXPECT_GE(importer_->summary_calls, 1);

    auto summary = controller_->summary();
    EXPECT_EQ(summary.successful_imports + summary.failed_imports + summary.skipped_imports,
              summary.total_files);
}

TEST_F(ImportControllerTest, CompleteWithoutResultsHasNoReport) {
    start_with({"/keys/a.json"});
    ASSERT_TRUE(controller_->complete_import({}).has_value());

    EXPECT_TRUE(controller_->is_completed());
    EXPECT_FALSE(controller_->completion().has_value());
}

TEST_F(ImportControllerTest, CompleteFromPasswordInput) {
    start_with({"/keys/a.json"});
    ASSERT_TRUE(controller_->handle_password_request(request_for("/keys/a.json")).has_value());

    ASSERT_TRUE(controller_->complete_import({make_result("/keys/a.json", true)}).has_value());

    EXPECT_FALSE(controller_->is_showing_popup());
    EXPECT_FALSE(controller_->pending_password_request().has_value());
}

// ============================================================================
// Retry and completion actions
// ============================================================================

TEST_F(ImportControllerTest, CompletionActions) {
    drive_to_complete({
        make_result("/keys/a.json", true),
        make_result("/keys/b.json", false, false,
                    error{error_code::keystore_import_failed, "incorrect password"}),
        make_result("/keys/c.json", false, true,
                    error{error_code::password_input_skipped, "import skipped by user"}),
    });

    auto retry = controller_->handle_completion_action(completion_action::retry_failed);
    ASSERT_TRUE(retry.has_value());
    auto* request = std::get_if<retry_request_event>(&*retry);
    ASSERT_NE(request, nullptr);
    EXPECT_EQ(request->strategy, retry_strategy::retry_failed);
    EXPECT_EQ(request->files, (std::vector<std::string>{"/keys/b.json"}));

    auto manual =
        controller_->handle_completion_action(completion_action::retry_with_manual_passwords);
    ASSERT_TRUE(manual.has_value());
    EXPECT_EQ(std::get<retry_request_event>(*manual).strategy, retry_strategy::manual_passwords);

    auto select = controller_->handle_completion_action(completion_action::select_different_files);
    ASSERT_TRUE(select.has_value());
    EXPECT_TRUE(std::holds_alternative<return_to_selection_event>(*select));

    auto menu = controller_->handle_completion_action(completion_action::return_to_menu);
    ASSERT_TRUE(menu.has_value());
    EXPECT_TRUE(std::holds_alternative<return_to_menu_event>(*menu));

    EXPECT_FALSE(
        controller_->handle_completion_action(completion_action::view_error_details).has_value());

    auto specific = controller_->retry_specific_file("/keys/c.json");
    EXPECT_EQ(std::get<retry_request_event>(specific).strategy, retry_strategy::retry_specific);
}

TEST_F(ImportControllerTest, StartRetryRunsFailedJobs) {
    drive_to_complete({
        make_result("/keys/a.json", true),
        make_result("/keys/b.json", false, false,
                    error{error_code::keystore_import_failed, "incorrect password"}),
        make_result("/keys/c.json", false, true,
                    error{error_code::password_input_skipped, "import skipped by user"}),
    });
    auto old = controller_->worker_channels();

    ASSERT_TRUE(controller_->start_retry(retry_strategy::retry_failed, {"/keys/b.json"})
                    .has_value());

    EXPECT_EQ(controller_->current_phase(), import_phase::importing);
    ASSERT_EQ(controller_->jobs().size(), 1u);
    EXPECT_EQ(controller_->jobs()[0].keystore_path.string(), "/keys/b.json");
    ASSERT_EQ(controller_->selected_files().size(), 1u);
    EXPECT_TRUE(controller_->results().empty());
    EXPECT_FALSE(controller_->completion().has_value());
    EXPECT_EQ(controller_->current_progress().total_files, 1);
    EXPECT_TRUE(old.progress.is_closed());
}

TEST_F(ImportControllerTest, StartRetryErrors) {
    start_with({"/keys/a.json"});
    auto early = controller_->start_retry(retry_strategy::retry_failed, {"/keys/a.json"});
    ASSERT_FALSE(early.has_value());
    EXPECT_EQ(early.error().code, error_code::invalid_phase);

    ASSERT_TRUE(controller_->complete_import({make_result("/keys/a.json", true)}).has_value());
    auto none = controller_->start_retry(retry_strategy::retry_failed, {});
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, error_code::no_jobs);
    EXPECT_EQ(controller_->current_phase(), import_phase::complete);
}

TEST_F(ImportControllerTest, RestartWithFiles) {
    start_with({"/keys/a.json"});
    EXPECT_FALSE(controller_->restart_with_files({"/keys/z.json"}).has_value());

    ASSERT_TRUE(controller_->complete_import({make_result("/keys/a.json", true)}).has_value());
    ASSERT_TRUE(controller_->restart_with_files({"/keys/z.json"}).has_value());

    EXPECT_EQ(controller_->current_phase(), import_phase::file_selection);
    ASSERT_EQ(controller_->selected_files().size(), 1u);
    EXPECT_EQ(controller_->selected_files()[0].string(), "/keys/z.json");
}

}  // namespace kcenon::batch_import::test
