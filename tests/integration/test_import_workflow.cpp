/**
 * @file test_import_workflow.cpp
 * @brief End-to-end import runs through controller, worker and driver
 */

#include "test_fixtures.h"

#include <algorithm>
#include <future>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace kcenon::batch_import::test {

using namespace std::chrono_literals;

class ImportWorkflowTest : public ImportWorkflowFixture {};

TEST_F(ImportWorkflowTest, DirectoryImportWithOnePrompt) {
    write_standard_batch();
    build_controller();

    std::vector<std::string> prompted;
    auto provider = std::make_shared<callback_password_provider>(
        [&prompted](const password_prompt& prompt) {
            prompted.push_back(std::filesystem::path(prompt.keystore_file).filename().string());
            return password_response{"beta-pass", false, false};
        });

    import_session session(*controller_, provider);
    controller_->set_selected_directory(test_dir_);
    ASSERT_TRUE(session.start().has_value());
    ASSERT_TRUE(session.run_until_done(20s).has_value());

    EXPECT_EQ(prompted, (std::vector<std::string>{"beta.json"}));
    EXPECT_EQ(controller_->current_phase(), import_phase::complete);

    auto summary = controller_->summary();
    EXPECT_EQ(summary.total_files, 3);
    EXPECT_EQ(summary.successful_imports, 3);
    EXPECT_EQ(summary.successful_imports + summary.failed_imports + summary.skipped_imports,
              summary.total_files);

    auto report = controller_->completion();
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->has_retryable_errors());

    auto progress = controller_->current_progress();
    EXPECT_EQ(progress.processed_files, 3);
    EXPECT_DOUBLE_EQ(progress.percentage, 100.0);
    EXPECT_EQ(decryptor_->import_calls.load(), 3);
}

TEST_F(ImportWorkflowTest, SkippedPromptCountsAsSkipped) {
    write_standard_batch();
    build_controller();

    auto provider = std::make_shared<callback_password_provider>(
        [](const password_prompt&) { return password_response{{}, false, true}; });

    import_session session(*controller_, provider);
    controller_->set_selected_directory(test_dir_);
    ASSERT_TRUE(session.start().has_value());
    ASSERT_TRUE(session.run_until_done(20s).has_value());

    auto summary = controller_->summary();
    EXPECT_EQ(summary.total_files, 3);
    EXPECT_EQ(summary.successful_imports, 2);
    EXPECT_EQ(summary.skipped_imports, 1);
    ASSERT_EQ(summary.errors.size(), 1u);
    EXPECT_TRUE(summary.errors[0].skipped);

    auto report = controller_->completion();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->skipped_files.size(), 1u);
}

TEST_F(ImportWorkflowTest, WrongPasswordsThenManualRetry) {
    write_standard_batch();
    build_controller();

    int calls = 0;
    auto provider = std::make_shared<callback_password_provider>(
        [&calls](const password_prompt& prompt) {
            ++calls;
            // Wrong on every first-run attempt, right on the retry.
            if (calls <= 3) {
                EXPECT_EQ(prompt.attempt, calls);
                return password_response{"wrong", false, false};
            }
            return password_response{"beta-pass", false, false};
        });

    import_session session(*controller_, provider);
    controller_->set_selected_directory(test_dir_);
    ASSERT_TRUE(session.start().has_value());
    ASSERT_TRUE(session.run_until_done(20s).has_value());

    auto first = controller_->completion();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->summary.failed_imports, 1);
    EXPECT_TRUE(first->has_retryable_errors());
    auto actions = first->actions;
    EXPECT_NE(std::find(actions.begin(), actions.end(),
                        completion_action::retry_with_manual_passwords),
              actions.end());

    ASSERT_TRUE(session.apply_completion_action(completion_action::retry_with_manual_passwords)
                    .has_value());
    ASSERT_TRUE(session.run_until_done(20s).has_value());

    auto summary = controller_->summary();
    EXPECT_EQ(summary.total_files, 1);
    EXPECT_EQ(summary.successful_imports, 1);
    EXPECT_EQ(calls, 4);
}

TEST_F(ImportWorkflowTest, SlowAnswerDoesNotReachNextPrompt) {
    config_.password_response_timeout = 500ms;
    write_keystore("alpha.json", "alpha-pass");
    write_keystore("beta.json", "beta-pass");
    build_controller();

    std::vector<std::string> prompted;
    auto provider = std::make_shared<callback_password_provider>(
        [&prompted](const password_prompt& prompt) {
            auto name = std::filesystem::path(prompt.keystore_file).filename().string();
            prompted.push_back(name);
            if (name == "alpha.json") {
                // Answer only after the worker stopped waiting for alpha.
                std::this_thread::sleep_for(700ms);
                return password_response{"alpha-pass", false, false};
            }
            return password_response{"beta-pass", false, false};
        });

    import_session session(*controller_, provider);
    controller_->set_selected_directory(test_dir_);
    ASSERT_TRUE(session.start().has_value());
    ASSERT_TRUE(session.run_until_done(20s).has_value());

    EXPECT_EQ(prompted, (std::vector<std::string>{"alpha.json", "beta.json"}));

    auto errors = session.dispatch_errors();
    EXPECT_TRUE(std::any_of(errors.begin(), errors.end(), [](const error& e) {
        return e.code == error_code::channel_unavailable;
    }));

    auto results = controller_->results();
    ASSERT_EQ(results.size(), 2u);
    ASSERT_TRUE(results[0].failure.has_value());
    EXPECT_EQ(results[0].failure->code, error_code::password_input_timeout);
    EXPECT_TRUE(results[1].success);
    EXPECT_EQ(decryptor_->import_calls.load(), 1);
}

TEST_F(ImportWorkflowTest, ManualDrivingWithoutSession) {
    write_standard_batch();
    build_controller();

    controller_->set_selected_files(
        {test_dir_ / "alpha.json", test_dir_ / "beta.json", test_dir_ / "gamma.json"});
    ASSERT_TRUE(controller_->start_import().has_value());

    auto batch = controller_->process_import_batch();
    auto worker = std::async(std::launch::async, batch);

    // Answer the single prompt the way a UI would.
    std::optional<password_request> request;
    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (!request && std::chrono::steady_clock::now() < deadline) {
        auto event = controller_->listen_for_password_requests()();
        if (event) {
            if (auto* r = std::get_if<password_request_event>(&*event)) {
                request = r->request;
            }
        }
    }
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(std::filesystem::path(request->keystore_file).filename().string(), "beta.json");

    ASSERT_TRUE(controller_->handle_password_request(*request).has_value());
    ASSERT_TRUE(controller_->submit_password("beta-pass").has_value());

    auto done = worker.get();
    ASSERT_TRUE(done.has_value());
    auto& results = std::get<batch_complete_event>(*done).results;
    ASSERT_TRUE(controller_->complete_import(results).has_value());

    auto summary = controller_->summary();
    EXPECT_EQ(summary.total_files, 3);
    EXPECT_EQ(summary.successful_imports, 3);
}

TEST_F(ImportWorkflowTest, CancelStopsRemainingJobs) {
    write_keystore("a.json", "a");
    write_keystore("b.json", "b", "b");
    build_controller();

    int cleanups = 0;
    controller_->add_cleanup([&cleanups] { ++cleanups; });

    import_session session(*controller_);
    controller_->set_selected_directory(test_dir_);
    ASSERT_TRUE(session.start().has_value());

    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (controller_->current_phase() != import_phase::password_input &&
           std::chrono::steady_clock::now() < deadline) {
        session.pump();
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(controller_->current_phase(), import_phase::password_input);

    session.cancel();
    ASSERT_TRUE(session.run_until_done(10s).has_value());

    EXPECT_TRUE(controller_->is_cancelled());
    EXPECT_EQ(cleanups, 1);
    EXPECT_EQ(decryptor_->import_calls.load(), 0);
}

TEST_F(ImportWorkflowTest, EmptyDirectoryFailsToStart) {
    write_file("readme.txt", "nothing to import");
    build_controller();

    controller_->set_selected_directory(test_dir_);
    auto started = controller_->start_import();

    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::no_keystores_found);
    EXPECT_EQ(started.error().message.find("failed to create import jobs: "), 0u);
    EXPECT_EQ(controller_->current_phase(), import_phase::file_selection);
}

}  // namespace kcenon::batch_import::test
