/**
 * @file keystore_batch_importer.cpp
 * @brief Implementation of the reference keystore batch worker
 */

#include <kcenon/batch_import/worker/keystore_batch_importer.h>

#include <kcenon/batch_import/core/checksum.h>
#include <kcenon/batch_import/core/logging.h>
#include <kcenon/batch_import/core/progress_validator.h>
#include <kcenon/batch_import/worker/password_file_manager.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <system_error>
#include <unordered_map>

namespace kcenon::batch_import {

namespace {

auto lower_extension(const std::filesystem::path& path) -> std::string {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

auto describe_timeout(std::chrono::milliseconds timeout) -> std::string {
    auto ms = timeout.count();
    if (ms % 60000 == 0) {
        auto minutes = ms / 60000;
        return std::to_string(minutes) + (minutes == 1 ? " minute" : " minutes");
    }
    if (ms % 1000 == 0) {
        return std::to_string(ms / 1000) + " seconds";
    }
    return std::to_string(ms) + " ms";
}

/**
 * @brief Mutable per-batch state owned by the worker thread
 */
struct batch_run {
    const std::vector<import_job>& jobs;
    channel_sender<import_progress> progress_out;
    channel_sender<password_request> requests;
    channel_receiver<password_response> responses;
    import_progress progress;
    std::unordered_map<std::string, std::string> seen_hashes;  // hash -> first path
    bool interrupted = false;
    std::uint64_t next_request_id = 1;
};

}  // namespace

struct keystore_batch_importer::impl {
    std::shared_ptr<keystore_decryptor> decryptor;
    import_config config;
    password_file_manager passwords;

    mutable std::mutex report_mutex;
    discovery_report last_report;

    impl(std::shared_ptr<keystore_decryptor> d, const import_config& c)
        : decryptor(std::move(d)), config(c), passwords(c) {}

    auto make_job(const std::filesystem::path& keystore) const -> import_job {
        import_job job;
        job.keystore_path = keystore;
        job.wallet_name = keystore.stem().string();

        auto pwd = passwords.find_password_file(keystore);
        if (pwd) {
            job.password_path = pwd.value();
        } else {
            job.requires_input = true;
        }
        return job;
    }

    void send_progress(batch_run& run) const {
        run.progress.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - run.progress.start_time);

        auto status = run.progress_out.send_for(run.progress, config.progress_send_timeout);
        if (status != channel_status::ok) {
            import_log_context ctx;
            ctx.filename = run.progress.current_file;
            ctx.processed_files = run.progress.processed_files;
            ctx.total_files = run.progress.total_files;
            BI_LOG_DEBUG_CTX(log_category::channel,
                             std::string("progress update dropped: ") + to_string(status), ctx);
        }
    }

    void send_final_progress(batch_run& run) const {
        run.progress.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - run.progress.start_time);

        if (run.progress_out.send_evicting(run.progress) != channel_status::ok) {
            BI_LOG_DEBUG(log_category::channel, "final progress update not delivered: channel closed");
        }
    }

    void set_pending(batch_run& run, const std::filesystem::path& keystore, bool pending) const {
        run.progress.pending_password = pending;
        run.progress.pending_file = pending ? keystore.filename().string() : std::string{};
    }

    // Answers left over from a request that already timed out.
    void discard_stale_responses(batch_run& run) const {
        while (auto stale = run.responses.try_receive()) {
            BI_LOG_DEBUG(log_category::channel,
                         "discarded password response for request " +
                             std::to_string(stale->request_id));
        }
    }

    /**
     * @brief Publish @p request and wait for the answer carrying its id
     *
     * The worker counts as waiting on the response channel before the
     * request becomes visible. Answers addressed to other requests are
     * dropped without restarting the timeout.
     */
    auto await_response(batch_run& run, const password_request& request) const
        -> receive_result<password_response> {
        const auto deadline = std::chrono::steady_clock::now() + config.password_response_timeout;

        auto response = run.responses.receive_after(
            [&run, &request] { return run.requests.try_send(request); },
            config.password_response_timeout);

        while (response.item && response.item->request_id != request.request_id) {
            BI_LOG_DEBUG(log_category::channel,
                         "discarded password response for request " +
                             std::to_string(response.item->request_id) + ", waiting for " +
                             std::to_string(request.request_id));
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining <= std::chrono::milliseconds::zero()) {
                return receive_result<password_response>{channel_status::timeout, std::nullopt};
            }
            response = run.responses.receive_for(remaining);
        }
        return response;
    }

    auto request_manual_password(batch_run& run, const std::filesystem::path& keystore)
        -> result<std::string> {
        const int max_attempts = config.max_password_attempts;
        bool last_was_empty = false;

        for (int attempt = 1; attempt <= max_attempts; ++attempt) {
            set_pending(run, keystore, true);
            send_progress(run);

            password_request request;
            request.request_id = run.next_request_id++;
            request.keystore_file = keystore.string();
            request.attempt_count = attempt;
            request.is_retry = attempt > 1;
            if (request.is_retry) {
                request.error_message =
                    last_was_empty
                        ? "Password cannot be empty. Please enter a valid password."
                        : "Incorrect password. Please try again.";
            }

            discard_stale_responses(run);

            import_log_context ctx;
            ctx.filename = keystore.string();
            ctx.attempt = attempt;
            BI_LOG_DEBUG_CTX(log_category::worker, "waiting for password input", ctx);

            auto response = await_response(run, request);
            set_pending(run, keystore, false);

            if (response.status == channel_status::closed) {
                return unexpected(error{error_code::import_interrupted,
                                        "import cancelled before password input"});
            }
            if (response.status == channel_status::full) {
                return unexpected(error{error_code::password_input_timeout,
                                        "failed to send password request - communication error"});
            }
            send_progress(run);

            if (!response.item) {
                return unexpected(error{error_code::password_input_timeout,
                                        "password input timeout after " +
                                            describe_timeout(config.password_response_timeout)});
            }

            const auto& answer = *response.item;
            if (answer.cancelled) {
                return unexpected(error{error_code::password_input_cancelled,
                                        "password input cancelled by user"});
            }
            if (answer.skip) {
                return unexpected(
                    error{error_code::password_input_skipped, "import skipped by user"});
            }
            if (answer.password.empty()) {
                last_was_empty = true;
                if (attempt < max_attempts) {
                    continue;
                }
                return unexpected(
                    error{error_code::password_input_invalid, "empty password provided"});
            }

            last_was_empty = false;
            if (decryptor->verify_password(keystore, answer.password)) {
                return answer.password;
            }
        }

        return unexpected(error{error_code::password_max_attempts,
                                "incorrect password after " + std::to_string(max_attempts) +
                                    " attempts"});
    }

    auto process_job(batch_run& run, const import_job& job) -> import_result {
        import_result out;
        out.job = job;

        std::string password;
        bool needs_input = job.requires_input;

        if (job.manual_password && !job.manual_password->empty()) {
            password = *job.manual_password;
        } else if (!job.password_path.empty()) {
            auto from_file = passwords.read_password_file(job.password_path);
            if (from_file) {
                password = std::move(from_file.value());
            } else {
                import_log_context ctx;
                ctx.filename = job.password_path.string();
                ctx.error_message = from_file.error().message;
                BI_LOG_INFO_CTX(log_category::worker,
                                "password file unusable, falling back to manual input", ctx);
                needs_input = true;
            }
        }

        if (password.empty() && needs_input) {
            auto manual = request_manual_password(run, job.keystore_path);
            if (!manual) {
                const auto code = manual.error().code;
                out.failure = manual.error();
                out.skipped = code == error_code::password_input_cancelled ||
                              code == error_code::password_input_skipped ||
                              code == error_code::import_interrupted;
                if (code == error_code::import_interrupted) {
                    run.interrupted = true;
                }
                return out;
            }
            password = std::move(manual.value());
        }

        if (password.empty()) {
            out.failure = error{error_code::keystore_import_failed,
                                "no password available for keystore import"};
            return out;
        }

        auto imported = decryptor->import_keystore(job.keystore_path, password, job.wallet_name);
        if (!imported) {
            out.failure = imported.error().wrap("keystore import failed");
            return out;
        }

        out.success = true;
        out.wallet_id = std::move(imported.value());
        return out;
    }

    auto check_duplicate(batch_run& run, import_result& out) const -> bool {
        if (!config.detect_duplicates) {
            return false;
        }

        auto hash = checksum::sha256_file(out.job.keystore_path);
        if (!hash) {
            BI_LOG_DEBUG(log_category::worker,
                         "source hash unavailable: " + hash.error().message);
            return false;
        }
        out.source_hash = hash.value();

        auto [it, inserted] =
            run.seen_hashes.emplace(out.source_hash, out.job.keystore_path.string());
        if (inserted) {
            return false;
        }

        out.failure = error{error_code::duplicate_keystore,
                            "duplicate keystore: " + out.job.keystore_path.string() +
                                " has the same contents as " + it->second};
        return true;
    }
};

// ============================================================================
// keystore_batch_importer
// ============================================================================

keystore_batch_importer::keystore_batch_importer(std::unique_ptr<impl> impl)
    : impl_(std::move(impl)) {}

keystore_batch_importer::~keystore_batch_importer() = default;

keystore_batch_importer::keystore_batch_importer(keystore_batch_importer&&) noexcept = default;

auto keystore_batch_importer::operator=(keystore_batch_importer&&) noexcept
    -> keystore_batch_importer& = default;

auto keystore_batch_importer::create_import_jobs_from_files(
    const std::vector<std::filesystem::path>& files) -> result<std::vector<import_job>> {
    if (files.empty()) {
        return unexpected(error{error_code::no_jobs, "no keystore files provided"});
    }

    std::vector<import_job> jobs;
    jobs.reserve(files.size());
    for (const auto& file : files) {
        std::error_code ec;
        if (!std::filesystem::exists(file, ec) || ec) {
            return unexpected(error{error_code::file_not_found,
                                    "keystore file not found: " + file.string()});
        }
        jobs.push_back(impl_->make_job(file));
    }
    return jobs;
}

auto keystore_batch_importer::create_import_jobs_from_directory(
    const std::filesystem::path& directory) -> result<std::vector<import_job>> {
    if (directory.empty()) {
        return unexpected(
            error{error_code::directory_not_found, "directory path cannot be empty"});
    }

    std::error_code ec;
    auto status = std::filesystem::status(directory, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return unexpected(error{error_code::directory_not_found,
                                "directory not found: " + directory.string()});
    }
    if (ec) {
        return unexpected(error{error_code::file_access_denied,
                                "cannot access directory " + directory.string() + ": " +
                                    ec.message()});
    }
    if (!std::filesystem::is_directory(status)) {
        return unexpected(error{error_code::not_a_directory,
                                "path is not a directory: " + directory.string()});
    }

    discovery_report report;
    report.directory = directory;
    std::vector<std::filesystem::path> keystores;

    std::filesystem::recursive_directory_iterator it(
        directory, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return unexpected(error{error_code::file_access_denied,
                                "error scanning directory " + directory.string() + ": " +
                                    ec.message()});
    }

    const auto end = std::filesystem::recursive_directory_iterator{};
    for (; it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }

        const auto& path = it->path();
        auto ext = lower_extension(path);
        if (ext == impl_->config.password_file_extension) {
            ++report.password_files_found;
            continue;
        }
        if (ext != impl_->config.keystore_extension) {
            continue;
        }

        auto inspected = impl_->decryptor->inspect(path);
        if (inspected) {
            keystores.push_back(path);
        } else {
            report.scan_errors.push_back(import_error{path.string(), inspected.error(), false});
        }
    }

    // A failed increment leaves the iterator at end; keep what was found so far.
    if (ec) {
        report.scan_errors.push_back(import_error{
            directory.string(),
            error{error_code::file_access_denied, "access error: " + ec.message()},
            false});
    }

    report.valid_keystores = static_cast<int>(keystores.size());
    report.invalid_files = static_cast<int>(report.scan_errors.size());
    {
        std::lock_guard<std::mutex> lock(impl_->report_mutex);
        impl_->last_report = report;
    }

    if (keystores.empty()) {
        std::string message = "no valid keystore files found in directory: " + directory.string();
        if (report.invalid_files > 0) {
            message += " (found " + std::to_string(report.invalid_files) + " invalid files)";
        }
        return unexpected(error{error_code::no_keystores_found, message});
    }

    std::sort(keystores.begin(), keystores.end());

    std::vector<import_job> jobs;
    jobs.reserve(keystores.size());
    for (const auto& keystore : keystores) {
        jobs.push_back(impl_->make_job(keystore));
    }

    import_log_context ctx;
    ctx.filename = directory.string();
    ctx.total_files = report.valid_keystores;
    BI_LOG_INFO_CTX(log_category::worker, "directory scan complete", ctx);
    return jobs;
}

auto keystore_batch_importer::validate_import_jobs(std::vector<import_job>& jobs)
    -> result<void> {
    if (jobs.empty()) {
        return unexpected(error{error_code::no_jobs, "no import jobs provided"});
    }

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        auto& job = jobs[i];
        const auto prefix = "job " + std::to_string(i) + ": ";

        if (job.keystore_path.empty()) {
            return unexpected(error{error_code::empty_keystore_path,
                                    prefix + "keystore path cannot be empty"});
        }

        std::error_code ec;
        if (!std::filesystem::exists(job.keystore_path, ec) || ec) {
            return unexpected(error{error_code::file_not_found,
                                    prefix + "keystore file not found: " +
                                        job.keystore_path.string()});
        }

        if (job.wallet_name.empty()) {
            return unexpected(
                error{error_code::empty_wallet_name, prefix + "wallet name cannot be empty"});
        }

        if (!job.password_path.empty()) {
            auto valid = impl_->passwords.validate_password_file(job.password_path);
            if (!valid) {
                import_log_context ctx;
                ctx.filename = job.password_path.string();
                ctx.error_message = valid.error().message;
                BI_LOG_INFO_CTX(log_category::worker,
                                "password file rejected, job will ask for input", ctx);
                job.password_path.clear();
                job.requires_input = true;
            }
        }
    }
    return {};
}

auto keystore_batch_importer::import_batch(const std::vector<import_job>& jobs,
                                           channel_sender<import_progress> progress,
                                           channel_sender<password_request> requests,
                                           channel_receiver<password_response> responses)
    -> std::vector<import_result> {
    batch_run run{jobs, std::move(progress), std::move(requests), std::move(responses), {}, {}, false, 1};
    const int total = static_cast<int>(jobs.size());

    run.progress.total_files = total;
    run.progress.start_time = std::chrono::system_clock::now();

    std::vector<import_result> results;
    results.reserve(jobs.size());

    if (total == 0) {
        return results;
    }

    impl_->send_progress(run);

    for (int i = 0; i < total; ++i) {
        const auto& job = jobs[static_cast<std::size_t>(i)];

        // Controller cancelled between jobs.
        if (run.responses && run.responses.is_closed()) {
            run.interrupted = true;
        }

        if (run.interrupted) {
            import_result skipped;
            skipped.job = job;
            skipped.skipped = true;
            skipped.failure = error{error_code::import_interrupted,
                                    "import cancelled before processing"};
            run.progress.errors.push_back(
                import_error{job.keystore_path.string(), *skipped.failure, true});
            results.push_back(std::move(skipped));
            continue;
        }

        run.progress.current_file = job.keystore_path.filename().string();
        run.progress.processed_files = i;
        run.progress.percentage = progress_validator::expected_percentage(i, total);
        impl_->send_progress(run);

        import_result outcome;
        outcome.job = job;
        if (!impl_->check_duplicate(run, outcome)) {
            auto hash = std::move(outcome.source_hash);
            outcome = impl_->process_job(run, job);
            outcome.source_hash = std::move(hash);
        }

        if (!outcome.success) {
            run.progress.errors.push_back(import_error{
                job.keystore_path.string(),
                outcome.failure.value_or(error{error_code::keystore_import_failed}),
                outcome.skipped});
        }

        import_log_context ctx;
        ctx.filename = job.keystore_path.string();
        ctx.processed_files = i + 1;
        ctx.total_files = total;
        if (outcome.failure) {
            ctx.error_message = outcome.failure->message;
        }
        BI_LOG_INFO_CTX(log_category::worker,
                        outcome.success ? "keystore imported"
                                        : (outcome.skipped ? "keystore skipped"
                                                           : "keystore import failed"),
                        ctx);

        results.push_back(std::move(outcome));
    }

    run.progress.current_file.clear();
    run.progress.processed_files = total;
    run.progress.percentage = 100.0;
    run.progress.pending_password = false;
    run.progress.pending_file.clear();
    impl_->send_final_progress(run);

    return results;
}

auto keystore_batch_importer::get_import_summary(const std::vector<import_result>& results) const
    -> import_summary {
    return retry_policy::build_summary(results);
}

auto keystore_batch_importer::create_recovery_jobs(const std::vector<import_result>& failed,
                                                   retry_strategy strategy) const
    -> std::vector<import_job> {
    std::vector<import_job> jobs;
    std::vector<std::string> files;
    for (const auto& r : failed) {
        if (retry_policy::is_retryable(r)) {
            jobs.push_back(r.job);
            files.push_back(r.job.keystore_path.string());
        }
    }
    return retry_policy::create_retry_jobs(jobs, files, strategy);
}

auto keystore_batch_importer::last_discovery_report() const -> discovery_report {
    std::lock_guard<std::mutex> lock(impl_->report_mutex);
    return impl_->last_report;
}

auto keystore_batch_importer::config() const -> const import_config& {
    return impl_->config;
}

// ============================================================================
// builder
// ============================================================================

keystore_batch_importer::builder::builder() = default;

auto keystore_batch_importer::builder::with_decryptor(
    std::shared_ptr<keystore_decryptor> decryptor) -> builder& {
    decryptor_ = std::move(decryptor);
    return *this;
}

auto keystore_batch_importer::builder::with_config(const import_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto keystore_batch_importer::builder::build() -> result<keystore_batch_importer> {
    if (!decryptor_) {
        return unexpected(
            error{error_code::invalid_configuration, "keystore decryptor is required"});
    }
    if (!config_.is_valid()) {
        return unexpected(
            error{error_code::invalid_configuration, "invalid import configuration"});
    }
    return keystore_batch_importer(std::make_unique<impl>(decryptor_, config_));
}

}  // namespace kcenon::batch_import
