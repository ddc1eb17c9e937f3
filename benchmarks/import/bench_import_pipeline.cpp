/**
 * @file bench_import_pipeline.cpp
 * @brief Benchmarks for the batch import worker and its channels
 */

#include <benchmark/benchmark.h>

#include <kcenon/batch_import/core/bounded_channel.h>
#include <kcenon/batch_import/core/progress_validator.h>
#include <kcenon/batch_import/worker/keystore_batch_importer.h>
#include <kcenon/batch_import/worker/password_file_manager.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <thread>

namespace kcenon::batch_import::benchmark {

/**
 * @brief Producer/consumer throughput of a bounded channel
 */
static void BM_Channel_SendReceive(::benchmark::State& state) {
    const auto capacity = static_cast<std::size_t>(state.range(0));
    constexpr int items = 10000;

    for (auto _ : state) {
        auto channel = std::make_shared<bounded_channel<int>>(capacity);
        std::thread producer([&channel] {
            for (int i = 0; i < items; ++i) {
                channel->send_for(i, std::chrono::seconds(1));
            }
            channel->close();
        });

        int received = 0;
        while (true) {
            auto r = channel->receive_for(std::chrono::seconds(1));
            if (r.has_item()) {
                ++received;
            } else if (r.status == channel_status::closed) {
                break;
            }
        }
        producer.join();
        ::benchmark::DoNotOptimize(received);
    }

    state.SetItemsProcessed(static_cast<int64_t>(items) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Cost of validating a snapshot against its predecessor
 */
static void BM_ProgressValidator_Validate(::benchmark::State& state) {
    import_progress previous;
    previous.total_files = 1000;
    previous.processed_files = 499;
    previous.percentage = progress_validator::expected_percentage(499, 1000);

    import_progress next = previous;
    next.processed_files = 500;
    next.percentage = progress_validator::expected_percentage(500, 1000);

    for (auto _ : state) {
        auto r = progress_validator::validate(next, previous);
        ::benchmark::DoNotOptimize(r.has_value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Password file lookup, validation and read for one keystore
 */
static void BM_PasswordFile_Read(::benchmark::State& state) {
    keystore_set keystores(1, true);
    password_file_manager manager;
    const auto& keystore = keystores.files().front();

    for (auto _ : state) {
        auto path = manager.find_password_file(keystore);
        if (!path) {
            state.SkipWithError("Password file not found");
            return;
        }
        auto password = manager.read_password_file(path.value());
        if (!password) {
            state.SkipWithError("Failed to read password file");
            return;
        }
        ::benchmark::DoNotOptimize(password.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Directory scan and job creation
 */
static void BM_Importer_ScanDirectory(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    keystore_set keystores(file_count, true);

    auto importer = keystore_batch_importer::builder()
                        .with_decryptor(std::make_shared<plaintext_decryptor>())
                        .build();
    if (!importer) {
        state.SkipWithError("Failed to build importer");
        return;
    }

    for (auto _ : state) {
        auto jobs = importer.value().create_import_jobs_from_directory(keystores.directory());
        if (!jobs) {
            state.SkipWithError("Directory scan failed");
            return;
        }
        ::benchmark::DoNotOptimize(jobs.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(file_count) *
                           static_cast<int64_t>(state.iterations()));
    state.counters["files"] = ::benchmark::Counter(static_cast<double>(file_count));
}

/**
 * @brief Full non-interactive batch with password files for every keystore
 */
static void BM_Importer_ImportBatch(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    keystore_set keystores(file_count, true);

    import_config config;
    // Room for every snapshot so intermediate sends never wait.
    config.progress_channel_capacity = file_count * 4 + 8;

    auto importer = keystore_batch_importer::builder()
                        .with_decryptor(std::make_shared<plaintext_decryptor>())
                        .with_config(config)
                        .build();
    if (!importer) {
        state.SkipWithError("Failed to build importer");
        return;
    }

    auto jobs = importer.value().create_import_jobs_from_files(keystores.files());
    if (!jobs) {
        state.SkipWithError("Failed to create jobs");
        return;
    }

    for (auto _ : state) {
        state.PauseTiming();
        auto progress =
            std::make_shared<bounded_channel<import_progress>>(config.progress_channel_capacity);
        auto requests = std::make_shared<bounded_channel<password_request>>(1);
        auto responses = std::make_shared<bounded_channel<password_response>>(1);
        state.ResumeTiming();

        auto results = importer.value().import_batch(
            jobs.value(),
            channel_sender<import_progress>(progress),
            channel_sender<password_request>(requests),
            channel_receiver<password_response>(responses));

        auto summary = importer.value().get_import_summary(results);
        if (summary.successful_imports != static_cast<int>(file_count)) {
            state.SkipWithError("Unexpected import failures");
            return;
        }
        ::benchmark::DoNotOptimize(results);
    }

    state.SetItemsProcessed(static_cast<int64_t>(file_count) *
                           static_cast<int64_t>(state.iterations()));
    state.counters["files"] = ::benchmark::Counter(static_cast<double>(file_count));
}

BENCHMARK(BM_Channel_SendReceive)
    ->Arg(1)
    ->Arg(16)
    ->Arg(500)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ProgressValidator_Validate);

BENCHMARK(BM_PasswordFile_Read)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Importer_ScanDirectory)
    ->Arg(10)
    ->Arg(100)
    ->Arg(500)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Importer_ImportBatch)
    ->Arg(10)
    ->Arg(100)
    ->Arg(500)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::batch_import::benchmark
