// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file import_thread_pool_adapter.cpp
 * @brief Thread pool adapters for import commands
 */

#include "kcenon/batch_import/adapters/thread_pool_adapter.h"

#include <algorithm>
#include <mutex>
#include <thread>
#include <unordered_map>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::batch_import::adapters {

namespace {

/**
 * @brief Outstanding task count per stage name
 */
class stage_counter {
public:
    void add(const std::string& stage) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage];
    }

    void done(const std::string& stage) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t get(const std::string& stage) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

/**
 * @brief Run @p task, routing its outcome into @p promise
 */
void run_into(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace

// ============================================================================
// thread_system_import_adapter
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

class command_job : public kcenon::thread::job {
public:
    explicit command_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_import_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> in_flight{0};
    stage_counter stages;

    std::future<void> enqueue(std::function<void()> task, const std::string& job_name) {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();

        in_flight.fetch_add(1, std::memory_order_relaxed);
        auto wrapped = [this, task = std::move(task), promise]() {
            run_into(task, *promise);
            in_flight.fetch_sub(1, std::memory_order_relaxed);
        };

        pool->enqueue(std::make_unique<command_job>(std::move(wrapped), job_name));
        return future;
    }
};

thread_system_import_adapter::thread_system_import_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_import_adapter::~thread_system_import_adapter() = default;

thread_system_import_adapter::thread_system_import_adapter(
    thread_system_import_adapter&&) noexcept = default;

thread_system_import_adapter& thread_system_import_adapter::operator=(
    thread_system_import_adapter&&) noexcept = default;

std::shared_ptr<thread_system_import_adapter>
thread_system_import_adapter::create_default(size_t worker_count,
                                             const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
    }
    worker_count = std::max<size_t>(worker_count, 3);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_import_adapter>(std::move(pool), pool_name,
                                                          worker_count);
}

std::future<void> thread_system_import_adapter::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task), "import_command");
}

std::future<void> thread_system_import_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->stages.add(stage_name);

    auto* stages = &pimpl_->stages;
    auto tracked = [task = std::move(task), stages, stage = stage_name]() {
        struct stage_guard {
            stage_counter* counter;
            const std::string& name;
            ~stage_guard() { counter->done(name); }
        } guard{stages, stage};
        task();
    };
    return pimpl_->enqueue(std::move(tracked), stage_name);
}

size_t thread_system_import_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_import_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_import_adapter::pending_tasks() const {
    return pimpl_->in_flight.load(std::memory_order_relaxed);
}

size_t thread_system_import_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->stages.get(stage_name);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_import_adapter::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_import_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_import_pool
// ============================================================================

struct async_import_pool::impl {
    std::atomic<size_t> in_flight{0};
    stage_counter stages;
};

async_import_pool::async_import_pool() : pimpl_(std::make_unique<impl>()) {}

async_import_pool::~async_import_pool() = default;

std::future<void> async_import_pool::submit(std::function<void()> task) {
    pimpl_->in_flight.fetch_add(1, std::memory_order_relaxed);

    auto* state = pimpl_.get();
    return std::async(std::launch::async, [state, task = std::move(task)]() {
        struct done_guard {
            impl* state;
            ~done_guard() { state->in_flight.fetch_sub(1, std::memory_order_relaxed); }
        } guard{state};
        task();
    });
}

std::future<void> async_import_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->stages.add(stage_name);
    pimpl_->in_flight.fetch_add(1, std::memory_order_relaxed);

    auto* state = pimpl_.get();
    return std::async(std::launch::async,
                      [state, task = std::move(task), stage = stage_name]() {
                          struct done_guard {
                              impl* state;
                              const std::string& stage;
                              ~done_guard() {
                                  state->stages.done(stage);
                                  state->in_flight.fetch_sub(1, std::memory_order_relaxed);
                              }
                          } guard{state, stage};
                          task();
                      });
}

size_t async_import_pool::worker_count() const {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

bool async_import_pool::is_running() const { return true; }

size_t async_import_pool::pending_tasks() const {
    return pimpl_->in_flight.load(std::memory_order_relaxed);
}

size_t async_import_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->stages.get(stage_name);
}

// ============================================================================
// import_pool_factory
// ============================================================================

std::shared_ptr<import_thread_pool_interface> import_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_import_adapter::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_import_pool>();
#endif
}

}  // namespace kcenon::batch_import::adapters
