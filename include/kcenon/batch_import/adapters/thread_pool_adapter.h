// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Task execution for import commands
 *
 * Import commands block on channels or on a whole batch, so each one runs
 * as its own pool task. Tasks are tagged with a stage ("import_batch",
 * "progress_listener", "password_listener") so the driver can tell what is
 * still outstanding.
 *
 * Uses thread_system's thread_pool when available, std::async otherwise.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::batch_import::adapters {

/**
 * @brief Pool used by the import driver to run commands
 */
class import_thread_pool_interface {
public:
    virtual ~import_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future completing when the task returns; carries any exception
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task counted under @p stage_name until it finishes
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Runs import commands on a thread_system thread_pool
 *
 * @note Thread-safe.
 */
class thread_system_import_adapter : public import_thread_pool_interface {
public:
    /**
     * @param pool Started thread_pool
     * @param pool_name Name used in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_import_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "batch_import_pool",
        size_t worker_count = 0);

    ~thread_system_import_adapter() override;

    thread_system_import_adapter(const thread_system_import_adapter&) = delete;
    thread_system_import_adapter& operator=(const thread_system_import_adapter&) = delete;

    thread_system_import_adapter(thread_system_import_adapter&&) noexcept;
    thread_system_import_adapter& operator=(thread_system_import_adapter&&) noexcept;

    /**
     * @brief Create and start a pool
     *
     * At least three workers are started so the batch and both listeners
     * can block at the same time.
     */
    [[nodiscard]] static std::shared_ptr<thread_system_import_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "batch_import_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback running every task on its own std::async thread
 */
class async_import_pool : public import_thread_pool_interface {
public:
    async_import_pool();
    ~async_import_pool() override;

    async_import_pool(const async_import_pool&) = delete;
    async_import_pool& operator=(const async_import_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Picks thread_system_import_adapter when built with thread_system,
 *        async_import_pool otherwise
 */
class import_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<import_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "batch_import_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::batch_import::adapters
