// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_pool_adapter.h
 * @brief Worker pool adapter for coordinated I/O
 *
 * Coordinated opens, coordinated writes and retry re-issues must never run
 * on the index notification thread. This adapter gives the engine a single
 * pool abstraction for that work.
 *
 * Features:
 * - Stage-based task tracking ("coordinated_open", "coordinated_write", ...)
 * - Integration with thread_system when available
 * - Fixed-size fallback pool when thread_system is unavailable
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

namespace kcenon::cloud_sync::adapters {

/**
 * @brief Stage names used by the engine when submitting work
 */
struct pool_stage {
    static constexpr const char* coordinated_open = "coordinated_open";
    static constexpr const char* coordinated_write = "coordinated_write";
    static constexpr const char* retry = "retry";
};

/**
 * @brief Interface for worker pool operations in cloud_sync
 */
class task_pool_interface {
public:
    virtual ~task_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task to a named stage for tracking
     * @param task The task to execute
     * @param stage_name Name of the stage (see pool_stage)
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool accepts work
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get total pending task count
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Get pending or running task count for a stage
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;

    /**
     * @brief Stop accepting work and join the workers
     *
     * Queued tasks are drained before the workers exit.
     */
    virtual void shutdown() = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_task_pool : public task_pool_interface {
public:
    explicit thread_system_task_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "cloud_sync_pool",
        size_t worker_count = 0);

    ~thread_system_task_pool() override;

    thread_system_task_pool(const thread_system_task_pool&) = delete;
    thread_system_task_pool& operator=(const thread_system_task_pool&) = delete;

    /**
     * @brief Factory method to create a started pool
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_task_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "cloud_sync_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    void shutdown() override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool with a fixed set of workers and a FIFO queue
 *
 * Used when thread_system is unavailable. Tasks submitted after shutdown()
 * are rejected with a future holding std::runtime_error.
 */
class basic_task_pool : public task_pool_interface {
public:
    explicit basic_task_pool(size_t worker_count = 0);
    ~basic_task_pool() override;

    basic_task_pool(const basic_task_pool&) = delete;
    basic_task_pool& operator=(const basic_task_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    void shutdown() override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the appropriate pool
 *
 * 1. thread_system_task_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. basic_task_pool (fallback)
 */
class task_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<task_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "cloud_sync_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::cloud_sync::adapters
