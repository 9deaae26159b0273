// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_pool_adapter.cpp
 * @brief Worker pool adapter implementation for cloud_sync
 */

#include "kcenon/cloud_sync/adapters/task_pool_adapter.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::cloud_sync::adapters {

// ============================================================================
// Stage tracking helper (shared implementation)
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

size_t resolve_worker_count(size_t requested) {
    if (requested != 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : hw;
}

/**
 * @brief Wrap a task so its future observes completion or the thrown exception
 */
std::function<void()> bind_promise(std::function<void()> task,
                                   std::shared_ptr<std::promise<void>> promise) {
    return [task = std::move(task), promise = std::move(promise)]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };
}

}  // namespace

// ============================================================================
// thread_system_task_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Simple job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
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

struct thread_system_task_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<bool> running{true};
    stage_tracker tracker;
};

thread_system_task_pool::thread_system_task_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_task_pool::~thread_system_task_pool() {
    shutdown();
}

std::shared_ptr<thread_system_task_pool>
thread_system_task_pool::create_default(size_t worker_count,
                                        const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_task_pool>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_task_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    if (!pimpl_->running.load()) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("task pool is shut down")));
        return future;
    }

    auto job = std::make_unique<function_job>(bind_promise(std::move(task), promise),
                                              "cloud_sync_task");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

std::future<void> thread_system_task_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto* tracker = &pimpl_->tracker;
    auto tracked = [task = std::move(task), tracker, stage = stage_name]() {
        try {
            task();
        } catch (...) {
            tracker->decrement(stage);
            throw;
        }
        tracker->decrement(stage);
    };

    return submit(std::move(tracked));
}

size_t thread_system_task_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_task_pool::is_running() const {
    return pimpl_->pool != nullptr && pimpl_->running.load();
}

size_t thread_system_task_pool::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

size_t thread_system_task_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

void thread_system_task_pool::shutdown() {
    bool expected = true;
    if (!pimpl_->running.compare_exchange_strong(expected, false)) {
        return;
    }
    if (pimpl_->pool) {
        pimpl_->pool->stop(false);
    }
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_task_pool::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// basic_task_pool implementation
// ============================================================================

struct basic_task_pool::impl {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> queue;
    std::vector<std::thread> workers;
    bool stopping{false};
    stage_tracker tracker;

    void run() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                task = std::move(queue.front());
                queue.pop_front();
            }
            task();
        }
    }
};

basic_task_pool::basic_task_pool(size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    worker_count = resolve_worker_count(worker_count);
    pimpl_->workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        // Workers share ownership so a detached worker outlives the pool object
        pimpl_->workers.emplace_back([p = pimpl_] { p->run(); });
    }
}

basic_task_pool::~basic_task_pool() {
    shutdown();
}

std::future<void> basic_task_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("task pool is shut down")));
            return future;
        }
        pimpl_->queue.push_back(bind_promise(std::move(task), std::move(promise)));
    }
    pimpl_->cv.notify_one();

    return future;
}

std::future<void> basic_task_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto* tracker = &pimpl_->tracker;
    auto tracked = [task = std::move(task), tracker, stage = stage_name]() {
        try {
            task();
        } catch (...) {
            tracker->decrement(stage);
            throw;
        }
        tracker->decrement(stage);
    };

    return submit(std::move(tracked));
}

size_t basic_task_pool::worker_count() const {
    return pimpl_->workers.size();
}

bool basic_task_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t basic_task_pool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->queue.size();
}

size_t basic_task_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

void basic_task_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return;
        }
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();

    auto self = std::this_thread::get_id();
    for (auto& worker : pimpl_->workers) {
        if (!worker.joinable()) {
            continue;
        }
        // A task that drops the last engine reference shuts the pool down
        // from one of its own workers.
        if (worker.get_id() == self) {
            worker.detach();
        } else {
            worker.join();
        }
    }
}

// ============================================================================
// task_pool_factory implementation
// ============================================================================

std::shared_ptr<task_pool_interface> task_pool_factory::create(
    size_t worker_count, [[maybe_unused]] const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_task_pool::create_default(worker_count, pool_name);
#else
    return std::make_shared<basic_task_pool>(worker_count);
#endif
}

}  // namespace kcenon::cloud_sync::adapters
