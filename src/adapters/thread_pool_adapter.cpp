// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for blob_storage_system
 */

#include "kcenon/blob_storage/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::blob_storage::adapters {

namespace {

/**
 * @brief Wrap a task so its outcome lands in a promise
 */
auto make_promised_task(std::function<void()> task,
                        std::shared_ptr<std::promise<void>> promise)
    -> std::function<void()> {
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
// thread_system_pipeline_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Simple job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "pipeline_job")
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

struct thread_system_pipeline_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<std::atomic<size_t>> active_tasks =
        std::make_shared<std::atomic<size_t>>(0);
};

thread_system_pipeline_adapter::thread_system_pipeline_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_pipeline_adapter::~thread_system_pipeline_adapter() = default;

std::shared_ptr<thread_system_pipeline_adapter>
thread_system_pipeline_adapter::create_default(size_t worker_count,
                                               const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) {
            worker_count = 4;
        }
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_pipeline_adapter>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_pipeline_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto active = pimpl_->active_tasks;
    active->fetch_add(1, std::memory_order_relaxed);
    auto counted = [task = std::move(task), active]() {
        struct decrement_on_exit {
            std::shared_ptr<std::atomic<size_t>> counter;
            ~decrement_on_exit() { counter->fetch_sub(1, std::memory_order_relaxed); }
        } guard{active};
        task();
    };

    auto job = std::make_unique<function_job>(
        make_promised_task(std::move(counted), std::move(promise)), "pipeline_send");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_pipeline_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_pipeline_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_pipeline_adapter::pending_tasks() const {
    return pimpl_->active_tasks->load(std::memory_order_relaxed);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_pipeline_adapter::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// detached_thread_pool implementation
// ============================================================================

detached_thread_pool::detached_thread_pool()
    : active_tasks_(std::make_shared<std::atomic<size_t>>(0)) {}

detached_thread_pool::~detached_thread_pool() = default;

std::future<void> detached_thread_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    active_tasks_->fetch_add(1, std::memory_order_relaxed);
    auto wrapped = make_promised_task(std::move(task), std::move(promise));

    // The counter is shared so a task may outlive the pool object
    std::thread([wrapped = std::move(wrapped), active = active_tasks_]() {
        wrapped();
        active->fetch_sub(1, std::memory_order_relaxed);
    }).detach();

    return future;
}

size_t detached_thread_pool::worker_count() const {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

bool detached_thread_pool::is_running() const { return true; }

size_t detached_thread_pool::pending_tasks() const {
    return active_tasks_->load(std::memory_order_relaxed);
}

// ============================================================================
// pipeline_pool_factory implementation
// ============================================================================

std::shared_ptr<pipeline_thread_pool_interface> pipeline_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pipeline_adapter::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<detached_thread_pool>();
#endif
}

}  // namespace kcenon::blob_storage::adapters
