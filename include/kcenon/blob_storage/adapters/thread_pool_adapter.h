// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Thread pool adapter for blob_storage_system
 *
 * Provides the worker pool that runs asynchronous pipeline sends and
 * transport calls, using thread_system when available and a standalone
 * fallback otherwise.
 *
 * Futures returned by every implementation are promise-backed: dropping a
 * future never blocks, so a cancelled caller can abandon an in-flight
 * transport call.
 *
 * @since 0.1.0
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

namespace kcenon::blob_storage::adapters {

/**
 * @brief Interface for thread pool operations in blob_storage_system
 */
class pipeline_thread_pool_interface {
public:
    virtual ~pipeline_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool is running
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get number of submitted tasks that have not finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool for pipeline work
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_pipeline_adapter : public pipeline_thread_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_pipeline_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "blob_storage_pipeline",
        size_t worker_count = 0);

    ~thread_system_pipeline_adapter() override;

    thread_system_pipeline_adapter(const thread_system_pipeline_adapter&) = delete;
    thread_system_pipeline_adapter& operator=(const thread_system_pipeline_adapter&) = delete;

    /**
     * @brief Factory method to create a started pool
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pipeline_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "blob_storage_pipeline");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using one detached thread per task
 *
 * Used when thread_system is unavailable. worker_count() reports
 * hardware_concurrency since there is no fixed worker set.
 */
class detached_thread_pool : public pipeline_thread_pool_interface {
public:
    detached_thread_pool();
    ~detached_thread_pool() override;

    detached_thread_pool(const detached_thread_pool&) = delete;
    detached_thread_pool& operator=(const detached_thread_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    std::shared_ptr<std::atomic<size_t>> active_tasks_;
};

/**
 * @brief Factory for creating the best available pool implementation
 */
class pipeline_pool_factory {
public:
    /**
     * @brief Create a pool: thread_system if available, else the fallback
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<pipeline_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "blob_storage_pipeline");
};

}  // namespace kcenon::blob_storage::adapters
