// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file blocking_executor.h
 * @brief Executor for blocking work kept off the upload event loop
 *
 * HTTP requests block for up to the configured send/receive timeouts, so the
 * transport runs them here instead of on the task_scheduler.
 *
 * - thread_system_executor: runs jobs on a thread_system thread_pool
 * - async_executor: thread-per-job fallback when thread_system is unavailable
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::resumable_upload {

/**
 * @brief Interface for running blocking jobs
 */
class blocking_executor {
public:
    virtual ~blocking_executor() = default;

    /**
     * @brief Run a job on a background thread
     * @return Future completed when the job returns
     */
    virtual std::future<void> submit(std::function<void()> job) = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor backed by thread_system's thread_pool
 */
class thread_system_executor : public blocking_executor {
public:
    explicit thread_system_executor(std::shared_ptr<kcenon::thread::thread_pool> pool);
    ~thread_system_executor() override;

    thread_system_executor(const thread_system_executor&) = delete;
    thread_system_executor& operator=(const thread_system_executor&) = delete;

    /**
     * @brief Create a started pool with @p worker_count workers
     */
    [[nodiscard]] static std::shared_ptr<thread_system_executor> create(
        std::size_t worker_count = 2,
        const std::string& pool_name = "resumable_upload_io");

    std::future<void> submit(std::function<void()> job) override;
    [[nodiscard]] bool is_running() const override;

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor running each job on its own detached thread
 *
 * Unlike a std::async future, the returned future does not block on
 * destruction.
 */
class async_executor : public blocking_executor {
public:
    std::future<void> submit(std::function<void()> job) override;
    [[nodiscard]] bool is_running() const override { return true; }
};

/**
 * @brief Create the best available executor
 *
 * Returns a thread_system_executor when built with thread_system,
 * otherwise an async_executor.
 */
[[nodiscard]] std::shared_ptr<blocking_executor> create_default_executor();

}  // namespace kcenon::resumable_upload
