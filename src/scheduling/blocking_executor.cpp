// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file blocking_executor.cpp
 * @brief Implementation of the blocking job executors
 */

#include "kcenon/resumable_upload/scheduling/blocking_executor.h"
#include "kcenon/resumable_upload/core/logging.h"

#include <exception>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::resumable_upload {

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/**
 * @brief Job wrapping a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "upload_io_job")
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

}  // namespace

thread_system_executor::thread_system_executor(
    std::shared_ptr<kcenon::thread::thread_pool> pool)
    : pool_(std::move(pool)) {}

thread_system_executor::~thread_system_executor() {
    if (pool_) {
        // Let in-flight requests finish; they are bounded by the HTTP timeouts
        pool_->stop(false);
    }
}

std::shared_ptr<thread_system_executor> thread_system_executor::create(
    std::size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = 1;
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_executor>(std::move(pool));
}

std::future<void> thread_system_executor::submit(std::function<void()> job) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped = [job = std::move(job), promise]() {
        try {
            job();
            promise->set_value();
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    };

    pool_->enqueue(std::make_unique<function_job>(std::move(wrapped)));
    return future;
}

bool thread_system_executor::is_running() const {
    return pool_ != nullptr;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

std::future<void> async_executor::submit(std::function<void()> job) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    // Detached so that dropping the future never blocks the caller
    std::thread([job = std::move(job), promise]() {
        try {
            job();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    return future;
}

std::shared_ptr<blocking_executor> create_default_executor() {
#if KCENON_WITH_THREAD_SYSTEM
    RU_LOG_DEBUG(log_category::transport, "Using thread_system executor for HTTP requests");
    return thread_system_executor::create();
#else
    return std::make_shared<async_executor>();
#endif
}

}  // namespace kcenon::resumable_upload
