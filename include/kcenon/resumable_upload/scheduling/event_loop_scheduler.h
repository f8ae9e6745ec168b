// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file event_loop_scheduler.h
 * @brief Single worker thread scheduler with a timer queue
 */

#pragma once

#include "task_scheduler.h"

#include <memory>
#include <string>

namespace kcenon::resumable_upload {

/**
 * @brief Scheduler running every task on one dedicated worker thread
 *
 * Tasks run in due-time order; tasks due at the same time run in posting
 * order. Pending tasks are discarded by stop().
 *
 * @note Thread-safe: post_delayed() may be called from any thread.
 */
class event_loop_scheduler : public task_scheduler {
public:
    explicit event_loop_scheduler(std::string name = "resumable_upload_loop");
    ~event_loop_scheduler() override;

    event_loop_scheduler(const event_loop_scheduler&) = delete;
    event_loop_scheduler& operator=(const event_loop_scheduler&) = delete;

    [[nodiscard]] static auto create(std::string name = "resumable_upload_loop")
        -> std::shared_ptr<event_loop_scheduler>;

    auto post_delayed(task t, std::chrono::milliseconds delay) -> timer_handle override;

    [[nodiscard]] auto now() const -> clock::time_point override;

    /**
     * @brief Stop the worker thread and discard pending tasks
     *
     * Safe to call multiple times and from within a task.
     */
    void stop();

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto pending_tasks() const -> std::size_t;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::resumable_upload
