// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_scheduler.h
 * @brief Serialized task scheduling seam used by the uploader
 *
 * Every continuation of an upload (next chunk, retry backoff, resume settle
 * delay, network debounce) is a task posted to one task_scheduler. Tasks of
 * a scheduler never run concurrently with each other, which gives the
 * uploader a single logical execution context.
 *
 * Implementations:
 * - event_loop_scheduler: one worker thread with a timer queue
 * - manual_scheduler: virtual clock driven explicitly by tests
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace kcenon::resumable_upload {

namespace detail {

struct timer_state {
    std::atomic<bool> cancelled{false};
    std::atomic<bool> done{false};
};

}  // namespace detail

/**
 * @brief Handle to a scheduled task
 *
 * Cancelling a handle guarantees the task will not start afterwards. A
 * default-constructed handle refers to nothing.
 */
class timer_handle {
public:
    timer_handle() = default;

    explicit timer_handle(std::shared_ptr<detail::timer_state> state)
        : state_(std::move(state)) {}

    /**
     * @brief Prevent the task from running; no-op if it already ran
     */
    void cancel() {
        if (state_) {
            state_->cancelled.store(true);
        }
    }

    /**
     * @brief Check whether the task is still waiting to run
     */
    [[nodiscard]] auto is_pending() const -> bool {
        return state_ && !state_->cancelled.load() && !state_->done.load();
    }

private:
    std::shared_ptr<detail::timer_state> state_;
};

/**
 * @brief Interface for serialized task execution with delays
 */
class task_scheduler {
public:
    using task = std::function<void()>;
    using clock = std::chrono::steady_clock;

    virtual ~task_scheduler() = default;

    /**
     * @brief Run a task as soon as possible, after already-due tasks
     */
    auto post(task t) -> timer_handle {
        return post_delayed(std::move(t), std::chrono::milliseconds{0});
    }

    /**
     * @brief Run a task once @p delay has elapsed
     */
    virtual auto post_delayed(task t, std::chrono::milliseconds delay) -> timer_handle = 0;

    /**
     * @brief Current time of this scheduler's clock
     */
    [[nodiscard]] virtual auto now() const -> clock::time_point = 0;
};

}  // namespace kcenon::resumable_upload
