// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file manual_scheduler.h
 * @brief Virtual-clock scheduler for deterministic tests
 */

#pragma once

#include "task_scheduler.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Scheduler whose clock only moves when told to
 *
 * Tasks run on the thread calling advance() or run_ready(). Nothing runs
 * from post_delayed() itself.
 *
 * @code
 * manual_scheduler scheduler;
 * scheduler.post_delayed(task, std::chrono::milliseconds{500});
 * scheduler.advance(std::chrono::milliseconds{499});  // not yet
 * scheduler.advance(std::chrono::milliseconds{1});    // runs task
 * @endcode
 */
class manual_scheduler : public task_scheduler {
public:
    manual_scheduler();

    auto post_delayed(task t, std::chrono::milliseconds delay) -> timer_handle override;

    [[nodiscard]] auto now() const -> clock::time_point override;

    /**
     * @brief Move the clock forward, running every task that becomes due
     *
     * Tasks posted while advancing run too if they fall due before the new
     * time. Returns the number of tasks run.
     */
    auto advance(std::chrono::milliseconds duration) -> std::size_t;

    /**
     * @brief Run all tasks due at the current time
     */
    auto run_ready() -> std::size_t;

    /**
     * @brief Number of scheduled, not cancelled, tasks
     */
    [[nodiscard]] auto pending() const -> std::size_t;

    /**
     * @brief Delay until the next pending task, if any
     */
    [[nodiscard]] auto next_due_in() const -> std::optional<std::chrono::milliseconds>;

private:
    struct entry {
        clock::time_point due;
        uint64_t sequence;
        task work;
        std::shared_ptr<detail::timer_state> state;
    };

    auto pop_due(clock::time_point limit, entry& out) -> bool;

    mutable std::mutex mutex_;
    clock::time_point now_;
    uint64_t next_sequence_ = 0;
    std::vector<entry> entries_;
};

}  // namespace kcenon::resumable_upload
