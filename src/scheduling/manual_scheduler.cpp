/**
 * @file manual_scheduler.cpp
 * @brief Implementation of the virtual-clock scheduler
 */

#include "kcenon/resumable_upload/scheduling/manual_scheduler.h"

#include <algorithm>

namespace kcenon::resumable_upload {

manual_scheduler::manual_scheduler() : now_(clock::time_point{}) {}

auto manual_scheduler::post_delayed(task t, std::chrono::milliseconds delay) -> timer_handle {
    auto state = std::make_shared<detail::timer_state>();
    std::lock_guard lock(mutex_);
    entries_.push_back(entry{now_ + std::max(delay, std::chrono::milliseconds{0}),
                             next_sequence_++, std::move(t), state});
    return timer_handle(state);
}

auto manual_scheduler::now() const -> clock::time_point {
    std::lock_guard lock(mutex_);
    return now_;
}

auto manual_scheduler::pop_due(clock::time_point limit, entry& out) -> bool {
    std::lock_guard lock(mutex_);

    entries_.erase(
        std::remove_if(entries_.begin(), entries_.end(),
            [](const entry& e) { return e.state->cancelled.load(); }),
        entries_.end());

    auto earliest = std::min_element(entries_.begin(), entries_.end(),
        [](const entry& a, const entry& b) {
            return a.due < b.due || (a.due == b.due && a.sequence < b.sequence);
        });

    if (earliest == entries_.end() || earliest->due > limit) {
        return false;
    }

    out = std::move(*earliest);
    entries_.erase(earliest);
    now_ = std::max(now_, out.due);
    return true;
}

auto manual_scheduler::advance(std::chrono::milliseconds duration) -> std::size_t {
    clock::time_point target;
    {
        std::lock_guard lock(mutex_);
        target = now_ + duration;
    }

    std::size_t executed = 0;
    entry next;
    while (pop_due(target, next)) {
        if (next.state->cancelled.load()) {
            continue;
        }
        next.state->done.store(true);
        next.work();
        ++executed;
    }

    std::lock_guard lock(mutex_);
    now_ = std::max(now_, target);
    return executed;
}

auto manual_scheduler::run_ready() -> std::size_t {
    return advance(std::chrono::milliseconds{0});
}

auto manual_scheduler::pending() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const entry& e) { return !e.state->cancelled.load(); }));
}

auto manual_scheduler::next_due_in() const -> std::optional<std::chrono::milliseconds> {
    std::lock_guard lock(mutex_);
    std::optional<clock::time_point> earliest;
    for (const auto& e : entries_) {
        if (e.state->cancelled.load()) {
            continue;
        }
        if (!earliest || e.due < *earliest) {
            earliest = e.due;
        }
    }
    if (!earliest) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*earliest - now_);
}

}  // namespace kcenon::resumable_upload
