/**
 * @file event_loop_scheduler.cpp
 * @brief Implementation of the single worker thread scheduler
 */

#include "kcenon/resumable_upload/scheduling/event_loop_scheduler.h"
#include "kcenon/resumable_upload/core/logging.h"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace kcenon::resumable_upload {

namespace {

struct scheduled_task {
    task_scheduler::clock::time_point due;
    uint64_t sequence;
    task_scheduler::task work;
    std::shared_ptr<detail::timer_state> state;
};

struct later_first {
    auto operator()(const scheduled_task& a, const scheduled_task& b) const -> bool {
        if (a.due != b.due) {
            return a.due > b.due;
        }
        return a.sequence > b.sequence;
    }
};

}  // namespace

struct event_loop_scheduler::impl {
    std::string name;
    std::priority_queue<scheduled_task, std::vector<scheduled_task>, later_first> queue;
    uint64_t next_sequence{0};
    bool stopping{false};
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::thread worker;

    explicit impl(std::string n) : name(std::move(n)) {}

    void run() {
        std::unique_lock lock(mutex);
        while (!stopping) {
            if (queue.empty()) {
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                continue;
            }

            auto due = queue.top().due;
            if (clock::now() < due) {
                cv.wait_until(lock, due);
                continue;
            }

            auto next = std::move(const_cast<scheduled_task&>(queue.top()));
            queue.pop();

            if (next.state->cancelled.load()) {
                continue;
            }

            next.state->done.store(true);
            lock.unlock();
            execute(next);
            lock.lock();
        }
    }

    void execute(scheduled_task& next) {
        try {
            next.work();
        } catch (const std::exception& e) {
            RU_LOG_ERROR(log_category::scheduler,
                "Task on '" + name + "' threw: " + std::string(e.what()));
        }
    }
};

event_loop_scheduler::event_loop_scheduler(std::string name)
    : impl_(std::make_shared<impl>(std::move(name))) {
    // The worker keeps impl alive so the loop may outlive a stop() issued
    // from one of its own tasks.
    impl_->worker = std::thread([self = impl_] { self->run(); });
    RU_LOG_DEBUG(log_category::scheduler, "Event loop '" + impl_->name + "' started");
}

event_loop_scheduler::~event_loop_scheduler() {
    stop();
}

auto event_loop_scheduler::create(std::string name) -> std::shared_ptr<event_loop_scheduler> {
    return std::make_shared<event_loop_scheduler>(std::move(name));
}

auto event_loop_scheduler::post_delayed(task t, std::chrono::milliseconds delay)
    -> timer_handle {
    auto state = std::make_shared<detail::timer_state>();
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopping) {
            state->cancelled.store(true);
            return timer_handle(state);
        }
        impl_->queue.push(scheduled_task{
            clock::now() + std::max(delay, std::chrono::milliseconds{0}),
            impl_->next_sequence++, std::move(t), state});
    }
    impl_->cv.notify_one();
    return timer_handle(state);
}

auto event_loop_scheduler::now() const -> clock::time_point {
    return clock::now();
}

void event_loop_scheduler::stop() {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopping && !impl_->worker.joinable()) {
            return;
        }
        impl_->stopping = true;
        while (!impl_->queue.empty()) {
            impl_->queue.top().state->cancelled.store(true);
            impl_->queue.pop();
        }
    }
    impl_->cv.notify_all();

    if (impl_->worker.joinable()) {
        if (impl_->worker.get_id() == std::this_thread::get_id()) {
            // Stopped from one of our own tasks; the loop exits after it returns
            impl_->worker.detach();
        } else {
            impl_->worker.join();
        }
        RU_LOG_DEBUG(log_category::scheduler, "Event loop '" + impl_->name + "' stopped");
    }
}

auto event_loop_scheduler::is_running() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return !impl_->stopping;
}

auto event_loop_scheduler::pending_tasks() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->queue.size();
}

}  // namespace kcenon::resumable_upload
