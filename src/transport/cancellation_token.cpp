/**
 * @file cancellation_token.cpp
 * @brief Implementation of cooperative cancellation
 */

#include "kcenon/resumable_upload/transport/upload_transport.h"

#include <mutex>
#include <vector>

namespace kcenon::resumable_upload {

struct cancellation_token::state {
    explicit state(uint64_t gen) : generation(gen) {}

    const uint64_t generation;
    std::mutex mutex;
    bool cancelled{false};
    std::vector<std::function<void()>> callbacks;
};

cancellation_token::cancellation_token() : cancellation_token(0) {}

cancellation_token::cancellation_token(uint64_t generation)
    : state_(std::make_shared<state>(generation)) {}

auto cancellation_token::next(const cancellation_token& previous) -> cancellation_token {
    return cancellation_token(previous.generation() + 1);
}

void cancellation_token::cancel() {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        to_run.swap(state_->callbacks);
    }

    for (auto& callback : to_run) {
        callback();
    }
}

auto cancellation_token::is_cancelled() const -> bool {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
}

auto cancellation_token::generation() const -> uint64_t {
    return state_->generation;
}

void cancellation_token::on_cancel(std::function<void()> callback) {
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->cancelled) {
            state_->callbacks.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

}  // namespace kcenon::resumable_upload
