/**
 * @file retry_tracker.cpp
 * @brief Implementation of per-chunk retry accounting
 */

#include <kcenon/resumable_upload/core/retry_tracker.h>

namespace kcenon::resumable_upload {

auto retry_tracker::record_attempt(uint32_t chunk_index) -> uint32_t {
    return ++attempts_[chunk_index];
}

auto retry_tracker::attempt_count(uint32_t chunk_index) const -> uint32_t {
    auto it = attempts_.find(chunk_index);
    return it == attempts_.end() ? 0 : it->second;
}

auto retry_tracker::has_exceeded(uint32_t chunk_index, uint32_t max_retries) const -> bool {
    return attempt_count(chunk_index) >= max_retries;
}

auto retry_tracker::remaining_attempts(uint32_t chunk_index, uint32_t max_retries) const
    -> uint32_t {
    auto count = attempt_count(chunk_index);
    return count >= max_retries ? 0 : max_retries - count;
}

auto retry_tracker::backoff_delay(uint32_t chunk_index,
                                  std::chrono::milliseconds base_delay) const
    -> std::chrono::milliseconds {
    return base_delay * attempt_count(chunk_index);
}

void retry_tracker::reset(uint32_t chunk_index) {
    attempts_.erase(chunk_index);
}

void retry_tracker::reset_all() {
    attempts_.clear();
}

}  // namespace kcenon::resumable_upload
