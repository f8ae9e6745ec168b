/**
 * @file retry_tracker.h
 * @brief Per-chunk retry accounting
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_RETRY_TRACKER_H
#define KCENON_RESUMABLE_UPLOAD_CORE_RETRY_TRACKER_H

#include <chrono>
#include <cstdint>
#include <map>

namespace kcenon::resumable_upload {

/**
 * @brief Failure counters keyed by 1-based chunk index
 *
 * A failure of chunk N only ever touches the counter of N. Counters are
 * removed when their chunk succeeds, so an absent entry means zero attempts.
 *
 * Not thread-safe: the uploader only calls it from its serialized context.
 */
class retry_tracker {
public:
    /**
     * @brief Record one failed attempt for a chunk
     * @return The attempt count after recording
     */
    auto record_attempt(uint32_t chunk_index) -> uint32_t;

    [[nodiscard]] auto attempt_count(uint32_t chunk_index) const -> uint32_t;

    /**
     * @brief Check whether a chunk has used up its retry budget
     */
    [[nodiscard]] auto has_exceeded(uint32_t chunk_index, uint32_t max_retries) const -> bool;

    /**
     * @brief Attempts left for a chunk, max_retries - attempt_count (floored at zero)
     */
    [[nodiscard]] auto remaining_attempts(uint32_t chunk_index, uint32_t max_retries) const
        -> uint32_t;

    /**
     * @brief Linear backoff: base_delay * attempt_count(chunk_index)
     */
    [[nodiscard]] auto backoff_delay(uint32_t chunk_index,
                                     std::chrono::milliseconds base_delay) const
        -> std::chrono::milliseconds;

    void reset(uint32_t chunk_index);
    void reset_all();

    [[nodiscard]] auto empty() const -> bool { return attempts_.empty(); }

    /**
     * @brief Copy of all non-zero counters, ordered by chunk index
     */
    [[nodiscard]] auto snapshot() const -> std::map<uint32_t, uint32_t> { return attempts_; }

private:
    std::map<uint32_t, uint32_t> attempts_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_RETRY_TRACKER_H
