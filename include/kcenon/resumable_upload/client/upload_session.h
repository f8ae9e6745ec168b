/**
 * @file upload_session.h
 * @brief State of one logical upload and its phase transition table
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CLIENT_UPLOAD_SESSION_H
#define KCENON_RESUMABLE_UPLOAD_CLIENT_UPLOAD_SESSION_H

#include <kcenon/resumable_upload/core/chunk_layout.h>
#include <kcenon/resumable_upload/core/types.h>

#include <cstdint>

namespace kcenon::resumable_upload {

/**
 * @brief Lifecycle phase of an upload session
 */
enum class upload_phase {
    uninitialized,   ///< No upload configured
    initializing,    ///< Layout computed, chunk loop not yet entered
    ready,           ///< Waiting to enter the chunk loop
    transferring,    ///< One chunk in flight
    awaiting_retry,  ///< Backoff timer pending for the current chunk
    suspended,       ///< Paused and/or offline
    stalled,         ///< Current chunk exhausted its retry budget
    completed,       ///< Final chunk accepted
    aborted,         ///< Aborted by the caller
};

[[nodiscard]] constexpr auto to_string(upload_phase phase) -> const char* {
    switch (phase) {
        case upload_phase::uninitialized: return "uninitialized";
        case upload_phase::initializing: return "initializing";
        case upload_phase::ready: return "ready";
        case upload_phase::transferring: return "transferring";
        case upload_phase::awaiting_retry: return "awaiting_retry";
        case upload_phase::suspended: return "suspended";
        case upload_phase::stalled: return "stalled";
        case upload_phase::completed: return "completed";
        case upload_phase::aborted: return "aborted";
        default: return "unknown";
    }
}

/**
 * @brief Check if a phase transition is allowed
 *
 * Staying in the same phase is always allowed. Resetting a session to
 * uninitialized goes through upload_session::clear() and bypasses the table.
 */
[[nodiscard]] auto is_valid_transition(upload_phase from, upload_phase to) noexcept -> bool;

/**
 * @brief Mutable state of one logical upload
 *
 * The boolean flags callers observe are projections of the phase, except
 * paused and offline which are independent latches. Owned and mutated by
 * resumable_uploader only; not thread-safe on its own.
 */
class upload_session {
public:
    upload_session() = default;

    /**
     * @brief Start a new session over @p file_length bytes
     *
     * Allowed from uninitialized, completed and aborted.
     */
    [[nodiscard]] auto begin(uint64_t file_length, uint64_t chunk_size) -> result<void>;

    /**
     * @brief Move to @p next, rejecting transitions outside the table
     */
    [[nodiscard]] auto transition_to(upload_phase next) -> result<void>;

    [[nodiscard]] auto phase() const -> upload_phase { return phase_; }
    [[nodiscard]] auto layout() const -> const chunk_layout& { return layout_; }

    [[nodiscard]] auto file_length() const -> uint64_t { return layout_.file_length; }
    [[nodiscard]] auto total_chunks() const -> uint32_t { return total_chunks_; }
    [[nodiscard]] auto next_chunk_start() const -> uint64_t { return next_chunk_start_; }
    [[nodiscard]] auto successive_chunk_count() const -> uint32_t { return successive_chunk_count_; }

    /**
     * @brief 1-based index of the next chunk to send
     */
    [[nodiscard]] auto current_chunk_index() const -> uint32_t {
        return successive_chunk_count_ + 1;
    }

    /**
     * @brief Byte range [next_chunk_start, min(next_chunk_start + chunk_size, file_length))
     */
    [[nodiscard]] auto next_chunk_range() const -> result<byte_range>;

    /**
     * @brief Record acceptance of the chunk covering @p range
     *
     * Fails with invalid_chunk_range unless @p range starts at next_chunk_start.
     */
    [[nodiscard]] auto advance(const byte_range& range) -> result<void>;

    [[nodiscard]] auto is_final_chunk(uint32_t chunk_index) const -> bool {
        return chunk_index == total_chunks_;
    }

    [[nodiscard]] auto all_chunks_sent() const -> bool {
        return successive_chunk_count_ == total_chunks_;
    }

    [[nodiscard]] auto is_only_chunk() const -> bool { return total_chunks_ == 1; }

    [[nodiscard]] auto is_initialized() const -> bool {
        return phase_ != upload_phase::uninitialized && phase_ != upload_phase::aborted;
    }
    [[nodiscard]] auto is_completed() const -> bool { return phase_ == upload_phase::completed; }
    [[nodiscard]] auto is_aborted() const -> bool { return phase_ == upload_phase::aborted; }
    [[nodiscard]] auto is_stalled() const -> bool { return phase_ == upload_phase::stalled; }

    [[nodiscard]] auto is_paused() const -> bool { return paused_; }
    [[nodiscard]] auto is_offline() const -> bool { return offline_; }
    void set_paused(bool paused) { paused_ = paused; }
    void set_offline(bool offline) { offline_ = offline; }

    /**
     * @brief True when any of offline, paused, aborted or completed is set
     */
    [[nodiscard]] auto is_blocked() const -> bool {
        return offline_ || paused_ || is_aborted() || is_completed();
    }

    /**
     * @brief Acquire the single-flight lock without blocking
     * @return false if a transfer already holds it
     */
    [[nodiscard]] auto try_acquire_transfer_lock() -> bool;

    void release_transfer_lock() { transfer_in_flight_ = false; }

    [[nodiscard]] auto is_transfer_in_flight() const -> bool { return transfer_in_flight_; }

    /**
     * @brief Consume the first-network-signal marker
     * @return true exactly once per session
     */
    auto take_first_network_signal() -> bool;

    /**
     * @brief Drop everything and return to uninitialized
     */
    void clear();

    /**
     * @brief Drop everything and latch the aborted phase
     */
    void mark_aborted();

private:
    upload_phase phase_ = upload_phase::uninitialized;
    chunk_layout layout_;
    uint32_t total_chunks_ = 0;
    uint64_t next_chunk_start_ = 0;
    uint32_t successive_chunk_count_ = 0;
    bool paused_ = false;
    bool offline_ = false;
    bool first_network_signal_ = true;
    bool transfer_in_flight_ = false;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CLIENT_UPLOAD_SESSION_H
