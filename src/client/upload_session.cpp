/**
 * @file upload_session.cpp
 * @brief Implementation of the upload session state machine
 */

#include <kcenon/resumable_upload/client/upload_session.h>

#include <string>

namespace kcenon::resumable_upload {

auto is_valid_transition(upload_phase from, upload_phase to) noexcept -> bool {
    if (from == to) {
        return true;
    }

    switch (from) {
        case upload_phase::uninitialized:
            return to == upload_phase::initializing ||
                   to == upload_phase::aborted;
        case upload_phase::initializing:
            return to == upload_phase::ready ||
                   to == upload_phase::suspended ||
                   to == upload_phase::uninitialized ||
                   to == upload_phase::aborted;
        case upload_phase::ready:
            return to == upload_phase::transferring ||
                   to == upload_phase::suspended ||
                   to == upload_phase::stalled ||
                   to == upload_phase::aborted;
        case upload_phase::transferring:
            return to == upload_phase::ready ||
                   to == upload_phase::awaiting_retry ||
                   to == upload_phase::stalled ||
                   to == upload_phase::suspended ||
                   to == upload_phase::completed ||
                   to == upload_phase::aborted;
        case upload_phase::awaiting_retry:
            return to == upload_phase::transferring ||
                   to == upload_phase::stalled ||
                   to == upload_phase::suspended ||
                   to == upload_phase::aborted;
        case upload_phase::suspended:
            return to == upload_phase::ready ||
                   to == upload_phase::completed ||
                   to == upload_phase::aborted;
        case upload_phase::stalled:
            return to == upload_phase::ready ||
                   to == upload_phase::transferring ||
                   to == upload_phase::suspended ||
                   to == upload_phase::aborted;
        case upload_phase::completed:
            return to == upload_phase::initializing ||
                   to == upload_phase::aborted;
        case upload_phase::aborted:
            return to == upload_phase::initializing;
        default:
            return false;
    }
}

auto upload_session::begin(uint64_t file_length, uint64_t chunk_size) -> result<void> {
    if (phase_ != upload_phase::uninitialized &&
        phase_ != upload_phase::completed &&
        phase_ != upload_phase::aborted) {
        return unexpected(error{error_code::upload_in_progress,
            std::string("Cannot begin a session while ") + to_string(phase_)});
    }
    if (file_length == 0 || chunk_size == 0) {
        return unexpected(error{error_code::invalid_configuration,
            "File length and chunk size must be non-zero"});
    }

    clear();
    layout_ = chunk_layout{file_length, chunk_size};
    total_chunks_ = layout_.total_chunks();
    phase_ = upload_phase::initializing;
    return {};
}

auto upload_session::transition_to(upload_phase next) -> result<void> {
    if (!is_valid_transition(phase_, next)) {
        return unexpected(error{error_code::invalid_state_transition,
            std::string("Invalid phase transition: ") + to_string(phase_) + " -> " +
            to_string(next)});
    }
    phase_ = next;
    return {};
}

auto upload_session::next_chunk_range() const -> result<byte_range> {
    if (phase_ == upload_phase::uninitialized || all_chunks_sent()) {
        return unexpected(error{error_code::invalid_chunk_range, "No chunk left to send"});
    }
    return byte_range{next_chunk_start_, layout_.chunk_end(next_chunk_start_)};
}

auto upload_session::advance(const byte_range& range) -> result<void> {
    if (range.start != next_chunk_start_ || range.end > layout_.file_length ||
        range.empty()) {
        return unexpected(error{error_code::invalid_chunk_range,
            "Chunk range does not continue at offset " + std::to_string(next_chunk_start_)});
    }
    next_chunk_start_ = range.end;
    ++successive_chunk_count_;
    return {};
}

auto upload_session::try_acquire_transfer_lock() -> bool {
    if (transfer_in_flight_) {
        return false;
    }
    transfer_in_flight_ = true;
    return true;
}

auto upload_session::take_first_network_signal() -> bool {
    if (!first_network_signal_) {
        return false;
    }
    first_network_signal_ = false;
    return true;
}

void upload_session::clear() {
    phase_ = upload_phase::uninitialized;
    layout_ = chunk_layout{};
    total_chunks_ = 0;
    next_chunk_start_ = 0;
    successive_chunk_count_ = 0;
    paused_ = false;
    offline_ = false;
    first_network_signal_ = true;
    transfer_in_flight_ = false;
}

void upload_session::mark_aborted() {
    clear();
    phase_ = upload_phase::aborted;
}

}  // namespace kcenon::resumable_upload
