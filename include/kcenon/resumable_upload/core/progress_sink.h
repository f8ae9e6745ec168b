/**
 * @file progress_sink.h
 * @brief Progress and error event destination for one uploader
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_PROGRESS_SINK_H
#define KCENON_RESUMABLE_UPLOAD_CORE_PROGRESS_SINK_H

#include <kcenon/resumable_upload/core/types.h>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::resumable_upload {

/**
 * @brief Well-known upload status texts
 */
enum class upload_status {
    splitting_chunks,
    uploading_chunks,
    paused,
    completed,
    connection_lost,
    aborted,
};

[[nodiscard]] constexpr auto to_string(upload_status status) -> const char* {
    switch (status) {
        case upload_status::splitting_chunks: return "Splitting Chunks";
        case upload_status::uploading_chunks: return "Uploading Chunks";
        case upload_status::paused: return "Paused";
        case upload_status::completed: return "Completed";
        case upload_status::connection_lost: return "Connection Lost";
        case upload_status::aborted: return "Aborted";
        default: return "Unknown";
    }
}

/**
 * @brief Latest known progress of an upload
 */
struct progress_snapshot {
    std::string status;
    double upload_percentage = 0.0;
    uint32_t current_chunk_index = 0;
    uint32_t total_chunks = 0;
    uint32_t chunks_uploaded = 0;
    bool is_completed = false;
};

/**
 * @brief Partial update merged into a progress_snapshot
 *
 * Unset fields keep their previous value. The status text is always replaced.
 */
struct progress_update {
    std::string status;
    std::optional<uint32_t> current_chunk_index;
    std::optional<uint32_t> total_chunks;
    std::optional<double> upload_percentage;
    std::optional<bool> is_completed;
};

/**
 * @brief Classification of errors delivered to the error callback
 */
enum class upload_error_kind {
    validation,      ///< Bad input, reported before any transfer
    service_state,   ///< Disposed service or duplicate start
    transient,       ///< Retryable transfer failure, retry scheduled
    terminal,        ///< Chunk exhausted its retry budget
};

[[nodiscard]] constexpr auto to_string(upload_error_kind kind) -> const char* {
    switch (kind) {
        case upload_error_kind::validation: return "validation";
        case upload_error_kind::service_state: return "service_state";
        case upload_error_kind::transient: return "transient";
        case upload_error_kind::terminal: return "terminal";
        default: return "unknown";
    }
}

/**
 * @brief Error event delivered to the error callback
 */
struct upload_error {
    upload_error_kind kind = upload_error_kind::transient;
    error_code code = error_code::internal_error;
    std::string message;
    std::optional<uint32_t> chunk_index;
    std::optional<uint32_t> remaining_attempts;
};

using progress_callback = std::function<void(const progress_snapshot&)>;
using error_callback = std::function<void(const upload_error&)>;

/**
 * @brief Destination for status, percentage and error events
 *
 * Each uploader owns one sink, so concurrent uploaders never share
 * snapshots. Callbacks run on the emitting thread, outside the sink's lock.
 * An exception thrown by the progress callback is turned into an error
 * emission; one thrown by the error callback is logged.
 */
class progress_sink {
public:
    progress_sink() = default;

    progress_sink(const progress_sink&) = delete;
    auto operator=(const progress_sink&) -> progress_sink& = delete;

    void set_callbacks(progress_callback on_progress, error_callback on_error);

    /**
     * @brief Merge @p update into the snapshot and notify the progress callback
     *
     * A supplied current_chunk_index > 0 also sets
     * chunks_uploaded = current_chunk_index - 1.
     */
    void emit_progress(const progress_update& update);

    void emit_progress(upload_status status);

    void emit_error(const upload_error& err);

    [[nodiscard]] auto snapshot() const -> progress_snapshot;

    /**
     * @brief Reset the snapshot to its initial values, keeping callbacks
     */
    void reset();

    /**
     * @brief Drop callbacks; later emissions only update the snapshot
     */
    void dispose();

    [[nodiscard]] auto is_disposed() const -> bool;

private:
    mutable std::mutex mutex_;
    progress_snapshot snapshot_;
    progress_callback on_progress_;
    error_callback on_error_;
    bool disposed_ = false;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_PROGRESS_SINK_H
