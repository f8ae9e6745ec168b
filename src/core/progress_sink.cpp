/**
 * @file progress_sink.cpp
 * @brief Implementation of the progress and error event destination
 */

#include <kcenon/resumable_upload/core/progress_sink.h>
#include <kcenon/resumable_upload/core/logging.h>

#include <exception>

namespace kcenon::resumable_upload {

void progress_sink::set_callbacks(progress_callback on_progress, error_callback on_error) {
    std::lock_guard lock(mutex_);
    on_progress_ = std::move(on_progress);
    on_error_ = std::move(on_error);
}

void progress_sink::emit_progress(const progress_update& update) {
    progress_snapshot current;
    progress_callback callback;
    {
        std::lock_guard lock(mutex_);
        snapshot_.status = update.status;
        if (update.current_chunk_index) {
            snapshot_.current_chunk_index = *update.current_chunk_index;
            if (*update.current_chunk_index > 0) {
                snapshot_.chunks_uploaded = *update.current_chunk_index - 1;
            }
        }
        if (update.total_chunks) {
            snapshot_.total_chunks = *update.total_chunks;
        }
        if (update.upload_percentage) {
            snapshot_.upload_percentage = *update.upload_percentage;
        }
        if (update.is_completed) {
            snapshot_.is_completed = *update.is_completed;
        }
        current = snapshot_;
        if (!disposed_) {
            callback = on_progress_;
        }
    }

    RU_LOG_TRACE(log_category::progress, current.status);

    if (!callback) {
        return;
    }

    try {
        callback(current);
    } catch (const std::exception& e) {
        emit_error(upload_error{upload_error_kind::transient, error_code::internal_error,
                                std::string("Error emitting progress: ") + e.what(),
                                std::nullopt, std::nullopt});
    }
}

void progress_sink::emit_progress(upload_status status) {
    emit_progress(progress_update{to_string(status), std::nullopt, std::nullopt,
                                  std::nullopt, std::nullopt});
}

void progress_sink::emit_error(const upload_error& err) {
    error_callback callback;
    {
        std::lock_guard lock(mutex_);
        if (!disposed_) {
            callback = on_error_;
        }
    }

    if (!callback) {
        RU_LOG_WARN(log_category::progress,
            std::string("Unhandled ") + to_string(err.kind) + " upload error: " + err.message);
        return;
    }

    try {
        callback(err);
    } catch (const std::exception& e) {
        RU_LOG_ERROR(log_category::progress,
            std::string("Error callback threw: ") + e.what() + " (while reporting: " +
            err.message + ")");
    }
}

auto progress_sink::snapshot() const -> progress_snapshot {
    std::lock_guard lock(mutex_);
    return snapshot_;
}

void progress_sink::reset() {
    std::lock_guard lock(mutex_);
    snapshot_ = progress_snapshot{};
}

void progress_sink::dispose() {
    std::lock_guard lock(mutex_);
    on_progress_ = nullptr;
    on_error_ = nullptr;
    disposed_ = true;
}

auto progress_sink::is_disposed() const -> bool {
    std::lock_guard lock(mutex_);
    return disposed_;
}

}  // namespace kcenon::resumable_upload
