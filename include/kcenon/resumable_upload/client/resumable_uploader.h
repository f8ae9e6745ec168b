/**
 * @file resumable_uploader.h
 * @brief Resumable chunked upload orchestrator
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CLIENT_RESUMABLE_UPLOADER_H
#define KCENON_RESUMABLE_UPLOAD_CLIENT_RESUMABLE_UPLOADER_H

#include <kcenon/resumable_upload/client/upload_session.h>
#include <kcenon/resumable_upload/client/uploader_types.h>
#include <kcenon/resumable_upload/core/chunk_source.h>
#include <kcenon/resumable_upload/core/progress_sink.h>
#include <kcenon/resumable_upload/core/types.h>
#include <kcenon/resumable_upload/network/connectivity_source.h>
#include <kcenon/resumable_upload/scheduling/task_scheduler.h>
#include <kcenon/resumable_upload/transport/upload_transport.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace kcenon::resumable_upload {

/**
 * @brief Uploads one payload in sequential byte-range chunks
 *
 * Drives the chunk loop on a task_scheduler: at most one chunk is in flight,
 * each success schedules the next chunk, and each failure schedules a retry of
 * the same chunk with linear backoff until its retry budget runs out.
 * Connectivity changes from the network monitor suspend and resume the loop.
 *
 * Progress and errors are reported through the callbacks given to the
 * builder. Public operations are safe to call from any thread, including
 * from inside those callbacks.
 *
 * Callbacks run while the uploader's internal (recursive) mutex is held.
 * Calling back into the uploader on the callback's own thread is fine, but a
 * callback must not block waiting for another thread that calls the
 * uploader; that thread would wait on the same mutex. Hand such work off
 * without waiting for it.
 *
 * @code
 * auto uploader = resumable_uploader::builder()
 *     .with_chunk_size(16 * 1024 * 1024)
 *     .with_max_retries(3)
 *     .with_on_progress([](const progress_snapshot& p) { ... })
 *     .build();
 *
 * if (uploader) {
 *     auto started = uploader->start("/data/video.mp4", signed_url);
 * }
 * @endcode
 */
class resumable_uploader {
public:
    class builder;

    resumable_uploader(resumable_uploader&&) noexcept;
    auto operator=(resumable_uploader&&) noexcept -> resumable_uploader&;
    ~resumable_uploader();

    resumable_uploader(const resumable_uploader&) = delete;
    auto operator=(const resumable_uploader&) -> resumable_uploader& = delete;

    /**
     * @brief Start uploading the file at @p file to @p upload_url
     *
     * Failures are also delivered to the error callback.
     * @return service_disposed, upload_in_progress or a validation error
     */
    [[nodiscard]] auto start(const std::filesystem::path& file,
                             const std::string& upload_url) -> result<void>;

    /**
     * @brief Start uploading an already opened source
     */
    [[nodiscard]] auto start(std::shared_ptr<chunk_source> source,
                             const std::string& upload_url) -> result<void>;

    /**
     * @brief Pause the upload, cancelling the chunk in flight
     * @return invalid_state_transition when not initialized, offline,
     *         already paused, aborted or completed
     */
    auto pause() -> result<void>;

    /**
     * @brief Resume a paused upload from the first unconfirmed chunk
     */
    auto resume() -> result<void>;

    /**
     * @brief Abort the upload and clear its state; idempotent
     */
    void abort();

    /**
     * @brief Stop monitoring, cancel any transfer and refuse further work
     */
    void dispose();

    /**
     * @brief Clear session, retry and progress state for a new upload
     * @return service_disposed after dispose()
     */
    auto reset() -> result<void>;

    /**
     * @brief Feed a debounced connectivity change
     *
     * Called by the internal network monitor. The first signal of a session
     * only initializes the offline latch.
     */
    void handle_network_change(bool connected);

    [[nodiscard]] auto state_snapshot() const -> upload_state_snapshot;
    [[nodiscard]] auto progress() const -> progress_snapshot;
    [[nodiscard]] auto phase() const -> upload_phase;

    /**
     * @brief Failed attempts recorded so far for a 1-based chunk index
     */
    [[nodiscard]] auto retry_attempts(uint32_t chunk_index) const -> uint32_t;

    /**
     * @brief Initialized and neither completed nor aborted
     */
    [[nodiscard]] auto is_uploading() const -> bool;

    /**
     * @brief A chunk transfer currently holds the single-flight lock
     */
    [[nodiscard]] auto is_transfer_in_flight() const -> bool;

    [[nodiscard]] auto is_paused() const -> bool;
    [[nodiscard]] auto is_network_stable() const -> bool;
    [[nodiscard]] auto is_disposed() const -> bool;

    [[nodiscard]] auto config() const -> const upload_config&;

private:
    struct impl;
    explicit resumable_uploader(std::shared_ptr<impl> state);

    std::shared_ptr<impl> impl_;
};

/**
 * @brief Builder for resumable_uploader
 *
 * Collaborators left unset get production defaults: an event_loop_scheduler,
 * an http_upload_transport and an interface_connectivity_source.
 */
class resumable_uploader::builder {
public:
    builder();

    auto with_chunk_size(uint64_t size) -> builder&;
    auto with_chunk_size_bounds(chunk_size_bounds bounds) -> builder&;
    auto with_max_file_size(uint64_t max_bytes) -> builder&;
    auto with_max_retries(uint32_t max_retries) -> builder&;
    auto with_retry_delay(std::chrono::milliseconds delay) -> builder&;
    auto with_resume_settle_delay(std::chrono::milliseconds delay) -> builder&;
    auto with_restore_settle_delay(std::chrono::milliseconds delay) -> builder&;
    auto with_network_monitor_config(network_monitor_config config) -> builder&;
    auto with_transport_config(transport_config config) -> builder&;

    auto with_on_progress(progress_callback callback) -> builder&;
    auto with_on_error(error_callback callback) -> builder&;
    auto with_on_pause(pause_callback callback) -> builder&;
    auto with_on_abort(abort_callback callback) -> builder&;

    auto with_scheduler(std::shared_ptr<task_scheduler> scheduler) -> builder&;
    auto with_transport(std::shared_ptr<upload_transport> transport) -> builder&;
    auto with_connectivity_source(std::shared_ptr<connectivity_source> source) -> builder&;

    /**
     * @brief Validate the configuration and create the uploader
     * @return invalid_chunk_size or invalid_configuration on bad settings
     */
    [[nodiscard]] auto build() -> result<resumable_uploader>;

private:
    upload_config config_;
    progress_callback on_progress_;
    error_callback on_error_;
    pause_callback on_pause_;
    abort_callback on_abort_;
    std::shared_ptr<task_scheduler> scheduler_;
    std::shared_ptr<upload_transport> transport_;
    std::shared_ptr<connectivity_source> connectivity_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CLIENT_RESUMABLE_UPLOADER_H
