/**
 * @file resumable_uploader.cpp
 * @brief Implementation of the resumable chunked upload orchestrator
 */

#include <kcenon/resumable_upload/client/resumable_uploader.h>
#include <kcenon/resumable_upload/core/logging.h>
#include <kcenon/resumable_upload/core/retry_tracker.h>
#include <kcenon/resumable_upload/core/upload_log.h>
#include <kcenon/resumable_upload/core/upload_validator.h>
#include <kcenon/resumable_upload/network/network_monitor.h>
#include <kcenon/resumable_upload/scheduling/event_loop_scheduler.h>
#include <kcenon/resumable_upload/transport/http_upload_transport.h>

#include <algorithm>
#include <functional>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>

namespace kcenon::resumable_upload {

namespace {

[[nodiscard]] auto format_percent(double percent) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << percent << "%";
    return oss.str();
}

[[nodiscard]] auto http_error_reason(int status_code) -> std::string {
    return "HTTP Error: " + std::to_string(status_code);
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct resumable_uploader::impl : std::enable_shared_from_this<resumable_uploader::impl> {
    upload_config config;
    std::shared_ptr<task_scheduler> scheduler;
    std::shared_ptr<upload_transport> transport;
    std::shared_ptr<connectivity_source> connectivity;
    std::unique_ptr<network_monitor> monitor;
    pause_callback on_pause;
    abort_callback on_abort;

    // Guards every member below; recursive so callbacks may re-enter
    mutable std::recursive_mutex mutex;
    upload_session session;
    retry_tracker retries;
    progress_sink sink;
    cancellation_token token;
    std::shared_ptr<chunk_source> source;
    std::string upload_url;
    task_scheduler::clock::time_point started_at;
    bool disposed{false};
    bool network_connected{true};

    timer_handle loop_timer;
    timer_handle retry_timer;
    timer_handle resume_timer;
    timer_handle restore_timer;

    impl(upload_config cfg,
         std::shared_ptr<task_scheduler> sched,
         std::shared_ptr<upload_transport> trans,
         std::shared_ptr<connectivity_source> conn)
        : config(std::move(cfg)),
          scheduler(std::move(sched)),
          transport(std::move(trans)),
          connectivity(std::move(conn)) {
        monitor = std::make_unique<network_monitor>(scheduler, connectivity, config.monitor);
    }

    // ------------------------------------------------------------------------
    // Helpers (mutex held)
    // ------------------------------------------------------------------------

    void move_to(upload_phase next) {
        auto moved = session.transition_to(next);
        if (!moved) {
            RU_LOG_WARN(log_category::uploader, moved.error().message);
        }
    }

    void suspend_phase() {
        switch (session.phase()) {
            case upload_phase::initializing:
            case upload_phase::ready:
            case upload_phase::transferring:
            case upload_phase::awaiting_retry:
                move_to(upload_phase::suspended);
                break;
            default:
                break;
        }
    }

    void cancel_timers() {
        loop_timer.cancel();
        retry_timer.cancel();
        resume_timer.cancel();
        restore_timer.cancel();
    }

    // Completions issued under the old token are discarded by generation
    void cancel_transfer() {
        auto previous = token;
        token = cancellation_token::next(previous);
        previous.cancel();
    }

    void halt_transfer() {
        cancel_transfer();
        session.release_transfer_lock();
        cancel_timers();
    }

    void report_error(upload_error_kind kind,
                      const error& err,
                      std::optional<uint32_t> chunk_index = std::nullopt,
                      std::optional<uint32_t> remaining = std::nullopt) {
        upload_log_context ctx;
        ctx.chunk_index = chunk_index;
        ctx.remaining_attempts = remaining;
        if (kind == upload_error_kind::transient) {
            RU_LOG_WARN_CTX(log_category::uploader, err.message, ctx);
        } else {
            RU_LOG_ERROR_CTX(log_category::uploader, err.message, ctx);
        }

        upload_error event;
        event.kind = kind;
        event.code = err.code;
        event.message = err.message;
        event.chunk_index = chunk_index;
        event.remaining_attempts = remaining;
        sink.emit_error(event);
    }

    void notify(const std::function<void()>& callback, const char* name) {
        if (!callback) {
            return;
        }
        try {
            callback();
        } catch (const std::exception& e) {
            RU_LOG_ERROR(log_category::uploader,
                std::string(name) + " callback threw: " + e.what());
        }
    }

    template <typename Method>
    auto guarded(Method method) -> std::function<void()> {
        std::weak_ptr<impl> weak = shared_from_this();
        return [weak, method] {
            if (auto self = weak.lock()) {
                ((*self).*method)();
            }
        };
    }

    void post_loop() {
        loop_timer = scheduler->post(guarded(&impl::run_chunk_loop));
    }

    // ------------------------------------------------------------------------
    // Start
    // ------------------------------------------------------------------------

    auto check_service_ready() -> result<void> {
        const bool active = session.is_initialized() && !session.is_completed();
        auto ready = upload_validator::validate_service_ready(
            disposed, active, session.is_aborted());
        if (!ready) {
            report_error(upload_error_kind::service_state, ready.error());
        }
        return ready;
    }

    auto start(std::shared_ptr<chunk_source> new_source,
               const std::string& url) -> result<void> {
        std::lock_guard lock(mutex);

        if (auto ready = check_service_ready(); !ready) {
            return ready;
        }

        upload_params params;
        params.source = new_source.get();
        params.upload_url = url;
        params.chunk_size = config.chunk_size;
        params.bounds = config.bounds;
        params.max_file_size = config.max_file_size;

        auto valid = upload_validator::validate_upload_params(params);
        if (!valid) {
            report_error(upload_error_kind::validation, valid.error());
            return valid;
        }

        cancel_timers();
        cancel_transfer();
        retries.reset_all();
        sink.reset();

        auto began = session.begin(new_source->length(), config.chunk_size);
        if (!began) {
            report_error(upload_error_kind::service_state, began.error());
            return began;
        }

        source = std::move(new_source);
        upload_url = url;
        started_at = scheduler->now();

        sink.emit_progress(upload_status::splitting_chunks);

        upload_summary summary;
        summary.source_name = source->name();
        summary.upload_url = upload_url;
        summary.file_size = session.file_length();
        summary.chunk_size = config.chunk_size;
        summary.total_chunks = session.total_chunks();
        summary.max_retries = config.max_retries;
        summary.retry_delay = config.retry_delay;
        log_upload_config(summary);

        progress_update initial;
        initial.status = "Starting upload. Total chunks: " +
                         std::to_string(session.total_chunks());
        initial.current_chunk_index = 1;
        initial.total_chunks = session.total_chunks();
        initial.upload_percentage = 0.0;
        sink.emit_progress(initial);

        move_to(upload_phase::ready);
        sink.emit_progress(upload_status::uploading_chunks);

        start_network_monitor();
        post_loop();
        return {};
    }

    void start_network_monitor() {
        std::weak_ptr<impl> weak = shared_from_this();
        monitor->stop_monitoring();
        monitor->start_monitoring([weak](bool connected) {
            if (auto self = weak.lock()) {
                self->handle_network_change(connected);
            }
        });
    }

    // ------------------------------------------------------------------------
    // Chunk loop
    // ------------------------------------------------------------------------

    void run_chunk_loop() {
        std::lock_guard lock(mutex);

        if (disposed || !session.is_initialized() || session.all_chunks_sent()) {
            return;
        }

        if (session.is_blocked()) {
            RU_LOG_DEBUG(log_category::uploader,
                std::string("Upload blocked - offline: ") +
                (session.is_offline() ? "true" : "false") +
                ", paused: " + (session.is_paused() ? "true" : "false") +
                ", aborted: " + (session.is_aborted() ? "true" : "false") +
                ", completed: " + (session.is_completed() ? "true" : "false"));
            return;
        }

        if (!session.try_acquire_transfer_lock()) {
            RU_LOG_DEBUG(log_category::uploader,
                "Upload already in progress, skipping duplicate call");
            return;
        }

        const auto chunk_index = session.current_chunk_index();

        if (retries.has_exceeded(chunk_index, config.max_retries)) {
            session.release_transfer_lock();
            move_to(upload_phase::stalled);
            report_error(upload_error_kind::terminal,
                error{error_code::retry_exhausted,
                      "Upload failed after " + std::to_string(config.max_retries) +
                      " attempts. Chunk " + std::to_string(chunk_index) +
                      " could not be uploaded."},
                chunk_index, 0u);
            return;
        }

        move_to(upload_phase::transferring);

        auto range = session.next_chunk_range();
        if (!range) {
            session.release_transfer_lock();
            handle_failure(chunk_index, range.error());
            return;
        }

        auto bytes = source->read(range.value().start, range.value().end);
        if (!bytes) {
            session.release_transfer_lock();
            handle_failure(chunk_index,
                error{error_code::file_read_error,
                      "File read error: " + bytes.error().message});
            return;
        }

        log_chunk_upload(chunk_index, session.total_chunks(),
            range.value().start, range.value().end,
            static_cast<double>(session.successive_chunk_count()) /
                static_cast<double>(session.total_chunks()) * 100.0);

        chunk_request request;
        request.url = upload_url;
        request.chunk_index = chunk_index;
        request.range = range.value();
        request.file_length = session.file_length();
        request.content_range = session.layout().content_range(range.value());
        request.body = std::move(bytes.value());

        const auto generation = token.generation();
        const auto chunk_range = range.value();
        std::weak_ptr<impl> weak = shared_from_this();
        auto sched = scheduler;

        transport->send(std::move(request), token,
            [weak, sched, generation, chunk_range](uint64_t bytes_sent) {
                sched->post([weak, generation, chunk_range, bytes_sent] {
                    if (auto self = weak.lock()) {
                        self->on_sub_progress(generation, chunk_range, bytes_sent);
                    }
                });
            },
            [weak, sched, generation, chunk_index, chunk_range](
                result<transport_response> outcome) {
                sched->post([weak, generation, chunk_index, chunk_range,
                             outcome = std::move(outcome)]() mutable {
                    if (auto self = weak.lock()) {
                        self->on_transfer_complete(generation, chunk_index, chunk_range,
                                                   std::move(outcome));
                    }
                });
            });
    }

    void on_sub_progress(uint64_t generation, byte_range range, uint64_t bytes_sent) {
        std::lock_guard lock(mutex);
        if (disposed || generation != token.generation() ||
            !session.is_transfer_in_flight() || session.file_length() == 0) {
            return;
        }

        double percent = static_cast<double>(range.start + bytes_sent) /
                         static_cast<double>(session.file_length()) * 100.0;
        percent = std::clamp(percent, 0.0, 100.0);

        progress_update update;
        update.status = "Uploading: " + format_percent(percent);
        update.upload_percentage = percent;
        sink.emit_progress(update);
    }

    void on_transfer_complete(uint64_t generation,
                              uint32_t chunk_index,
                              byte_range range,
                              result<transport_response> outcome) {
        std::lock_guard lock(mutex);
        if (disposed) {
            return;
        }

        if (generation != token.generation()) {
            log_stale_completion(chunk_index, outcome);
            return;
        }

        if (!outcome) {
            session.release_transfer_lock();
            if (outcome.error().code == error_code::transfer_cancelled) {
                if (session.is_paused() || session.is_offline() || session.is_aborted()) {
                    return;
                }
            }
            RU_LOG_WARN(log_category::transport,
                "Transfer error for chunk " + std::to_string(chunk_index) + ": " +
                outcome.error().message);
            handle_failure(chunk_index, outcome.error());
            return;
        }

        const auto& response = outcome.value();
        upload_log_context ctx;
        ctx.chunk_index = chunk_index;
        ctx.total_chunks = session.total_chunks();
        ctx.status_code = response.status_code;
        RU_LOG_DEBUG_CTX(log_category::transport, "Chunk response received", ctx);

        if (session.is_final_chunk(chunk_index)) {
            if (response.is_success()) {
                complete_upload(range);
                return;
            }
        } else if (response.is_resume_incomplete() || response.is_success()) {
            accept_chunk(chunk_index, range);
            return;
        }

        session.release_transfer_lock();
        RU_LOG_WARN(log_category::transport,
            http_error_reason(response.status_code) + " for chunk " +
            std::to_string(chunk_index));
        handle_failure(chunk_index,
            error{error_code::http_status_error, http_error_reason(response.status_code)});
    }

    void log_stale_completion(uint32_t chunk_index, const result<transport_response>& outcome) {
        if (outcome || outcome.error().code != error_code::transfer_cancelled) {
            RU_LOG_DEBUG(log_category::transport,
                "Discarding stale completion for chunk " + std::to_string(chunk_index));
            return;
        }

        if (session.is_aborted()) {
            RU_LOG_DEBUG(log_category::transport,
                "Chunk " + std::to_string(chunk_index) + " cancelled by abort");
        } else if (session.is_paused()) {
            RU_LOG_INFO(log_category::transport,
                "Chunk " + std::to_string(chunk_index) + " cancelled by pause");
        } else if (session.is_offline()) {
            RU_LOG_TRACE(log_category::transport,
                "Chunk " + std::to_string(chunk_index) + " cancelled by connection loss");
        } else {
            RU_LOG_DEBUG(log_category::transport,
                "Chunk " + std::to_string(chunk_index) + " cancelled");
        }
    }

    void accept_chunk(uint32_t chunk_index, byte_range range) {
        auto advanced = session.advance(range);
        session.release_transfer_lock();
        if (!advanced) {
            handle_failure(chunk_index, advanced.error());
            return;
        }

        retries.reset(chunk_index);
        move_to(upload_phase::ready);
        RU_LOG_DEBUG(log_category::chunk,
            "Chunk " + std::to_string(chunk_index) + " uploaded successfully");

        progress_update update;
        update.status = "Chunk " + std::to_string(chunk_index) + " completed. Starting chunk " +
                        std::to_string(chunk_index + 1) + "/" +
                        std::to_string(session.total_chunks());
        update.current_chunk_index = chunk_index + 1;
        update.total_chunks = session.total_chunks();
        sink.emit_progress(update);

        post_loop();
    }

    void complete_upload(byte_range range) {
        session.release_transfer_lock();
        auto advanced = session.advance(range);
        if (!advanced) {
            RU_LOG_WARN(log_category::uploader, advanced.error().message);
        }
        move_to(upload_phase::completed);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            scheduler->now() - started_at);
        log_upload_completion(session.total_chunks(), session.file_length(), elapsed);
        log_retry_statistics(retries.snapshot(), session.total_chunks(), config.max_retries);

        progress_update update;
        update.status = to_string(upload_status::completed);
        update.current_chunk_index = session.total_chunks();
        update.total_chunks = session.total_chunks();
        update.upload_percentage = 100.0;
        update.is_completed = true;
        sink.emit_progress(update);

        retries.reset_all();
        monitor->stop_monitoring();
    }

    void handle_failure(uint32_t chunk_index, const error& cause) {
        if (session.is_paused() || session.is_offline() || session.is_aborted()) {
            RU_LOG_DEBUG(log_category::retry,
                "Not retrying chunk " + std::to_string(chunk_index) + " while suspended");
            return;
        }

        const auto attempt = retries.record_attempt(chunk_index);
        const auto remaining = retries.remaining_attempts(chunk_index, config.max_retries);
        log_retry_statistics(retries.snapshot(), session.total_chunks(), config.max_retries);

        if (remaining > 0) {
            move_to(upload_phase::awaiting_retry);
            const auto delay = retries.backoff_delay(chunk_index, config.retry_delay);

            progress_update update;
            update.status = "Retrying chunk " + std::to_string(chunk_index) + ". Attempt " +
                            std::to_string(attempt) + "/" +
                            std::to_string(config.max_retries);
            sink.emit_progress(update);

            report_error(upload_error_kind::transient,
                error{cause.code, cause.message + ". Retrying... (" +
                                  std::to_string(remaining) + " attempts remaining)"},
                chunk_index, remaining);

            log_retry_attempt(chunk_index, attempt, config.max_retries, cause.message, delay);
            retry_timer = scheduler->post_delayed(
                guarded(&impl::run_guarded_continuation), delay);
            return;
        }

        move_to(upload_phase::stalled);
        log_upload_failure(cause.message, chunk_index, session.total_chunks());
        report_error(upload_error_kind::terminal,
            error{error_code::retry_exhausted,
                  "Upload failed after " + std::to_string(config.max_retries) +
                  " attempts for chunk " + std::to_string(chunk_index) + ". " + cause.message},
            chunk_index, 0u);
    }

    // Re-checks every latch at fire time
    void run_guarded_continuation() {
        std::lock_guard lock(mutex);
        if (disposed || session.is_blocked() || session.is_transfer_in_flight()) {
            return;
        }
        run_chunk_loop();
    }

    // ------------------------------------------------------------------------
    // Network
    // ------------------------------------------------------------------------

    void handle_network_change(bool connected) {
        std::lock_guard lock(mutex);
        if (disposed) {
            return;
        }

        network_connected = connected;
        log_network_status(connected);

        if (!session.is_initialized() || session.is_completed()) {
            return;
        }

        // The first report only sets the latch; no "connection lost" status
        if (session.take_first_network_signal()) {
            session.set_offline(!connected);
            if (!connected) {
                halt_transfer();
                suspend_phase();
            }
            return;
        }

        if (connected) {
            on_network_restored();
        } else {
            on_network_lost();
        }
    }

    void on_network_lost() {
        if (session.is_offline()) {
            return;
        }

        RU_LOG_INFO(log_category::network, "Network lost");
        sink.emit_progress(upload_status::connection_lost);
        session.set_offline(true);
        halt_transfer();
        suspend_phase();
    }

    void on_network_restored() {
        if (!session.is_offline()) {
            RU_LOG_TRACE(log_category::network, "Network already online");
            return;
        }
        session.set_offline(false);

        if (session.is_paused() || session.is_aborted() || session.is_completed() ||
            session.is_stalled() || session.all_chunks_sent()) {
            return;
        }

        if (session.is_transfer_in_flight()) {
            RU_LOG_DEBUG(log_category::network,
                "Upload already in progress, skipping network restoration");
            return;
        }

        move_to(upload_phase::ready);
        sink.emit_progress(progress_update{"Network restored. Resuming upload..."});
        restore_timer = scheduler->post_delayed(
            guarded(&impl::run_guarded_continuation), config.restore_settle_delay);
    }

    // ------------------------------------------------------------------------
    // Commands
    // ------------------------------------------------------------------------

    auto pause() -> result<void> {
        std::lock_guard lock(mutex);
        if (disposed) {
            return unexpected(error{error_code::service_disposed,
                "Upload service has been disposed"});
        }
        if (!session.is_initialized() || session.is_offline() || session.is_paused() ||
            session.is_aborted() || session.is_completed()) {
            RU_LOG_DEBUG(log_category::uploader,
                std::string("Ignoring pause in phase ") + to_string(session.phase()));
            return unexpected(error{error_code::invalid_state_transition,
                std::string("Cannot pause while ") + to_string(session.phase()) +
                (session.is_offline() ? " (offline)" : "") +
                (session.is_paused() ? " (paused)" : "")});
        }

        session.set_paused(true);
        RU_LOG_INFO(log_category::uploader, "Manual pause triggered");

        halt_transfer();
        if (session.is_stalled()) {
            move_to(upload_phase::suspended);
        } else {
            suspend_phase();
        }

        sink.emit_progress(upload_status::paused);
        notify(on_pause, "pause");
        return {};
    }

    auto resume() -> result<void> {
        std::lock_guard lock(mutex);
        if (disposed) {
            return unexpected(error{error_code::service_disposed,
                "Upload service has been disposed"});
        }
        if (!session.is_paused() || session.is_offline() || session.is_aborted() ||
            session.is_completed() || !session.is_initialized() ||
            session.all_chunks_sent()) {
            RU_LOG_DEBUG(log_category::uploader,
                std::string("Ignoring resume in phase ") + to_string(session.phase()));
            return unexpected(error{error_code::invalid_state_transition,
                std::string("Cannot resume while ") + to_string(session.phase()) +
                (session.is_offline() ? " (offline)" : "") +
                (session.is_paused() ? "" : " (not paused)")});
        }
        if (session.is_transfer_in_flight()) {
            RU_LOG_DEBUG(log_category::uploader,
                "Upload already in progress, skipping manual resume");
            return unexpected(error{error_code::upload_in_progress,
                "A chunk transfer is still in flight"});
        }

        session.set_paused(false);
        move_to(upload_phase::ready);
        RU_LOG_INFO(log_category::uploader, "Manual resume triggered");
        sink.emit_progress(progress_update{"Resuming upload..."});

        resume_timer = scheduler->post_delayed(
            guarded(&impl::run_guarded_continuation), config.resume_settle_delay);
        return {};
    }

    void abort() {
        std::lock_guard lock(mutex);
        if (disposed) {
            return;
        }

        cancel_transfer();
        cancel_timers();
        if (session.is_aborted()) {
            return;
        }

        RU_LOG_INFO(log_category::uploader, "Upload aborted by user");
        sink.emit_progress(upload_status::aborted);

        session.release_transfer_lock();
        monitor->stop_monitoring();
        session.mark_aborted();
        retries.reset_all();
        sink.reset();
        source.reset();

        notify(on_abort, "abort");
    }

    void dispose() {
        std::lock_guard lock(mutex);
        if (disposed) {
            return;
        }

        monitor->stop_monitoring();
        cancel_transfer();
        session.release_transfer_lock();
        cancel_timers();
        sink.dispose();
        disposed = true;
        RU_LOG_INFO(log_category::uploader, "Upload service disposed");
    }

    auto reset() -> result<void> {
        std::lock_guard lock(mutex);
        if (disposed) {
            return unexpected(error{error_code::service_disposed,
                "Cannot reset a disposed upload service"});
        }

        cancel_transfer();
        cancel_timers();
        monitor->stop_monitoring();
        session.clear();
        retries.reset_all();
        sink.reset();
        source.reset();
        upload_url.clear();

        RU_LOG_INFO(log_category::uploader, "Upload service reset successfully");
        return {};
    }

    auto snapshot() const -> upload_state_snapshot {
        std::lock_guard lock(mutex);
        upload_state_snapshot snap;
        snap.offline = session.is_offline();
        snap.paused = session.is_paused();
        snap.aborted = session.is_aborted();
        snap.completed = session.is_completed();
        snap.initialized = session.is_initialized();
        snap.uploading = session.is_transfer_in_flight();
        snap.current_chunk = session.successive_chunk_count();
        snap.total_chunks = session.total_chunks();
        snap.network_connected = network_connected;
        return snap;
    }
};

// ============================================================================
// Builder
// ============================================================================

resumable_uploader::builder::builder() = default;

auto resumable_uploader::builder::with_chunk_size(uint64_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto resumable_uploader::builder::with_chunk_size_bounds(chunk_size_bounds bounds) -> builder& {
    config_.bounds = bounds;
    return *this;
}

auto resumable_uploader::builder::with_max_file_size(uint64_t max_bytes) -> builder& {
    config_.max_file_size = max_bytes;
    return *this;
}

auto resumable_uploader::builder::with_max_retries(uint32_t max_retries) -> builder& {
    config_.max_retries = max_retries;
    return *this;
}

auto resumable_uploader::builder::with_retry_delay(std::chrono::milliseconds delay) -> builder& {
    config_.retry_delay = delay;
    return *this;
}

auto resumable_uploader::builder::with_resume_settle_delay(std::chrono::milliseconds delay)
    -> builder& {
    config_.resume_settle_delay = delay;
    return *this;
}

auto resumable_uploader::builder::with_restore_settle_delay(std::chrono::milliseconds delay)
    -> builder& {
    config_.restore_settle_delay = delay;
    return *this;
}

auto resumable_uploader::builder::with_network_monitor_config(network_monitor_config config)
    -> builder& {
    config_.monitor = config;
    return *this;
}

auto resumable_uploader::builder::with_transport_config(transport_config config) -> builder& {
    config_.transport = config;
    return *this;
}

auto resumable_uploader::builder::with_on_progress(progress_callback callback) -> builder& {
    on_progress_ = std::move(callback);
    return *this;
}

auto resumable_uploader::builder::with_on_error(error_callback callback) -> builder& {
    on_error_ = std::move(callback);
    return *this;
}

auto resumable_uploader::builder::with_on_pause(pause_callback callback) -> builder& {
    on_pause_ = std::move(callback);
    return *this;
}

auto resumable_uploader::builder::with_on_abort(abort_callback callback) -> builder& {
    on_abort_ = std::move(callback);
    return *this;
}

auto resumable_uploader::builder::with_scheduler(std::shared_ptr<task_scheduler> scheduler)
    -> builder& {
    scheduler_ = std::move(scheduler);
    return *this;
}

auto resumable_uploader::builder::with_transport(std::shared_ptr<upload_transport> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto resumable_uploader::builder::with_connectivity_source(
    std::shared_ptr<connectivity_source> source) -> builder& {
    connectivity_ = std::move(source);
    return *this;
}

auto resumable_uploader::builder::build() -> result<resumable_uploader> {
    auto chunk_check = upload_validator::validate_chunk_size(config_.chunk_size, config_.bounds);
    if (!chunk_check) {
        return unexpected{chunk_check.error()};
    }

    if (config_.max_retries == 0) {
        return unexpected{error{error_code::invalid_configuration,
                               "Max retries must be at least 1"}};
    }

    if (config_.max_file_size && *config_.max_file_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
                               "Max file size must be greater than zero"}};
    }

    get_logger().initialize();

    std::shared_ptr<task_scheduler> scheduler = scheduler_;
    if (!scheduler) {
        scheduler = event_loop_scheduler::create();
    }

    std::shared_ptr<upload_transport> transport = transport_;
    if (!transport) {
        transport = std::make_shared<http_upload_transport>(config_.transport);
    }

    std::shared_ptr<connectivity_source> connectivity = connectivity_;
    if (!connectivity) {
        connectivity = std::make_shared<interface_connectivity_source>(scheduler);
    }

    if (!transport_ && !http_upload_transport::is_available()) {
        RU_LOG_WARN(log_category::uploader,
            "Built without network_system; default transport cannot send chunks");
    }

    auto state = std::make_shared<impl>(config_, std::move(scheduler), std::move(transport),
                                        std::move(connectivity));
    state->on_pause = on_pause_;
    state->on_abort = on_abort_;
    state->sink.set_callbacks(on_progress_, on_error_);

    return resumable_uploader{std::move(state)};
}

// ============================================================================
// resumable_uploader
// ============================================================================

resumable_uploader::resumable_uploader(std::shared_ptr<impl> state)
    : impl_(std::move(state)) {}

resumable_uploader::resumable_uploader(resumable_uploader&&) noexcept = default;
auto resumable_uploader::operator=(resumable_uploader&&) noexcept
    -> resumable_uploader& = default;

resumable_uploader::~resumable_uploader() {
    if (impl_) {
        impl_->dispose();
    }
}

auto resumable_uploader::start(const std::filesystem::path& file,
                               const std::string& upload_url) -> result<void> {
    std::lock_guard lock(impl_->mutex);
    if (auto ready = impl_->check_service_ready(); !ready) {
        return ready;
    }

    auto opened = file_chunk_source::open(file);
    if (!opened) {
        impl_->report_error(upload_error_kind::validation, opened.error());
        return unexpected{opened.error()};
    }

    return impl_->start(std::shared_ptr<chunk_source>(std::move(opened.value())), upload_url);
}

auto resumable_uploader::start(std::shared_ptr<chunk_source> source,
                               const std::string& upload_url) -> result<void> {
    return impl_->start(std::move(source), upload_url);
}

auto resumable_uploader::pause() -> result<void> {
    return impl_->pause();
}

auto resumable_uploader::resume() -> result<void> {
    return impl_->resume();
}

void resumable_uploader::abort() {
    impl_->abort();
}

void resumable_uploader::dispose() {
    impl_->dispose();
}

auto resumable_uploader::reset() -> result<void> {
    return impl_->reset();
}

void resumable_uploader::handle_network_change(bool connected) {
    impl_->handle_network_change(connected);
}

auto resumable_uploader::state_snapshot() const -> upload_state_snapshot {
    return impl_->snapshot();
}

auto resumable_uploader::progress() const -> progress_snapshot {
    return impl_->sink.snapshot();
}

auto resumable_uploader::phase() const -> upload_phase {
    std::lock_guard lock(impl_->mutex);
    return impl_->session.phase();
}

auto resumable_uploader::retry_attempts(uint32_t chunk_index) const -> uint32_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->retries.attempt_count(chunk_index);
}

auto resumable_uploader::is_uploading() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->session.is_initialized() && !impl_->session.is_completed();
}

auto resumable_uploader::is_transfer_in_flight() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->session.is_transfer_in_flight();
}

auto resumable_uploader::is_paused() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->session.is_paused();
}

auto resumable_uploader::is_network_stable() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return !impl_->session.is_offline() && impl_->network_connected;
}

auto resumable_uploader::is_disposed() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->disposed;
}

auto resumable_uploader::config() const -> const upload_config& {
    return impl_->config;
}

}  // namespace kcenon::resumable_upload
