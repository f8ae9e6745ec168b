/**
 * @file network_monitor.cpp
 * @brief Implementation of the debounced connectivity monitor
 */

#include "kcenon/resumable_upload/network/network_monitor.h"
#include "kcenon/resumable_upload/core/logging.h"

#include <mutex>

namespace kcenon::resumable_upload {

struct network_monitor::impl : std::enable_shared_from_this<network_monitor::impl> {
    std::shared_ptr<task_scheduler> scheduler;
    std::shared_ptr<connectivity_source> source;
    network_monitor_config config;

    mutable std::mutex mutex;
    monitor_state current_state{monitor_state::idle};
    bool monitoring{false};
    uint64_t cycle{0};
    status_callback callback;
    std::optional<bool> last_reported;

    timer_handle initial_probe_timer;
    timer_handle debounce_timer;
    timer_handle stability_timer;

    impl(std::shared_ptr<task_scheduler> s,
         std::shared_ptr<connectivity_source> src,
         network_monitor_config cfg)
        : scheduler(std::move(s)), source(std::move(src)), config(cfg) {}

    void set_state(monitor_state new_state) {
        if (current_state != new_state) {
            RU_LOG_TRACE(log_category::network,
                std::string("Monitor state: ") + to_string(current_state) + " -> " +
                to_string(new_state));
            current_state = new_state;
        }
    }

    void cancel_timers() {
        initial_probe_timer.cancel();
        debounce_timer.cancel();
        stability_timer.cancel();
    }

    void start(status_callback on_change) {
        {
            std::lock_guard lock(mutex);
            cancel_timers();
            monitoring = true;
            callback = std::move(on_change);
            last_reported.reset();
            auto expected_cycle = ++cycle;
            set_state(monitor_state::confirming);

            std::weak_ptr<impl> weak = shared_from_this();
            initial_probe_timer = scheduler->post([weak, expected_cycle] {
                if (auto self = weak.lock()) {
                    self->probe_and_report(expected_cycle, true);
                }
            });
        }

        std::weak_ptr<impl> weak = shared_from_this();
        source->watch([weak] {
            if (auto self = weak.lock()) {
                self->on_raw_change();
            }
        });

        RU_LOG_DEBUG(log_category::network, "Network monitoring started");
    }

    void stop() {
        bool was_monitoring = false;
        {
            std::lock_guard lock(mutex);
            was_monitoring = monitoring;
            monitoring = false;
            ++cycle;
            cancel_timers();
            callback = nullptr;
            set_state(monitor_state::idle);
        }

        if (was_monitoring) {
            source->unwatch();
            RU_LOG_DEBUG(log_category::network, "Network monitoring stopped");
        }
    }

    void on_raw_change() {
        std::lock_guard lock(mutex);
        if (!monitoring) {
            return;
        }

        cancel_timers();
        auto expected_cycle = ++cycle;
        set_state(monitor_state::debouncing);

        std::weak_ptr<impl> weak = shared_from_this();
        debounce_timer = scheduler->post_delayed([weak, expected_cycle] {
            if (auto self = weak.lock()) {
                self->on_debounce_elapsed(expected_cycle);
            }
        }, config.debounce_delay);
    }

    void on_debounce_elapsed(uint64_t expected_cycle) {
        std::lock_guard lock(mutex);
        if (!monitoring || cycle != expected_cycle) {
            return;
        }

        set_state(monitor_state::confirming);

        std::weak_ptr<impl> weak = shared_from_this();
        stability_timer = scheduler->post_delayed([weak, expected_cycle] {
            if (auto self = weak.lock()) {
                self->probe_and_report(expected_cycle, false);
            }
        }, config.stability_window);
    }

    void probe_and_report(uint64_t expected_cycle, bool unconditional) {
        {
            std::lock_guard lock(mutex);
            if (!monitoring || cycle != expected_cycle) {
                return;
            }
        }

        // Probing may block; a raw change meanwhile invalidates the result
        bool connected = source->probe();

        status_callback to_notify;
        {
            std::lock_guard lock(mutex);
            if (!monitoring || cycle != expected_cycle) {
                return;
            }

            set_state(monitor_state::settled);
            if (unconditional || !last_reported || *last_reported != connected) {
                last_reported = connected;
                to_notify = callback;
            } else {
                RU_LOG_TRACE(log_category::network, "Connectivity unchanged after stability window");
            }
        }

        if (to_notify) {
            to_notify(connected);
        }
    }
};

network_monitor::network_monitor(std::shared_ptr<task_scheduler> scheduler,
                                 std::shared_ptr<connectivity_source> source,
                                 network_monitor_config config)
    : impl_(std::make_shared<impl>(std::move(scheduler), std::move(source), config)) {}

network_monitor::~network_monitor() {
    if (impl_) {
        impl_->stop();
    }
}

void network_monitor::start_monitoring(status_callback on_change) {
    impl_->start(std::move(on_change));
}

void network_monitor::stop_monitoring() {
    impl_->stop();
}

void network_monitor::notify_raw_change() {
    impl_->on_raw_change();
}

auto network_monitor::state() const -> monitor_state {
    std::lock_guard lock(impl_->mutex);
    return impl_->current_state;
}

auto network_monitor::last_reported() const -> std::optional<bool> {
    std::lock_guard lock(impl_->mutex);
    return impl_->last_reported;
}

auto network_monitor::is_monitoring() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->monitoring;
}

auto network_monitor::config() const -> const network_monitor_config& {
    return impl_->config;
}

}  // namespace kcenon::resumable_upload
