/**
 * @file network_monitor.h
 * @brief Debounced, stability-windowed connectivity monitor
 */

#ifndef KCENON_RESUMABLE_UPLOAD_NETWORK_NETWORK_MONITOR_H
#define KCENON_RESUMABLE_UPLOAD_NETWORK_NETWORK_MONITOR_H

#include <kcenon/resumable_upload/network/connectivity_source.h>
#include <kcenon/resumable_upload/scheduling/task_scheduler.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace kcenon::resumable_upload {

/**
 * @brief Filter stage of the network monitor
 *
 * idle -> (start) -> confirming -> settled
 * settled -> (raw change) -> debouncing -> confirming -> settled
 * any raw change restarts at debouncing; stop returns to idle.
 */
enum class monitor_state {
    idle,         ///< Not monitoring
    debouncing,   ///< Raw change seen, waiting for the debounce delay
    confirming,   ///< Waiting for the stability window before re-probing
    settled,      ///< Last probe reported, waiting for raw changes
};

[[nodiscard]] constexpr auto to_string(monitor_state state) -> const char* {
    switch (state) {
        case monitor_state::idle: return "idle";
        case monitor_state::debouncing: return "debouncing";
        case monitor_state::confirming: return "confirming";
        case monitor_state::settled: return "settled";
        default: return "unknown";
    }
}

/**
 * @brief Timing of the two-stage filter
 */
struct network_monitor_config {
    std::chrono::milliseconds debounce_delay{500};
    std::chrono::milliseconds stability_window{2000};
};

/**
 * @brief Turns a noisy raw connectivity signal into a debounced boolean stream
 *
 * Every raw change cancels pending timers and starts the debounce delay;
 * the stability window follows; then connectivity is re-probed and reported
 * only if it differs from the last report. start_monitoring() reports its
 * initial probe unconditionally.
 *
 * All timers run on the injected scheduler and the callback is invoked from
 * there, outside the monitor's lock.
 */
class network_monitor {
public:
    using status_callback = std::function<void(bool connected)>;

    network_monitor(std::shared_ptr<task_scheduler> scheduler,
                    std::shared_ptr<connectivity_source> source,
                    network_monitor_config config = {});
    ~network_monitor();

    network_monitor(const network_monitor&) = delete;
    network_monitor& operator=(const network_monitor&) = delete;

    /**
     * @brief Probe once, report the result, then listen for raw changes
     *
     * Restarts monitoring if already active.
     */
    void start_monitoring(status_callback on_change);

    /**
     * @brief Cancel all timers and listeners; safe to call multiple times
     */
    void stop_monitoring();

    /**
     * @brief Feed one raw connectivity change into the filter
     */
    void notify_raw_change();

    [[nodiscard]] auto state() const -> monitor_state;

    /**
     * @brief Last value delivered to the callback, if any
     */
    [[nodiscard]] auto last_reported() const -> std::optional<bool>;

    [[nodiscard]] auto is_monitoring() const -> bool;

    [[nodiscard]] auto config() const -> const network_monitor_config&;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_NETWORK_NETWORK_MONITOR_H
