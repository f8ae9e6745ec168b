/**
 * @file connectivity_source.h
 * @brief Raw connectivity signal and reachability probe
 */

#ifndef KCENON_RESUMABLE_UPLOAD_NETWORK_CONNECTIVITY_SOURCE_H
#define KCENON_RESUMABLE_UPLOAD_NETWORK_CONNECTIVITY_SOURCE_H

#include <kcenon/resumable_upload/scheduling/task_scheduler.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Network interface snapshot
 */
struct network_interface {
    std::string name;
    std::string address;
    bool is_up = false;

    [[nodiscard]] auto operator==(const network_interface& other) const -> bool = default;
};

/**
 * @brief Source of raw connectivity change notifications
 *
 * Raw notifications fire on every interface transition and say nothing
 * about end-to-end reachability; probe() answers that question.
 */
class connectivity_source {
public:
    using change_callback = std::function<void()>;

    virtual ~connectivity_source() = default;

    /**
     * @brief Check end-to-end reachability now
     *
     * May block for the configured probe timeout.
     */
    [[nodiscard]] virtual auto probe() -> bool = 0;

    /**
     * @brief Start delivering raw change notifications
     *
     * Replaces any previous callback.
     */
    virtual void watch(change_callback on_change) = 0;

    /**
     * @brief Stop delivering notifications; safe to call multiple times
     */
    virtual void unwatch() = 0;
};

/**
 * @brief Configuration for interface_connectivity_source
 */
struct interface_source_config {
    /// How often the interface list is polled for changes
    std::chrono::milliseconds poll_interval{1000};

    /// Endpoints tried by probe(); an empty list only checks interfaces
    std::vector<std::pair<std::string, uint16_t>> probe_endpoints{
        {"1.1.1.1", 53}, {"8.8.8.8", 53}};

    /// Timeout per probe connect attempt
    std::chrono::milliseconds probe_timeout{2000};
};

/**
 * @brief Connectivity source polling the host's network interfaces
 *
 * A raw change is any difference in the set of non-loopback IPv4
 * interfaces, their addresses or their up flag. probe() requires an up
 * interface and, when endpoints are configured, a successful TCP connect to
 * one of them.
 */
class interface_connectivity_source : public connectivity_source {
public:
    interface_connectivity_source(std::shared_ptr<task_scheduler> scheduler,
                                  interface_source_config config = {});
    ~interface_connectivity_source() override;

    interface_connectivity_source(const interface_connectivity_source&) = delete;
    interface_connectivity_source& operator=(const interface_connectivity_source&) = delete;

    [[nodiscard]] auto probe() -> bool override;
    void watch(change_callback on_change) override;
    void unwatch() override;

    /**
     * @brief Enumerate non-loopback IPv4 interfaces
     */
    [[nodiscard]] static auto get_available_interfaces() -> std::vector<network_interface>;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_NETWORK_CONNECTIVITY_SOURCE_H
