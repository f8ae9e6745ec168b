/**
 * @file interface_connectivity_source.cpp
 * @brief Interface polling connectivity source
 */

#include "kcenon/resumable_upload/network/connectivity_source.h"
#include "kcenon/resumable_upload/core/logging.h"

#include <algorithm>
#include <cerrno>
#include <mutex>

#if defined(__APPLE__) || defined(__linux__)
#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace kcenon::resumable_upload {

namespace {

#if defined(__APPLE__) || defined(__linux__)

/**
 * @brief Non-blocking TCP connect bounded by @p timeout
 */
auto try_connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
    -> bool {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        RU_LOG_WARN(log_category::network, "Probe endpoint is not an IPv4 address: " + host);
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return false;
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    bool connected = false;
    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) {
        connected = true;
    } else if (errno == EINPROGRESS) {
        pollfd pfd{fd, POLLOUT, 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) == 1) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0) {
                connected = (so_error == 0);
            }
        }
    }

    ::close(fd);
    return connected;
}

#endif

}  // namespace

struct interface_connectivity_source::impl {
    std::weak_ptr<task_scheduler> scheduler;
    interface_source_config config;

    std::mutex mutex;
    change_callback on_change;
    std::vector<network_interface> last_known_interfaces;
    timer_handle poll_timer;
    bool watching{false};

    impl(std::shared_ptr<task_scheduler> s, interface_source_config cfg)
        : scheduler(std::move(s)), config(std::move(cfg)) {}

    static void schedule_poll(const std::shared_ptr<impl>& self) {
        auto sched = self->scheduler.lock();
        if (!sched) {
            return;
        }
        std::weak_ptr<impl> weak = self;
        self->poll_timer = sched->post_delayed([weak] {
            if (auto strong = weak.lock()) {
                poll_once(strong);
            }
        }, self->config.poll_interval);
    }

    static void poll_once(const std::shared_ptr<impl>& self) {
        auto interfaces = get_available_interfaces();

        change_callback callback;
        {
            std::lock_guard lock(self->mutex);
            if (!self->watching) {
                return;
            }
            if (interfaces != self->last_known_interfaces) {
                RU_LOG_DEBUG(log_category::network,
                    "Interface set changed (" + std::to_string(self->last_known_interfaces.size()) +
                    " -> " + std::to_string(interfaces.size()) + ")");
                self->last_known_interfaces = std::move(interfaces);
                callback = self->on_change;
            }
            schedule_poll(self);
        }

        if (callback) {
            callback();
        }
    }
};

interface_connectivity_source::interface_connectivity_source(
    std::shared_ptr<task_scheduler> scheduler, interface_source_config config)
    : impl_(std::make_shared<impl>(std::move(scheduler), std::move(config))) {}

interface_connectivity_source::~interface_connectivity_source() {
    unwatch();
}

auto interface_connectivity_source::probe() -> bool {
    auto interfaces = get_available_interfaces();
    bool any_up = std::any_of(interfaces.begin(), interfaces.end(),
        [](const network_interface& iface) { return iface.is_up && !iface.address.empty(); });
    if (!any_up) {
        return false;
    }

#if defined(__APPLE__) || defined(__linux__)
    if (impl_->config.probe_endpoints.empty()) {
        return true;
    }
    for (const auto& [host, port] : impl_->config.probe_endpoints) {
        if (try_connect(host, port, impl_->config.probe_timeout)) {
            return true;
        }
    }
    return false;
#else
    return true;
#endif
}

void interface_connectivity_source::watch(change_callback on_change) {
    std::lock_guard lock(impl_->mutex);
    impl_->on_change = std::move(on_change);
    impl_->poll_timer.cancel();
    impl_->last_known_interfaces = get_available_interfaces();
    impl_->watching = true;
    impl::schedule_poll(impl_);
}

void interface_connectivity_source::unwatch() {
    std::lock_guard lock(impl_->mutex);
    impl_->watching = false;
    impl_->on_change = nullptr;
    impl_->poll_timer.cancel();
}

auto interface_connectivity_source::get_available_interfaces()
    -> std::vector<network_interface> {
    std::vector<network_interface> interfaces;

#if defined(__APPLE__) || defined(__linux__)
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        return interfaces;
    }

    for (struct ifaddrs* addr = addrs; addr != nullptr; addr = addr->ifa_next) {
        if (addr->ifa_addr == nullptr) {
            continue;
        }

        // Only IPv4 for now
        if (addr->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        if ((addr->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        network_interface iface;
        iface.name = addr->ifa_name;
        iface.is_up = (addr->ifa_flags & IFF_UP) != 0 && (addr->ifa_flags & IFF_RUNNING) != 0;

        auto* sin = reinterpret_cast<struct sockaddr_in*>(addr->ifa_addr);
        char ip_str[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &sin->sin_addr, ip_str, sizeof(ip_str)) != nullptr) {
            iface.address = ip_str;
        }

        interfaces.push_back(iface);
    }

    freeifaddrs(addrs);

    std::sort(interfaces.begin(), interfaces.end(),
        [](const network_interface& a, const network_interface& b) {
            return a.name < b.name || (a.name == b.name && a.address < b.address);
        });
#endif

    return interfaces;
}

}  // namespace kcenon::resumable_upload
