/**
 * @file uploader_types.h
 * @brief Configuration and diagnostic types for resumable_uploader
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CLIENT_UPLOADER_TYPES_H
#define KCENON_RESUMABLE_UPLOAD_CLIENT_UPLOADER_TYPES_H

#include <kcenon/resumable_upload/core/chunk_layout.h>
#include <kcenon/resumable_upload/core/upload_validator.h>
#include <kcenon/resumable_upload/network/network_monitor.h>
#include <kcenon/resumable_upload/transport/http_upload_transport.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace kcenon::resumable_upload {

/**
 * @brief Uploader configuration
 */
struct upload_config {
    uint64_t chunk_size = chunk_layout::default_chunk_size;
    chunk_size_bounds bounds;
    std::optional<uint64_t> max_file_size;

    /// Failed attempts allowed per chunk before the upload stalls
    uint32_t max_retries = 3;

    /// Base delay of the linear retry backoff
    std::chrono::milliseconds retry_delay{2000};

    /// Delay between resume() and re-entering the chunk loop
    std::chrono::milliseconds resume_settle_delay{100};

    /// Delay between a confirmed network restore and re-entering the chunk loop
    std::chrono::milliseconds restore_settle_delay{500};

    network_monitor_config monitor;
    transport_config transport;
};

using pause_callback = std::function<void()>;
using abort_callback = std::function<void()>;

/**
 * @brief Read-only view of the uploader state for diagnostics
 */
struct upload_state_snapshot {
    bool offline = false;
    bool paused = false;
    bool aborted = false;
    bool completed = false;
    bool initialized = false;
    bool uploading = false;
    uint32_t current_chunk = 0;
    uint32_t total_chunks = 0;
    bool network_connected = true;

    [[nodiscard]] auto to_map() const -> std::map<std::string, std::string> {
        auto flag = [](bool value) { return std::string(value ? "true" : "false"); };
        return {
            {"offline", flag(offline)},
            {"paused", flag(paused)},
            {"aborted", flag(aborted)},
            {"completed", flag(completed)},
            {"initialized", flag(initialized)},
            {"uploading", flag(uploading)},
            {"current_chunk", std::to_string(current_chunk)},
            {"total_chunks", std::to_string(total_chunks)},
            {"network_connected", flag(network_connected)},
        };
    }
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CLIENT_UPLOADER_TYPES_H
