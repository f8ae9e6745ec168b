/**
 * @file resumable_upload.h
 * @brief Main header for the resumable_upload library
 * @version 0.1.0
 *
 * Include this header to access the resumable chunked upload engine.
 *
 * @code
 * #include <kcenon/resumable_upload/resumable_upload.h>
 *
 * using namespace kcenon::resumable_upload;
 *
 * auto uploader = resumable_uploader::builder()
 *     .with_max_retries(3)
 *     .build();
 *
 * if (uploader) {
 *     auto started = uploader->start("/path/to/video.mp4", signed_url);
 * }
 * @endcode
 */

#ifndef KCENON_RESUMABLE_UPLOAD_RESUMABLE_UPLOAD_H
#define KCENON_RESUMABLE_UPLOAD_RESUMABLE_UPLOAD_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/resumable_upload/core/types.h"
#include "kcenon/resumable_upload/core/chunk_layout.h"
#include "kcenon/resumable_upload/core/chunk_source.h"
#include "kcenon/resumable_upload/core/logging.h"
#include "kcenon/resumable_upload/core/progress_sink.h"

// Scheduling
#include "kcenon/resumable_upload/scheduling/task_scheduler.h"
#include "kcenon/resumable_upload/scheduling/event_loop_scheduler.h"

// Network
#include "kcenon/resumable_upload/network/connectivity_source.h"
#include "kcenon/resumable_upload/network/network_monitor.h"

// Transport
#include "kcenon/resumable_upload/transport/upload_transport.h"
#include "kcenon/resumable_upload/transport/http_upload_transport.h"

// Client
#include "kcenon/resumable_upload/client/uploader_types.h"
#include "kcenon/resumable_upload/client/resumable_uploader.h"

namespace kcenon::resumable_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_RESUMABLE_UPLOAD_H
