/**
 * @file http_upload_transport.h
 * @brief HTTP PUT chunk transport backed by network_system
 *
 * Each chunk is sent as
 *
 *   PUT <signed url>
 *   Content-Type: application/octet-stream
 *   Content-Range: bytes <start>-<end - 1>/<file length>
 *
 * with the chunk bytes as body. Requests run on a blocking_executor so the
 * upload event loop never waits on the network.
 */

#ifndef KCENON_RESUMABLE_UPLOAD_TRANSPORT_HTTP_UPLOAD_TRANSPORT_H
#define KCENON_RESUMABLE_UPLOAD_TRANSPORT_HTTP_UPLOAD_TRANSPORT_H

#include <kcenon/resumable_upload/scheduling/blocking_executor.h>
#include <kcenon/resumable_upload/transport/upload_transport.h>

#include <chrono>
#include <memory>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::resumable_upload {

/**
 * @brief Timeouts of the HTTP transport
 *
 * network_system's http_client applies a single request timeout; it is set
 * to connect_timeout + send_timeout + receive_timeout.
 */
struct transport_config {
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds send_timeout{60000};
    std::chrono::milliseconds receive_timeout{30000};

    [[nodiscard]] auto request_timeout() const -> std::chrono::milliseconds {
        return connect_timeout + send_timeout + receive_timeout;
    }
};

/**
 * @brief upload_transport issuing HTTP PUT requests
 *
 * Cancellation is reported as soon as the token is cancelled; the request
 * itself runs to completion in the background and its response is dropped.
 * The destructor does not wait for background requests.
 */
class http_upload_transport : public upload_transport {
public:
    explicit http_upload_transport(transport_config config = {},
                                   std::shared_ptr<blocking_executor> executor = nullptr);
    ~http_upload_transport() override;

    http_upload_transport(const http_upload_transport&) = delete;
    auto operator=(const http_upload_transport&) -> http_upload_transport& = delete;

    void send(chunk_request request,
              cancellation_token token,
              sub_progress_callback on_progress,
              completion_callback on_complete) override;

    /**
     * @brief Whether an HTTP backend was compiled in
     */
    [[nodiscard]] static auto is_available() -> bool;

    [[nodiscard]] auto config() const -> const transport_config&;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_TRANSPORT_HTTP_UPLOAD_TRANSPORT_H
