/**
 * @file http_upload_transport.cpp
 * @brief HTTP PUT chunk transport implementation
 */

#include "kcenon/resumable_upload/transport/http_upload_transport.h"
#include "kcenon/resumable_upload/core/logging.h"

#include <atomic>
#include <map>

#include "kcenon/resumable_upload/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::resumable_upload {

// ============================================================================
// Implementation
// ============================================================================

struct http_upload_transport::impl {
    transport_config config;
    std::shared_ptr<blocking_executor> executor;
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif

    impl(transport_config cfg, std::shared_ptr<blocking_executor> exec)
        : config(cfg), executor(std::move(exec)) {
        if (!executor) {
            executor = create_default_executor();
        }
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(config.request_timeout());
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto put(kcenon::network::core::http_client& client, const chunk_request& request)
        -> result<transport_response> {
        std::map<std::string, std::string> headers{
            {"Content-Type", request.content_type},
            {"Content-Range", request.content_range},
        };
        std::string body(reinterpret_cast<const char*>(request.body.data()), request.body.size());

        auto response = client.put(request.url, body, headers);
        if (response.is_err()) {
            return unexpected{error{error_code::connection_failed,
                "HTTP PUT request failed"}};
        }

        const auto& resp = response.value();
        transport_response converted;
        converted.status_code = resp.status_code;
        converted.headers = resp.headers;
        converted.body = std::string(resp.body.begin(), resp.body.end());
        return converted;
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

http_upload_transport::http_upload_transport(transport_config config,
                                             std::shared_ptr<blocking_executor> executor)
    : impl_(std::make_shared<impl>(config, std::move(executor))) {}

http_upload_transport::~http_upload_transport() = default;

auto http_upload_transport::is_available() -> bool {
#if KCENON_WITH_NETWORK_SYSTEM
    return true;
#else
    return false;
#endif
}

auto http_upload_transport::config() const -> const transport_config& {
    return impl_->config;
}

// ============================================================================
// Send
// ============================================================================

void http_upload_transport::send(chunk_request request,
                                 cancellation_token token,
                                 sub_progress_callback on_progress,
                                 completion_callback on_complete) {
#if KCENON_WITH_NETWORK_SYSTEM
    auto delivered = std::make_shared<std::atomic<bool>>(false);
    auto shared_complete = std::make_shared<completion_callback>(std::move(on_complete));
    auto deliver = [delivered, shared_complete](result<transport_response> outcome) {
        if (!delivered->exchange(true) && *shared_complete) {
            (*shared_complete)(std::move(outcome));
        }
    };

    token.on_cancel([deliver] {
        deliver(unexpected{error{error_code::transfer_cancelled, "Chunk transfer cancelled"}});
    });

    if (token.is_cancelled()) {
        return;
    }

    RU_LOG_TRACE(log_category::transport,
        "PUT chunk " + std::to_string(request.chunk_index) + " " + request.content_range);

    // The future is not tracked and a running request holds only the client,
    // so destroying the transport never waits on a cancelled request
    std::weak_ptr<impl> weak = impl_;
    (void)impl_->executor->submit(
        [weak, request = std::move(request), token, on_progress = std::move(on_progress),
         deliver, delivered]() {
            std::shared_ptr<kcenon::network::core::http_client> client;
            if (auto self = weak.lock()) {
                client = self->client;
            }
            if (!client) {
                deliver(unexpected{error{error_code::transfer_cancelled,
                    "Transport destroyed before the request started"}});
                return;
            }
            if (token.is_cancelled()) {
                return;
            }

            auto outcome = impl::put(*client, request);
            if (outcome && on_progress && !delivered->load()) {
                on_progress(request.body.size());
            }
            deliver(std::move(outcome));
        });
#else
    (void)request;
    (void)token;
    (void)on_progress;
    RU_LOG_ERROR(log_category::transport,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)");
    if (on_complete) {
        on_complete(unexpected{error{error_code::transport_unavailable,
            "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}});
    }
#endif
}

}  // namespace kcenon::resumable_upload
