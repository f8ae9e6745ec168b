/**
 * @file upload_transport.h
 * @brief Chunk transport seam and cooperative cancellation
 */

#ifndef KCENON_RESUMABLE_UPLOAD_TRANSPORT_UPLOAD_TRANSPORT_H
#define KCENON_RESUMABLE_UPLOAD_TRANSPORT_UPLOAD_TRANSPORT_H

#include <kcenon/resumable_upload/core/types.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace kcenon::resumable_upload {

/**
 * @brief Cooperative cancellation shared between the uploader and a transfer
 *
 * Copies share state. Each token carries the generation it was issued for;
 * the uploader replaces its token whenever it cancels one, so completions
 * of cancelled transfers can be recognised as stale.
 */
class cancellation_token {
public:
    cancellation_token();

    /**
     * @brief Fresh, uncancelled token with generation() == previous + 1
     */
    [[nodiscard]] static auto next(const cancellation_token& previous) -> cancellation_token;

    /**
     * @brief Cancel and run registered callbacks; idempotent
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const -> bool;

    [[nodiscard]] auto generation() const -> uint64_t;

    /**
     * @brief Run @p callback on cancellation, immediately if already cancelled
     */
    void on_cancel(std::function<void()> callback);

private:
    struct state;
    explicit cancellation_token(uint64_t generation);

    std::shared_ptr<state> state_;
};

/**
 * @brief One ranged upload request
 */
struct chunk_request {
    std::string url;
    uint32_t chunk_index = 0;
    byte_range range;
    uint64_t file_length = 0;
    std::string content_range;
    std::string content_type = "application/octet-stream";
    chunk_bytes body;
};

/**
 * @brief Response to a chunk request
 */
struct transport_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /**
     * @brief 308 Resume Incomplete: partial data stored, send the next range
     */
    [[nodiscard]] auto is_resume_incomplete() const -> bool { return status_code == 308; }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Performs one ranged upload request
 *
 * send() must eventually invoke @p on_complete exactly once, from any thread
 * and possibly before send() returns. The result is a response for any HTTP
 * status (classification is up to the caller), or an error:
 * - error_code::transfer_cancelled when @p token was cancelled
 * - error_code::connection_timeout / connection_failed for network failures
 * - error_code::transport_unavailable when no HTTP backend is built in
 */
class upload_transport {
public:
    using sub_progress_callback = std::function<void(uint64_t bytes_sent)>;
    using completion_callback = std::function<void(result<transport_response>)>;

    virtual ~upload_transport() = default;

    virtual void send(chunk_request request,
                      cancellation_token token,
                      sub_progress_callback on_progress,
                      completion_callback on_complete) = 0;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_TRANSPORT_UPLOAD_TRANSPORT_H
