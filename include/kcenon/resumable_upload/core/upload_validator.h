/**
 * @file upload_validator.h
 * @brief Pass/fail gate applied before an upload starts
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_VALIDATOR_H
#define KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_VALIDATOR_H

#include <kcenon/resumable_upload/core/chunk_layout.h>
#include <kcenon/resumable_upload/core/types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::resumable_upload {

class chunk_source;

/**
 * @brief Inclusive bounds for the configured chunk size
 */
struct chunk_size_bounds {
    uint64_t min = chunk_layout::default_min_chunk_size;
    uint64_t max = chunk_layout::default_max_chunk_size;

    [[nodiscard]] auto contains(uint64_t size) const -> bool {
        return size >= min && size <= max;
    }
};

/**
 * @brief Parameters checked by upload_validator::validate_upload_params
 */
struct upload_params {
    const chunk_source* source = nullptr;
    std::string upload_url;
    uint64_t chunk_size = chunk_layout::default_chunk_size;
    chunk_size_bounds bounds;
    std::optional<uint64_t> max_file_size;
};

/**
 * @brief Static validation of uploader state and upload inputs
 */
class upload_validator {
public:
    /**
     * @brief Check the uploader can accept a new upload
     * @return service_disposed, or upload_in_progress when an upload is
     *         active and has not been aborted
     */
    [[nodiscard]] static auto validate_service_ready(bool disposed,
                                                     bool has_active_upload,
                                                     bool aborted) -> result<void>;

    [[nodiscard]] static auto validate_chunk_size(uint64_t chunk_size,
                                                  const chunk_size_bounds& bounds)
        -> result<void>;

    /**
     * @brief Validate source, URL, chunk size and size ceiling, in that order
     */
    [[nodiscard]] static auto validate_upload_params(const upload_params& params)
        -> result<void>;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_VALIDATOR_H
