/**
 * @file upload_validator.cpp
 * @brief Implementation of upload input validation
 */

#include <kcenon/resumable_upload/core/upload_validator.h>
#include <kcenon/resumable_upload/core/chunk_layout.h>
#include <kcenon/resumable_upload/core/chunk_source.h>

namespace kcenon::resumable_upload {

auto upload_validator::validate_service_ready(bool disposed,
                                              bool has_active_upload,
                                              bool aborted) -> result<void> {
    if (disposed) {
        return unexpected(error{error_code::service_disposed,
            "Upload service has been disposed"});
    }

    if (has_active_upload && !aborted) {
        return unexpected(error{error_code::upload_in_progress,
            "Upload already in progress. Call reset() first or abort the current upload."});
    }

    return {};
}

auto upload_validator::validate_chunk_size(uint64_t chunk_size,
                                           const chunk_size_bounds& bounds) -> result<void> {
    if (bounds.min == 0 || bounds.min > bounds.max) {
        return unexpected(error{error_code::invalid_configuration,
            "Invalid chunk size bounds [" + std::to_string(bounds.min) + ", " +
            std::to_string(bounds.max) + "]"});
    }

    if (!bounds.contains(chunk_size)) {
        return unexpected(error{error_code::invalid_chunk_size,
            "Chunk size must be between " + std::to_string(bounds.min) + " and " +
            std::to_string(bounds.max) + " bytes"});
    }

    return {};
}

auto upload_validator::validate_upload_params(const upload_params& params) -> result<void> {
    if (params.source == nullptr) {
        return unexpected(error{error_code::file_not_found, "No upload source provided"});
    }

    if (params.source->length() == 0) {
        return unexpected(error{error_code::file_empty, "File is empty"});
    }

    if (params.upload_url.empty()) {
        return unexpected(error{error_code::invalid_url, "Signed URL must not be empty"});
    }

    auto chunk_check = validate_chunk_size(params.chunk_size, params.bounds);
    if (!chunk_check) {
        return chunk_check;
    }

    const auto chunks = chunk_layout::chunk_count(params.source->length(), params.chunk_size);
    if (chunks > chunk_layout::max_total_chunks) {
        return unexpected(error{error_code::invalid_chunk_size,
            "Chunk size " + std::to_string(params.chunk_size) + " splits " +
            std::to_string(params.source->length()) + " bytes into " +
            std::to_string(chunks) + " chunks, more than the maximum of " +
            std::to_string(chunk_layout::max_total_chunks)});
    }

    if (params.max_file_size && *params.max_file_size < params.source->length()) {
        return unexpected(error{error_code::file_too_large,
            "File size " + std::to_string(params.source->length()) +
            " exceeds maximum allowed " + std::to_string(*params.max_file_size)});
    }

    return {};
}

}  // namespace kcenon::resumable_upload
