/**
 * @file chunk_layout.h
 * @brief Byte-range arithmetic for splitting an upload into chunks
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_CHUNK_LAYOUT_H
#define KCENON_RESUMABLE_UPLOAD_CORE_CHUNK_LAYOUT_H

#include <kcenon/resumable_upload/core/types.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

namespace kcenon::resumable_upload {

/**
 * @brief Chunk layout of one payload
 *
 * Chunk indices are 1-based. Chunk i covers
 * [(i - 1) * chunk_size, min(i * chunk_size, file_length)), so the ranges of
 * chunks 1..total_chunks() tile [0, file_length) without gap or overlap.
 */
struct chunk_layout {
    /// Default chunk size (16MB)
    static constexpr uint64_t default_chunk_size = 16ULL * 1024 * 1024;

    /// Minimum allowed chunk size (5MB)
    static constexpr uint64_t default_min_chunk_size = 5ULL * 1024 * 1024;

    /// Maximum allowed chunk size (500MB)
    static constexpr uint64_t default_max_chunk_size = 500ULL * 1024 * 1024;

    /// Largest chunk count a session can index (chunk indices are 1-based uint32_t)
    static constexpr uint64_t max_total_chunks = std::numeric_limits<uint32_t>::max() - 1;

    uint64_t file_length = 0;
    uint64_t chunk_size = default_chunk_size;

    chunk_layout() = default;

    chunk_layout(uint64_t length, uint64_t size) : file_length(length), chunk_size(size) {}

    /**
     * @brief Number of chunks, ceil(file_length / chunk_size)
     */
    [[nodiscard]] auto total_chunks() const -> uint32_t {
        return static_cast<uint32_t>(chunk_count(file_length, chunk_size));
    }

    /**
     * @brief Unnarrowed chunk count; compare against max_total_chunks
     */
    [[nodiscard]] static auto chunk_count(uint64_t length, uint64_t size) -> uint64_t {
        if (length == 0 || size == 0) return 0;
        return length / size + (length % size != 0 ? 1 : 0);
    }

    /**
     * @brief End offset (exclusive) of a chunk starting at @p start
     */
    [[nodiscard]] auto chunk_end(uint64_t start) const -> uint64_t {
        if (start >= file_length) return file_length;
        return std::min(start + chunk_size, file_length);
    }

    /**
     * @brief Byte range of the 1-based chunk @p index
     */
    [[nodiscard]] auto range_of(uint32_t index) const -> result<byte_range> {
        if (index == 0 || index > total_chunks()) {
            return unexpected(error{error_code::invalid_chunk_range,
                "chunk index " + std::to_string(index) + " outside 1.." +
                std::to_string(total_chunks())});
        }
        uint64_t start = static_cast<uint64_t>(index - 1) * chunk_size;
        return byte_range{start, chunk_end(start)};
    }

    /**
     * @brief Content-Range header value, "bytes start-(end-1)/length"
     */
    [[nodiscard]] auto content_range(const byte_range& range) const -> std::string {
        return "bytes " + std::to_string(range.start) + "-" +
               std::to_string(range.end - 1) + "/" + std::to_string(file_length);
    }
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_CHUNK_LAYOUT_H
