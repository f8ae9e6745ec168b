/**
 * @file chunk_source.h
 * @brief Ranged byte sources for chunked uploads
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_CHUNK_SOURCE_H
#define KCENON_RESUMABLE_UPLOAD_CORE_CHUNK_SOURCE_H

#include <kcenon/resumable_upload/core/types.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace kcenon::resumable_upload {

/**
 * @brief Source of the bytes being uploaded
 *
 * read() returns the bytes of [start, end) and fails with
 * error_code::invalid_chunk_range when start >= end or end > length().
 */
class chunk_source {
public:
    virtual ~chunk_source() = default;

    [[nodiscard]] virtual auto length() const -> uint64_t = 0;

    /**
     * @brief Human readable name used in logs (file path, buffer label)
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    [[nodiscard]] virtual auto read(uint64_t start, uint64_t end) -> result<chunk_bytes> = 0;

protected:
    [[nodiscard]] auto check_range(uint64_t start, uint64_t end) const -> result<void>;
};

/**
 * @brief Chunk source backed by a file on disk
 *
 * The file is opened once and kept open for the lifetime of the source.
 * The length is captured at open time.
 */
class file_chunk_source : public chunk_source {
public:
    /**
     * @brief Open a file for ranged reads
     * @return error_code::file_not_found, file_unreadable or file_empty on failure
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::unique_ptr<file_chunk_source>>;

    ~file_chunk_source() override = default;

    file_chunk_source(const file_chunk_source&) = delete;
    auto operator=(const file_chunk_source&) -> file_chunk_source& = delete;

    [[nodiscard]] auto length() const -> uint64_t override { return length_; }
    [[nodiscard]] auto name() const -> std::string override { return path_.string(); }
    [[nodiscard]] auto read(uint64_t start, uint64_t end) -> result<chunk_bytes> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    file_chunk_source(std::filesystem::path path, std::ifstream stream, uint64_t length);

    std::filesystem::path path_;
    std::ifstream stream_;
    uint64_t length_;
    std::mutex mutex_;
};

/**
 * @brief Chunk source over an in-memory buffer
 */
class memory_chunk_source : public chunk_source {
public:
    explicit memory_chunk_source(chunk_bytes data, std::string label = "memory");

    [[nodiscard]] auto length() const -> uint64_t override { return data_.size(); }
    [[nodiscard]] auto name() const -> std::string override { return label_; }
    [[nodiscard]] auto read(uint64_t start, uint64_t end) -> result<chunk_bytes> override;

private:
    chunk_bytes data_;
    std::string label_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_CHUNK_SOURCE_H
