/**
 * @file upload_log.h
 * @brief Upload-specific log helpers built on the library logger
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_LOG_H
#define KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_LOG_H

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace kcenon::resumable_upload {

/**
 * @brief Format a byte count as "512 B", "1.5 KB", "16.0 MB", "2.0 GB"
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format a duration as "42s", "3m 5s" or "1h 2m 3s"
 */
[[nodiscard]] auto format_duration(std::chrono::milliseconds duration) -> std::string;

/**
 * @brief Summary of an upload logged when the session starts
 */
struct upload_summary {
    std::string source_name;
    std::string upload_url;
    uint64_t file_size = 0;
    uint64_t chunk_size = 0;
    uint32_t total_chunks = 0;
    uint32_t max_retries = 0;
    std::chrono::milliseconds retry_delay{0};
};

void log_upload_config(const upload_summary& summary);

void log_chunk_upload(uint32_t chunk_index, uint32_t total_chunks,
                      uint64_t start_byte, uint64_t end_byte, double progress);

void log_retry_attempt(uint32_t chunk_index, uint32_t attempt, uint32_t max_retries,
                       const std::string& reason, std::chrono::milliseconds delay);

/**
 * @brief Log per-chunk retry counters, marking exhausted chunks as FAILED
 */
void log_retry_statistics(const std::map<uint32_t, uint32_t>& attempts,
                          uint32_t total_chunks, uint32_t max_retries);

void log_upload_completion(uint32_t total_chunks, uint64_t total_bytes,
                           std::chrono::milliseconds elapsed);

void log_upload_failure(const std::string& reason, uint32_t chunk_index,
                        uint32_t total_chunks);

void log_network_status(bool online);

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_LOG_H
