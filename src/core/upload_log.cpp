/**
 * @file upload_log.cpp
 * @brief Implementation of upload-specific log helpers
 */

#include "kcenon/resumable_upload/core/upload_log.h"
#include "kcenon/resumable_upload/core/logging.h"

#include <iomanip>
#include <sstream>

namespace kcenon::resumable_upload {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t kib = 1024;
    constexpr uint64_t mib = kib * 1024;
    constexpr uint64_t gib = mib * 1024;

    if (bytes < kib) {
        return std::to_string(bytes) + " B";
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (bytes < mib) {
        oss << static_cast<double>(bytes) / kib << " KB";
    } else if (bytes < gib) {
        oss << static_cast<double>(bytes) / mib << " MB";
    } else {
        oss << static_cast<double>(bytes) / gib << " GB";
    }
    return oss.str();
}

auto format_duration(std::chrono::milliseconds duration) -> std::string {
    auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    auto hours = total_seconds / 3600;
    auto minutes = (total_seconds / 60) % 60;
    auto seconds = total_seconds % 60;

    if (total_seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    if (hours == 0) {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
           std::to_string(seconds) + "s";
}

void log_upload_config(const upload_summary& summary) {
    upload_log_context ctx;
    ctx.upload_url = summary.upload_url;
    ctx.file_path = summary.source_name;
    ctx.file_size = summary.file_size;
    ctx.total_chunks = summary.total_chunks;

    RU_LOG_INFO_CTX(log_category::uploader,
        "Upload configuration: size=" + format_bytes(summary.file_size) +
        ", chunk=" + format_bytes(summary.chunk_size) +
        ", chunks=" + std::to_string(summary.total_chunks) +
        ", max_retries=" + std::to_string(summary.max_retries) +
        ", retry_delay=" + std::to_string(summary.retry_delay.count()) + "ms",
        ctx);
}

void log_chunk_upload(uint32_t chunk_index, uint32_t total_chunks,
                      uint64_t start_byte, uint64_t end_byte, double progress) {
    if (!get_logger().is_enabled(log_level::debug)) {
        return;
    }

    upload_log_context ctx;
    ctx.chunk_index = chunk_index;
    ctx.total_chunks = total_chunks;
    ctx.bytes_sent = start_byte;
    ctx.progress_percent = progress;

    RU_LOG_DEBUG_CTX(log_category::chunk,
        "Chunk upload " + std::to_string(chunk_index) + "/" + std::to_string(total_chunks) +
        " range " + std::to_string(start_byte) + "-" + std::to_string(end_byte) +
        " (" + format_bytes(end_byte - start_byte) + ")",
        ctx);
}

void log_retry_attempt(uint32_t chunk_index, uint32_t attempt, uint32_t max_retries,
                       const std::string& reason, std::chrono::milliseconds delay) {
    upload_log_context ctx;
    ctx.chunk_index = chunk_index;
    ctx.attempt = attempt;
    ctx.remaining_attempts = max_retries > attempt ? max_retries - attempt : 0;
    ctx.error_message = reason;

    RU_LOG_WARN_CTX(log_category::retry,
        "Retry attempt: chunk " + std::to_string(chunk_index) + ", attempt " +
        std::to_string(attempt) + "/" + std::to_string(max_retries) +
        ", delay " + std::to_string(delay.count()) + "ms",
        ctx);
}

void log_retry_statistics(const std::map<uint32_t, uint32_t>& attempts,
                          uint32_t total_chunks, uint32_t max_retries) {
    if (!get_logger().is_enabled(log_level::debug)) {
        return;
    }

    if (attempts.empty()) {
        RU_LOG_DEBUG(log_category::retry,
            "Retry statistics: no chunks retried (" + std::to_string(total_chunks) +
            " chunks)");
        return;
    }

    std::ostringstream oss;
    oss << "Retry statistics: " << attempts.size() << " of " << total_chunks
        << " chunks retried;";
    for (const auto& [chunk_index, count] : attempts) {
        oss << " chunk " << chunk_index << " " << count << "/" << max_retries
            << (count >= max_retries ? " (FAILED)" : " (RETRYING)") << ";";
    }
    RU_LOG_DEBUG(log_category::retry, oss.str());
}

void log_upload_completion(uint32_t total_chunks, uint64_t total_bytes,
                           std::chrono::milliseconds elapsed) {
    upload_log_context ctx;
    ctx.total_chunks = total_chunks;
    ctx.bytes_sent = total_bytes;
    ctx.duration_ms = static_cast<uint64_t>(elapsed.count());
    ctx.progress_percent = 100.0;

    RU_LOG_INFO_CTX(log_category::uploader,
        "Upload completed: " + std::to_string(total_chunks) + " chunks, " +
        format_bytes(total_bytes) + " in " + format_duration(elapsed),
        ctx);
}

void log_upload_failure(const std::string& reason, uint32_t chunk_index,
                        uint32_t total_chunks) {
    upload_log_context ctx;
    ctx.chunk_index = chunk_index;
    ctx.total_chunks = total_chunks;
    ctx.error_message = reason;

    RU_LOG_ERROR_CTX(log_category::uploader,
        "Upload failed at chunk " + std::to_string(chunk_index) + "/" +
        std::to_string(total_chunks),
        ctx);
}

void log_network_status(bool online) {
    RU_LOG_INFO(log_category::network,
        std::string("Network status: ") + (online ? "ONLINE" : "OFFLINE"));
}

}  // namespace kcenon::resumable_upload
