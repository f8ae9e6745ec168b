/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_RESUMABLE_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_RESUMABLE_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/resumable_upload/transport/upload_transport.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::resumable_upload::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     * @param name File name
     * @param size File size
     * @param seed Random seed
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Clean up all temporary files
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Transport that accepts every chunk immediately
 *
 * Intermediate chunks get 308 and the final chunk gets 200, so benchmarks
 * measure orchestration cost without any I/O.
 */
class instant_transport : public upload_transport {
public:
    void send(chunk_request request,
              cancellation_token token,
              sub_progress_callback on_progress,
              completion_callback on_complete) override;

    [[nodiscard]] auto requests() const -> uint64_t { return requests_; }

private:
    uint64_t requests_ = 0;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_file = 1 * MB;
constexpr std::size_t medium_file = 16 * MB;
constexpr std::size_t large_file = 64 * MB;

// Chunk sizes for testing
constexpr std::size_t small_chunk = 64 * KB;
constexpr std::size_t default_chunk = 256 * KB;
constexpr std::size_t large_chunk = 1 * MB;
}  // namespace sizes

}  // namespace kcenon::resumable_upload::benchmark

#endif  // KCENON_RESUMABLE_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
