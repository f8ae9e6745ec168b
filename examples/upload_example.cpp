/**
 * @file upload_example.cpp
 * @brief Upload a local file to a signed resumable-upload URL
 *
 * This example demonstrates:
 * - Configuring chunk size and retry policy through the builder
 * - Using progress and error callbacks to monitor the upload
 * - Waiting for completion or a terminal failure
 */

#include <kcenon/resumable_upload/resumable_upload.h>
#include <kcenon/resumable_upload/core/upload_log.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kcenon::resumable_upload;

namespace {

/**
 * @brief Create a test file with pattern content for demonstration
 * @param path File path to create
 * @param size File size in bytes
 */
void create_test_file(const std::filesystem::path& path, size_t size) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create file: " + path.string());
    }

    std::vector<char> buffer(std::min(size, size_t{65536}));
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<char>('A' + (i % 26));
    }

    size_t remaining = size;
    while (remaining > 0) {
        size_t to_write = std::min(remaining, buffer.size());
        file.write(buffer.data(), static_cast<std::streamsize>(to_write));
        remaining -= to_write;
    }

    std::cout << "Created test file: " << path << " (" << format_bytes(size) << ")" << std::endl;
}

/**
 * @brief Outcome shared between the callbacks and main()
 */
struct upload_outcome {
    std::mutex mutex;
    std::condition_variable cv;
    bool finished = false;
    bool succeeded = false;
    std::string failure;
};

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - Resumable Upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <upload_url>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --chunk-size <size>  Chunk size, e.g. 16M (default: 16M)" << std::endl;
    std::cout << "  -r, --retries <n>        Attempts per chunk (default: 3)" << std::endl;
    std::cout << "  --create-test <size>     Create test file of specified size (e.g., 10M, 1G)" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " video.mp4 'https://storage.example.com/upload?sig=...'" << std::endl;
    std::cout << "  " << program << " --create-test 100M test.bin 'https://...'" << std::endl;
}

auto parse_size(const std::string& size_str) -> size_t {
    size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        char suffix = static_cast<char>(std::toupper(size_str[pos]));
        switch (suffix) {
            case 'K': return static_cast<size_t>(value * 1024);
            case 'M': return static_cast<size_t>(value * 1024 * 1024);
            case 'G': return static_cast<size_t>(value * 1024 * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<size_t>(value);
}

int main(int argc, char* argv[]) {
    uint64_t chunk_size = chunk_layout::default_chunk_size;
    uint32_t retries = 3;
    std::string local_path;
    std::string upload_url;
    std::optional<size_t> create_test_size;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "-c" || arg == "--chunk-size") {
                if (++i >= argc) {
                    std::cerr << "Error: --chunk-size requires an argument" << std::endl;
                    return 1;
                }
                chunk_size = parse_size(argv[i]);
            } else if (arg == "-r" || arg == "--retries") {
                if (++i >= argc) {
                    std::cerr << "Error: --retries requires an argument" << std::endl;
                    return 1;
                }
                retries = static_cast<uint32_t>(std::stoul(argv[i]));
            } else if (arg == "--create-test") {
                if (++i >= argc) {
                    std::cerr << "Error: --create-test requires a size argument" << std::endl;
                    return 1;
                }
                create_test_size = parse_size(argv[i]);
            } else if (arg[0] != '-') {
                if (local_path.empty()) {
                    local_path = arg;
                } else if (upload_url.empty()) {
                    upload_url = arg;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: invalid value for " << arg << ": " << e.what() << std::endl;
            return 1;
        }
    }

    if (local_path.empty() || upload_url.empty()) {
        std::cerr << "Error: Both local_file and upload_url are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (create_test_size) {
        try {
            create_test_file(local_path, *create_test_size);
        } catch (const std::exception& e) {
            std::cerr << "Error creating test file: " << e.what() << std::endl;
            return 1;
        }
    }

    if (!http_upload_transport::is_available()) {
        std::cerr << "Warning: built without an HTTP backend, every chunk will fail" << std::endl;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "       Resumable Upload Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Local file: " << local_path << std::endl;
    std::cout << "  Chunk size: " << format_bytes(chunk_size) << std::endl;
    std::cout << "  Attempts per chunk: " << retries << std::endl;
    std::cout << std::endl;

    upload_outcome outcome;

    auto built = resumable_uploader::builder()
        .with_chunk_size(chunk_size)
        .with_max_retries(retries)
        .with_on_progress([&outcome](const progress_snapshot& progress) {
            std::cout << "\r[" << std::setw(5) << std::fixed << std::setprecision(1)
                      << progress.upload_percentage << "%] chunk "
                      << progress.current_chunk_index << "/" << progress.total_chunks
                      << " " << progress.status << "          " << std::flush;
            if (progress.is_completed) {
                std::cout << std::endl;
                std::lock_guard lock(outcome.mutex);
                outcome.finished = true;
                outcome.succeeded = true;
                outcome.cv.notify_all();
            }
        })
        .with_on_error([&outcome](const upload_error& err) {
            std::cout << std::endl << "[" << to_string(err.kind) << "] " << err.message << std::endl;
            if (err.kind == upload_error_kind::terminal) {
                std::lock_guard lock(outcome.mutex);
                outcome.finished = true;
                outcome.failure = err.message;
                outcome.cv.notify_all();
            }
        })
        .build();

    if (!built) {
        std::cerr << "Failed to create uploader: " << built.error().message << std::endl;
        return 1;
    }
    auto& uploader = built.value();

    auto start_time = std::chrono::steady_clock::now();
    auto started = uploader.start(std::filesystem::path(local_path), upload_url);
    if (!started) {
        std::cerr << "Failed to start upload: " << started.error().message << std::endl;
        return 1;
    }

    {
        std::unique_lock lock(outcome.mutex);
        outcome.cv.wait(lock, [&outcome] { return outcome.finished; });
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    if (outcome.succeeded) {
        std::cout << "Upload completed in " << format_duration(elapsed) << std::endl;
    } else {
        std::cout << "Upload failed: " << outcome.failure << std::endl;
    }
    std::cout << "========================================" << std::endl;

    uploader.dispose();
    return outcome.succeeded ? 0 : 1;
}
