/**
 * @file pause_resume_example.cpp
 * @brief Pause, resume and connectivity loss against a simulated storage server
 *
 * This example demonstrates:
 * - Pausing an upload mid-chunk and resuming it later
 * - Feeding connectivity changes to the uploader
 * - Plugging a custom upload_transport into the builder
 */

#include <kcenon/resumable_upload/resumable_upload.h>

#include <chrono>
#include <condition_variable>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace kcenon::resumable_upload;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Transport that answers each chunk after a fixed latency
 *
 * Every request runs on its own thread and polls its cancellation token, the
 * way a real HTTP client aborts an in-flight PUT.
 */
class simulated_transport : public upload_transport {
public:
    explicit simulated_transport(std::chrono::milliseconds latency) : latency_(latency) {}

    ~simulated_transport() override {
        std::vector<std::thread> workers;
        {
            std::lock_guard lock(mutex_);
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    void send(chunk_request request,
              cancellation_token token,
              sub_progress_callback on_progress,
              completion_callback on_complete) override {
        std::lock_guard lock(mutex_);
        workers_.emplace_back([latency = latency_, request = std::move(request), token,
                               on_progress = std::move(on_progress),
                               on_complete = std::move(on_complete)] {
            const auto deadline = std::chrono::steady_clock::now() + latency;
            while (std::chrono::steady_clock::now() < deadline) {
                if (token.is_cancelled()) {
                    on_complete(unexpected{error{error_code::transfer_cancelled,
                                                 "Request cancelled"}});
                    return;
                }
                std::this_thread::sleep_for(10ms);
            }

            if (on_progress) {
                on_progress(request.body.size());
            }
            transport_response response;
            response.status_code = request.range.end == request.file_length ? 201 : 308;
            on_complete(response);
        });
    }

private:
    std::chrono::milliseconds latency_;
    std::mutex mutex_;
    std::vector<std::thread> workers_;
};

struct upload_monitor {
    std::mutex mutex;
    std::condition_variable cv;
    uint32_t chunk = 0;
    bool finished = false;

    void wait_for_chunk(uint32_t target) {
        std::unique_lock lock(mutex);
        cv.wait(lock, [this, target] { return chunk >= target || finished; });
    }

    void wait_finished() {
        std::unique_lock lock(mutex);
        cv.wait(lock, [this] { return finished; });
    }
};

}  // namespace

int main() {
    constexpr uint64_t chunk_size = 256 * 1024;
    constexpr std::size_t file_size = 20 * chunk_size;

    get_logger().set_level(log_level::warn);

    upload_monitor monitor;
    auto transport = std::make_shared<simulated_transport>(150ms);

    auto built = resumable_uploader::builder()
        .with_chunk_size(chunk_size)
        .with_chunk_size_bounds(chunk_size_bounds{64 * 1024, 64 * 1024 * 1024})
        .with_transport(transport)
        .with_on_progress([&monitor](const progress_snapshot& progress) {
            std::cout << "[" << std::setw(5) << std::fixed << std::setprecision(1)
                      << progress.upload_percentage << "%] " << progress.status << std::endl;
            std::lock_guard lock(monitor.mutex);
            monitor.chunk = progress.current_chunk_index;
            monitor.finished = monitor.finished || progress.is_completed;
            monitor.cv.notify_all();
        })
        .with_on_error([&monitor](const upload_error& err) {
            std::cout << "[" << to_string(err.kind) << "] " << err.message << std::endl;
            if (err.kind == upload_error_kind::terminal) {
                std::lock_guard lock(monitor.mutex);
                monitor.finished = true;
                monitor.cv.notify_all();
            }
        })
        .with_on_pause([] { std::cout << "-- paused by user" << std::endl; })
        .build();

    if (!built) {
        std::cerr << "Failed to create uploader: " << built.error().message << std::endl;
        return 1;
    }
    auto& uploader = built.value();

    chunk_bytes payload(file_size, std::byte{0x5a});
    auto started = uploader.start(std::make_shared<memory_chunk_source>(std::move(payload), "demo.bin"),
                                  "https://storage.example.com/demo.bin?upload_id=demo");
    if (!started) {
        std::cerr << "Failed to start upload: " << started.error().message << std::endl;
        return 1;
    }

    monitor.wait_for_chunk(5);
    if (auto paused = uploader.pause(); !paused) {
        std::cerr << "Pause rejected: " << paused.error().message << std::endl;
    }
    std::this_thread::sleep_for(1s);
    if (auto resumed = uploader.resume(); !resumed) {
        std::cerr << "Resume rejected: " << resumed.error().message << std::endl;
    }

    monitor.wait_for_chunk(12);
    std::cout << "-- simulating connectivity loss" << std::endl;
    uploader.handle_network_change(false);
    std::this_thread::sleep_for(1s);
    uploader.handle_network_change(true);

    monitor.wait_finished();

    auto snapshot = uploader.state_snapshot();
    std::cout << std::endl << "Final state:" << std::endl;
    for (const auto& [key, value] : snapshot.to_map()) {
        std::cout << "  " << key << " = " << value << std::endl;
    }

    uploader.dispose();
    return snapshot.completed ? 0 : 1;
}
