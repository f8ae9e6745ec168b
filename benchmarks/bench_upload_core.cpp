/**
 * @file bench_upload_core.cpp
 * @brief Benchmarks for chunk reads, log masking and upload orchestration
 */

#include <benchmark/benchmark.h>

#include <kcenon/resumable_upload/resumable_upload.h>
#include <kcenon/resumable_upload/scheduling/manual_scheduler.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::resumable_upload::benchmark {

/**
 * @brief Sequential ranged reads over a file, one chunk at a time
 */
static void BM_FileChunkSource_Read(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("read_test.bin", file_size, 42);

    auto opened = file_chunk_source::open(path);
    if (!opened) {
        state.SkipWithError("Failed to open source");
        return;
    }
    auto& source = *opened.value();
    chunk_layout layout(file_size, chunk_size);

    for (auto _ : state) {
        for (uint32_t i = 1; i <= layout.total_chunks(); ++i) {
            auto range = layout.range_of(i);
            auto bytes = source.read(range.value().start, range.value().end);
            if (!bytes) {
                state.SkipWithError("Failed to read chunk");
                return;
            }
            ::benchmark::DoNotOptimize(bytes.value().data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(layout.total_chunks()) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_FileChunkSource_Read)
    ->Args({sizes::small_file, sizes::small_chunk})
    ->Args({sizes::medium_file, sizes::default_chunk})
    ->Args({sizes::medium_file, sizes::large_chunk})
    ->Unit(::benchmark::kMillisecond);

static void BM_ChunkLayout_ContentRange(::benchmark::State& state) {
    chunk_layout layout(10ULL * sizes::GB, 16 * sizes::MB);
    const auto total = layout.total_chunks();

    for (auto _ : state) {
        for (uint32_t i = 1; i <= total; ++i) {
            auto header = layout.content_range(layout.range_of(i).value());
            ::benchmark::DoNotOptimize(header);
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(total) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkLayout_ContentRange);

/**
 * @brief Masking cost paid by every log line that carries a signed URL
 */
static void BM_Masker_SignedUrl(::benchmark::State& state) {
    sensitive_info_masker masker;
    const std::string message =
        "Uploading chunk 3/12 to https://storage.example.com/bucket/video.mp4"
        "?X-Goog-Algorithm=GOOG4-RSA-SHA256&X-Goog-Credential=svc%40proj"
        "&X-Goog-Expires=900&X-Goog-Signature=0123456789abcdef";

    for (auto _ : state) {
        auto masked = masker.mask(message);
        ::benchmark::DoNotOptimize(masked);
    }
}

BENCHMARK(BM_Masker_SignedUrl);

/**
 * @brief Full upload against a transport that answers instantly
 */
static void BM_Uploader_FullUpload(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    get_logger().set_level(log_level::error);
    auto payload = test_data_generator::generate_random_data(file_size, 7);

    auto scheduler = std::make_shared<manual_scheduler>();
    auto transport = std::make_shared<instant_transport>();
    auto built = resumable_uploader::builder()
        .with_chunk_size(chunk_size)
        .with_chunk_size_bounds(chunk_size_bounds{1, sizes::GB})
        .with_scheduler(scheduler)
        .with_transport(transport)
        .build();
    if (!built) {
        state.SkipWithError(built.error().message.c_str());
        return;
    }
    auto uploader = std::move(built.value());

    for (auto _ : state) {
        state.PauseTiming();
        auto source = std::make_shared<memory_chunk_source>(payload, "bench");
        state.ResumeTiming();

        auto started = uploader.start(source, "https://storage.example.com/bench?sig=x");
        if (!started) {
            state.SkipWithError(started.error().message.c_str());
            return;
        }
        scheduler->run_ready();
        if (!uploader.state_snapshot().completed) {
            state.SkipWithError("Upload did not complete");
            return;
        }
    }

    const auto bytes = static_cast<double>(file_size) * static_cast<double>(state.iterations());
    state.SetBytesProcessed(static_cast<int64_t>(bytes));
    state.counters["chunks"] = static_cast<double>(transport->requests());
    get_logger().set_level(log_level::info);
}

BENCHMARK(BM_Uploader_FullUpload)
    ->Args({sizes::small_file, sizes::small_chunk})
    ->Args({sizes::medium_file, sizes::default_chunk})
    ->Args({sizes::large_file, sizes::large_chunk})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::resumable_upload::benchmark
