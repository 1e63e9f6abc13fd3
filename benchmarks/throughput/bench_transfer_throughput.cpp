/**
 * @file bench_transfer_throughput.cpp
 * @brief Benchmarks for upload and download throughput by chunk size
 *
 * Runs against memory_session, so the numbers measure the client's own
 * overhead: dispatch, chunking, local file I/O and progress delivery.
 */

#include <benchmark/benchmark.h>

#include "utils/benchmark_helpers.h"

namespace async_sftp::benchmark {

/**
 * @brief Upload a file of range(0) bytes with chunks of range(1) bytes
 */
static void BM_Upload(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto source = temp_files.create_random_file("upload_source.bin", file_size, 42);

    auto setup = make_memory_client(chunk_size);
    if (!setup.client) {
        state.SkipWithError("Failed to connect memory client");
        return;
    }

    for (auto _ : state) {
        auto outcome = setup.client->upload("/bench/upload.bin", source).get();
        if (!outcome) {
            state.SkipWithError(outcome.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(outcome.value().bytes_transferred);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["chunks"] = static_cast<double>((file_size + chunk_size - 1) / chunk_size);
}

/**
 * @brief Download a file of range(0) bytes with chunks of range(1) bytes
 */
static void BM_Download(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto setup = make_memory_client(chunk_size);
    if (!setup.client) {
        state.SkipWithError("Failed to connect memory client");
        return;
    }
    setup.remote->add_file("/bench/download.bin", generate_random_data(file_size, 42));
    auto target = temp_files.base_dir() / "download_target.bin";

    for (auto _ : state) {
        auto outcome = setup.client->download("/bench/download.bin", target).get();
        if (!outcome) {
            state.SkipWithError(outcome.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(outcome.value().bytes_transferred);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Download with a progress callback attached
 */
static void BM_DownloadWithProgress(::benchmark::State& state) {
    const auto file_size = sizes::medium_file;
    const auto chunk_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto setup = make_memory_client(chunk_size);
    if (!setup.client) {
        state.SkipWithError("Failed to connect memory client");
        return;
    }
    setup.remote->add_file("/bench/progress.bin", generate_random_data(file_size, 7));
    auto target = temp_files.base_dir() / "progress_target.bin";

    uint64_t last_seen = 0;
    for (auto _ : state) {
        auto outcome = setup.client
                           ->download("/bench/progress.bin", target,
                                      [&last_seen](uint64_t done, uint64_t) {
                                          last_seen = done;
                                          return true;
                                      })
                           .get();
        if (!outcome) {
            state.SkipWithError(outcome.error().message.c_str());
            return;
        }
    }

    ::benchmark::DoNotOptimize(last_seen);
    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Upload)
    ->Args({sizes::small_file, 1 * sizes::KB})
    ->Args({sizes::small_file, 32 * sizes::KB})
    ->Args({sizes::medium_file, 32 * sizes::KB})
    ->Args({sizes::medium_file, 256 * sizes::KB})
    ->Args({sizes::medium_file, 4 * sizes::MB})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Download)
    ->Args({sizes::small_file, 1 * sizes::KB})
    ->Args({sizes::small_file, 32 * sizes::KB})
    ->Args({sizes::medium_file, 32 * sizes::KB})
    ->Args({sizes::medium_file, 256 * sizes::KB})
    ->Args({sizes::medium_file, 4 * sizes::MB})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_DownloadWithProgress)
    ->Arg(32 * sizes::KB)
    ->Arg(256 * sizes::KB)
    ->Unit(::benchmark::kMillisecond);

}  // namespace async_sftp::benchmark

BENCHMARK_MAIN();
