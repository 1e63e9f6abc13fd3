/**
 * @file bench_operation_latency.cpp
 * @brief Benchmarks for request round-trip latency
 *
 * Measures the cost of one request from issue to future fulfilment: admission,
 * the hop to the worker thread and the hop to the delivery thread.
 */

#include <benchmark/benchmark.h>

#include "utils/benchmark_helpers.h"

#include <string>

namespace async_sftp::benchmark {

/**
 * @brief stat round trip
 */
static void BM_StatRoundTrip(::benchmark::State& state) {
    auto setup = make_memory_client(default_chunk_size);
    if (!setup.client) {
        state.SkipWithError("Failed to connect memory client");
        return;
    }
    setup.remote->add_file("/bench/file.txt", std::string_view("payload"));

    for (auto _ : state) {
        auto outcome = setup.client->stat("/bench/file.txt").get();
        if (!outcome) {
            state.SkipWithError(outcome.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(outcome.value().size);
    }
}

/**
 * @brief Listing of a directory with range(0) entries
 */
static void BM_ListFiles(::benchmark::State& state) {
    const auto entries = static_cast<int>(state.range(0));

    auto setup = make_memory_client(default_chunk_size);
    if (!setup.client) {
        state.SkipWithError("Failed to connect memory client");
        return;
    }
    for (int i = 0; i < entries; ++i) {
        setup.remote->add_file("/bench/list/file_" + std::to_string(i), std::string_view("x"));
    }

    for (auto _ : state) {
        auto outcome = setup.client->list_files("/bench/list").get();
        if (!outcome) {
            state.SkipWithError(outcome.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(outcome.value().size());
    }

    state.SetItemsProcessed(static_cast<int64_t>(entries) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Connect followed by disconnect
 */
static void BM_ConnectDisconnect(::benchmark::State& state) {
    auto setup = make_memory_client(default_chunk_size);
    if (!setup.client) {
        state.SkipWithError("Failed to connect memory client");
        return;
    }

    for (auto _ : state) {
        setup.client->disconnect();
        auto outcome = setup.client->connect().get();
        if (!outcome) {
            state.SkipWithError(outcome.error().message.c_str());
            return;
        }
    }
}

BENCHMARK(BM_StatRoundTrip)->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_ListFiles)->Arg(10)->Arg(1000)->Arg(10000)->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_ConnectDisconnect)->Unit(::benchmark::kMicrosecond);

}  // namespace async_sftp::benchmark

BENCHMARK_MAIN();
