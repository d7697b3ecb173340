/**
 * @file latency_benchmark.cpp
 * @brief Latency benchmarks for rxpipe
 */

#include <benchmark/benchmark.h>
#include <chrono>
#include <cstdint>
#include <string>

#include "rxpipe/rxpipe.hpp"

using namespace rxpipe;

static void BM_EndToEndLatency(benchmark::State& state) {
    const auto workers = state.range(0);

    for (auto _ : state) {
        CountingSink sink;

        auto start = std::chrono::high_resolution_clock::now();
        auto stream = map(range(1, 1000),
                          [](std::int64_t x, std::size_t) { return x; },
                          with_pool_size(workers));
        sink.drain(stream);
        auto end = std::chrono::high_resolution_clock::now();

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }

    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_EndToEndLatency)->Arg(1)->Arg(2)->Arg(4)->UseManualTime();

static void BM_PipelineLatency(benchmark::State& state) {
    const int pipeline_depth = static_cast<int>(state.range(0));

    for (auto _ : state) {
        CountingSink sink;

        auto start = std::chrono::high_resolution_clock::now();
        auto stream = range(1, 100);
        for (int i = 0; i < pipeline_depth; i++) {
            stream = map(std::move(stream),
                         [](std::int64_t x, std::size_t) { return x; },
                         with_name("pass_" + std::to_string(i)));
        }
        sink.drain(stream);
        auto end = std::chrono::high_resolution_clock::now();

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }
}
BENCHMARK(BM_PipelineLatency)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseManualTime();

static void BM_TimerLatency(benchmark::State& state) {
    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();
        auto stream = timer(std::chrono::milliseconds(1));
        auto fired = stream.next();
        auto end = std::chrono::high_resolution_clock::now();
        benchmark::DoNotOptimize(fired);

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }
}
BENCHMARK(BM_TimerLatency)->UseManualTime();

BENCHMARK_MAIN();
