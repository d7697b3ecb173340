/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for rxpipe
 */

#include <benchmark/benchmark.h>

#include "rxpipe/rxpipe.hpp"

using namespace rxpipe;

static void BM_QueuePushPop(benchmark::State& state) {
    Channel<Result<std::int64_t>> queue(4096);

    for (auto _ : state) {
        queue.push(Result<std::int64_t>::ok(42));
        auto result = queue.pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueuePushPop);

static void BM_QueuePushPopWithToken(benchmark::State& state) {
    Channel<Result<std::int64_t>> queue(4096);
    CancellationSource source;
    auto token = source.token();

    for (auto _ : state) {
        queue.push(Result<std::int64_t>::ok(42), token);
        auto result = queue.pop(token);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueuePushPopWithToken);

static void BM_QueueTryPushPop(benchmark::State& state) {
    Channel<Result<std::int64_t>> queue(4096);

    for (auto _ : state) {
        queue.try_push(Result<std::int64_t>::ok(42));
        auto result = queue.try_pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueueTryPushPop);

static void BM_ResultCreation(benchmark::State& state) {
    for (auto _ : state) {
        auto r = Result<std::int64_t>::ok(42);
        benchmark::DoNotOptimize(r);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ResultCreation);

static void BM_Range(benchmark::State& state) {
    const auto count = state.range(0);

    for (auto _ : state) {
        CountingSink sink;
        auto stream = range(0, count, with_buffer_size(1024));
        sink.drain(stream);
        benchmark::DoNotOptimize(sink.count());
    }

    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_Range)->Arg(10000);

static void BM_MapOperator(benchmark::State& state) {
    const auto count = state.range(0);
    const auto workers = state.range(1);

    for (auto _ : state) {
        CountingSink sink;
        auto stream = map(range(0, count, with_buffer_size(1024)),
                          [](std::int64_t x, std::size_t) { return x * x; },
                          with_buffer_size(1024), with_pool_size(workers));
        sink.drain(stream);
    }

    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_MapOperator)->Args({10000, 1})->Args({10000, 4});

static void BM_OrderedMap(benchmark::State& state) {
    const auto count = state.range(0);

    for (auto _ : state) {
        CountingSink sink;
        auto stream = map(range(0, count, with_buffer_size(1024)),
                          [](std::int64_t x, std::size_t) { return x * x; },
                          with_buffer_size(1024), with_pool_size(4), with_ordered_output());
        sink.drain(stream);
    }

    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_OrderedMap)->Arg(10000);

static void BM_FilterOperator(benchmark::State& state) {
    const auto count = state.range(0);

    for (auto _ : state) {
        CountingSink sink;
        auto stream = filter(range(0, count, with_buffer_size(1024)),
                             [](std::int64_t x, std::size_t) { return x % 2 == 0; },
                             with_buffer_size(1024));
        sink.drain(stream);
    }

    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_FilterOperator)->Arg(10000);

static void BM_BufferWithCount(benchmark::State& state) {
    const auto count = state.range(0);

    for (auto _ : state) {
        CountingSink sink;
        auto stream = buffer_with_count(range(0, count, with_buffer_size(1024)), 64);
        sink.drain(stream);
    }

    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_BufferWithCount)->Arg(10000);

BENCHMARK_MAIN();
