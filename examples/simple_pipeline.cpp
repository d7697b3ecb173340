/**
 * @file simple_pipeline.cpp
 * @brief Example: Interval → Map → Filter → BufferWithTimeOrCount → Sink
 *
 * Runs a live pipeline until interrupted or until it times out, printing
 * stage metrics once per second.
 */

#include <iostream>
#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include <memory>

#include "rxpipe/rxpipe.hpp"

std::atomic<bool> g_shutdown{false};

void signal_handler(int /*signal*/) {
    g_shutdown.store(true);
}

int main() {
    using namespace std::chrono_literals;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "=== rxpipe Example Pipeline ===" << std::endl;
    std::cout << "Version: " << rxpipe::VERSION << std::endl;
    std::cout << std::endl;

    auto metrics = std::make_shared<rxpipe::MetricsCollector>();
    rxpipe::CancellationSource cancel;
    auto token = cancel.token();

    // Pipeline: interval(1ms) → square → even → batches of 100 or 250ms
    auto ticks = rxpipe::interval(1ms,
        rxpipe::with_cancellation(token),
        rxpipe::with_metrics(metrics));

    auto squares = rxpipe::map(std::move(ticks),
        [](std::int64_t x, std::size_t) { return x * x; },
        rxpipe::with_pool_size(4),
        rxpipe::with_ordered_output(),
        rxpipe::with_cancellation(token),
        rxpipe::with_metrics(metrics),
        rxpipe::with_name("square"));

    auto evens = rxpipe::filter(std::move(squares),
        [](std::int64_t x, std::size_t) { return x % 2 == 0; },
        rxpipe::with_cancellation(token),
        rxpipe::with_metrics(metrics),
        rxpipe::with_name("even_filter"));

    auto batches = rxpipe::buffer_with_time_or_count(std::move(evens), 250ms, 100,
        rxpipe::with_cancellation(token),
        rxpipe::with_metrics(metrics),
        rxpipe::with_name("batch"));

    std::thread watchdog([&]() {
        auto start_time = std::chrono::steady_clock::now();
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(1s);
            std::cout << "\r" << metrics->format() << std::flush;

            if (std::chrono::steady_clock::now() - start_time > 10s) {
                std::cout << "\n\nTimeout reached, stopping..." << std::endl;
                break;
            }
        }
        cancel.cancel();
    });

    std::uint64_t batch_count = 0;
    std::uint64_t values = 0;
    std::int64_t max_value = 0;
    for (auto& batch : batches) {
        if (batch.is_err()) {
            std::cerr << "\nPipeline failed: " << batch.error_message() << std::endl;
            g_shutdown.store(true);
            break;
        }
        batch_count++;
        values += batch.value().size();
        if (!batch.value().empty()) {
            max_value = batch.value().back();
        }
    }

    g_shutdown.store(true);
    watchdog.join();
    batches.shutdown();

    std::cout << std::endl;
    std::cout << "\n=== Final Statistics ===" << std::endl;
    std::cout << "Batches: " << batch_count << std::endl;
    std::cout << "Values: " << values << std::endl;
    std::cout << "Max: " << max_value << std::endl;
    metrics->print(std::cout);
    std::cout << "Uptime: " << metrics->uptime().count() << " ms" << std::endl;

    return 0;
}
