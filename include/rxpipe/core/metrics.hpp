#pragma once

/**
 * @file metrics.hpp
 * @brief Metrics collection and reporting
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rxpipe {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

    void reset() noexcept {
        value_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Gauge metric (can go up and down)
 */
class Gauge {
public:
    void set(std::int64_t value) noexcept {
        value_.store(value, std::memory_order_relaxed);
    }

    void increment(std::int64_t delta = 1) noexcept {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(std::int64_t delta = 1) noexcept {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    [[nodiscard]] std::int64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::int64_t> value_{0};
};

/**
 * @brief Histogram for latency measurements (seconds)
 */
class Histogram {
public:
    explicit Histogram(std::vector<double> buckets = default_buckets());

    void observe(double value);

    [[nodiscard]] double sum() const;
    [[nodiscard]] std::uint64_t count() const;
    [[nodiscard]] double mean() const;

    /**
     * @brief Per-bucket counts, last entry is the +Inf bucket
     */
    [[nodiscard]] std::vector<std::uint64_t> bucket_counts() const;

    static std::vector<double> default_buckets() {
        return {0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> buckets_;
    std::vector<std::uint64_t> counts_;
    double sum_{0.0};
    std::uint64_t count_{0};
};

/**
 * @brief Live counters of one stage
 */
struct StageCounters {
    Counter received;
    Counter emitted;
    Counter failed;
};

/**
 * @brief Stage-level metrics snapshot
 */
struct StageMetrics {
    std::string name;
    std::uint64_t received{0};
    std::uint64_t emitted{0};
    std::uint64_t failed{0};
};

/**
 * @brief Pipeline metrics snapshot
 */
struct PipelineMetrics {
    std::vector<StageMetrics> stages;
    std::int64_t active_stages{0};
    std::uint64_t callbacks{0};
    double avg_callback_ms{0.0};
    std::chrono::steady_clock::time_point timestamp;
};

/**
 * @brief Metrics collector and reporter
 *
 * Shared by the stages of one or more pipelines through the
 * with_metrics() option. Stages with the same name share counters.
 */
class MetricsCollector {
public:
    MetricsCollector();

    // Non-copyable
    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    /**
     * @brief Counters for a named stage, created on first use
     */
    StageCounters& stage(const std::string& name);

    Gauge& active_stages() { return active_stages_; }
    Histogram& callback_latency() { return latency_; }

    /**
     * @brief Collect a snapshot, stages sorted by name
     */
    [[nodiscard]] PipelineMetrics snapshot() const;

    /**
     * @brief Format metrics as one line per stage
     */
    [[nodiscard]] std::string format() const;

    /**
     * @brief Print metrics to a stream (stdout by default)
     */
    void print(std::ostream& os) const;
    void print() const;

    [[nodiscard]] std::chrono::milliseconds uptime() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_
        );
    }

private:
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<StageCounters>> stages_;

    Gauge active_stages_;
    Histogram latency_;
};

} // namespace rxpipe
