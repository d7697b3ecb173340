/**
 * @file metrics.cpp
 * @brief Metrics collector implementation
 */

#include "rxpipe/core/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace rxpipe {

Histogram::Histogram(std::vector<double> buckets)
    : buckets_(std::move(buckets))
    , counts_(buckets_.size() + 1, 0) {}

void Histogram::observe(double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sum_ += value;
    count_++;

    for (std::size_t i = 0; i < buckets_.size(); i++) {
        if (value <= buckets_[i]) {
            counts_[i]++;
            return;
        }
    }
    counts_.back()++;  // +Inf bucket
}

double Histogram::sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

std::uint64_t Histogram::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double Histogram::mean() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
}

std::vector<std::uint64_t> Histogram::bucket_counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

MetricsCollector::MetricsCollector()
    : start_time_(std::chrono::steady_clock::now()) {}

StageCounters& MetricsCollector::stage(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = stages_[name];
    if (!slot) {
        slot = std::make_unique<StageCounters>();
    }
    return *slot;
}

PipelineMetrics MetricsCollector::snapshot() const {
    PipelineMetrics metrics;
    metrics.timestamp = std::chrono::steady_clock::now();
    metrics.active_stages = active_stages_.value();
    metrics.callbacks = latency_.count();
    metrics.avg_callback_ms = latency_.mean() * 1000.0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics.stages.reserve(stages_.size());
        for (const auto& [name, counters] : stages_) {
            StageMetrics stage;
            stage.name = name;
            stage.received = counters->received.value();
            stage.emitted = counters->emitted.value();
            stage.failed = counters->failed.value();
            metrics.stages.push_back(std::move(stage));
        }
    }

    std::sort(metrics.stages.begin(), metrics.stages.end(),
              [](const StageMetrics& a, const StageMetrics& b) { return a.name < b.name; });
    return metrics;
}

std::string MetricsCollector::format() const {
    auto m = snapshot();
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Active stages: " << m.active_stages
        << " | Callbacks: " << m.callbacks
        << " | Avg callback: " << m.avg_callback_ms << " ms"
        << " | Uptime: " << uptime().count() << " ms";
    for (const auto& stage : m.stages) {
        oss << "\n  " << stage.name
            << ": in=" << stage.received
            << " out=" << stage.emitted
            << " failed=" << stage.failed;
    }
    return oss.str();
}

void MetricsCollector::print(std::ostream& os) const {
    os << format() << std::endl;
}

void MetricsCollector::print() const {
    print(std::cout);
}

} // namespace rxpipe
