/**
 * @file config.cpp
 * @brief Option factories
 */

#include "rxpipe/core/config.hpp"

namespace rxpipe {

Option with_buffer_size(long long size) {
    return [size](Config& config) {
        if (size >= 0) {
            config.buffer_size = static_cast<std::size_t>(size);
        }
    };
}

Option with_pool_size(long long size) {
    return [size](Config& config) {
        if (size > 0) {
            config.pool_size = static_cast<std::size_t>(size);
        }
    };
}

Option with_ordered_output() {
    return [](Config& config) {
        config.ordered = true;
    };
}

Option with_cancellation(CancellationToken token) {
    return [token = std::move(token)](Config& config) {
        config.token = token;
    };
}

Option with_metrics(std::shared_ptr<MetricsCollector> metrics) {
    return [metrics = std::move(metrics)](Config& config) {
        if (metrics) {
            config.metrics = metrics;
        }
    };
}

Option with_name(std::string name) {
    return [name = std::move(name)](Config& config) {
        if (!name.empty()) {
            config.name = name;
        }
    };
}

} // namespace rxpipe
