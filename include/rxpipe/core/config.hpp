#pragma once

/**
 * @file config.hpp
 * @brief Operator configuration and composable options
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "rxpipe/core/cancellation.hpp"
#include "rxpipe/core/metrics.hpp"

namespace rxpipe {

/**
 * @brief Per-operator configuration snapshot
 */
struct Config {
    std::size_t buffer_size{0};      // 0 = synchronous handoff
    std::size_t pool_size{1};        // 1 = inline, no concurrency
    bool ordered{false};             // release pooled output in input order
    CancellationToken token;         // default: never cancelled
    std::shared_ptr<MetricsCollector> metrics;
    std::string name;                // stage label, defaults to the operator name
};

/**
 * @brief A single named configuration option
 *
 * Options are applied in the order given. Each one validates its own
 * value and leaves the configuration untouched on invalid input.
 */
using Option = std::function<void(Config&)>;

/**
 * @brief Output buffer capacity; negative values are ignored
 */
Option with_buffer_size(long long size);

/**
 * @brief Worker count for Map/Filter; values below 1 are ignored
 */
Option with_pool_size(long long size);

/**
 * @brief Release pooled results in source order
 */
Option with_ordered_output();

/**
 * @brief Cancellation handle observed by the stage
 */
Option with_cancellation(CancellationToken token);

/**
 * @brief Report stage counters to a collector; null is ignored
 */
Option with_metrics(std::shared_ptr<MetricsCollector> metrics);

/**
 * @brief Stage label used in metrics; empty is ignored
 */
Option with_name(std::string name);

/**
 * @brief Build a configuration from a default name and a list of options
 */
template<typename... Options>
Config make_config(std::string default_name, const Options&... options) {
    Config config;
    config.name = std::move(default_name);
    (options(config), ...);
    return config;
}

} // namespace rxpipe
