#pragma once

/**
 * @file rxpipe.hpp
 * @brief Main header for rxpipe - reactive stream operators over threads
 *
 * Include this single header to access the full rxpipe API.
 */

#include "rxpipe/core/result.hpp"
#include "rxpipe/core/cancellation.hpp"
#include "rxpipe/core/queue.hpp"
#include "rxpipe/core/stream.hpp"
#include "rxpipe/core/config.hpp"
#include "rxpipe/core/operator.hpp"
#include "rxpipe/core/worker_pool.hpp"
#include "rxpipe/core/ticker.hpp"
#include "rxpipe/core/metrics.hpp"

#include "rxpipe/operators/creation.hpp"
#include "rxpipe/operators/map.hpp"
#include "rxpipe/operators/filter.hpp"
#include "rxpipe/operators/buffer.hpp"
#include "rxpipe/operators/sink.hpp"

namespace rxpipe {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace rxpipe
