#pragma once

/**
 * @file creation.hpp
 * @brief Operators that start a stream from a static source
 */

#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

#include "rxpipe/core/config.hpp"
#include "rxpipe/core/operator.hpp"
#include "rxpipe/core/queue.hpp"
#include "rxpipe/core/stream.hpp"
#include "rxpipe/core/ticker.hpp"

namespace rxpipe {

/**
 * @brief Emit a single 0 after d has elapsed, then close
 *
 * Closes without emitting if cancelled first.
 */
template<typename Rep, typename Period, typename... Options>
Stream<std::int64_t> timer(std::chrono::duration<Rep, Period> d, const Options&... options) {
    auto config = make_config("timer", options...);
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(d);

    return detail::launch<std::int64_t>(config, [deadline](StageContext<std::int64_t>& ctx) {
        if (ctx.token().wait_until(deadline)) {
            return;
        }
        ctx.emit_value(0);
    });
}

/**
 * @brief Emit 0, 1, 2, ... once per period until cancelled
 *
 * Never closes on its own; pair it with take() or a cancellation
 * token, or drop the stream.
 *
 * @throws std::invalid_argument if d is not positive
 */
template<typename Rep, typename Period, typename... Options>
Stream<std::int64_t> interval(std::chrono::duration<Rep, Period> d, const Options&... options) {
    auto config = make_config("interval", options...);
    Ticker ticker(std::chrono::duration_cast<std::chrono::steady_clock::duration>(d));

    return detail::launch<std::int64_t>(config, [ticker](StageContext<std::int64_t>& ctx) mutable {
        for (std::int64_t i = 0;; i++) {
            if (ctx.token().wait_until(ticker.next_fire())) {
                return;
            }
            ticker.fire();
            if (!ctx.emit_value(i)) {
                return;
            }
        }
    });
}

/**
 * @brief Emit count consecutive integers starting at start
 *
 * count <= 0 yields an empty stream.
 *
 * @throws std::invalid_argument if start + count - 1 exceeds INT64_MAX
 */
template<typename... Options>
Stream<std::int64_t> range(std::int64_t start, std::int64_t count, const Options&... options) {
    if (count > 0 && start > std::numeric_limits<std::int64_t>::max() - (count - 1)) {
        throw std::invalid_argument("range end overflows int64");
    }
    auto config = make_config("range", options...);

    return detail::launch<std::int64_t>(config, [start, count](StageContext<std::int64_t>& ctx) {
        for (std::int64_t i = 0; i < count; i++) {
            if (ctx.cancelled() || !ctx.emit_value(start + i)) {
                return;
            }
        }
    });
}

/**
 * @brief Emit every element of an in-memory sequence in order
 */
template<typename T, typename... Options>
Stream<T> from_sequence(std::vector<T> items, const Options&... options) {
    auto config = make_config("from_sequence", options...);

    return detail::launch<T>(config, [items = std::move(items)](StageContext<T>& ctx) mutable {
        for (auto& item : items) {
            if (ctx.cancelled() || !ctx.emit_value(std::move(item))) {
                return;
            }
        }
    });
}

/**
 * @brief Bridge an existing push-style channel into a stream
 *
 * Every item is wrapped as a success. The output buffer defaults to
 * the source channel's capacity; a with_buffer_size option overrides
 * it.
 */
template<typename T, typename... Options>
Stream<T> from_source(std::shared_ptr<Channel<T>> source, const Options&... options) {
    if (!source) {
        throw std::invalid_argument("from_source requires a channel");
    }
    auto config = make_config("from_source",
                              with_buffer_size(static_cast<long long>(source->capacity())),
                              options...);

    return detail::launch<T>(config, [source](StageContext<T>& ctx) {
        while (auto item = source->pop(ctx.token())) {
            ctx.record_received();
            if (!ctx.emit_value(std::move(*item))) {
                return;
            }
        }
    });
}

} // namespace rxpipe
