#pragma once

/**
 * @file buffer.hpp
 * @brief Batching operators: by count, by time, by time or count
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "rxpipe/core/config.hpp"
#include "rxpipe/core/operator.hpp"
#include "rxpipe/core/queue.hpp"
#include "rxpipe/core/result.hpp"
#include "rxpipe/core/stream.hpp"
#include "rxpipe/core/ticker.hpp"

namespace rxpipe {

namespace detail {

/**
 * @brief What a count-triggered flush does to the window timer
 */
enum class CountFlush {
    ResetTimer,
    KeepPhase
};

/**
 * @brief Windowing loop shared by the two time-based operators
 *
 * Races the next source element against the ticker deadline and the
 * stage token. Ticks flush a non-empty batch and keep the phase. A tick
 * that expired while elements were arriving is serviced before the next
 * element joins the batch. When
 * limit > 0 and the batch reaches it, the batch is flushed at once and
 * the ticker is either reset or left alone. A source failure is
 * forwarded and ends the loop, discarding the partial batch.
 */
template<typename T>
void run_time_window(
    Stream<T>& source,
    StageContext<std::vector<T>>& ctx,
    Ticker& ticker,
    std::size_t limit,
    CountFlush on_count
) {
    std::vector<T> batch;

    auto flush = [&]() {
        bool delivered = ctx.emit_value(std::move(batch));
        batch = std::vector<T>();
        return delivered;
    };

    while (true) {
        std::optional<Result<T>> item;
        auto status = source.receive(item, ticker.next_fire(), ctx.token());

        switch (status) {
        case PopStatus::Cancelled:
            return;

        case PopStatus::Timeout:
            ticker.fire();
            if (!batch.empty() && !flush()) {
                return;
            }
            break;

        case PopStatus::Closed:
            if (!batch.empty()) {
                flush();
            }
            return;

        case PopStatus::Ok:
            ctx.record_received();
            // A backlog keeps pops succeeding; the tick still closes its window
            if (ticker.expired()) {
                ticker.fire();
                if (!batch.empty() && !flush()) {
                    return;
                }
            }
            if (item->is_err()) {
                ctx.emit(item->template forward_error<std::vector<T>>());
                return;
            }
            batch.push_back(std::move(*item).value());
            if (limit > 0 && batch.size() >= limit) {
                if (!flush()) {
                    return;
                }
                if (on_count == CountFlush::ResetTimer) {
                    ticker.reset();
                }
            }
            break;
        }
    }
}

template<typename Rep, typename Period>
std::chrono::steady_clock::duration window_period(std::chrono::duration<Rep, Period> d) {
    auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(d);
    if (period <= std::chrono::steady_clock::duration::zero()) {
        throw std::invalid_argument("buffer window must be positive");
    }
    return period;
}

} // namespace detail

/**
 * @brief Group successes into batches of count elements
 *
 * A trailing partial batch is emitted when the source closes. The
 * first source failure is forwarded, the partial batch is discarded
 * and the stage ends.
 *
 * @throws std::invalid_argument if count is 0
 */
template<typename T, typename... Options>
Stream<std::vector<T>> buffer_with_count(Stream<T> source, std::size_t count, const Options&... options) {
    if (count == 0) {
        throw std::invalid_argument("buffer_with_count requires count > 0");
    }
    auto config = make_config("buffer_with_count", options...);

    return detail::launch<std::vector<T>>(config,
        [source = std::move(source), count](StageContext<std::vector<T>>& ctx) mutable {
            std::vector<T> batch;
            batch.reserve(count);

            while (auto item = source.next(ctx.token())) {
                ctx.record_received();
                if (item->is_err()) {
                    ctx.emit(item->template forward_error<std::vector<T>>());
                    return;
                }

                batch.push_back(std::move(*item).value());
                if (batch.size() >= count) {
                    if (!ctx.emit_value(std::move(batch))) {
                        return;
                    }
                    batch = std::vector<T>();
                    batch.reserve(count);
                }
            }

            if (!batch.empty() && !ctx.cancelled()) {
                ctx.emit_value(std::move(batch));
            }
        });
}

/**
 * @brief Group successes into time windows of length d
 *
 * Every d the current batch is emitted if it is non-empty. With
 * max_size > 0 a batch reaching max_size is emitted at once and the
 * window restarts, so the next timed flush is d after it. Remaining
 * elements are emitted when the source closes. The first source
 * failure is forwarded and ends the stage, discarding the batch.
 *
 * @throws std::invalid_argument if d is not positive
 */
template<typename T, typename Rep, typename Period, typename... Options>
Stream<std::vector<T>> buffer_with_time(
    Stream<T> source,
    std::chrono::duration<Rep, Period> d,
    std::size_t max_size,
    const Options&... options
) {
    auto period = detail::window_period(d);
    auto config = make_config("buffer_with_time", options...);

    return detail::launch<std::vector<T>>(config,
        [source = std::move(source), period, max_size](StageContext<std::vector<T>>& ctx) mutable {
            Ticker ticker(period);
            detail::run_time_window(source, ctx, ticker, max_size, detail::CountFlush::ResetTimer);
        });
}

/**
 * @brief Group successes into batches closed by time or by count
 *
 * Same as buffer_with_time() except that a count-triggered flush
 * leaves the timer alone: the next timed flush stays on the original
 * phase and may follow the count flush almost immediately.
 *
 * @throws std::invalid_argument if d is not positive
 */
template<typename T, typename Rep, typename Period, typename... Options>
Stream<std::vector<T>> buffer_with_time_or_count(
    Stream<T> source,
    std::chrono::duration<Rep, Period> d,
    std::size_t count,
    const Options&... options
) {
    auto period = detail::window_period(d);
    auto config = make_config("buffer_with_time_or_count", options...);

    return detail::launch<std::vector<T>>(config,
        [source = std::move(source), period, count](StageContext<std::vector<T>>& ctx) mutable {
            Ticker ticker(period);
            detail::run_time_window(source, ctx, ticker, count, detail::CountFlush::KeepPhase);
        });
}

} // namespace rxpipe
