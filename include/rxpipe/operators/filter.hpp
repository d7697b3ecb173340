#pragma once

/**
 * @file filter.hpp
 * @brief Filtering operators: filter and take
 */

#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

#include "rxpipe/core/config.hpp"
#include "rxpipe/core/operator.hpp"
#include "rxpipe/core/result.hpp"
#include "rxpipe/core/stream.hpp"
#include "rxpipe/core/worker_pool.hpp"

namespace rxpipe {

namespace detail {

/**
 * @brief Evaluate a predicate; returns keep/drop or the failure
 */
template<typename Predicate, typename T>
Result<bool> apply_predicate(Predicate& predicate, const T& value, std::size_t index) {
    using R = std::decay_t<std::invoke_result_t<Predicate&, const T&, std::size_t>>;
    try {
        if constexpr (is_result_v<R>) {
            return predicate(value, index);
        } else {
            return Result<bool>::ok(static_cast<bool>(predicate(value, index)));
        }
    } catch (...) {
        return Result<bool>::err(std::current_exception());
    }
}

} // namespace detail

/**
 * @brief Pass through the elements a predicate accepts
 *
 * The predicate is called as predicate(value, index) and returns bool
 * (reporting errors by throwing) or Result<bool>. Accepted values are
 * re-emitted unchanged. Source failures pass through and predicate
 * failures are emitted; neither stops the stage. Pooling and ordering
 * work as in map().
 */
template<typename T, typename Predicate, typename... Options>
Stream<T> filter(Stream<T> source, Predicate predicate, const Options&... options) {
    auto config = make_config("filter", options...);
    WorkerPoolConfig pool_config{config.pool_size, config.ordered};

    return detail::launch<T>(config,
        [source = std::move(source), predicate = std::move(predicate), pool_config](StageContext<T>& ctx) mutable {
            WorkerPool pool(pool_config);
            std::size_t index = 0;

            while (auto item = source.next(ctx.token())) {
                ctx.record_received();

                // Shared so the std::function task stays copyable for move-only T
                auto result = std::make_shared<Result<T>>(std::move(*item));

                pool.submit([&ctx, &predicate, result, i = index]() -> WorkerPool::Callback {
                    if (result->is_err()) {
                        return [&ctx, error = result->error()]() {
                            ctx.emit_error(error);
                        };
                    }

                    auto start = std::chrono::steady_clock::now();
                    auto keep = detail::apply_predicate(predicate, result->value(), i);
                    ctx.record_callback_time(std::chrono::steady_clock::now() - start);

                    if (keep.is_err()) {
                        return [&ctx, error = keep.error()]() {
                            ctx.emit_error(error);
                        };
                    }
                    if (!keep.value()) {
                        return {};
                    }
                    return [&ctx, result]() {
                        ctx.emit(std::move(*result));
                    };
                });

                index++;
            }

            pool.drain();
        });
}

/**
 * @brief Forward at most n successes, then close
 *
 * The first source failure is forwarded and ends the stage. A source
 * that closes early simply yields fewer elements.
 */
template<typename T, typename... Options>
Stream<T> take(Stream<T> source, std::size_t n, const Options&... options) {
    auto config = make_config("take", options...);

    return detail::launch<T>(config, [source = std::move(source), n](StageContext<T>& ctx) mutable {
        std::size_t count = 0;
        while (count < n) {
            auto item = source.next(ctx.token());
            if (!item) {
                return;
            }
            ctx.record_received();

            if (item->is_err()) {
                ctx.emit(std::move(*item));
                return;
            }
            if (!ctx.emit(std::move(*item))) {
                return;
            }
            count++;
        }
    });
}

} // namespace rxpipe
