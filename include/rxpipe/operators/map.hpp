#pragma once

/**
 * @file map.hpp
 * @brief Map transformation operator
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

template<typename R>
struct unwrap_result {
    using type = R;
};

template<typename U>
struct unwrap_result<Result<U>> {
    using type = U;
};

/**
 * @brief Output type of a mapper: U for both U and Result<U> returns
 */
template<typename Mapper, typename T>
using mapped_t = typename unwrap_result<
    std::decay_t<std::invoke_result_t<Mapper&, T, std::size_t>>>::type;

/**
 * @brief Run a mapper, folding thrown and returned errors into a Result
 */
template<typename U, typename Mapper, typename T>
Result<U> apply_mapper(Mapper& mapper, T value, std::size_t index) {
    using R = std::decay_t<std::invoke_result_t<Mapper&, T, std::size_t>>;
    try {
        if constexpr (is_result_v<R>) {
            return mapper(std::move(value), index);
        } else {
            return Result<U>::ok(mapper(std::move(value), index));
        }
    } catch (...) {
        return Result<U>::err(std::current_exception());
    }
}

} // namespace detail

/**
 * @brief Transform every element of a stream
 *
 * The mapper is called as mapper(value, index), where index counts
 * source elements in pull order starting at 0. It returns either the
 * mapped value (reporting errors by throwing) or a Result.
 *
 * Source failures and mapper failures each become one failure in the
 * output; later elements are still processed. With with_pool_size(n)
 * up to n mapper calls run concurrently, and with_ordered_output()
 * keeps the output in source order. The mapper must be safe to call
 * concurrently when pooled.
 *
 * Options: with_buffer_size, with_pool_size, with_ordered_output,
 * with_cancellation, with_metrics, with_name.
 */
template<typename T, typename Mapper, typename... Options>
auto map(Stream<T> source, Mapper mapper, const Options&... options)
    -> Stream<detail::mapped_t<Mapper, T>> {
    using U = detail::mapped_t<Mapper, T>;
    auto config = make_config("map", options...);
    WorkerPoolConfig pool_config{config.pool_size, config.ordered};

    return detail::launch<U>(config,
        [source = std::move(source), mapper = std::move(mapper), pool_config](StageContext<U>& ctx) mutable {
            WorkerPool pool(pool_config);
            std::size_t index = 0;

            while (auto item = source.next(ctx.token())) {
                ctx.record_received();

                // Shared so the std::function task stays copyable for move-only types
                auto result = std::make_shared<Result<T>>(std::move(*item));

                pool.submit([&ctx, &mapper, result, i = index]() -> WorkerPool::Callback {
                    if (result->is_err()) {
                        return [&ctx, error = result->error()]() {
                            ctx.emit_error(error);
                        };
                    }

                    auto start = std::chrono::steady_clock::now();
                    auto mapped = std::make_shared<Result<U>>(
                        detail::apply_mapper<U>(mapper, std::move(*result).value(), i));
                    ctx.record_callback_time(std::chrono::steady_clock::now() - start);

                    return [&ctx, mapped]() {
                        ctx.emit(std::move(*mapped));
                    };
                });

                index++;
            }

            // Work already submitted is awaited even after cancellation
            pool.drain();
        });
}

} // namespace rxpipe
