#pragma once

/**
 * @file operator.hpp
 * @brief Stage context and the launcher shared by every operator
 */

#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "rxpipe/core/cancellation.hpp"
#include "rxpipe/core/config.hpp"
#include "rxpipe/core/metrics.hpp"
#include "rxpipe/core/queue.hpp"
#include "rxpipe/core/result.hpp"
#include "rxpipe/core/stream.hpp"

namespace rxpipe {

/**
 * @brief Context provided to a stage body during execution
 *
 * Owns the write side of the stage's output channel. emit() is safe to
 * call from pool workers concurrently.
 */
template<typename T>
class StageContext {
public:
    StageContext(
        std::string name,
        std::shared_ptr<Channel<Result<T>>> output,
        CancellationToken token,
        std::shared_ptr<MetricsCollector> metrics
    )
        : name_(std::move(name))
        , output_(std::move(output))
        , token_(std::move(token))
        , metrics_(std::move(metrics)) {
        if (metrics_) {
            counters_ = &metrics_->stage(name_);
            metrics_->active_stages().increment();
        }
    }

    ~StageContext() {
        close();
    }

    StageContext(const StageContext&) = delete;
    StageContext& operator=(const StageContext&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const CancellationToken& token() const noexcept { return token_; }

    [[nodiscard]] bool cancelled() const {
        return token_.is_cancelled();
    }

    /**
     * @brief Send a result downstream, blocking while the output is full
     * @return false if the stage was cancelled or the consumer went away
     */
    bool emit(Result<T> result) {
        const bool failed = result.is_err();
        if (!output_->push(std::move(result), token_)) {
            return false;
        }
        if (counters_) {
            counters_->emitted.increment();
            if (failed) {
                counters_->failed.increment();
            }
        }
        return true;
    }

    bool emit_value(T value) {
        return emit(Result<T>::ok(std::move(value)));
    }

    bool emit_error(std::exception_ptr error) {
        return emit(Result<T>::err(std::move(error)));
    }

    void record_received() noexcept {
        if (counters_) {
            counters_->received.increment();
        }
    }

    void record_callback_time(std::chrono::steady_clock::duration elapsed) {
        if (metrics_) {
            metrics_->callback_latency().observe(
                std::chrono::duration<double>(elapsed).count());
        }
    }

    /**
     * @brief Close the output; later calls are no-ops
     */
    void close() {
        if (closed_) {
            return;
        }
        closed_ = true;
        output_->close();
        if (metrics_) {
            metrics_->active_stages().decrement();
        }
    }

private:
    std::string name_;
    std::shared_ptr<Channel<Result<T>>> output_;
    CancellationToken token_;
    std::shared_ptr<MetricsCollector> metrics_;
    StageCounters* counters_{nullptr};
    bool closed_{false};
};

namespace detail {

/**
 * @brief Start a stage thread running body(ctx) and return its stream
 *
 * The output closes when body returns. An exception escaping body is
 * emitted as a final failure first. The stage token is linked to the
 * configured one, so dropping the returned stream cancels this stage
 * without touching the caller's token.
 */
template<typename T, typename Body>
Stream<T> launch(const Config& config, Body body) {
    auto output = std::make_shared<Channel<Result<T>>>(config.buffer_size);
    auto stop = CancellationSource::linked_to(config.token);
    auto ctx = std::make_shared<StageContext<T>>(
        config.name, output, stop.token(), config.metrics);

    std::thread producer([ctx, body = std::move(body)]() mutable {
        try {
            body(*ctx);
        } catch (...) {
            ctx->emit_error(std::current_exception());
        }
        ctx->close();
    });

    return Stream<T>(std::move(output), std::move(stop), std::move(producer));
}

} // namespace detail

} // namespace rxpipe
