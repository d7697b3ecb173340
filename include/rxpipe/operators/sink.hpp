#pragma once

/**
 * @file sink.hpp
 * @brief Consumer-side helpers that drain a stream
 */

#include <atomic>
#include <cstdint>
#include <utility>
#include <vector>

#include "rxpipe/core/result.hpp"
#include "rxpipe/core/stream.hpp"

namespace rxpipe {

/**
 * @brief Drain a stream into a vector, in arrival order
 */
template<typename T>
std::vector<Result<T>> collect(Stream<T>& stream) {
    std::vector<Result<T>> results;
    while (auto item = stream.next()) {
        results.push_back(std::move(*item));
    }
    return results;
}

template<typename T>
std::vector<Result<T>> collect(Stream<T>&& stream) {
    return collect(stream);
}

/**
 * @brief Call func(result) for every remaining element
 * @return Number of elements consumed
 */
template<typename T, typename Func>
std::uint64_t for_each(Stream<T>& stream, Func&& func) {
    std::uint64_t consumed = 0;
    while (auto item = stream.next()) {
        func(std::move(*item));
        consumed++;
    }
    return consumed;
}

/**
 * @brief Counting sink (tallies successes and failures)
 */
class CountingSink {
public:
    template<typename T>
    void consume(const Result<T>& result) noexcept {
        if (result.is_ok()) {
            ok_.fetch_add(1, std::memory_order_relaxed);
        } else {
            failed_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /**
     * @brief Consume a whole stream
     */
    template<typename T>
    void drain(Stream<T>& stream) {
        while (auto item = stream.next()) {
            consume(*item);
        }
    }

    [[nodiscard]] std::uint64_t count() const noexcept {
        return ok() + failed();
    }

    [[nodiscard]] std::uint64_t ok() const noexcept {
        return ok_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t failed() const noexcept {
        return failed_.load(std::memory_order_relaxed);
    }

    void reset() noexcept {
        ok_.store(0, std::memory_order_relaxed);
        failed_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> ok_{0};
    std::atomic<std::uint64_t> failed_{0};
};

} // namespace rxpipe
