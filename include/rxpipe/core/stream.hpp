#pragma once

/**
 * @file stream.hpp
 * @brief Consumer handle of an asynchronous sequence of results
 */

#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

#include "rxpipe/core/cancellation.hpp"
#include "rxpipe/core/queue.hpp"
#include "rxpipe/core/result.hpp"

namespace rxpipe {

/**
 * @brief Single-consumer stream of Result<T>
 *
 * A Stream owns the background thread producing into it. Pull with
 * next() until it returns nullopt, or iterate with a range-for.
 * Destroying the handle stops the producer, joins its thread and,
 * because every stage owns its source, tears down the whole chain
 * upstream of it.
 *
 * Streams are move-only.
 */
template<typename T>
class Stream {
public:
    using value_type = Result<T>;
    using channel_type = Channel<Result<T>>;

    Stream() = default;

    Stream(std::shared_ptr<channel_type> channel, CancellationSource stop, std::thread producer)
        : channel_(std::move(channel))
        , stop_(std::move(stop))
        , producer_(std::move(producer)) {}

    ~Stream() {
        shutdown();
    }

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    Stream(Stream&& other) noexcept = default;

    Stream& operator=(Stream&& other) noexcept {
        if (this != &other) {
            shutdown();
            channel_ = std::move(other.channel_);
            stop_ = std::move(other.stop_);
            producer_ = std::move(other.producer_);
        }
        return *this;
    }

    /**
     * @brief Blocking pull of the next result
     * @return Result, or nullopt once the stream is closed and drained
     */
    std::optional<Result<T>> next() {
        if (!channel_) {
            return std::nullopt;
        }
        return channel_->pop();
    }

    /**
     * @brief Blocking pull that gives up when token is cancelled
     */
    std::optional<Result<T>> next(const CancellationToken& token) {
        if (!channel_) {
            return std::nullopt;
        }
        return channel_->pop(token);
    }

    /**
     * @brief Pull racing arrival, close, deadline and cancellation
     */
    PopStatus receive(
        std::optional<Result<T>>& out,
        std::chrono::steady_clock::time_point deadline,
        const CancellationToken& token = {}
    ) {
        if (!channel_) {
            return PopStatus::Closed;
        }
        return channel_->pop_until(out, deadline, token);
    }

    /**
     * @brief Stop the producer, close the channel and join
     */
    void shutdown() {
        if (!channel_) {
            return;
        }
        stop_.cancel();
        channel_->close();
        if (producer_.joinable()) {
            producer_.join();
        }
    }

    [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(channel_); }

    /**
     * @brief Output buffer capacity of the producing stage
     */
    [[nodiscard]] std::size_t capacity() const noexcept {
        return channel_ ? channel_->capacity() : 0;
    }

    [[nodiscard]] QueueStats stats() const {
        return channel_ ? channel_->stats() : QueueStats{};
    }

    /**
     * @brief Input iterator over the remaining results
     */
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Result<T>;
        using difference_type = std::ptrdiff_t;
        using pointer = Result<T>*;
        using reference = Result<T>&;

        iterator() = default;

        explicit iterator(Stream* stream)
            : stream_(stream) {
            advance();
        }

        reference operator*() { return *current_; }
        pointer operator->() { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const noexcept {
            return stream_ == other.stream_;
        }

        bool operator!=(const iterator& other) const noexcept {
            return !(*this == other);
        }

    private:
        void advance() {
            current_ = stream_->next();
            if (!current_) {
                stream_ = nullptr;
            }
        }

        Stream* stream_{nullptr};
        std::optional<Result<T>> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::shared_ptr<channel_type> channel_;
    CancellationSource stop_;
    std::thread producer_;
};

} // namespace rxpipe
