#pragma once

/**
 * @file queue.hpp
 * @brief Closable, thread-safe channel with bounded capacity
 */

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "rxpipe/core/cancellation.hpp"

namespace rxpipe {

/**
 * @brief Queue statistics for monitoring
 */
struct QueueStats {
    std::uint64_t push_count{0};
    std::uint64_t pop_count{0};
    std::uint64_t push_blocked_count{0};
    std::uint64_t pop_blocked_count{0};
    std::size_t current_size{0};
    std::size_t capacity{0};
    std::size_t high_watermark{0};
};

/**
 * @brief Outcome of a deadline-bounded pop
 */
enum class PopStatus {
    Ok,
    Closed,
    Timeout,
    Cancelled
};

/**
 * @brief Bounded MPMC (Multi-Producer Multi-Consumer) channel
 *
 * Thread-safe FIFO that blocks producers when full. A capacity of 0
 * makes every push a synchronous handoff: the producer waits until a
 * consumer has taken the item. After close() no push succeeds, but
 * items already queued can still be popped.
 *
 * Blocking operations accept a CancellationToken and return early
 * once it is cancelled. A call that never has to wait does not touch
 * the token's callback list.
 *
 * @tparam T Item type
 */
template<typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity = 0)
        : capacity_(capacity) {}

    // Non-copyable, non-movable (due to synchronization primitives)
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;

    /**
     * @brief Push an item, blocking while full
     * @param item Item to push
     * @param token Cancellation token interrupting the wait
     * @return true if queued, false if the channel is closed or the
     *         token was cancelled before the item could be queued
     */
    bool push(T item, const CancellationToken& token = {}) {
        std::optional<CancellationRegistration> wake;
        std::unique_lock<std::mutex> lock(mutex_);

        stats_.push_count++;

        while (size_locked() >= slot_limit() && !closed_ && !token.is_cancelled()) {
            if (arm_wakeup(wake, token, lock)) {
                continue;
            }
            stats_.push_blocked_count++;
            not_full_.wait(lock);
        }

        if (closed_ || token.is_cancelled()) {
            return false;
        }

        buffer_.push_back(std::move(item));
        const auto ticket = ++pushed_;
        record_size();

        not_empty_.notify_one();

        if (capacity_ == 0) {
            // Synchronous handoff: wait for a consumer to take it
            while (popped_ < ticket && !closed_ && !token.is_cancelled()) {
                if (arm_wakeup(wake, token, lock)) {
                    continue;
                }
                taken_.wait(lock);
            }
        }

        return true;
    }

    /**
     * @brief Try to push without blocking
     *
     * With capacity 0 this succeeds only if nothing is pending, and
     * does not wait for the handoff.
     */
    bool try_push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (size_locked() >= slot_limit() || closed_) {
            return false;
        }

        stats_.push_count++;
        buffer_.push_back(std::move(item));
        ++pushed_;
        record_size();

        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop an item, blocking while empty
     * @return Item if available, nullopt if closed and empty, or cancelled
     */
    std::optional<T> pop(const CancellationToken& token = {}) {
        std::optional<CancellationRegistration> wake;
        std::unique_lock<std::mutex> lock(mutex_);

        stats_.pop_count++;

        while (buffer_.empty() && !closed_ && !token.is_cancelled()) {
            if (arm_wakeup(wake, token, lock)) {
                continue;
            }
            stats_.pop_blocked_count++;
            not_empty_.wait(lock);
        }

        if (token.is_cancelled() || buffer_.empty()) {
            return std::nullopt;
        }

        return take_front();
    }

    /**
     * @brief Pop with a deadline, racing item arrival, close and cancellation
     * @param out Receives the item when the status is PopStatus::Ok
     */
    PopStatus pop_until(
        std::optional<T>& out,
        std::chrono::steady_clock::time_point deadline,
        const CancellationToken& token = {}
    ) {
        std::optional<CancellationRegistration> wake;
        std::unique_lock<std::mutex> lock(mutex_);

        stats_.pop_count++;

        while (buffer_.empty() && !closed_ && !token.is_cancelled()) {
            if (arm_wakeup(wake, token, lock)) {
                continue;
            }
            stats_.pop_blocked_count++;
            if (not_empty_.wait_until(lock, deadline) == std::cv_status::timeout) {
                break;
            }
        }

        if (token.is_cancelled()) {
            return PopStatus::Cancelled;
        }
        if (!buffer_.empty()) {
            out.emplace(take_front());
            return PopStatus::Ok;
        }
        if (closed_) {
            return PopStatus::Closed;
        }
        return PopStatus::Timeout;
    }

    /**
     * @brief Try to pop without blocking
     * @return Item if available, nullopt if empty
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (buffer_.empty()) {
            return std::nullopt;
        }

        stats_.pop_count++;
        return take_front();
    }

    /**
     * @brief Pop with timeout
     * @return Item if available, nullopt if timeout or closed+empty
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::optional<T> out;
        pop_until(out, std::chrono::steady_clock::now() +
                       std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout));
        return out;
    }

    /**
     * @brief Close the channel (no more pushes accepted)
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
        taken_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.empty();
    }

    [[nodiscard]] bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size() >= slot_limit();
    }

    /**
     * @brief Configured capacity (0 = synchronous handoff)
     */
    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

    [[nodiscard]] QueueStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.capacity = capacity_;
        return s;
    }

private:
    [[nodiscard]] std::size_t slot_limit() const noexcept {
        return std::max<std::size_t>(capacity_, 1);
    }

    [[nodiscard]] std::size_t size_locked() const noexcept {
        return buffer_.size();
    }

    void record_size() noexcept {
        stats_.current_size = buffer_.size();
        if (stats_.current_size > stats_.high_watermark) {
            stats_.high_watermark = stats_.current_size;
        }
    }

    T take_front() {
        T item = std::move(buffer_.front());
        buffer_.pop_front();
        ++popped_;
        stats_.current_size = buffer_.size();

        not_full_.notify_one();
        taken_.notify_all();
        return item;
    }

    /**
     * @brief Register the cancellation wakeup before a call first blocks
     *
     * The registration is made with the lock released, since a token
     * that is already cancelled runs notify_all() inline. Returns true
     * when the lock was dropped and the caller must re-check its
     * wait condition.
     */
    bool arm_wakeup(
        std::optional<CancellationRegistration>& wake,
        const CancellationToken& token,
        std::unique_lock<std::mutex>& lock
    ) {
        if (wake || !token.can_be_cancelled()) {
            return false;
        }
        lock.unlock();
        wake.emplace(token, [this] { notify_all(); });
        lock.lock();
        return true;
    }

    void notify_all() {
        // Taking the lock orders the wakeup after a waiter's predicate check
        std::lock_guard<std::mutex> lock(mutex_);
        not_full_.notify_all();
        not_empty_.notify_all();
        taken_.notify_all();
    }

    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::condition_variable taken_;

    std::deque<T> buffer_;
    std::uint64_t pushed_{0};
    std::uint64_t popped_{0};
    bool closed_{false};

    QueueStats stats_;
};

} // namespace rxpipe
