#pragma once

/**
 * @file ticker.hpp
 * @brief Periodic deadline tracker owned by a single stage loop
 */

#include <chrono>
#include <cstdint>

namespace rxpipe {

/**
 * @brief Periodic timer handle
 *
 * A Ticker does not own a thread. The owning loop waits until
 * next_fire() and then calls fire() to move to the next period.
 * Missed periods are skipped so ticks stay on the original phase.
 */
class Ticker {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Start a ticker whose first firing is one period from now
     * @throws std::invalid_argument if period is not positive
     */
    explicit Ticker(Clock::duration period);

    /**
     * @brief Time of the next firing (time_point::max() when stopped)
     */
    [[nodiscard]] Clock::time_point next_fire() const noexcept { return next_; }

    [[nodiscard]] bool expired(Clock::time_point now = Clock::now()) const noexcept {
        return active_ && now >= next_;
    }

    /**
     * @brief Acknowledge a firing and advance to the next period boundary
     */
    void fire(Clock::time_point now = Clock::now());

    /**
     * @brief Restart the phase: next firing is one period after now
     */
    void reset(Clock::time_point now = Clock::now());

    /**
     * @brief Disarm the ticker
     */
    void stop() noexcept;

    [[nodiscard]] bool active() const noexcept { return active_; }
    [[nodiscard]] Clock::duration period() const noexcept { return period_; }
    [[nodiscard]] std::uint64_t fired() const noexcept { return fired_; }

private:
    Clock::duration period_;
    Clock::time_point next_;
    bool active_{true};
    std::uint64_t fired_{0};
};

} // namespace rxpipe
