/**
 * @file ticker.cpp
 * @brief Ticker implementation
 */

#include "rxpipe/core/ticker.hpp"

#include <stdexcept>

namespace rxpipe {

Ticker::Ticker(Clock::duration period)
    : period_(period) {
    if (period_ <= Clock::duration::zero()) {
        throw std::invalid_argument("Ticker period must be positive");
    }
    next_ = Clock::now() + period_;
}

void Ticker::fire(Clock::time_point now) {
    if (!active_) {
        return;
    }
    fired_++;
    next_ += period_;
    if (next_ <= now) {
        auto missed = (now - next_) / period_ + 1;
        next_ += period_ * missed;
    }
}

void Ticker::reset(Clock::time_point now) {
    active_ = true;
    next_ = now + period_;
}

void Ticker::stop() noexcept {
    active_ = false;
    next_ = Clock::time_point::max();
}

} // namespace rxpipe
