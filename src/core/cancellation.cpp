/**
 * @file cancellation.cpp
 * @brief Cancellation state implementation
 */

#include "rxpipe/core/cancellation.hpp"

namespace rxpipe {

namespace detail {

CancellationState::~CancellationState() = default;

bool CancellationState::cancel() {
    std::map<std::uint64_t, Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return false;
        }
        cancelled_ = true;
        invoking_ = true;
        invoker_ = std::this_thread::get_id();
        callbacks.swap(callbacks_);
    }
    cv_.notify_all();

    for (auto& [id, callback] : callbacks) {
        (void)id;
        callback();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        invoking_ = false;
    }
    cv_.notify_all();
    return true;
}

bool CancellationState::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationState::wait_until(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_until(lock, deadline, [this] { return cancelled_; });
}

std::uint64_t CancellationState::add_callback(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            auto id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationState::remove_callback(std::uint64_t id) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (callbacks_.erase(id) > 0) {
        return;
    }
    // Already handed to cancel(); wait for it unless we are the invoker
    if (invoking_ && invoker_ != std::this_thread::get_id()) {
        cv_.wait(lock, [this] { return !invoking_; });
    }
}

void CancellationState::set_parent_link(std::unique_ptr<CancellationRegistrationBase> link) {
    std::lock_guard<std::mutex> lock(mutex_);
    parent_link_ = std::move(link);
}

} // namespace detail

bool CancellationToken::wait_until(std::chrono::steady_clock::time_point deadline) const {
    if (!state_) {
        std::this_thread::sleep_until(deadline);
        return false;
    }
    return state_->wait_until(deadline);
}

CancellationRegistration::CancellationRegistration(
    const CancellationToken& token,
    std::function<void()> callback
)
    : state_(token.state_) {
    if (state_) {
        id_ = state_->add_callback(std::move(callback));
    }
}

CancellationRegistration::~CancellationRegistration() {
    if (state_ && id_ != 0) {
        state_->remove_callback(id_);
    }
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource CancellationSource::linked_to(const CancellationToken& parent) {
    CancellationSource child;
    if (parent.can_be_cancelled()) {
        std::weak_ptr<detail::CancellationState> weak = child.state_;
        auto link = std::make_unique<CancellationRegistration>(parent, [weak]() {
            if (auto state = weak.lock()) {
                state->cancel();
            }
        });
        child.state_->set_parent_link(std::move(link));
    }
    return child;
}

} // namespace rxpipe
