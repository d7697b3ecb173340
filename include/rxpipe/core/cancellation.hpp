#pragma once

/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation shared by every stage of a pipeline
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace rxpipe {

namespace detail {

class CancellationRegistrationBase {
public:
    virtual ~CancellationRegistrationBase() = default;
};

/**
 * @brief Shared cancellation state
 *
 * Callbacks run on the cancelling thread, outside the state lock.
 * Deregistration from another thread blocks until a running callback
 * batch has finished, so a registration never outlives its callback.
 */
class CancellationState {
public:
    using Callback = std::function<void()>;

    CancellationState() = default;
    ~CancellationState();

    CancellationState(const CancellationState&) = delete;
    CancellationState& operator=(const CancellationState&) = delete;

    /**
     * @brief Request cancellation
     * @return true if this call performed the cancellation
     */
    bool cancel();

    [[nodiscard]] bool is_cancelled() const;

    /**
     * @brief Block until cancelled or the deadline passes
     * @return true if cancelled
     */
    bool wait_until(std::chrono::steady_clock::time_point deadline) const;

    /**
     * @brief Register a callback; runs it immediately if already cancelled
     * @return Registration id, 0 when the callback already ran
     */
    std::uint64_t add_callback(Callback callback);

    void remove_callback(std::uint64_t id);

    /**
     * @brief Keep a parent registration alive as long as this state
     */
    void set_parent_link(std::unique_ptr<CancellationRegistrationBase> link);

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_{false};
    bool invoking_{false};
    std::thread::id invoker_;
    std::uint64_t next_id_{1};
    std::map<std::uint64_t, Callback> callbacks_;
    std::unique_ptr<CancellationRegistrationBase> parent_link_;
};

} // namespace detail

/**
 * @brief Read-only view of a cancellation state
 *
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const {
        return state_ && state_->is_cancelled();
    }

    [[nodiscard]] bool can_be_cancelled() const noexcept {
        return static_cast<bool>(state_);
    }

    /**
     * @brief Sleep until the deadline, waking early on cancellation
     * @return true if cancelled
     */
    bool wait_until(std::chrono::steady_clock::time_point deadline) const;

    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        return wait_until(std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout));
    }

private:
    friend class CancellationSource;
    friend class CancellationRegistration;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief RAII callback registration on a token
 *
 * The callback fires once when the token is cancelled, or immediately
 * if it already is. Destruction unregisters it.
 */
class CancellationRegistration : public detail::CancellationRegistrationBase {
public:
    CancellationRegistration(const CancellationToken& token, std::function<void()> callback);
    ~CancellationRegistration() override;

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t id_{0};
};

/**
 * @brief Owner side of a cancellation state
 */
class CancellationSource {
public:
    CancellationSource();

    /**
     * @brief Create a source that is also cancelled when parent is
     */
    static CancellationSource linked_to(const CancellationToken& parent);

    [[nodiscard]] CancellationToken token() const {
        return CancellationToken(state_);
    }

    /**
     * @brief Cancel every token issued by this source
     * @return true if this call performed the cancellation
     */
    bool cancel() { return state_->cancel(); }

    [[nodiscard]] bool is_cancelled() const { return state_->is_cancelled(); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace rxpipe
