#pragma once

/**
 * @file worker_pool.hpp
 * @brief Bounded worker pool used by pooled operators
 */

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace rxpipe {

/**
 * @brief Execution strategy selected from the pool configuration
 */
enum class PoolMode {
    Inline,      // Run on the submitting thread
    Unordered,   // Concurrent, results released as they complete
    Ordered      // Concurrent, results released in submission order
};

/**
 * @brief Worker pool statistics
 */
struct WorkerPoolStats {
    std::uint64_t submitted{0};
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::size_t high_watermark{0};
};

/**
 * @brief Configuration for worker pool
 */
struct WorkerPoolConfig {
    std::size_t num_workers{1};  // <= 1 = inline
    bool ordered{false};
};

/**
 * @brief Pool of worker threads with bounded outstanding work
 *
 * A task runs on a worker and returns a callback holding its
 * observable side effect. In unordered mode the callback runs as soon
 * as its task finishes; in ordered mode callbacks are released in
 * submission order, one at a time.
 *
 * submit() blocks while num_workers tasks are outstanding (queued,
 * running or waiting for release). An exception escaping a task or
 * callback is recorded and rethrown by the next drain().
 */
class WorkerPool {
public:
    using Callback = std::function<void()>;
    using Task = std::function<Callback()>;

    explicit WorkerPool(WorkerPoolConfig config = {});

    /**
     * @brief Finishes queued work, then joins the workers
     */
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Schedule a task
     * @throws std::runtime_error if the pool is shutting down
     */
    void submit(Task task);

    /**
     * @brief Block until every submitted task has completed and released
     *
     * Rethrows the first exception recorded since the last drain.
     */
    void drain();

    [[nodiscard]] PoolMode mode() const noexcept { return mode_; }

    [[nodiscard]] std::size_t num_workers() const noexcept {
        return config_.num_workers;
    }

    [[nodiscard]] WorkerPoolStats stats() const;

private:
    struct Job {
        std::uint64_t sequence;
        Task task;
    };

    void run();
    void run_inline(Task& task);
    void release_in_order(std::unique_lock<std::mutex>& lock);
    void complete_one();
    void record_failure(std::exception_ptr error);

    WorkerPoolConfig config_;
    PoolMode mode_;

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable slot_free_;
    std::condition_variable drained_;

    std::deque<Job> queue_;
    std::size_t outstanding_{0};
    std::uint64_t next_sequence_{0};
    std::uint64_t next_release_{0};
    std::map<std::uint64_t, Callback> parked_;
    bool releasing_{false};
    bool stopping_{false};
    std::exception_ptr first_error_;
    WorkerPoolStats stats_;

    std::vector<std::thread> workers_;
};

} // namespace rxpipe
