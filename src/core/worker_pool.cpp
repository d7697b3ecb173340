/**
 * @file worker_pool.cpp
 * @brief Worker pool implementation
 */

#include "rxpipe/core/worker_pool.hpp"

#include <stdexcept>

namespace rxpipe {

WorkerPool::WorkerPool(WorkerPoolConfig config)
    : config_(config) {
    if (config_.num_workers == 0) {
        config_.num_workers = 1;
    }

    if (config_.num_workers == 1) {
        mode_ = PoolMode::Inline;
        return;
    }

    mode_ = config_.ordered ? PoolMode::Ordered : PoolMode::Unordered;
    workers_.reserve(config_.num_workers);
    for (std::size_t i = 0; i < config_.num_workers; i++) {
        workers_.emplace_back(&WorkerPool::run, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();
    slot_free_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::submit(Task task) {
    if (mode_ == PoolMode::Inline) {
        run_inline(task);
        return;
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        slot_free_.wait(lock, [this] {
            return outstanding_ < config_.num_workers || stopping_;
        });

        if (stopping_) {
            throw std::runtime_error("WorkerPool is shutting down");
        }

        outstanding_++;
        stats_.submitted++;
        if (outstanding_ > stats_.high_watermark) {
            stats_.high_watermark = outstanding_;
        }
        queue_.push_back(Job{next_sequence_++, std::move(task)});
    }
    work_available_.notify_one();
}

void WorkerPool::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this] { return outstanding_ == 0; });

    if (first_error_) {
        auto error = first_error_;
        first_error_ = nullptr;
        lock.unlock();
        std::rethrow_exception(error);
    }
}

WorkerPoolStats WorkerPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void WorkerPool::run_inline(Task& task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.submitted++;
        stats_.high_watermark = 1;
    }

    try {
        auto callback = task();
        if (callback) {
            callback();
        }
    } catch (...) {
        record_failure(std::current_exception());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.completed++;
}

void WorkerPool::run() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] {
                return stopping_ || !queue_.empty();
            });

            // Queued work is finished before a stopping worker exits
            if (queue_.empty()) {
                return;
            }

            job = std::move(queue_.front());
            queue_.pop_front();
        }

        Callback callback;
        try {
            callback = job.task();
        } catch (...) {
            record_failure(std::current_exception());
        }

        if (mode_ == PoolMode::Unordered) {
            try {
                if (callback) {
                    callback();
                }
            } catch (...) {
                record_failure(std::current_exception());
            }
            complete_one();
            continue;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        parked_.emplace(job.sequence, std::move(callback));
        if (!releasing_) {
            release_in_order(lock);
        }
    }
}

void WorkerPool::release_in_order(std::unique_lock<std::mutex>& lock) {
    releasing_ = true;

    while (true) {
        auto it = parked_.find(next_release_);
        if (it == parked_.end()) {
            break;
        }

        auto callback = std::move(it->second);
        parked_.erase(it);
        next_release_++;

        lock.unlock();
        try {
            if (callback) {
                callback();
            }
        } catch (...) {
            record_failure(std::current_exception());
        }
        complete_one();
        lock.lock();
    }

    releasing_ = false;
}

void WorkerPool::complete_one() {
    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outstanding_--;
        stats_.completed++;
        idle = outstanding_ == 0;
    }
    slot_free_.notify_one();
    if (idle) {
        drained_.notify_all();
    }
}

void WorkerPool::record_failure(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.failed++;
    if (!first_error_) {
        first_error_ = std::move(error);
    }
}

} // namespace rxpipe
