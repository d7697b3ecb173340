/**
 * @file queue_test.cpp
 * @brief Unit tests for Channel
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

#include "rxpipe/core/cancellation.hpp"
#include "rxpipe/core/queue.hpp"

using namespace rxpipe;
using namespace std::chrono_literals;

class QueueTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(QueueTest, BasicPushPop) {
    Channel<int> queue(64);

    ASSERT_TRUE(queue.push(42));

    auto result = queue.pop();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST_F(QueueTest, TryPushPop) {
    Channel<int> queue(64);

    // Try pop on empty queue
    auto empty_result = queue.try_pop();
    EXPECT_FALSE(empty_result.has_value());

    ASSERT_TRUE(queue.try_push(123));

    auto result = queue.try_pop();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 123);
}

TEST_F(QueueTest, Capacity) {
    Channel<int> queue(4);

    EXPECT_EQ(queue.capacity(), 4u);
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.full());

    for (int i = 0; i < 4; i++) {
        ASSERT_TRUE(queue.try_push(i));
    }

    EXPECT_TRUE(queue.full());
    EXPECT_FALSE(queue.empty());
    EXPECT_EQ(queue.size(), 4u);

    // Should fail on full queue
    EXPECT_FALSE(queue.try_push(99));
}

TEST_F(QueueTest, FifoOrder) {
    Channel<int> queue(8);
    for (int i = 0; i < 8; i++) {
        queue.push(i);
    }
    for (int i = 0; i < 8; i++) {
        EXPECT_EQ(queue.pop().value(), i);
    }
}

TEST_F(QueueTest, Close) {
    Channel<int> queue(64);

    queue.push(1);
    queue.push(2);

    queue.close();
    EXPECT_TRUE(queue.is_closed());

    // Should fail to push after close
    EXPECT_FALSE(queue.push(3));
    EXPECT_FALSE(queue.try_push(3));

    // Should still be able to pop existing items
    auto r1 = queue.pop();
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(*r1, 1);

    auto r2 = queue.pop();
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(*r2, 2);

    // Empty and closed
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(QueueTest, CloseWakesBlockedConsumer) {
    Channel<int> queue(4);

    std::thread closer([&]() {
        std::this_thread::sleep_for(20ms);
        queue.close();
    });

    EXPECT_FALSE(queue.pop().has_value());
    closer.join();
}

TEST_F(QueueTest, UnbufferedPushWaitsForConsumer) {
    Channel<int> queue(0);
    std::atomic<bool> pushed{false};

    std::thread producer([&]() {
        queue.push(7);
        pushed.store(true);
    });

    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(pushed.load());

    auto item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, 7);

    producer.join();
    EXPECT_TRUE(pushed.load());
}

TEST_F(QueueTest, CancelledPopReturnsEmpty) {
    Channel<int> queue(4);
    CancellationSource source;

    std::thread canceller([&]() {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });

    EXPECT_FALSE(queue.pop(source.token()).has_value());
    canceller.join();
}

TEST_F(QueueTest, CancelledPushGivesUp) {
    Channel<int> queue(1);
    CancellationSource source;
    ASSERT_TRUE(queue.push(1));

    std::thread canceller([&]() {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });

    // Full queue: blocks until cancelled
    EXPECT_FALSE(queue.push(2, source.token()));
    canceller.join();

    EXPECT_EQ(queue.size(), 1u);
}

TEST_F(QueueTest, PopUntilReportsEveryOutcome) {
    Channel<int> queue(4);
    CancellationSource source;
    std::optional<int> out;

    auto status = queue.pop_until(out, std::chrono::steady_clock::now() + 10ms, source.token());
    EXPECT_EQ(status, PopStatus::Timeout);
    EXPECT_FALSE(out.has_value());

    queue.push(5);
    status = queue.pop_until(out, std::chrono::steady_clock::now() + 10ms, source.token());
    EXPECT_EQ(status, PopStatus::Ok);
    EXPECT_EQ(out.value(), 5);

    out.reset();
    queue.close();
    status = queue.pop_until(out, std::chrono::steady_clock::now() + 10ms, source.token());
    EXPECT_EQ(status, PopStatus::Closed);

    source.cancel();
    status = queue.pop_until(out, std::chrono::steady_clock::now() + 10ms, source.token());
    EXPECT_EQ(status, PopStatus::Cancelled);
}

TEST_F(QueueTest, PopForTimesOut) {
    Channel<int> queue(4);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop_for(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST_F(QueueTest, ConcurrentPushPop) {
    Channel<int> queue(1024);
    constexpr int num_items = 10000;
    std::atomic<int> produced{0};
    std::atomic<int> consumed{0};

    std::thread producer([&]() {
        for (int i = 0; i < num_items; i++) {
            queue.push(i);
            produced.fetch_add(1, std::memory_order_relaxed);
        }
    });

    std::thread consumer([&]() {
        while (consumed.load(std::memory_order_relaxed) < num_items) {
            auto item = queue.pop_for(std::chrono::milliseconds(100));
            if (item) {
                consumed.fetch_add(1, std::memory_order_relaxed);
            }
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(produced.load(), num_items);
    EXPECT_EQ(consumed.load(), num_items);
}

TEST_F(QueueTest, MultipleProducers) {
    Channel<int> queue(1024);
    constexpr int num_producers = 4;
    constexpr int items_per_producer = 1000;
    std::atomic<int> total_produced{0};
    std::atomic<int> total_consumed{0};

    std::vector<std::thread> producers;
    for (int p = 0; p < num_producers; p++) {
        producers.emplace_back([&, p]() {
            for (int i = 0; i < items_per_producer; i++) {
                queue.push(p * items_per_producer + i);
                total_produced.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    std::thread consumer([&]() {
        int target = num_producers * items_per_producer;
        while (total_consumed.load(std::memory_order_relaxed) < target) {
            auto item = queue.pop_for(std::chrono::milliseconds(100));
            if (item) {
                total_consumed.fetch_add(1, std::memory_order_relaxed);
            }
        }
    });

    for (auto& t : producers) {
        t.join();
    }
    consumer.join();

    EXPECT_EQ(total_produced.load(), num_producers * items_per_producer);
    EXPECT_EQ(total_consumed.load(), num_producers * items_per_producer);
}

TEST_F(QueueTest, Stats) {
    Channel<int> queue(64);

    queue.push(1);
    queue.push(2);
    queue.pop();

    auto stats = queue.stats();
    EXPECT_EQ(stats.push_count, 2u);
    EXPECT_EQ(stats.pop_count, 1u);
    EXPECT_EQ(stats.current_size, 1u);
    EXPECT_EQ(stats.capacity, 64u);
    EXPECT_EQ(stats.high_watermark, 2u);
}

TEST_F(QueueTest, LiveTokenOnFastPath) {
    Channel<int> queue(8);
    CancellationSource source;
    auto token = source.token();

    for (int round = 0; round < 1000; round++) {
        ASSERT_TRUE(queue.push(round, token));
        ASSERT_TRUE(queue.push(round + 1, token));
        EXPECT_EQ(queue.pop(token).value(), round);

        std::optional<int> out;
        ASSERT_EQ(queue.pop_until(out, std::chrono::steady_clock::now() + 1s, token), PopStatus::Ok);
        EXPECT_EQ(out.value(), round + 1);
    }

    auto stats = queue.stats();
    EXPECT_EQ(stats.push_blocked_count, 0u);
    EXPECT_EQ(stats.pop_blocked_count, 0u);

    // The token still reaches a later blocking call
    source.cancel();
    EXPECT_FALSE(queue.pop(token).has_value());
}

TEST_F(QueueTest, PreCancelledTokenNeverBlocks) {
    Channel<int> full(1);
    ASSERT_TRUE(full.push(1));
    Channel<int> empty(1);
    CancellationSource source;
    source.cancel();

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(full.push(2, source.token()));
    EXPECT_FALSE(empty.pop(source.token()).has_value());

    std::optional<int> out;
    EXPECT_EQ(empty.pop_until(out, std::chrono::steady_clock::now() + 10s, source.token()),
              PopStatus::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    EXPECT_EQ(full.stats().push_blocked_count, 0u);
    EXPECT_EQ(empty.stats().pop_blocked_count, 0u);
}

TEST_F(QueueTest, CancelRacingFirstWaitDoesNotHang) {
    for (int i = 0; i < 200; i++) {
        Channel<int> queue(1);
        CancellationSource source;

        // Cancel lands anywhere around the point the consumer starts waiting
        std::thread canceller([&source]() { source.cancel(); });
        EXPECT_FALSE(queue.pop(source.token()).has_value());
        canceller.join();
    }
}

TEST_F(QueueTest, CancelledHandoffReleasesProducer) {
    Channel<int> queue(0);
    CancellationSource source;
    std::atomic<bool> returned{false};

    std::thread producer([&]() {
        // Queued before the cancel, so the push still counts
        EXPECT_TRUE(queue.push(9, source.token()));
        returned = true;
    });

    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(returned.load());
    source.cancel();
    producer.join();

    EXPECT_TRUE(returned.load());
    EXPECT_EQ(queue.try_pop().value(), 9);
}
