/**
 * @file filter_test.cpp
 * @brief Tests for filter and take
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "rxpipe/rxpipe.hpp"

using namespace rxpipe;
using namespace std::chrono_literals;

namespace {

// Keeps even values, fails on 3
Result<bool> even_or_fail(std::int64_t value, std::size_t) {
    if (value == 3) {
        return Result<bool>::err(std::runtime_error("cannot judge 3"));
    }
    return Result<bool>::ok(value % 2 == 0);
}

Stream<std::int64_t> failing_at(std::int64_t bad, std::int64_t count) {
    return map(range(0, count), [bad](std::int64_t v, std::size_t) -> std::int64_t {
        if (v == bad) {
            throw std::runtime_error("failed at " + std::to_string(v));
        }
        return v;
    });
}

} // namespace

class FilterTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(FilterTest, KeepsMatchingValues) {
    auto results = collect(filter(range(0, 10), [](std::int64_t v, std::size_t) {
        return v % 3 == 0;
    }));

    std::vector<std::int64_t> values;
    for (const auto& r : results) {
        values.push_back(r.value());
    }
    EXPECT_EQ(values, (std::vector<std::int64_t>{0, 3, 6, 9}));
}

TEST_F(FilterTest, PassesIndex) {
    auto results = collect(filter(from_sequence(std::vector<int>{5, 5, 5, 5}),
        [](int, std::size_t index) {
            return index % 2 == 1;
        }));

    EXPECT_EQ(results.size(), 2u);
}

TEST_F(FilterTest, PredicateFailureIsEmitted) {
    auto results = collect(filter(range(0, 5), even_or_fail));

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].value(), 0);
    EXPECT_EQ(results[1].value(), 2);
    ASSERT_TRUE(results[2].is_err());
    EXPECT_EQ(results[2].error_message(), "cannot judge 3");
    EXPECT_EQ(results[3].value(), 4);
}

TEST_F(FilterTest, ThrowingPredicateIsCaptured) {
    auto results = collect(filter(range(0, 3), [](std::int64_t v, std::size_t) -> bool {
        if (v == 2) {
            throw std::invalid_argument("two");
        }
        return true;
    }));

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].is_ok());
    EXPECT_TRUE(results[1].is_ok());
    EXPECT_THROW((void)results[2].value(), std::invalid_argument);
}

TEST_F(FilterTest, SourceFailurePassesThrough) {
    auto results = collect(filter(failing_at(1, 4), [](std::int64_t, std::size_t) {
        return false;
    }));

    // Everything rejected except the failure
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error_message(), "failed at 1");
}

TEST_F(FilterTest, UnorderedPoolProducesSameSet) {
    auto results = collect(filter(range(0, 5), even_or_fail, with_pool_size(4)));

    ASSERT_EQ(results.size(), 4u);
    std::vector<std::int64_t> values;
    for (const auto& r : results) {
        if (r.is_ok()) {
            values.push_back(r.value());
        }
    }
    std::sort(values.begin(), values.end());
    EXPECT_EQ(values, (std::vector<std::int64_t>{0, 2, 4}));
}

TEST_F(FilterTest, OrderedPoolPreservesSourceOrder) {
    auto results = collect(filter(range(0, 5), even_or_fail, with_pool_size(4), with_ordered_output()));

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].value(), 0);
    EXPECT_EQ(results[1].value(), 2);
    EXPECT_TRUE(results[2].is_err());
    EXPECT_EQ(results[3].value(), 4);
}

TEST_F(FilterTest, TakeFirstN) {
    auto results = collect(take(range(0, 100), 5));

    ASSERT_EQ(results.size(), 5u);
    for (std::size_t i = 0; i < 5; i++) {
        EXPECT_EQ(results[i].value(), static_cast<std::int64_t>(i));
    }
}

TEST_F(FilterTest, TakeZeroIsEmpty) {
    auto stream = take(range(0, 100), 0);
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(FilterTest, TakeFromShortSource) {
    EXPECT_EQ(collect(take(range(0, 3), 10)).size(), 3u);
}

TEST_F(FilterTest, TakeStopsAtFirstFailure) {
    auto results = collect(take(failing_at(2, 10), 5));

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].value(), 0);
    EXPECT_EQ(results[1].value(), 1);
    ASSERT_TRUE(results[2].is_err());
    EXPECT_EQ(results[2].error_message(), "failed at 2");
}

TEST_F(FilterTest, TakeIgnoresFailureAfterLimit) {
    auto results = collect(take(failing_at(5, 10), 3));

    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) {
        EXPECT_TRUE(r.is_ok());
    }
}

TEST_F(FilterTest, TakeEndsInfiniteSource) {
    auto results = collect(take(interval(1ms), 4));
    EXPECT_EQ(results.size(), 4u);
    EXPECT_EQ(results.back().value(), 3);
}

TEST_F(FilterTest, TakeStopsWhenCancelled) {
    CancellationSource cancel;
    auto stream = take(interval(5ms), 1000, with_cancellation(cancel.token()));

    ASSERT_TRUE(stream.next().has_value());
    cancel.cancel();
    EXPECT_LE(collect(stream).size(), 1u);
}

TEST_F(FilterTest, MoveOnlyElements) {
    // Built by map so the stream carries a failure at 4 as well
    auto boxed = map(range(0, 8), [](std::int64_t v, std::size_t) {
        if (v == 4) {
            throw std::runtime_error("no box for 4");
        }
        return std::make_unique<std::int64_t>(v);
    });

    auto results = collect(filter(std::move(boxed),
        [](const std::unique_ptr<std::int64_t>& p, std::size_t) { return *p % 2 == 0; },
        with_pool_size(3), with_ordered_output()));

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(*results[0].value(), 0);
    EXPECT_EQ(*results[1].value(), 2);
    ASSERT_TRUE(results[2].is_err());
    EXPECT_EQ(results[2].error_message(), "no box for 4");
    EXPECT_EQ(*results[3].value(), 6);
}
