/*
 * test_transaction_counter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "alpaca/transaction_counter.hpp"

#include <climits>
#include <set>
#include <thread>
#include <vector>

using skygate::alpaca::TransactionCounter;

// ============================================================================
// TransactionCounter
// ============================================================================

TEST(TransactionCounterTest, StartsAtOneAndIncrements) {
    TransactionCounter counter;
    EXPECT_EQ(counter.current(), 0);
    EXPECT_EQ(counter.next(), 1);
    EXPECT_EQ(counter.next(), 2);
    EXPECT_EQ(counter.current(), 2);
}

TEST(TransactionCounterTest, WrapsToOneAfterMaximum) {
    TransactionCounter counter(INT32_MAX - 1);
    EXPECT_EQ(counter.next(), INT32_MAX);
    EXPECT_EQ(counter.next(), 1);
}

TEST(TransactionCounterTest, ConcurrentCallersGetUniqueIds) {
    TransactionCounter counter;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 1000;

    std::vector<std::vector<std::int32_t>> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                results[t].push_back(counter.next());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::set<std::int32_t> unique;
    for (const auto& r : results) {
        unique.insert(r.begin(), r.end());
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(*unique.begin(), 1);
    EXPECT_EQ(*unique.rbegin(), kThreads * kPerThread);
}

TEST(TransactionCounterTest, NegativeStateRecovers) {
    TransactionCounter counter(-5);
    EXPECT_EQ(counter.next(), 1);
}
