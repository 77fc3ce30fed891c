/*
 * transaction_counter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "transaction_counter.hpp"

#include "ascom_types.hpp"

namespace skygate::alpaca {

auto TransactionCounter::next() noexcept -> std::int32_t {
    std::int32_t current = value_.load(std::memory_order_relaxed);
    std::int32_t desired;
    do {
        desired = (current >= kMaxTransactionId || current < 0) ? 1
                                                                : current + 1;
    } while (!value_.compare_exchange_weak(current, desired,
                                           std::memory_order_relaxed));
    return desired;
}

}  // namespace skygate::alpaca
