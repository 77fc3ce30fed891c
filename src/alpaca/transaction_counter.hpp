/*
 * transaction_counter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-1

Description: Wrapping Alpaca transaction id counter

**************************************************/

#ifndef SKYGATE_ALPACA_TRANSACTION_COUNTER_HPP
#define SKYGATE_ALPACA_TRANSACTION_COUNTER_HPP

#include <atomic>
#include <cstdint>

namespace skygate::alpaca {

/**
 * @brief Lock-free transaction id source
 *
 * Values increase by one per call. Past INT32_MAX the counter wraps to 1,
 * so 0 always means "not assigned". The reflector draws its
 * ServerTransactionID from it and the client its ClientTransactionID.
 */
class TransactionCounter {
public:
    explicit TransactionCounter(std::int32_t start = 0) : value_(start) {}

    TransactionCounter(const TransactionCounter&) = delete;
    TransactionCounter& operator=(const TransactionCounter&) = delete;

    auto next() noexcept -> std::int32_t;

    [[nodiscard]] auto current() const noexcept -> std::int32_t {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::int32_t> value_;
};

}  // namespace skygate::alpaca

#endif  // SKYGATE_ALPACA_TRANSACTION_COUNTER_HPP
