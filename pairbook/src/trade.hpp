#pragma once

#include "types.hpp"

namespace pairbook {

struct Trade {
    OrderId takerOrderId; // Order whose submission triggered the match
    OrderId makerOrderId; // Counter-order that was resting in the book
    Address taker;        // Maker of the incoming order
    Address maker;        // Maker of the resting order
    Amount takerAmount;   // Paid by the taker (taker order's amountIn)
    Amount makerAmount;   // Paid by the maker (resting order's amountIn)
    Wide price;           // Sell side amountOut * PRICE_SCALE / amountIn
    Timestamp timestamp;  // Logical time of the match
};

enum class OrderEventType : uint8_t { Created = 1, Filled = 2, Cancelled = 3 };

// Created is reported after the match attempt, so an order filled on
// submission is already Filled when its Created event arrives.
struct OrderEvent {
    OrderEventType type;
    OrderId orderId;
    Address maker;
    Amount fillAmount; // Always the full amountIn for Filled, zero otherwise
};

} // namespace pairbook
