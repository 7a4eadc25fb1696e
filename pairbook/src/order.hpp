#pragma once

#include "types.hpp"

namespace pairbook {

struct Order {
    OrderId id;             // Digest of the immutable fields
    Address maker;          // Owner of the order
    TokenId tokenIn;        // Asset offered
    TokenId tokenOut;       // Asset demanded
    Amount amountIn;        // Quantity offered
    Amount amountOut;       // Minimum quantity demanded in return
    Side side;              // Buy or Sell
    Timestamp creationTime; // Logical submission time (id derivation and audit only)
    OrderStatus status;     // Only this field ever changes

    [[nodiscard]] bool isOpen() const { return status == OrderStatus::Open; }

    // True if other trades the same two tokens in the opposite direction
    [[nodiscard]] bool mirrors(const Order& other) const
    {
        return tokenIn == other.tokenOut && tokenOut == other.tokenIn;
    }
};

} // namespace pairbook
