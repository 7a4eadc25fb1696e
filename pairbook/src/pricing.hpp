#pragma once

#include "order.hpp"

namespace pairbook {

// Demanded ratio of an order: amountOut per unit of amountIn
struct Ratio {
    Amount out;
    Amount in;
};

// Orders ratios by cross-multiplication; 2/4 and 1/2 are equivalent keys
struct RatioLess {
    bool operator()(const Ratio& lhs, const Ratio& rhs) const
    {
        return static_cast<Wide>(lhs.out) * rhs.in < static_cast<Wide>(rhs.out) * lhs.in;
    }
};

[[nodiscard]] inline Ratio demandedRatio(const Order& order) { return {order.amountOut, order.amountIn}; }

// buy pays buy.amountIn of X for at least buy.amountOut of Y,
// sell pays sell.amountIn of Y for at least sell.amountOut of X.
// Compatible iff buy.amountIn / buy.amountOut >= sell.amountOut / sell.amountIn.
[[nodiscard]] bool pricesCross(const Order& buy, const Order& sell);

// Normalizes the two orders by side, then applies pricesCross
[[nodiscard]] bool compatible(const Order& incoming, const Order& candidate);

// Would an order demanding `ratio` accept what `incoming` offers?
[[nodiscard]] bool ratioAccepts(const Ratio& ratio, const Order& incoming);

// sell.amountOut * PRICE_SCALE / sell.amountIn, taken from whichever order sells
[[nodiscard]] Wide executionPrice(const Order& first, const Order& second);

} // namespace pairbook
