#include "pricing.hpp"

namespace pairbook {

bool pricesCross(const Order& buy, const Order& sell)
{
    return static_cast<Wide>(buy.amountIn) * sell.amountIn >= static_cast<Wide>(buy.amountOut) * sell.amountOut;
}

bool compatible(const Order& incoming, const Order& candidate)
{
    if (incoming.side == Side::Buy) {
        return pricesCross(incoming, candidate);
    }
    return pricesCross(candidate, incoming);
}

bool ratioAccepts(const Ratio& ratio, const Order& incoming)
{
    // ratio.out / ratio.in <= incoming.amountIn / incoming.amountOut
    return static_cast<Wide>(ratio.out) * incoming.amountOut <= static_cast<Wide>(incoming.amountIn) * ratio.in;
}

Wide executionPrice(const Order& first, const Order& second)
{
    const Order& sell = first.side == Side::Sell ? first : second;
    return static_cast<Wide>(sell.amountOut) * PRICE_SCALE / sell.amountIn;
}

} // namespace pairbook
