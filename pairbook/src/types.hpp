#pragma once

#include <cstdint>
#include <string>

namespace pairbook {

// Strong typedefs for domain clarity
using Address = std::string;   // Account identifier
using TokenId = std::string;   // Asset identifier
using Amount = uint64_t;       // Token quantity in base units
using OrderId = uint64_t;      // Unique order identifier
using Timestamp = uint64_t;    // Logical submission time
using Wide = unsigned __int128; // Cross products and fixed-point prices

// Execution prices are fixed-point with 18 decimals
constexpr Amount PRICE_SCALE = 1000000000000000000ULL;

// Buy or Sell, relative to tokenOut being the asset the maker accumulates
enum class Side : uint8_t { Buy = 1, Sell = 2 };

// Lifecycle: Open -> Filled or Open -> Cancelled, both terminal
enum class OrderStatus : uint8_t { Open = 0, Filled = 1, Cancelled = 2 };

// How the matching engine picks among compatible counter-orders
enum class MatchPolicy : uint8_t { FirstCompatible = 0, BestPrice = 1 };

[[nodiscard]] inline Side opposite(Side side) { return side == Side::Buy ? Side::Sell : Side::Buy; }

[[nodiscard]] inline const char* toString(Side side) { return side == Side::Buy ? "buy" : "sell"; }

[[nodiscard]] inline const char* toString(OrderStatus status)
{
    switch (status) {
    case OrderStatus::Open:
        return "open";
    case OrderStatus::Filled:
        return "filled";
    case OrderStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

// Decimal rendering for 128-bit values (iostreams have no overload)
[[nodiscard]] inline std::string toDecimal(Wide value)
{
    if (value == 0) {
        return "0";
    }
    std::string digits;
    while (value > 0) {
        digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    return digits;
}

} // namespace pairbook
