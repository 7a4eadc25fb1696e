#pragma once

#include "pricelevel.hpp"

#include <functional>
#include <list>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pairbook {

// Token pair sorted into canonical order: (A,B) and (B,A) give the same key
struct PairKey {
    TokenId first;
    TokenId second;

    bool operator==(const PairKey& other) const { return first == other.first && second == other.second; }
};

struct PairKeyHash {
    size_t operator()(const PairKey& key) const
    {
        size_t seed = std::hash<TokenId>{}(key.first);
        return seed ^ (std::hash<TokenId>{}(key.second) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
    }
};

[[nodiscard]] PairKey canonicalKey(const TokenId& tokenA, const TokenId& tokenB);

// Open orders of one side trading tokenIn for tokenOut.
// Indexed twice: by arrival and by demanded ratio (FIFO within a ratio).
class OpenQueue {
public:
    using Ladder = std::map<Ratio, PriceLevel, RatioLess>;

    void add(const Order& order);
    bool remove(OrderId id);

    // Oldest first
    [[nodiscard]] const std::list<OrderId>& arrivals() const { return m_arrivals; }

    // Lowest demanded ratio first
    [[nodiscard]] const Ladder& ladder() const { return m_ladder; }

    [[nodiscard]] bool empty() const { return m_arrivals.empty(); }
    [[nodiscard]] size_t size() const { return m_arrivals.size(); }

private:
    struct Handle {
        std::list<OrderId>::iterator arrival;
        Ladder::iterator level;
        PriceLevel::Position position;
    };

    std::list<OrderId> m_arrivals;
    Ladder m_ladder;
    std::unordered_map<OrderId, Handle> m_handles;
};

class OrderBookIndex {
public:
    // Append-only history of one canonical pair
    struct PairBook {
        std::vector<OrderId> buyOrders;
        std::vector<OrderId> sellOrders;
    };

    // Record the order in its pair's history; Open orders also join the open queue
    void append(const Order& order);

    // Drop a no longer Open order from the open queue; history is untouched
    void removeOpen(const Order& order);

    // Both history sequences verbatim (empty for an unknown pair)
    [[nodiscard]] const PairBook& view(const PairKey& key) const;

    // Open orders of `side` offering tokenIn for tokenOut, or nullptr if none ever rested
    [[nodiscard]] const OpenQueue* openQueue(const TokenId& tokenIn, const TokenId& tokenOut, Side side) const;

    [[nodiscard]] size_t pairCount() const { return m_books.size(); }
    [[nodiscard]] size_t openCount() const;

private:
    struct QueueKey {
        TokenId tokenIn;
        TokenId tokenOut;
        Side side;

        bool operator<(const QueueKey& other) const
        {
            if (tokenIn != other.tokenIn) {
                return tokenIn < other.tokenIn;
            }
            if (tokenOut != other.tokenOut) {
                return tokenOut < other.tokenOut;
            }
            return side < other.side;
        }
    };

    std::unordered_map<PairKey, PairBook, PairKeyHash> m_books;
    std::map<QueueKey, OpenQueue> m_open;
    std::unordered_set<OrderId> m_indexed;
};

} // namespace pairbook
