#pragma once

#include "orderbookindex.hpp"
#include "orderstore.hpp"

#include <optional>

namespace pairbook {

// Finds the counter-order a newly submitted order settles against.
// Candidates are Open orders of the opposite side trading the same two tokens
// in the mirrored direction, made by someone else, whose terms cross.
class MatchingEngine {
public:
    MatchingEngine(const OrderStore& store, const OrderBookIndex& index, MatchPolicy policy);

    // Read-only; one candidate at most, both orders are consumed whole on a match
    [[nodiscard]] std::optional<OrderId> findCounterOrder(const Order& incoming) const;

    [[nodiscard]] MatchPolicy policy() const { return m_policy; }

private:
    // Oldest crossing candidate wins regardless of price
    [[nodiscard]] std::optional<OrderId> firstCompatible(const Order& incoming, const OpenQueue& queue) const;

    // Lowest demanded ratio wins, oldest first within a ratio
    [[nodiscard]] std::optional<OrderId> bestPrice(const Order& incoming, const OpenQueue& queue) const;

    [[nodiscard]] bool eligible(const Order& incoming, const Order& candidate) const;

    const OrderStore& m_store;
    const OrderBookIndex& m_index;
    MatchPolicy m_policy;
};

} // namespace pairbook
