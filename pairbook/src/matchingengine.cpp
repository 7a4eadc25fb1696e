#include "matchingengine.hpp"
#include "pricing.hpp"

namespace pairbook {

MatchingEngine::MatchingEngine(const OrderStore& store, const OrderBookIndex& index, MatchPolicy policy)
    : m_store(store), m_index(index), m_policy(policy)
{
}

std::optional<OrderId> MatchingEngine::findCounterOrder(const Order& incoming) const
{
    // Counter-orders offer what the incoming order wants
    const OpenQueue* queue = m_index.openQueue(incoming.tokenOut, incoming.tokenIn, opposite(incoming.side));
    if (queue == nullptr || queue->empty()) {
        return std::nullopt;
    }

    if (m_policy == MatchPolicy::BestPrice) {
        return bestPrice(incoming, *queue);
    }
    return firstCompatible(incoming, *queue);
}

std::optional<OrderId> MatchingEngine::firstCompatible(const Order& incoming, const OpenQueue& queue) const
{
    for (OrderId id : queue.arrivals()) {
        const Order& candidate = m_store.get(id);
        if (eligible(incoming, candidate) && compatible(incoming, candidate)) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<OrderId> MatchingEngine::bestPrice(const Order& incoming, const OpenQueue& queue) const
{
    for (const auto& [ratio, level] : queue.ladder()) {
        // Levels only get more demanding from here
        if (!ratioAccepts(ratio, incoming)) {
            break;
        }
        for (OrderId id : level) {
            if (eligible(incoming, m_store.get(id))) {
                return id;
            }
        }
    }
    return std::nullopt;
}

bool MatchingEngine::eligible(const Order& incoming, const Order& candidate) const
{
    if (!candidate.isOpen()) {
        return false;
    }
    // No self-trade
    if (candidate.maker == incoming.maker) {
        return false;
    }
    return candidate.side == opposite(incoming.side) && candidate.mirrors(incoming);
}

} // namespace pairbook
