#include "orderbookindex.hpp"
#include "errors.hpp"

#include <string>

namespace pairbook {

PairKey canonicalKey(const TokenId& tokenA, const TokenId& tokenB)
{
    if (tokenB < tokenA) {
        return {tokenB, tokenA};
    }
    return {tokenA, tokenB};
}

void OpenQueue::add(const Order& order)
{
    if (m_handles.count(order.id)) {
        return;
    }

    Handle handle{};
    handle.arrival = m_arrivals.insert(m_arrivals.end(), order.id);

    Ratio ratio = demandedRatio(order);
    auto [level, inserted] = m_ladder.try_emplace(ratio, ratio);
    handle.level = level;
    handle.position = level->second.addOrder(order.id);

    m_handles.emplace(order.id, handle);
}

bool OpenQueue::remove(OrderId id)
{
    auto iterator = m_handles.find(id);
    if (iterator == m_handles.end()) {
        return false;
    }

    const Handle& handle = iterator->second;
    m_arrivals.erase(handle.arrival);
    handle.level->second.removeOrder(handle.position);

    // Remove empty level
    if (handle.level->second.empty()) {
        m_ladder.erase(handle.level);
    }

    m_handles.erase(iterator);
    return true;
}

void OrderBookIndex::append(const Order& order)
{
    if (!m_indexed.insert(order.id).second) {
        throw EngineError(ErrorCode::InvalidState, "order already indexed: " + std::to_string(order.id));
    }

    PairBook& book = m_books[canonicalKey(order.tokenIn, order.tokenOut)];
    if (order.side == Side::Buy) {
        book.buyOrders.push_back(order.id);
    } else {
        book.sellOrders.push_back(order.id);
    }

    if (order.isOpen()) {
        m_open[{order.tokenIn, order.tokenOut, order.side}].add(order);
    }
}

void OrderBookIndex::removeOpen(const Order& order)
{
    auto iterator = m_open.find({order.tokenIn, order.tokenOut, order.side});
    if (iterator == m_open.end()) {
        return;
    }
    iterator->second.remove(order.id);
}

const OrderBookIndex::PairBook& OrderBookIndex::view(const PairKey& key) const
{
    static const PairBook empty{};

    auto iterator = m_books.find(key);
    if (iterator == m_books.end()) {
        return empty;
    }
    return iterator->second;
}

const OpenQueue* OrderBookIndex::openQueue(const TokenId& tokenIn, const TokenId& tokenOut, Side side) const
{
    auto iterator = m_open.find({tokenIn, tokenOut, side});
    if (iterator == m_open.end()) {
        return nullptr;
    }
    return &iterator->second;
}

size_t OrderBookIndex::openCount() const
{
    size_t total = 0;
    for (const auto& [key, queue] : m_open) {
        total += queue.size();
    }
    return total;
}

} // namespace pairbook
