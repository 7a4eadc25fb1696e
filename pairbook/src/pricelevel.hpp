#pragma once

#include "pricing.hpp"

#include <list>

namespace pairbook {

// Open orders resting at one demanded ratio, oldest first
class PriceLevel {
public:
    using Position = std::list<OrderId>::iterator;

    explicit PriceLevel(Ratio ratio);

    // Getters
    [[nodiscard]] Ratio ratio() const { return m_ratio; }
    [[nodiscard]] int orderCount() const { return static_cast<int>(m_orders.size()); }
    [[nodiscard]] bool empty() const { return m_orders.empty(); }

    // Add order to back of queue (time priority)
    Position addOrder(OrderId id);

    // Remove order at a position returned by addOrder
    void removeOrder(Position position);

    [[nodiscard]] OrderId front() const { return m_orders.front(); }

    [[nodiscard]] auto begin() const { return m_orders.begin(); }
    [[nodiscard]] auto end() const { return m_orders.end(); }

private:
    Ratio m_ratio;
    std::list<OrderId> m_orders; // FIFO queue (list for stable iterators)
};

} // namespace pairbook
