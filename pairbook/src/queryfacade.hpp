#pragma once

#include "orderbookindex.hpp"
#include "orderstore.hpp"

#include <vector>

namespace pairbook {

// Both sides of a canonical pair, including filled and cancelled entries
struct BookSnapshot {
    std::vector<Order> buyOrders;
    std::vector<Order> sellOrders;
};

class QueryFacade {
public:
    QueryFacade(const OrderStore& store, const OrderBookIndex& index);

    // Same result for (A,B) and (B,A)
    [[nodiscard]] BookSnapshot orderBook(const TokenId& tokenA, const TokenId& tokenB) const;

    [[nodiscard]] std::vector<OrderId> userOrders(const Address& user) const;

    // Throws OrderNotFound
    [[nodiscard]] const Order& order(OrderId id) const;

private:
    [[nodiscard]] std::vector<Order> resolve(const std::vector<OrderId>& ids) const;

    const OrderStore& m_store;
    const OrderBookIndex& m_index;
};

} // namespace pairbook
