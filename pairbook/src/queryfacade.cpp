#include "queryfacade.hpp"

namespace pairbook {

QueryFacade::QueryFacade(const OrderStore& store, const OrderBookIndex& index) : m_store(store), m_index(index) {}

BookSnapshot QueryFacade::orderBook(const TokenId& tokenA, const TokenId& tokenB) const
{
    const auto& book = m_index.view(canonicalKey(tokenA, tokenB));
    return {resolve(book.buyOrders), resolve(book.sellOrders)};
}

std::vector<OrderId> QueryFacade::userOrders(const Address& user) const { return m_store.ordersOf(user); }

const Order& QueryFacade::order(OrderId id) const { return m_store.get(id); }

std::vector<Order> QueryFacade::resolve(const std::vector<OrderId>& ids) const
{
    std::vector<Order> orders;
    orders.reserve(ids.size());
    for (OrderId id : ids) {
        orders.push_back(m_store.get(id));
    }
    return orders;
}

} // namespace pairbook
