#pragma once

#include "order.hpp"

#include <functional>
#include <unordered_map>
#include <vector>

namespace pairbook {

// Owns every Order record ever accepted; records are never deleted
class OrderStore {
public:
    using Clock = std::function<Timestamp()>;

    // Uses a logical clock that ticks once per prepared order
    OrderStore();
    explicit OrderStore(Clock clock);

    // Validate terms and build an Open order with a fresh unique id.
    // Nothing is stored; throws InvalidPair or InvalidAmounts.
    [[nodiscard]] Order prepare(const Address& maker, const TokenId& tokenIn, const TokenId& tokenOut, Amount amountIn,
                                Amount amountOut, Side side);

    // Persist an order built by prepare()
    void insert(const Order& order);

    // prepare() + insert()
    OrderId submit(const Address& maker, const TokenId& tokenIn, const TokenId& tokenOut, Amount amountIn,
                   Amount amountOut, Side side);

    // Open -> Cancelled. Throws Unauthorized before InvalidState.
    void cancel(OrderId id, const Address& caller);

    // Open -> Filled. Throws InvalidState on a terminal order.
    void markFilled(OrderId id);

    // Lookup; throws OrderNotFound
    [[nodiscard]] const Order& get(OrderId id) const;
    [[nodiscard]] bool contains(OrderId id) const { return m_orders.count(id) != 0; }

    // Ids of every order a user made, in submission order
    [[nodiscard]] std::vector<OrderId> ordersOf(const Address& user) const;

    [[nodiscard]] size_t count() const { return m_orders.size(); }

private:
    [[nodiscard]] Order& find(OrderId id);

    // FNV-1a over the immutable fields, re-mixed with a salt on collision
    [[nodiscard]] OrderId deriveId(const Order& order) const;

    Clock m_clock;
    std::unordered_map<OrderId, Order> m_orders;
    std::unordered_map<Address, std::vector<OrderId>> m_userOrders;
};

} // namespace pairbook
