#pragma once

#include "accessgate.hpp"
#include "ledger.hpp"
#include "matchingengine.hpp"
#include "orderbookindex.hpp"
#include "orderstore.hpp"
#include "queryfacade.hpp"
#include "settlement.hpp"
#include "trade.hpp"

#include <functional>
#include <vector>

namespace pairbook {

// Public surface of the order book: submission, cancellation and queries.
// Every mutating call is all-or-nothing; callbacks fire only after commit.
// An exception thrown by a callback propagates to the caller, but the order,
// its fills and the trade are already recorded by then.
class Exchange {
public:
    // Callback types for event notifications
    using TradeCallback = std::function<void(const Trade&)>;
    using OrderCallback = std::function<void(const OrderEvent&)>;

    explicit Exchange(TokenLedger& ledger, MatchPolicy policy = MatchPolicy::FirstCompatible,
                      OrderStore::Clock clock = {});
    Exchange(TokenLedger& ledger, const AccessGate& gate, MatchPolicy policy = MatchPolicy::FirstCompatible,
             OrderStore::Clock clock = {});

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    void setTradeCallback(TradeCallback callback);
    void setOrderCallback(OrderCallback callback);

    // Record a new Open order for maker and try once to match it.
    // Throws EngineError (AccessDenied, InvalidPair, InvalidAmounts, TransferFailure, ReentrantCall).
    OrderId createOrder(const Address& maker, const TokenId& tokenIn, const TokenId& tokenOut, Amount amountIn,
                        Amount amountOut, bool isBuyOrder);

    // Open -> Cancelled. Moves no funds.
    // Throws EngineError (AccessDenied, OrderNotFound, Unauthorized, InvalidState, ReentrantCall).
    void cancelOrder(OrderId id, const Address& caller);

    // Queries
    [[nodiscard]] BookSnapshot getOrderBook(const TokenId& tokenIn, const TokenId& tokenOut) const;
    [[nodiscard]] std::vector<OrderId> getUserOrders(const Address& user) const;
    [[nodiscard]] const Order& getOrder(OrderId id) const;

    // Every trade executed so far, oldest first
    [[nodiscard]] const std::vector<Trade>& trades() const { return m_trades; }

    // Statistics
    [[nodiscard]] size_t orderCount() const { return m_store.count(); }
    [[nodiscard]] size_t openOrderCount() const { return m_index.openCount(); }
    [[nodiscard]] size_t pairCount() const { return m_index.pairCount(); }
    [[nodiscard]] MatchPolicy matchPolicy() const { return m_matcher.policy(); }

private:
    void notify(OrderEventType type, const Order& order, Amount fillAmount);

    TokenLedger& m_ledger;
    const AccessGate& m_gate;

    OrderStore m_store;
    OrderBookIndex m_index;
    MatchingEngine m_matcher;
    SettlementExecutor m_settlement;
    QueryFacade m_queries;

    std::vector<Trade> m_trades;
    TradeCallback m_tradeCallback;
    OrderCallback m_orderCallback;

    // Set while a mutating call is in progress
    bool m_busy = false;
};

} // namespace pairbook
