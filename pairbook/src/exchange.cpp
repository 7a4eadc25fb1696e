#include "exchange.hpp"
#include "errors.hpp"

#include <optional>
#include <string>
#include <utility>

namespace pairbook {

namespace {

const OpenGate s_openGate{};

// Rejects a mutating call that starts while another one is still running
class CallGuard {
public:
    explicit CallGuard(bool& busy) : m_busy(busy)
    {
        if (m_busy) {
            throw EngineError(ErrorCode::ReentrantCall, "exchange is already processing a call");
        }
        m_busy = true;
    }

    ~CallGuard() { m_busy = false; }

    CallGuard(const CallGuard&) = delete;
    CallGuard& operator=(const CallGuard&) = delete;

private:
    bool& m_busy;
};

} // namespace

Exchange::Exchange(TokenLedger& ledger, MatchPolicy policy, OrderStore::Clock clock)
    : Exchange(ledger, s_openGate, policy, std::move(clock))
{
}

Exchange::Exchange(TokenLedger& ledger, const AccessGate& gate, MatchPolicy policy, OrderStore::Clock clock)
    : m_ledger(ledger),
      m_gate(gate),
      m_store(std::move(clock)),
      m_matcher(m_store, m_index, policy),
      m_settlement(m_ledger, m_store, m_index),
      m_queries(m_store, m_index)
{
}

void Exchange::setTradeCallback(TradeCallback callback) { m_tradeCallback = std::move(callback); }

void Exchange::setOrderCallback(OrderCallback callback) { m_orderCallback = std::move(callback); }

OrderId Exchange::createOrder(const Address& maker, const TokenId& tokenIn, const TokenId& tokenOut, Amount amountIn,
                              Amount amountOut, bool isBuyOrder)
{
    CallGuard guard(m_busy);

    if (!m_gate.permits(Operation::CreateOrder, maker)) {
        throw EngineError(ErrorCode::AccessDenied, "order creation refused for " + maker);
    }

    Order order = m_store.prepare(maker, tokenIn, tokenOut, amountIn, amountOut, isBuyOrder ? Side::Buy : Side::Sell);

    // Settle before anything is stored so a failed transfer leaves no trace
    std::optional<Trade> trade;
    if (auto counterId = m_matcher.findCounterOrder(order)) {
        trade = m_settlement.settle(order, *counterId, order.creationTime);
    }

    m_store.insert(order);
    m_index.append(order);
    if (trade.has_value()) {
        m_trades.push_back(*trade);
    }

    // Everything is recorded; an observer that throws from here on cannot undo the commit
    notify(OrderEventType::Created, order, 0);
    if (trade.has_value()) {
        notify(OrderEventType::Filled, m_store.get(trade->makerOrderId), trade->makerAmount);
        notify(OrderEventType::Filled, order, trade->takerAmount);
        if (m_tradeCallback != nullptr) {
            m_tradeCallback(*trade);
        }
    }

    return order.id;
}

void Exchange::cancelOrder(OrderId id, const Address& caller)
{
    CallGuard guard(m_busy);

    if (!m_gate.permits(Operation::CancelOrder, caller)) {
        throw EngineError(ErrorCode::AccessDenied, "order cancellation refused for " + caller);
    }

    m_store.cancel(id, caller);

    const Order& order = m_store.get(id);
    m_index.removeOpen(order);

    notify(OrderEventType::Cancelled, order, 0);
}

BookSnapshot Exchange::getOrderBook(const TokenId& tokenIn, const TokenId& tokenOut) const
{
    return m_queries.orderBook(tokenIn, tokenOut);
}

std::vector<OrderId> Exchange::getUserOrders(const Address& user) const { return m_queries.userOrders(user); }

const Order& Exchange::getOrder(OrderId id) const { return m_queries.order(id); }

void Exchange::notify(OrderEventType type, const Order& order, Amount fillAmount)
{
    if (m_orderCallback != nullptr) {
        m_orderCallback({type, order.id, order.maker, fillAmount});
    }
}

} // namespace pairbook
