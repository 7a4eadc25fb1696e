#include "settlement.hpp"
#include "errors.hpp"
#include "pricing.hpp"

#include <exception>
#include <string>

namespace pairbook {

SettlementExecutor::SettlementExecutor(TokenLedger& ledger, OrderStore& store, OrderBookIndex& index)
    : m_ledger(ledger), m_store(store), m_index(index)
{
}

Trade SettlementExecutor::settle(Order& incoming, OrderId restingId, Timestamp execTime)
{
    const Order& resting = m_store.get(restingId);
    if (!incoming.isOpen() || !resting.isOpen()) {
        throw EngineError(ErrorCode::InvalidState, "settlement requires two Open orders");
    }

    transferLeg(incoming, resting);
    try {
        transferLeg(resting, incoming);
    } catch (const EngineError&) {
        m_ledger.reverseTransfer(incoming.tokenIn, incoming.maker, resting.maker, incoming.amountIn);
        throw;
    }

    Trade trade{};
    trade.takerOrderId = incoming.id;
    trade.makerOrderId = resting.id;
    trade.taker = incoming.maker;
    trade.maker = resting.maker;
    trade.takerAmount = incoming.amountIn;
    trade.makerAmount = resting.amountIn;
    trade.price = executionPrice(incoming, resting);
    trade.timestamp = execTime;

    // Transfers are done; the status writes below cannot fail
    m_index.removeOpen(resting);
    m_store.markFilled(restingId);
    incoming.status = OrderStatus::Filled;

    return trade;
}

void SettlementExecutor::transferLeg(const Order& payer, const Order& payee)
{
    bool moved = false;
    try {
        moved = m_ledger.transferFrom(payer.tokenIn, payer.maker, payee.maker, payer.amountIn);
    } catch (const std::exception& e) {
        throw EngineError(ErrorCode::TransferFailure, "ledger error moving " + payer.tokenIn + " from " +
                                                          payer.maker + ": " + e.what());
    }

    if (!moved) {
        throw EngineError(ErrorCode::TransferFailure,
                          "ledger refused " + std::to_string(payer.amountIn) + " " + payer.tokenIn + " from " +
                              payer.maker + " to " + payee.maker);
    }
}

} // namespace pairbook
