#pragma once

#include "ledger.hpp"
#include "orderbookindex.hpp"
#include "orderstore.hpp"
#include "trade.hpp"

namespace pairbook {

class SettlementExecutor {
public:
    SettlementExecutor(TokenLedger& ledger, OrderStore& store, OrderBookIndex& index);

    // Settle an incoming order (not yet stored) against a stored Open counter-order.
    // Each maker's amountIn moves to the other maker, then both orders become Filled.
    // If either transfer fails the completed leg is reversed, neither order changes,
    // and TransferFailure is thrown.
    Trade settle(Order& incoming, OrderId restingId, Timestamp execTime);

private:
    // One transfer; throws TransferFailure if the ledger refuses or throws
    void transferLeg(const Order& payer, const Order& payee);

    TokenLedger& m_ledger;
    OrderStore& m_store;
    OrderBookIndex& m_index;
};

} // namespace pairbook
