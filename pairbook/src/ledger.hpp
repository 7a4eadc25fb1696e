#pragma once

#include "types.hpp"

namespace pairbook {

// Token balances the exchange settles against. Funds are never escrowed:
// makers pre-authorize the exchange and transfers happen only at settlement.
class TokenLedger {
public:
    virtual ~TokenLedger() = default;

    // Move amount of token from owner to recipient against owner's allowance.
    // Returning false or throwing both mean nothing moved.
    virtual bool transferFrom(const TokenId& token, const Address& owner, const Address& recipient, Amount amount) = 0;

    // Undo a transferFrom() that succeeded earlier in the same settlement
    virtual void reverseTransfer(const TokenId& token, const Address& owner, const Address& recipient,
                                 Amount amount) = 0;
};

} // namespace pairbook
