#pragma once

#include "ledger.hpp"

#include <map>
#include <utility>

namespace pairbook {

// Balances and allowances held in process (server and tests)
class InMemoryLedger : public TokenLedger {
public:
    // Credit an account out of thin air
    void deposit(const Address& account, const TokenId& token, Amount amount);

    // Set how much of token the exchange may move out of owner's balance
    void approve(const Address& owner, const TokenId& token, Amount amount);

    [[nodiscard]] Amount balanceOf(const Address& account, const TokenId& token) const;
    [[nodiscard]] Amount allowance(const Address& owner, const TokenId& token) const;

    bool transferFrom(const TokenId& token, const Address& owner, const Address& recipient, Amount amount) override;
    void reverseTransfer(const TokenId& token, const Address& owner, const Address& recipient, Amount amount) override;

    [[nodiscard]] size_t transferCount() const { return m_transferCount; }

private:
    using Key = std::pair<Address, TokenId>;

    std::map<Key, Amount> m_balances;
    std::map<Key, Amount> m_allowances;
    size_t m_transferCount = 0;
};

} // namespace pairbook
