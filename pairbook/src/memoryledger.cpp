#include "memoryledger.hpp"

#include <limits>
#include <stdexcept>

namespace pairbook {

void InMemoryLedger::deposit(const Address& account, const TokenId& token, Amount amount)
{
    Amount& balance = m_balances[{account, token}];
    if (amount > std::numeric_limits<Amount>::max() - balance) {
        throw std::overflow_error("balance overflow for " + account + "/" + token);
    }
    balance += amount;
}

void InMemoryLedger::approve(const Address& owner, const TokenId& token, Amount amount)
{
    m_allowances[{owner, token}] = amount;
}

Amount InMemoryLedger::balanceOf(const Address& account, const TokenId& token) const
{
    auto iterator = m_balances.find({account, token});
    return iterator == m_balances.end() ? 0 : iterator->second;
}

Amount InMemoryLedger::allowance(const Address& owner, const TokenId& token) const
{
    auto iterator = m_allowances.find({owner, token});
    return iterator == m_allowances.end() ? 0 : iterator->second;
}

bool InMemoryLedger::transferFrom(const TokenId& token, const Address& owner, const Address& recipient, Amount amount)
{
    if (amount == 0) {
        return true;
    }

    if (allowance(owner, token) < amount || balanceOf(owner, token) < amount) {
        return false;
    }
    if (owner != recipient && balanceOf(recipient, token) > std::numeric_limits<Amount>::max() - amount) {
        return false;
    }

    m_allowances[{owner, token}] -= amount;
    m_balances[{owner, token}] -= amount;
    m_balances[{recipient, token}] += amount;
    ++m_transferCount;
    return true;
}

void InMemoryLedger::reverseTransfer(const TokenId& token, const Address& owner, const Address& recipient,
                                     Amount amount)
{
    if (amount == 0) {
        return;
    }
    if (balanceOf(recipient, token) < amount) {
        throw std::logic_error("cannot reverse transfer of " + token + " from " + recipient);
    }

    m_balances[{recipient, token}] -= amount;
    m_balances[{owner, token}] += amount;
    m_allowances[{owner, token}] += amount;
    --m_transferCount;
}

} // namespace pairbook
