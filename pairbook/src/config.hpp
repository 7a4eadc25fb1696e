#pragma once

#include "memoryledger.hpp"
#include "types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pairbook {

// Initial funds and exchange allowance of one account in one token
struct AccountSeed {
    Address account;
    TokenId token;
    Amount balance;
    Amount allowance;
};

struct EngineConfig {
    uint16_t port = 8080;
    MatchPolicy matchPolicy = MatchPolicy::FirstCompatible;
    std::vector<AccountSeed> accounts;
};

// "fifo" or "best_price"; throws std::invalid_argument otherwise
[[nodiscard]] MatchPolicy parseMatchPolicy(const std::string& name);
[[nodiscard]] const char* toString(MatchPolicy policy);

// Parse a config document; missing keys keep their defaults
[[nodiscard]] EngineConfig parseConfig(const std::string& json);

// Read and parse a config file; throws std::runtime_error if unreadable
[[nodiscard]] EngineConfig loadConfig(const std::string& path);

// Deposit and approve every seeded account
void seedLedger(const EngineConfig& config, InMemoryLedger& ledger);

} // namespace pairbook
