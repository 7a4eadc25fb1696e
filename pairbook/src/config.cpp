#include "config.hpp"
#include "jsonutils.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace pairbook {

using namespace json;

MatchPolicy parseMatchPolicy(const std::string& name)
{
    if (name == "fifo") {
        return MatchPolicy::FirstCompatible;
    }
    if (name == "best_price") {
        return MatchPolicy::BestPrice;
    }
    throw std::invalid_argument("Unknown match policy: " + name);
}

const char* toString(MatchPolicy policy) { return policy == MatchPolicy::BestPrice ? "best_price" : "fifo"; }

EngineConfig parseConfig(const std::string& json)
{
    EngineConfig config;

    if (hasKey(json, "port")) {
        uint64_t port = extractUnsigned(json, "port");
        if (port == 0 || port > std::numeric_limits<uint16_t>::max()) {
            throw std::invalid_argument("Port out of range: " + std::to_string(port));
        }
        config.port = static_cast<uint16_t>(port);
    }

    if (hasKey(json, "match_policy")) {
        config.matchPolicy = parseMatchPolicy(extractString(json, "match_policy"));
    }

    for (const auto& objectJson : extractObjects(json, "accounts")) {
        AccountSeed seed{};
        seed.account = extractString(objectJson, "account");
        seed.token = extractString(objectJson, "token");
        seed.balance = extractUnsigned(objectJson, "balance");
        seed.allowance = extractUnsigned(objectJson, "allowance");

        if (seed.account.empty() || seed.token.empty()) {
            throw std::invalid_argument("Account entry needs \"account\" and \"token\": " + objectJson);
        }
        config.accounts.push_back(std::move(seed));
    }

    return config;
}

EngineConfig loadConfig(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseConfig(buffer.str());
}

void seedLedger(const EngineConfig& config, InMemoryLedger& ledger)
{
    for (const auto& seed : config.accounts) {
        ledger.deposit(seed.account, seed.token, seed.balance);
        ledger.approve(seed.account, seed.token, seed.allowance);
    }
}

} // namespace pairbook
