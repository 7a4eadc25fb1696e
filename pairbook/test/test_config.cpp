#include "../src/config.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace pairbook;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        // Create temporary test file
        std::ofstream out("test_pairbook.json");
        out << R"({
            "port": 9090,
            "match_policy": "best_price",
            "accounts": [
                { "account": "alice", "token": "WETH", "balance": 1000, "allowance": 400 },
                { "account": "bob", "token": "USDC", "balance": "18446744073709551615", "allowance": 0 }
            ]
        })";
        out.close();
    }

    void TearDown() override { std::remove("test_pairbook.json"); }
};

TEST_F(ConfigTest, LoadFromFile)
{
    EngineConfig config = loadConfig("test_pairbook.json");

    EXPECT_EQ(9090, config.port);
    EXPECT_EQ(MatchPolicy::BestPrice, config.matchPolicy);
    ASSERT_EQ(2u, config.accounts.size());

    EXPECT_EQ("alice", config.accounts[0].account);
    EXPECT_EQ("WETH", config.accounts[0].token);
    EXPECT_EQ(1000u, config.accounts[0].balance);
    EXPECT_EQ(400u, config.accounts[0].allowance);

    // Quoted values carry the full 64-bit range
    EXPECT_EQ(18446744073709551615ULL, config.accounts[1].balance);
}

TEST_F(ConfigTest, DefaultsWhenKeysMissing)
{
    EngineConfig config = parseConfig("{}");

    EXPECT_EQ(8080, config.port);
    EXPECT_EQ(MatchPolicy::FirstCompatible, config.matchPolicy);
    EXPECT_TRUE(config.accounts.empty());
}

TEST_F(ConfigTest, SeedLedger)
{
    InMemoryLedger ledger;
    seedLedger(loadConfig("test_pairbook.json"), ledger);

    EXPECT_EQ(1000u, ledger.balanceOf("alice", "WETH"));
    EXPECT_EQ(400u, ledger.allowance("alice", "WETH"));
    EXPECT_EQ(0u, ledger.allowance("bob", "USDC"));
}

TEST_F(ConfigTest, MatchPolicyNames)
{
    EXPECT_EQ(MatchPolicy::FirstCompatible, parseMatchPolicy("fifo"));
    EXPECT_EQ(MatchPolicy::BestPrice, parseMatchPolicy("best_price"));
    EXPECT_STREQ("fifo", toString(MatchPolicy::FirstCompatible));
    EXPECT_STREQ("best_price", toString(MatchPolicy::BestPrice));
    EXPECT_THROW(parseMatchPolicy("pro_rata"), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsBadValues)
{
    EXPECT_THROW(parseConfig(R"({"port": 70000})"), std::invalid_argument);
    EXPECT_THROW(parseConfig(R"({"port": -1})"), std::invalid_argument);
    EXPECT_THROW(parseConfig(R"({"accounts": [{"account": "alice", "balance": 1}]})"), std::invalid_argument);
}

TEST_F(ConfigTest, LoadInvalidFile) { EXPECT_THROW(loadConfig("non_existent.json"), std::runtime_error); }
