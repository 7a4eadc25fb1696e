#include "../src/exchange.hpp"
#include "../src/memoryledger.hpp"
#include "../src/server.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <unistd.h>

using namespace pairbook;

// TestableServer wrapper to expose protected methods
class TestableServer : public Server {
public:
    using Server::Server; // Inherit constructors

    // Expose handleClient for testing
    void testHandleClient(int clientSocket) { handleClient(clientSocket); }
};

class ServerTest : public ::testing::Test {
protected:
    InMemoryLedger ledger;
    std::unique_ptr<Exchange> exchange;
    std::unique_ptr<TestableServer> server;
    int sv[2]; // Socket pair: sv[0] user side, sv[1] server side

    void SetUp() override
    {
        for (const Address& account : {"alice", "bob"}) {
            for (const TokenId& token : {"WETH", "USDC"}) {
                ledger.deposit(account, token, 1000000);
                ledger.approve(account, token, 1000000);
            }
        }

        exchange = std::make_unique<Exchange>(ledger);
        server = std::make_unique<TestableServer>(*exchange, ledger);

        // Create socket pair
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    }

    void TearDown() override
    {
        close(sv[0]);
        close(sv[1]);
    }

    // Helper to send request and read response
    std::string sendRequest(const std::string& method, const std::string& path, const std::string& body = "")
    {
        std::stringstream ss;
        ss << method << " " << path << " HTTP/1.1\r\n";
        if (!body.empty()) {
            ss << "Content-Length: " << body.size() << "\r\n";
        }
        ss << "\r\n" << body;

        std::string req = ss.str();
        EXPECT_EQ(static_cast<ssize_t>(req.size()), write(sv[0], req.c_str(), req.size()));
        server->testHandleClient(sv[1]);

        std::string response;
        char buffer[4096];
        ssize_t n = read(sv[0], buffer, sizeof(buffer));
        if (n > 0)
            response.assign(buffer, n);
        return response;
    }

    int getStatus(const std::string& resp)
    {
        std::stringstream ss(resp);
        std::string proto;
        int code = 0;
        ss >> proto >> code;
        return code;
    }

    std::string createBody(const std::string& maker, const std::string& tokenIn, const std::string& tokenOut,
                           int amountIn, int amountOut, const std::string& side)
    {
        std::stringstream ss;
        ss << "{\"maker\": \"" << maker << "\", \"tokenIn\": \"" << tokenIn << "\", \"tokenOut\": \"" << tokenOut
           << "\", \"amountIn\": " << amountIn << ", \"amountOut\": " << amountOut << ", \"side\": \"" << side
           << "\"}";
        return ss.str();
    }
};

TEST_F(ServerTest, CreateOrder)
{
    std::string resp = sendRequest("POST", "/orders", createBody("alice", "USDC", "WETH", 3000, 1, "buy"));
    EXPECT_EQ(getStatus(resp), 200);
    EXPECT_TRUE(resp.find("\"status\": \"open\"") != std::string::npos);
    EXPECT_TRUE(resp.find("\"trades\": []") != std::string::npos);
    EXPECT_EQ(1u, exchange->orderCount());
}

TEST_F(ServerTest, CreateMatchingOrders)
{
    sendRequest("POST", "/orders", createBody("alice", "USDC", "WETH", 1000, 800, "buy"));
    std::string resp = sendRequest("POST", "/orders", createBody("bob", "WETH", "USDC", 800, 900, "sell"));

    EXPECT_EQ(getStatus(resp), 200);
    EXPECT_TRUE(resp.find("\"status\": \"filled\"") != std::string::npos);
    EXPECT_TRUE(resp.find("\"price\": \"1125000000000000000\"") != std::string::npos);
    EXPECT_EQ(1u, exchange->trades().size());
}

TEST_F(ServerTest, InvalidPair)
{
    std::string resp = sendRequest("POST", "/orders", createBody("alice", "USDC", "USDC", 10, 10, "buy"));
    EXPECT_EQ(getStatus(resp), 400);
    EXPECT_TRUE(resp.find("InvalidPair") != std::string::npos);
}

TEST_F(ServerTest, InvalidSide)
{
    std::string resp = sendRequest("POST", "/orders", createBody("alice", "USDC", "WETH", 10, 10, "hold"));
    EXPECT_EQ(getStatus(resp), 400);
}

TEST_F(ServerTest, MissingTokenIsRejected)
{
    std::string noTokenOut =
        "{\"maker\": \"alice\", \"tokenIn\": \"USDC\", \"amountIn\": 10, \"amountOut\": 10, \"side\": \"buy\"}";
    std::string resp = sendRequest("POST", "/orders", noTokenOut);
    EXPECT_EQ(getStatus(resp), 400);
    EXPECT_TRUE(resp.find("Missing tokenIn or tokenOut") != std::string::npos);

    std::string emptyTokenIn = createBody("alice", "", "WETH", 10, 10, "buy");
    EXPECT_EQ(getStatus(sendRequest("POST", "/orders", emptyTokenIn)), 400);

    EXPECT_EQ(0u, exchange->orderCount());
    EXPECT_EQ(0u, exchange->pairCount());
}

TEST_F(ServerTest, EscapedMakerRoundTrips)
{
    ledger.deposit("al\"ice", "USDC", 100);
    ledger.approve("al\"ice", "USDC", 100);

    std::string resp = sendRequest("POST", "/orders", createBody("al\\\"ice", "USDC", "WETH", 10, 10, "buy"));
    ASSERT_EQ(getStatus(resp), 200);

    std::vector<OrderId> orders = exchange->getUserOrders("al\"ice");
    ASSERT_EQ(1u, orders.size());
    EXPECT_EQ("al\"ice", exchange->getOrder(orders[0]).maker);

    std::string fetched = sendRequest("GET", "/order?id=" + std::to_string(orders[0]));
    EXPECT_TRUE(fetched.find("\"maker\": \"al\\\"ice\"") != std::string::npos);
}

TEST_F(ServerTest, TransferFailure)
{
    sendRequest("POST", "/orders", createBody("alice", "USDC", "WETH", 1000, 800, "buy"));
    ledger.approve("bob", "WETH", 0);

    std::string resp = sendRequest("POST", "/orders", createBody("bob", "WETH", "USDC", 800, 900, "sell"));
    EXPECT_EQ(getStatus(resp), 422);
    EXPECT_EQ(1u, exchange->orderCount());
}

TEST_F(ServerTest, CancelOrder)
{
    OrderId id = exchange->createOrder("alice", "USDC", "WETH", 3000, 1, true);

    std::string denied = sendRequest("DELETE", "/orders", "{\"id\": " + std::to_string(id) + ", \"caller\": \"bob\"}");
    EXPECT_EQ(getStatus(denied), 403);

    std::string resp = sendRequest("DELETE", "/orders", "{\"id\": " + std::to_string(id) + ", \"caller\": \"alice\"}");
    EXPECT_EQ(getStatus(resp), 200);
    EXPECT_TRUE(resp.find("cancelled") != std::string::npos);

    std::string again = sendRequest("DELETE", "/orders", "{\"id\": " + std::to_string(id) + ", \"caller\": \"alice\"}");
    EXPECT_EQ(getStatus(again), 409);
}

TEST_F(ServerTest, GetOrder)
{
    OrderId id = exchange->createOrder("alice", "USDC", "WETH", 3000, 1, true);

    std::string resp = sendRequest("GET", "/order?id=" + std::to_string(id));
    EXPECT_EQ(getStatus(resp), 200);
    EXPECT_TRUE(resp.find("\"maker\": \"alice\"") != std::string::npos);
    EXPECT_TRUE(resp.find("\"side\": \"buy\"") != std::string::npos);

    std::string missing = sendRequest("GET", "/order?id=" + std::to_string(id ^ 1));
    EXPECT_EQ(getStatus(missing), 404);
}

TEST_F(ServerTest, GetUserOrders)
{
    OrderId id = exchange->createOrder("alice", "USDC", "WETH", 3000, 1, true);

    std::string resp = sendRequest("GET", "/orders?user=alice");
    EXPECT_EQ(getStatus(resp), 200);
    EXPECT_TRUE(resp.find(std::to_string(id)) != std::string::npos);
}

TEST_F(ServerTest, GetBookEitherOrder)
{
    exchange->createOrder("alice", "USDC", "WETH", 3000, 1, true);

    std::string forward = sendRequest("GET", "/book?tokenA=USDC&tokenB=WETH");
    std::string backward = sendRequest("GET", "/book?tokenA=WETH&tokenB=USDC");
    EXPECT_EQ(getStatus(forward), 200);
    EXPECT_TRUE(forward.find("\"buyOrders\": [{") != std::string::npos);
    EXPECT_EQ(forward, backward);
}

TEST_F(ServerTest, GetBalance)
{
    std::string resp = sendRequest("GET", "/balance?account=alice&token=WETH");
    EXPECT_EQ(getStatus(resp), 200);
    EXPECT_TRUE(resp.find("\"balance\": 1000000") != std::string::npos);
}

TEST_F(ServerTest, GetTrades)
{
    std::string resp = sendRequest("GET", "/trades");
    EXPECT_EQ(getStatus(resp), 200);
    EXPECT_TRUE(resp.find("\"trades\": []") != std::string::npos);
}

TEST_F(ServerTest, GetStatus)
{
    std::string resp = sendRequest("GET", "/status");
    EXPECT_EQ(getStatus(resp), 200);
    EXPECT_TRUE(resp.find("\"policy\": \"fifo\"") != std::string::npos);
}

TEST_F(ServerTest, MethodNotAllowed)
{
    std::string resp = sendRequest("PUT", "/orders");
    EXPECT_EQ(getStatus(resp), 405);
}

TEST_F(ServerTest, NotFound)
{
    std::string resp = sendRequest("GET", "/nothing");
    EXPECT_EQ(getStatus(resp), 404);
}
