#pragma once

#include "exchange.hpp"
#include "memoryledger.hpp"

#include <cstdint>
#include <string>

namespace pairbook {

class Server {
public:
    Server(Exchange& exchange, const InMemoryLedger& ledger);

    // Start listening on port (blocking)
    void run(uint16_t port);

    // Stop server gracefully (can be called from signal handler)
    void stop();

protected:
    // Handle individual client connection
    void handleClient(int clientSocket);

private:
    // HTTP Handlers
    std::string handleCreateOrder(const std::string& body);
    std::string handleCancelOrder(const std::string& body);
    std::string handleGetUserOrders(const std::string& queryString);
    std::string handleGetOrder(const std::string& queryString);
    std::string handleGetBook(const std::string& queryString);
    std::string handleGetTrades();
    std::string handleGetBalance(const std::string& queryString);
    std::string handleStatus();

    // Helpers
    std::string createResponse(int statusCode, const std::string& body);
    std::string errorResponse(int statusCode, const std::string& message);
    std::string getQueryParam(const std::string& query, const std::string& key);

    Exchange& m_exchange;
    const InMemoryLedger& m_ledger;
    volatile bool m_running;
    int m_serverSocket;
};

} // namespace pairbook
