#include "config.hpp"
#include "exchange.hpp"
#include "memoryledger.hpp"
#include "server.hpp"

#include <csignal>
#include <iostream>
#include <string>

using namespace pairbook;

// Global pointer for signal handler
Server* g_server = nullptr;

void signalHandler(int signum)
{
    if (g_server) {
        std::cout << "\nInterrupt signal (" << signum << ") received. Stopping server..." << std::endl;
        g_server->stop();
    }
}

int main(int argc, char* argv[])
{
    try {
        std::string configPath = "config/pairbook.json";
        if (argc > 2)
            configPath = argv[2];

        std::cout << "PairBook Order Matching Engine" << std::endl;
        std::cout << "Loading config from " << configPath << "..." << std::endl;

        EngineConfig config = loadConfig(configPath);
        if (argc > 1)
            config.port = static_cast<uint16_t>(std::stoi(argv[1]));

        // Initialize components
        InMemoryLedger ledger;
        seedLedger(config, ledger);
        std::cout << "Seeded " << config.accounts.size() << " ledger accounts." << std::endl;
        for (const auto& seed : config.accounts) {
            std::cout << " - " << seed.account << " " << seed.token << " balance=" << seed.balance
                      << " allowance=" << seed.allowance << std::endl;
        }

        Exchange exchange(ledger, config.matchPolicy);
        std::cout << "Match policy: " << toString(config.matchPolicy) << std::endl;

        exchange.setTradeCallback([](const Trade& trade) {
            std::cout << "Trade: order " << trade.takerOrderId << " (" << trade.taker << ") x order "
                      << trade.makerOrderId << " (" << trade.maker << ") " << trade.takerAmount << " / "
                      << trade.makerAmount << " @ " << toDecimal(trade.price) << std::endl;
        });
        exchange.setOrderCallback([](const OrderEvent& event) {
            if (event.type == OrderEventType::Cancelled) {
                std::cout << "Cancelled: order " << event.orderId << " (" << event.maker << ")" << std::endl;
            }
        });

        Server server(exchange, ledger);
        g_server = &server;

        // Setup signal handling
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        // Run server (blocking)
        std::cout << "Starting server on port " << config.port << "..." << std::endl;
        server.run(config.port);

        std::cout << "Server stopped." << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
