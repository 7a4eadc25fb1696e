#include "server.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "jsonutils.hpp"
#include "types.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace pairbook {

using namespace json;

namespace {

int httpStatus(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidPair:
    case ErrorCode::InvalidAmounts:
        return 400;
    case ErrorCode::Unauthorized:
    case ErrorCode::AccessDenied:
        return 403;
    case ErrorCode::OrderNotFound:
        return 404;
    case ErrorCode::InvalidState:
    case ErrorCode::ReentrantCall:
        return 409;
    case ErrorCode::TransferFailure:
        return 422;
    }
    return 500;
}

std::string orderJson(const Order& order)
{
    std::stringstream ss;
    ss << "{\"id\": " << order.id << ", \"maker\": " << quote(order.maker) << ", \"tokenIn\": " << quote(order.tokenIn)
       << ", \"tokenOut\": " << quote(order.tokenOut) << ", \"amountIn\": " << order.amountIn
       << ", \"amountOut\": " << order.amountOut << ", \"side\": \"" << toString(order.side)
       << "\", \"creationTime\": " << order.creationTime << ", \"status\": \"" << toString(order.status) << "\"}";
    return ss.str();
}

std::string tradeJson(const Trade& trade)
{
    std::stringstream ss;
    ss << "{\"takerOrderId\": " << trade.takerOrderId << ", \"makerOrderId\": " << trade.makerOrderId
       << ", \"taker\": " << quote(trade.taker) << ", \"maker\": " << quote(trade.maker)
       << ", \"takerAmount\": " << trade.takerAmount << ", \"makerAmount\": " << trade.makerAmount
       << ", \"price\": \"" << toDecimal(trade.price) << "\"}";
    return ss.str();
}

template <typename T, typename Format>
std::string jsonArray(const std::vector<T>& items, Format format)
{
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        ss << format(items[i]);
        if (i < items.size() - 1)
            ss << ", ";
    }
    ss << "]";
    return ss.str();
}

} // namespace

Server::Server(Exchange& exchange, const InMemoryLedger& ledger)
    : m_exchange(exchange), m_ledger(ledger), m_running(false), m_serverSocket(-1)
{
}

void Server::run(uint16_t port)
{
    m_serverSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (m_serverSocket < 0) {
        throw std::runtime_error("Failed to create socket: " + std::string(std::strerror(errno)));
    }

    int opt = 1;
    setsockopt(m_serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port);

    if (bind(m_serverSocket, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        close(m_serverSocket);
        m_serverSocket = -1;
        throw std::runtime_error("Failed to bind to port " + std::to_string(port));
    }

    if (listen(m_serverSocket, 10) < 0) {
        close(m_serverSocket);
        m_serverSocket = -1;
        throw std::runtime_error("Failed to listen on port " + std::to_string(port));
    }

    m_running = true;
    std::cout << "Server listening on port " << port << std::endl;

    while (m_running) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientSocket = accept(m_serverSocket, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);

        if (clientSocket < 0) {
            if (m_running)
                std::cerr << "Accept failed" << std::endl;
            continue;
        }

        handleClient(clientSocket);
        close(clientSocket);
    }

    if (m_serverSocket >= 0) {
        close(m_serverSocket);
        m_serverSocket = -1;
    }
}

void Server::stop()
{
    m_running = false;
    // Close server socket to break accept loop
    if (m_serverSocket >= 0) {
        shutdown(m_serverSocket, SHUT_RDWR);
        close(m_serverSocket);
        m_serverSocket = -1;
    }
}

void Server::handleClient(int clientSocket)
{
    std::string request;
    char buffer[4096];
    bool headerComplete = false;
    size_t bodyTarget = 0;
    size_t bodyRead = 0;

    // Read headers
    while (!headerComplete) {
        ssize_t n = recv(clientSocket, buffer, sizeof(buffer), 0);
        if (n <= 0)
            return;
        request.append(buffer, n);

        auto pos = request.find("\r\n\r\n");
        if (pos != std::string::npos) {
            headerComplete = true;

            // Extract Content-Length if present
            auto clPos = request.find("Content-Length: ");
            if (clPos != std::string::npos && clPos < pos) {
                auto clEnd = request.find("\r\n", clPos);
                std::string clVal = request.substr(clPos + 16, clEnd - (clPos + 16));
                try {
                    bodyTarget = std::stoul(clVal);
                } catch (const std::exception&) {
                    std::string response = errorResponse(400, "Bad Content-Length");
                    send(clientSocket, response.c_str(), response.size(), 0);
                    return;
                }
            }

            bodyRead = request.size() - (pos + 4);
        }
    }

    // Read remaining body
    while (bodyRead < bodyTarget) {
        size_t toRead = std::min(sizeof(buffer), bodyTarget - bodyRead);
        ssize_t n = recv(clientSocket, buffer, toRead, 0);
        if (n <= 0)
            break;
        request.append(buffer, n);
        bodyRead += n;
    }

    auto doubleCRLF = request.find("\r\n\r\n");
    std::string body = request.substr(doubleCRLF + 4);

    // Request line (e.g., "POST /orders HTTP/1.1")
    std::istringstream stream(request);
    std::string method, path, protocol;
    stream >> method >> path >> protocol;

    std::string queryString;
    auto quesPos = path.find('?');
    if (quesPos != std::string::npos) {
        queryString = path.substr(quesPos + 1);
        path = path.substr(0, quesPos);
    }

    std::string response;
    try {
        if (path == "/orders") {
            if (method == "POST") {
                response = handleCreateOrder(body);
            } else if (method == "DELETE") {
                response = handleCancelOrder(body);
            } else if (method == "GET") {
                response = handleGetUserOrders(queryString);
            } else {
                response = errorResponse(405, "Method Not Allowed");
            }
        } else if (path == "/order" && method == "GET") {
            response = handleGetOrder(queryString);
        } else if (path == "/book" && method == "GET") {
            response = handleGetBook(queryString);
        } else if (path == "/trades" && method == "GET") {
            response = handleGetTrades();
        } else if (path == "/balance" && method == "GET") {
            response = handleGetBalance(queryString);
        } else if (path == "/status" && method == "GET") {
            response = handleStatus();
        } else {
            response = errorResponse(404, "Not Found");
        }
    } catch (const EngineError& e) {
        response = errorResponse(httpStatus(e.code()), e.what());
    } catch (const std::invalid_argument& e) {
        response = errorResponse(400, e.what());
    } catch (const std::out_of_range& e) {
        response = errorResponse(400, e.what());
    } catch (const std::exception& e) {
        response = errorResponse(500, e.what());
    }

    send(clientSocket, response.c_str(), response.size(), 0);
}

std::string Server::handleCreateOrder(const std::string& body)
{
    std::string sideInput = extractString(body, "side");
    if (sideInput != "buy" && sideInput != "sell") {
        return errorResponse(400, "side must be \"buy\" or \"sell\"");
    }

    std::string maker = extractString(body, "maker");
    if (maker.empty()) {
        return errorResponse(400, "Missing maker");
    }

    std::string tokenIn = extractString(body, "tokenIn");
    std::string tokenOut = extractString(body, "tokenOut");
    if (tokenIn.empty() || tokenOut.empty()) {
        return errorResponse(400, "Missing tokenIn or tokenOut");
    }

    OrderId id = m_exchange.createOrder(maker, tokenIn, tokenOut,
                                        extractUnsigned(body, "amountIn"), extractUnsigned(body, "amountOut"),
                                        sideInput == "buy");

    const Order& order = m_exchange.getOrder(id);
    std::vector<Trade> trades;
    if (!order.isOpen()) {
        trades.push_back(m_exchange.trades().back());
    }

    std::stringstream ss;
    ss << "{\"id\": " << id << ", \"status\": \"" << toString(order.status)
       << "\", \"trades\": " << jsonArray(trades, tradeJson) << "}";
    return createResponse(200, ss.str());
}

std::string Server::handleCancelOrder(const std::string& body)
{
    if (!hasKey(body, "id")) {
        return errorResponse(400, "Missing id");
    }
    m_exchange.cancelOrder(extractUnsigned(body, "id"), extractString(body, "caller"));
    return createResponse(200, "{\"status\": \"cancelled\"}");
}

std::string Server::handleGetUserOrders(const std::string& queryString)
{
    std::string user = getQueryParam(queryString, "user");
    if (user.empty()) {
        return errorResponse(400, "Missing user");
    }

    auto ids = m_exchange.getUserOrders(user);
    return createResponse(200, "{\"orders\": " + jsonArray(ids, [](OrderId id) { return std::to_string(id); }) + "}");
}

std::string Server::handleGetOrder(const std::string& queryString)
{
    std::string idParam = getQueryParam(queryString, "id");
    if (idParam.empty()) {
        return errorResponse(400, "Missing id");
    }
    return createResponse(200, orderJson(m_exchange.getOrder(std::stoull(idParam))));
}

std::string Server::handleGetBook(const std::string& queryString)
{
    std::string tokenA = getQueryParam(queryString, "tokenA");
    std::string tokenB = getQueryParam(queryString, "tokenB");
    if (tokenA.empty() || tokenB.empty()) {
        return errorResponse(400, "Missing tokenA or tokenB");
    }

    auto book = m_exchange.getOrderBook(tokenA, tokenB);

    std::stringstream ss;
    ss << "{\"buyOrders\": " << jsonArray(book.buyOrders, orderJson)
       << ", \"sellOrders\": " << jsonArray(book.sellOrders, orderJson) << "}";
    return createResponse(200, ss.str());
}

std::string Server::handleGetTrades()
{
    return createResponse(200, "{\"trades\": " + jsonArray(m_exchange.trades(), tradeJson) + "}");
}

std::string Server::handleGetBalance(const std::string& queryString)
{
    std::string account = getQueryParam(queryString, "account");
    std::string token = getQueryParam(queryString, "token");
    if (account.empty() || token.empty()) {
        return errorResponse(400, "Missing account or token");
    }

    std::stringstream ss;
    ss << "{\"account\": " << quote(account) << ", \"token\": " << quote(token)
       << ", \"balance\": " << m_ledger.balanceOf(account, token)
       << ", \"allowance\": " << m_ledger.allowance(account, token) << "}";
    return createResponse(200, ss.str());
}

std::string Server::handleStatus()
{
    std::stringstream ss;
    ss << "{\"status\": \"ok\", \"orders\": " << m_exchange.orderCount()
       << ", \"open\": " << m_exchange.openOrderCount() << ", \"pairs\": " << m_exchange.pairCount()
       << ", \"trades\": " << m_exchange.trades().size() << ", \"policy\": \""
       << toString(m_exchange.matchPolicy()) << "\"}";
    return createResponse(200, ss.str());
}

std::string Server::createResponse(int statusCode, const std::string& body)
{
    std::string statusMsg = "OK";
    if (statusCode == 400)
        statusMsg = "Bad Request";
    if (statusCode == 403)
        statusMsg = "Forbidden";
    if (statusCode == 404)
        statusMsg = "Not Found";
    if (statusCode == 405)
        statusMsg = "Method Not Allowed";
    if (statusCode == 409)
        statusMsg = "Conflict";
    if (statusCode == 422)
        statusMsg = "Unprocessable Entity";
    if (statusCode == 500)
        statusMsg = "Internal Server Error";

    std::stringstream ss;
    ss << "HTTP/1.1 " << statusCode << " " << statusMsg << "\r\n";
    ss << "Content-Type: application/json\r\n";
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n\r\n";
    ss << body;
    return ss.str();
}

std::string Server::errorResponse(int statusCode, const std::string& message)
{
    return createResponse(statusCode, "{\"error\": " + quote(message) + "}");
}

std::string Server::getQueryParam(const std::string& query, const std::string& key)
{
    // Match whole keys only ("id" must not hit "orderid")
    size_t pos = 0;
    while ((pos = query.find(key + "=", pos)) != std::string::npos) {
        if (pos == 0 || query[pos - 1] == '&')
            break;
        pos += key.size();
    }
    if (pos == std::string::npos)
        return "";

    auto start = pos + key.size() + 1;
    auto end = query.find('&', start);
    if (end == std::string::npos)
        return query.substr(start);
    return query.substr(start, end - start);
}

} // namespace pairbook
