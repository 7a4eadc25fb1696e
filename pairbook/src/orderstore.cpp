#include "orderstore.hpp"
#include "errors.hpp"

#include <memory>
#include <utility>
#include <string>

namespace pairbook {

namespace {

constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

void mix(uint64_t& hash, const void* data, size_t size)
{
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < size; ++i) {
        hash ^= bytes[i];
        hash *= FNV_PRIME;
    }
}

void mixString(uint64_t& hash, const std::string& value)
{
    // Length prefix keeps ("ab","c") and ("a","bc") apart
    uint64_t length = value.size();
    mix(hash, &length, sizeof(length));
    mix(hash, value.data(), value.size());
}

} // namespace

OrderStore::OrderStore() : OrderStore(Clock{}) {}

OrderStore::OrderStore(Clock clock) : m_clock(std::move(clock))
{
    if (!m_clock) {
        auto ticks = std::make_shared<Timestamp>(0);
        m_clock = [ticks]() { return ++(*ticks); };
    }
}

Order OrderStore::prepare(const Address& maker, const TokenId& tokenIn, const TokenId& tokenOut, Amount amountIn,
                          Amount amountOut, Side side)
{
    if (tokenIn == tokenOut) {
        throw EngineError(ErrorCode::InvalidPair, "tokenIn and tokenOut must differ (" + tokenIn + ")");
    }
    if (amountIn == 0 || amountOut == 0) {
        throw EngineError(ErrorCode::InvalidAmounts, "amountIn and amountOut must be positive");
    }

    Order order{};
    order.maker = maker;
    order.tokenIn = tokenIn;
    order.tokenOut = tokenOut;
    order.amountIn = amountIn;
    order.amountOut = amountOut;
    order.side = side;
    order.creationTime = m_clock();
    order.status = OrderStatus::Open;
    order.id = deriveId(order);
    return order;
}

void OrderStore::insert(const Order& order)
{
    if (contains(order.id)) {
        throw EngineError(ErrorCode::InvalidState, "order already stored: " + std::to_string(order.id));
    }
    m_orders.emplace(order.id, order);
    m_userOrders[order.maker].push_back(order.id);
}

OrderId OrderStore::submit(const Address& maker, const TokenId& tokenIn, const TokenId& tokenOut, Amount amountIn,
                           Amount amountOut, Side side)
{
    Order order = prepare(maker, tokenIn, tokenOut, amountIn, amountOut, side);
    insert(order);
    return order.id;
}

void OrderStore::cancel(OrderId id, const Address& caller)
{
    Order& order = find(id);
    if (order.maker != caller) {
        throw EngineError(ErrorCode::Unauthorized, caller + " is not the maker of order " + std::to_string(id));
    }
    if (!order.isOpen()) {
        throw EngineError(ErrorCode::InvalidState,
                          "order " + std::to_string(id) + " is " + toString(order.status));
    }
    order.status = OrderStatus::Cancelled;
}

void OrderStore::markFilled(OrderId id)
{
    Order& order = find(id);
    if (!order.isOpen()) {
        throw EngineError(ErrorCode::InvalidState,
                          "order " + std::to_string(id) + " is " + toString(order.status));
    }
    order.status = OrderStatus::Filled;
}

const Order& OrderStore::get(OrderId id) const
{
    auto iterator = m_orders.find(id);
    if (iterator == m_orders.end()) {
        throw EngineError(ErrorCode::OrderNotFound, "order not found: " + std::to_string(id));
    }
    return iterator->second;
}

std::vector<OrderId> OrderStore::ordersOf(const Address& user) const
{
    auto iterator = m_userOrders.find(user);
    if (iterator == m_userOrders.end()) {
        return {};
    }
    return iterator->second;
}

Order& OrderStore::find(OrderId id)
{
    auto iterator = m_orders.find(id);
    if (iterator == m_orders.end()) {
        throw EngineError(ErrorCode::OrderNotFound, "order not found: " + std::to_string(id));
    }
    return iterator->second;
}

OrderId OrderStore::deriveId(const Order& order) const
{
    uint64_t hash = FNV_OFFSET;
    mixString(hash, order.maker);
    mixString(hash, order.tokenIn);
    mixString(hash, order.tokenOut);
    mix(hash, &order.amountIn, sizeof(order.amountIn));
    mix(hash, &order.amountOut, sizeof(order.amountOut));
    mix(hash, &order.creationTime, sizeof(order.creationTime));

    uint64_t salt = 0;
    while (contains(hash)) {
        ++salt;
        mix(hash, &salt, sizeof(salt));
    }
    return hash;
}

} // namespace pairbook
