#include "pricelevel.hpp"

namespace pairbook {

PriceLevel::PriceLevel(Ratio ratio) : m_ratio(ratio) {}

PriceLevel::Position PriceLevel::addOrder(OrderId id) { return m_orders.insert(m_orders.end(), id); }

void PriceLevel::removeOrder(Position position) { m_orders.erase(position); }

} // namespace pairbook
