#include <volarb/order.hpp>

#include <utility>

namespace volarb {

Order market_order(std::string instrument, std::int64_t quantity) {
    return Order{.instrument = std::move(instrument),
                 .quantity = quantity,
                 .type = OrderType::Market,
                 .price = std::nullopt};
}

Order limit_order(std::string instrument, std::int64_t quantity, double price) {
    return Order{.instrument = std::move(instrument),
                 .quantity = quantity,
                 .type = OrderType::Limit,
                 .price = price};
}

const char* to_string(OrderType type) {
    return type == OrderType::Limit ? "LIMIT" : "MARKET";
}

} // namespace volarb
