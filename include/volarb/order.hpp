#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace volarb {

enum class OrderType : std::uint8_t { Market = 0, Limit = 1 };

struct Order {
    std::string instrument;
    std::int64_t quantity = 0; // signed, positive = buy
    OrderType type = OrderType::Market;
    std::optional<double> price; // limit orders only

    [[nodiscard]] bool is_buy() const noexcept {
        return quantity > 0;
    }
    [[nodiscard]] const char* action() const noexcept {
        return quantity >= 0 ? "BUY" : "SELL";
    }
};

Order market_order(std::string instrument, std::int64_t quantity);
Order limit_order(std::string instrument, std::int64_t quantity, double price);

const char* to_string(OrderType type);

} // namespace volarb
