#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <volarb/engine.hpp>
#include <volarb/exposure.hpp>
#include <volarb/instrument.hpp>
#include <volarb/market.hpp>
#include <volarb/order.hpp>

namespace volarb {

struct Fill {
    std::string instrument;
    std::int64_t quantity = 0;
    double price = 0.0;
};

// Simulated venue for recorded sessions: market orders fill in full at the
// touch, limit orders only when marketable. Fees are charged per unit.
class ReplayExchange {
public:
    ReplayExchange(const InstrumentBook& book, double fee_per_unit);

    std::optional<Fill> submit(const Order& order, const MarketQuote* quote);
    void mark(const std::vector<MarketQuote>& quotes);

    [[nodiscard]] const PositionMap& positions() const noexcept;
    [[nodiscard]] double cash() const noexcept;
    [[nodiscard]] double net_liquidation_value() const;

private:
    void apply(const Fill& fill, double multiplier);

    std::unordered_map<std::string, double> multipliers_;
    PositionMap positions_;
    std::unordered_map<std::string, double> marks_;
    double fee_per_unit_;
    double cash_ = 0.0;
};

struct ReplaySummary {
    std::size_t ticks = 0;
    std::size_t orders = 0;
    std::size_t fills = 0;
    std::int64_t last_tick = 0;
    double net_liquidation_value = 0.0;
    PositionMap positions;
};

// Drives the engine over recorded frames until the session ends or the market
// stops being active.
ReplaySummary run_replay(Engine& engine, ReplayExchange& exchange, const std::vector<MarketFrame>& frames);

} // namespace volarb
