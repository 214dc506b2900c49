#pragma once

#include <optional>
#include <string>

#include <volarb/config.hpp>
#include <volarb/exposure.hpp>
#include <volarb/market.hpp>
#include <volarb/order.hpp>

namespace volarb {

class DeltaHedger {
public:
    DeltaHedger(std::string underlying, double net_delta_limit, double hedge_ratio, double market_fee);
    explicit DeltaHedger(const EngineConfig& config);

    // Market order of -round(net x hedge_ratio) shares when |net| exceeds the
    // limit. Inside the limit, a hedge the options no longer need is closed with
    // a limit order at VWAP +/- fee once the market trades through that price.
    std::optional<Order> rehedge(const DeltaExposure& exposure,
                                 const Position& underlying_position,
                                 const MarketQuote* underlying_quote) const;

    std::optional<Order> rehedge(const InstrumentBook& book,
                                 const PositionMap& positions,
                                 const TheoreticalMap& theoreticals,
                                 const Position& underlying_position,
                                 const MarketQuote* underlying_quote) const;

    [[nodiscard]] double net_delta_limit() const noexcept {
        return net_delta_limit_;
    }

private:
    std::optional<Order> unwind(const DeltaExposure& exposure,
                                const Position& underlying_position,
                                const MarketQuote& quote) const;

    std::string underlying_;
    double net_delta_limit_;
    double hedge_ratio_;
    double market_fee_;
};

} // namespace volarb
