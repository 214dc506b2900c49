#include <volarb/delta_hedger.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace volarb {

DeltaHedger::DeltaHedger(std::string underlying, double net_delta_limit, double hedge_ratio, double market_fee)
    : underlying_(std::move(underlying)),
      net_delta_limit_(net_delta_limit),
      hedge_ratio_(hedge_ratio),
      market_fee_(market_fee) {
    if (!(net_delta_limit_ > 0.0)) {
        throw std::invalid_argument("net_delta_limit must be positive");
    }
    if (!(hedge_ratio_ > 0.0 && hedge_ratio_ <= 1.0)) {
        throw std::invalid_argument("hedge_ratio must be in (0,1]");
    }
}

DeltaHedger::DeltaHedger(const EngineConfig& config)
    : DeltaHedger(config.underlying, config.limits.net_delta_limit, config.hedge_ratio, config.market_fee) {}

std::optional<Order> DeltaHedger::rehedge(const DeltaExposure& exposure,
                                          const Position& underlying_position,
                                          const MarketQuote* underlying_quote) const {
    for (const auto& id : exposure.unpriced) {
        spdlog::warn("Hedge excludes unpriced leg {}", id);
    }

    const double net = exposure.net();
    if (std::abs(net) > net_delta_limit_) {
        const auto shares = -static_cast<std::int64_t>(std::llround(net * hedge_ratio_));
        if (shares == 0) {
            return std::nullopt;
        }
        spdlog::info("Delta hedge: net delta {:.1f} beyond {:.0f}, {} {} shares",
                     net,
                     net_delta_limit_,
                     shares > 0 ? "buying" : "selling",
                     std::llabs(shares));
        return market_order(underlying_, shares);
    }

    if (underlying_position.quantity != 0 && underlying_quote != nullptr) {
        return unwind(exposure, underlying_position, *underlying_quote);
    }
    return std::nullopt;
}

std::optional<Order> DeltaHedger::rehedge(const InstrumentBook& book,
                                          const PositionMap& positions,
                                          const TheoreticalMap& theoreticals,
                                          const Position& underlying_position,
                                          const MarketQuote* underlying_quote) const {
    const DeltaExposure exposure =
        compute_exposure(book, positions, theoreticals, underlying_position.quantity);
    return rehedge(exposure, underlying_position, underlying_quote);
}

std::optional<Order> DeltaHedger::unwind(const DeltaExposure& exposure,
                                         const Position& underlying_position,
                                         const MarketQuote& quote) const {
    // The hedge is only released once the options alone sit inside the limit.
    if (std::abs(exposure.option_delta) >= net_delta_limit_ || underlying_position.average_price <= 0.0) {
        return std::nullopt;
    }

    const std::int64_t held = underlying_position.quantity;
    if (held > 0) {
        const double target = underlying_position.average_price + market_fee_;
        if (quote.bid >= target) {
            spdlog::info("Delta hedge: unwinding {} long shares at {:.2f} (vwap {:.2f})",
                         held,
                         target,
                         underlying_position.average_price);
            return limit_order(underlying_, -held, target);
        }
        return std::nullopt;
    }

    const double target = underlying_position.average_price - market_fee_;
    if (quote.ask > 0.0 && quote.ask <= target) {
        spdlog::info("Delta hedge: unwinding {} short shares at {:.2f} (vwap {:.2f})",
                     -held,
                     target,
                     underlying_position.average_price);
        return limit_order(underlying_, -held, target);
    }
    return std::nullopt;
}

} // namespace volarb
