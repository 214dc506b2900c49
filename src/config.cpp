#include <volarb/config.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace volarb {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

bool finite_non_negative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

} // namespace

void EngineConfig::validate() const {
    require(!underlying.empty(), "underlying ticker must not be empty");
    require(!strikes.empty(), "at least one strike is required");
    for (const double strike : strikes) {
        require(std::isfinite(strike) && strike > 0.0, "strikes must be positive");
    }
    require(std::isfinite(shares_per_contract) && shares_per_contract > 0.0,
            "shares_per_contract must be positive");

    require(limits.options_qty_per_trade > 0, "options_qty_per_trade must be positive");
    require(limits.shares_order_limit > 0, "shares_order_limit must be positive");
    require(std::isfinite(limits.net_delta_limit) && limits.net_delta_limit > 0.0,
            "net_delta_limit must be positive");
    require(limits.max_option_position >= limits.options_qty_per_trade,
            "max_option_position must allow at least one trade");
    require(limits.max_underlying_position > 0, "max_underlying_position must be positive");

    require(finite_non_negative(open_threshold), "open_threshold must be non-negative");
    require(finite_non_negative(close_threshold), "close_threshold must be non-negative");
    require(close_threshold < open_threshold || open_threshold == 0.0,
            "close_threshold must be below open_threshold");
    require(finite_non_negative(scale_step), "scale_step must be non-negative");
    require(std::isfinite(profit_target_fraction) && profit_target_fraction > 0.0,
            "profit_target_fraction must be positive");

    require(std::isfinite(risk_free_rate), "risk_free_rate must be finite");
    require(std::isfinite(hedge_ratio) && hedge_ratio > 0.0 && hedge_ratio <= 1.0,
            "hedge_ratio must be in (0,1]");
    require(finite_non_negative(market_fee), "market_fee must be non-negative");

    require(ticks_per_session > 0, "ticks_per_session must be positive");
    require(std::isfinite(ticks_per_year) && ticks_per_year > 0.0, "ticks_per_year must be positive");

    if (seed_volatility) {
        require(std::isfinite(*seed_volatility) && *seed_volatility > 0.0, "seed_volatility must be positive");
    }
}

double time_to_expiry_years(const EngineConfig& config, std::int64_t tick) {
    const double remaining = static_cast<double>(config.ticks_per_session - tick);
    return std::max(remaining, 0.0) / config.ticks_per_year;
}

} // namespace volarb
