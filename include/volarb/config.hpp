#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace volarb {

struct RiskLimits {
    std::int64_t options_qty_per_trade = 90;    // contracts per order, also the open size
    std::int64_t shares_order_limit = 10000;    // shares per underlying order
    double net_delta_limit = 5000.0;            // shares, symmetric
    std::int64_t max_option_position = 180;     // contracts per option instrument
    std::int64_t max_underlying_position = 50000;
};

struct EngineConfig {
    std::string underlying = "RTM";
    std::vector<double> strikes{48.0, 49.0, 50.0, 51.0, 52.0};
    double shares_per_contract = 100.0;

    RiskLimits limits{};

    // Absolute price differences (theoretical - mid), not percentages: the same
    // threshold is a larger relative edge on cheap wings than on rich strikes.
    double open_threshold = 0.04;
    double close_threshold = 0.01;
    double scale_step = 0.04;
    double profit_target_fraction = 1.0;

    double risk_free_rate = 0.0;
    double hedge_ratio = 1.0;
    double market_fee = 0.02; // per share or contract

    std::int64_t ticks_per_session = 300;
    double ticks_per_year = 3600.0;

    std::optional<double> seed_volatility;

    // Throws std::invalid_argument describing the first inconsistent field.
    void validate() const;
};

// Years remaining until expiry at the given tick of the session, never negative.
double time_to_expiry_years(const EngineConfig& config, std::int64_t tick);

} // namespace volarb
