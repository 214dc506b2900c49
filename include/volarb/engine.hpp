#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <volarb/config.hpp>
#include <volarb/delta_hedger.hpp>
#include <volarb/exposure.hpp>
#include <volarb/instrument.hpp>
#include <volarb/market.hpp>
#include <volarb/order.hpp>
#include <volarb/position_manager.hpp>
#include <volarb/risk_governor.hpp>
#include <volarb/signal.hpp>
#include <volarb/vol_tracker.hpp>

namespace volarb {

struct TickReport {
    std::int64_t tick = 0;
    bool active = false;
    std::optional<double> volatility;
    double time_to_expiry = 0.0;
    std::size_t priced = 0;
    std::size_t skipped = 0;
    double net_delta = 0.0;           // from the snapshot positions
    double projected_net_delta = 0.0; // after this tick's approved orders
    TheoreticalMap theoreticals;
    std::vector<RiskDecision> decisions;
    std::vector<Order> orders; // ready for submission, options first then the hedge
};

// One pass per tick: pricing, signals, position decisions, hedge, each order
// through the risk governor. Single-threaded, no state beyond the session.
class Engine {
public:
    explicit Engine(EngineConfig config);
    Engine(EngineConfig config, InstrumentBook book);

    TickReport on_tick(const MarketSnapshot& snapshot);

    [[nodiscard]] const EngineConfig& config() const noexcept;
    [[nodiscard]] const InstrumentBook& book() const noexcept;
    [[nodiscard]] const RealizedVolTracker& volatility() const noexcept;
    [[nodiscard]] const PositionManager& positions() const noexcept;
    [[nodiscard]] const RiskGovernor& risk() const noexcept;

private:
    void submit(TickReport& report, const Order& order, const RiskContext& context);

    EngineConfig config_;
    InstrumentBook book_;
    RealizedVolTracker vol_;
    PositionManager positions_;
    DeltaHedger hedger_;
    RiskGovernor risk_;
};

} // namespace volarb
