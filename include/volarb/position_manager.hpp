#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include <volarb/config.hpp>
#include <volarb/instrument.hpp>
#include <volarb/market.hpp>
#include <volarb/order.hpp>
#include <volarb/signal.hpp>

namespace volarb {

enum class PositionState : std::uint8_t { Flat = 0, Opening = 1, Held = 2, Scaling = 3, Unwinding = 4 };

const char* to_string(PositionState state);

struct PositionRecord {
    PositionState state = PositionState::Flat;
    std::int64_t quantity = 0;         // as last observed in a snapshot
    std::optional<double> entry_price; // VWAP of the open quantity
    std::optional<double> entry_magnitude;
    double reference_magnitude = 0.0;  // |magnitude| at entry or at the last scale-in
    double pending_magnitude = 0.0;    // magnitude behind the outstanding open or scale-in
};

class PositionManager {
public:
    explicit PositionManager(const EngineConfig& config);

    // Re-derives the state from the authoritative snapshot position. Called for
    // every option every tick, priced or not.
    void observe(const Instrument& instrument, const Position* observed);

    // Decides this tick's action for an observed instrument. The returned order
    // has not been through risk; a clip or veto leaves the recorded state as is.
    std::optional<Order> decide(const Instrument& instrument,
                                const Signal& signal,
                                const MarketQuote& quote);

    [[nodiscard]] PositionState state(const std::string& instrument) const;
    [[nodiscard]] const PositionRecord* record(const std::string& instrument) const;

private:
    std::optional<Order> decide_held(const Instrument& instrument,
                                     PositionRecord& record,
                                     const Signal& signal,
                                     const MarketQuote& quote);
    Order start_unwind(const Instrument& instrument, PositionRecord& record, const char* reason, double mid);

    std::int64_t qty_per_trade_;
    std::int64_t max_position_;
    double close_threshold_;
    double scale_step_;
    double profit_target_fraction_;
    std::unordered_map<std::string, PositionRecord> records_;
};

} // namespace volarb
