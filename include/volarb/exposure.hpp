#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <volarb/bs.hpp>
#include <volarb/instrument.hpp>
#include <volarb/market.hpp>

namespace volarb {

using TheoreticalMap = std::unordered_map<std::string, bs::TheoreticalValue>;
using PositionMap = std::unordered_map<std::string, Position>;

struct LegDelta {
    std::string instrument;
    std::int64_t quantity = 0;
    double delta = 0.0;        // per contract, unscaled
    double delta_shares = 0.0; // delta x quantity x multiplier
};

struct DeltaExposure {
    double option_delta = 0.0;     // shares
    double underlying_delta = 0.0; // shares
    std::vector<LegDelta> legs;
    std::vector<std::string> unpriced; // open option legs with no theoretical this tick

    [[nodiscard]] double net() const noexcept {
        return option_delta + underlying_delta;
    }
};

DeltaExposure compute_exposure(const InstrumentBook& book,
                               const PositionMap& positions,
                               const TheoreticalMap& theoreticals,
                               std::int64_t underlying_position);

} // namespace volarb
