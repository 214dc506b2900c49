#include <volarb/exposure.hpp>

#include <utility>

namespace volarb {

DeltaExposure compute_exposure(const InstrumentBook& book,
                               const PositionMap& positions,
                               const TheoreticalMap& theoreticals,
                               std::int64_t underlying_position) {
    DeltaExposure exposure;
    exposure.underlying_delta = static_cast<double>(underlying_position);

    for (const auto& option : book.options()) {
        const auto pos = positions.find(option.id);
        if (pos == positions.end() || pos->second.quantity == 0) {
            continue;
        }
        const auto theo = theoreticals.find(option.id);
        if (theo == theoreticals.end()) {
            exposure.unpriced.push_back(option.id);
            continue;
        }

        LegDelta leg;
        leg.instrument = option.id;
        leg.quantity = pos->second.quantity;
        leg.delta = theo->second.delta;
        leg.delta_shares = leg.delta * static_cast<double>(leg.quantity) * option.multiplier;

        exposure.option_delta += leg.delta_shares;
        exposure.legs.push_back(std::move(leg));
    }

    return exposure;
}

} // namespace volarb
