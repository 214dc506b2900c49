#pragma once

#include <volarb/instrument.hpp>

namespace volarb {

namespace bs {

struct TheoreticalValue {
    double price = 0.0;
    double delta = 0.0;
};

double normal_cdf(double x);

double intrinsic(InstrumentKind kind, double spot, double strike);

// Black-Scholes value and delta. At time_to_expiry == 0 the value is intrinsic
// and delta is a step. Throws std::invalid_argument on non-finite inputs,
// non-positive spot, strike or volatility, negative time, or a non-option kind.
TheoreticalValue price(double spot,
                       double strike,
                       double time_to_expiry,
                       double volatility,
                       double rate,
                       InstrumentKind kind);

} // namespace bs

} // namespace volarb
