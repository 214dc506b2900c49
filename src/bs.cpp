#include <volarb/bs.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace volarb {

namespace bs {

namespace {

void check_inputs(double spot, double strike, double time_to_expiry, double volatility, double rate) {
    if (!std::isfinite(spot) || spot <= 0.0) {
        throw std::invalid_argument("spot must be positive");
    }
    if (!std::isfinite(strike) || strike <= 0.0) {
        throw std::invalid_argument("strike must be positive");
    }
    if (!std::isfinite(time_to_expiry) || time_to_expiry < 0.0) {
        throw std::invalid_argument("time_to_expiry must be non-negative");
    }
    if (!std::isfinite(volatility) || volatility <= 0.0) {
        throw std::invalid_argument("volatility must be positive");
    }
    if (!std::isfinite(rate)) {
        throw std::invalid_argument("rate must be finite");
    }
}

double expiry_delta(InstrumentKind kind, double spot, double strike) {
    if (kind == InstrumentKind::Call) {
        return spot > strike ? 1.0 : 0.0;
    }
    return spot < strike ? -1.0 : 0.0;
}

} // namespace

double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double intrinsic(InstrumentKind kind, double spot, double strike) {
    if (kind == InstrumentKind::Call) {
        return std::max(0.0, spot - strike);
    }
    return std::max(0.0, strike - spot);
}

TheoreticalValue price(double spot,
                       double strike,
                       double time_to_expiry,
                       double volatility,
                       double rate,
                       InstrumentKind kind) {
    if (kind == InstrumentKind::Underlying) {
        throw std::invalid_argument("price requires a call or put");
    }
    check_inputs(spot, strike, time_to_expiry, volatility, rate);

    if (time_to_expiry == 0.0) {
        return TheoreticalValue{.price = intrinsic(kind, spot, strike),
                                .delta = expiry_delta(kind, spot, strike)};
    }

    const double sqrt_tau = std::sqrt(time_to_expiry);
    const double d1 =
        (std::log(spot / strike) + (rate + 0.5 * volatility * volatility) * time_to_expiry) / (volatility * sqrt_tau);
    const double d2 = d1 - volatility * sqrt_tau;
    const double disc = std::exp(-rate * time_to_expiry);

    if (kind == InstrumentKind::Call) {
        const double nd1 = normal_cdf(d1);
        return TheoreticalValue{.price = spot * nd1 - strike * disc * normal_cdf(d2), .delta = nd1};
    }
    const double nd1_put = normal_cdf(-d1);
    return TheoreticalValue{.price = strike * disc * normal_cdf(-d2) - spot * nd1_put, .delta = -nd1_put};
}

} // namespace bs

} // namespace volarb
