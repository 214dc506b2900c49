#include <volarb/signal.hpp>

#include <cmath>

namespace volarb {

Signal evaluate(double theoretical_value, double market_mid, double threshold) {
    Signal signal;
    if (!std::isfinite(theoretical_value) || !std::isfinite(market_mid)) {
        return signal;
    }
    signal.magnitude = theoretical_value - market_mid;

    const double bound = std::abs(threshold);
    if (signal.magnitude > 0.0 && signal.magnitude >= bound) {
        signal.direction = Direction::Long;
    } else if (signal.magnitude < 0.0 && signal.magnitude <= -bound) {
        signal.direction = Direction::Short;
    }
    return signal;
}

const char* to_string(Direction direction) {
    switch (direction) {
    case Direction::Long:
        return "LONG";
    case Direction::Short:
        return "SHORT";
    case Direction::None:
        return "NONE";
    }
    return "UNKNOWN";
}

} // namespace volarb
