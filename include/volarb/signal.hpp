#pragma once

#include <cstdint>

namespace volarb {

enum class Direction : std::int8_t { Short = -1, None = 0, Long = 1 };

struct Signal {
    Direction direction = Direction::None;
    double magnitude = 0.0; // theoretical - market mid
};

// threshold is an absolute price difference, not a percentage of premium.
// magnitude >= +threshold is LONG (option cheap), <= -threshold is SHORT.
Signal evaluate(double theoretical_value, double market_mid, double threshold);

const char* to_string(Direction direction);

inline int sign(Direction direction) {
    return static_cast<int>(direction);
}

} // namespace volarb
