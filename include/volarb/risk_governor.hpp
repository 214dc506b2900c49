#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <volarb/config.hpp>
#include <volarb/order.hpp>

namespace volarb {

enum class Verdict : std::uint8_t { Approved = 0, Clipped = 1, Vetoed = 2, Rejected = 3 };

const char* to_string(Verdict verdict);

struct RiskContext {
    bool is_option = false;
    std::int64_t position = 0;   // current signed position in the order's instrument
    double delta_per_unit = 1.0; // shares of delta per unit bought (delta x multiplier)
};

struct RiskDecision {
    Verdict verdict = Verdict::Approved;
    std::optional<Order> order; // empty when vetoed or rejected
    std::string reason;
    bool intervention = false;  // book already breached the net-delta cap
};

struct RiskCounters {
    std::size_t approved = 0;
    std::size_t clipped = 0;
    std::size_t vetoed = 0;
    std::size_t rejected = 0;
};

class RiskGovernor {
public:
    explicit RiskGovernor(RiskLimits limits);

    // Starts a tick from the snapshot's net delta; approved orders accumulate on top.
    void begin_tick(double net_delta) noexcept;

    // Applies the per-order cap, the per-instrument position cap and the
    // net-delta cap, in that order. Quantities only ever shrink.
    RiskDecision clip(const Order& order, const RiskContext& context);

    [[nodiscard]] double projected_net_delta() const noexcept;
    [[nodiscard]] bool intervention_required() const noexcept;
    [[nodiscard]] const RiskCounters& counters() const noexcept;
    [[nodiscard]] const RiskLimits& limits() const noexcept;

private:
    RiskDecision finish(RiskDecision decision);

    RiskLimits limits_;
    double projected_net_delta_ = 0.0;
    bool intervention_ = false;
    RiskCounters counters_{};
};

} // namespace volarb
