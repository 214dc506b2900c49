#include <volarb/risk_governor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace volarb {

namespace {

constexpr double kEpsilon = 1e-9;

std::string join(std::string lhs, const std::string& rhs) {
    if (lhs.empty()) {
        return rhs;
    }
    return lhs + "; " + rhs;
}

} // namespace

const char* to_string(Verdict verdict) {
    switch (verdict) {
    case Verdict::Approved:
        return "APPROVED";
    case Verdict::Clipped:
        return "CLIPPED";
    case Verdict::Vetoed:
        return "VETOED";
    case Verdict::Rejected:
        return "REJECTED";
    }
    return "UNKNOWN";
}

RiskGovernor::RiskGovernor(RiskLimits limits)
    : limits_(limits) {}

void RiskGovernor::begin_tick(double net_delta) noexcept {
    projected_net_delta_ = net_delta;
}

RiskDecision RiskGovernor::clip(const Order& order, const RiskContext& context) {
    RiskDecision decision;
    if (order.quantity == 0) {
        decision.verdict = Verdict::Vetoed;
        decision.reason = "zero quantity";
        return finish(std::move(decision));
    }

    const std::int64_t side = order.quantity > 0 ? 1 : -1;
    std::int64_t qty = std::llabs(order.quantity);

    const std::int64_t order_cap = context.is_option ? limits_.options_qty_per_trade : limits_.shares_order_limit;
    if (qty > order_cap) {
        decision.reason = join(decision.reason,
                               "per-order cap " + std::to_string(order_cap) + " (requested " +
                                   std::to_string(qty) + ")");
        qty = order_cap;
        decision.verdict = Verdict::Clipped;
    }

    const std::int64_t position_cap =
        context.is_option ? limits_.max_option_position : limits_.max_underlying_position;
    const std::int64_t resulting = context.position + side * qty;
    if (std::llabs(resulting) > position_cap && std::llabs(resulting) > std::llabs(context.position)) {
        decision.verdict = Verdict::Rejected;
        decision.reason = join(decision.reason,
                               "position " + std::to_string(resulting) + " would exceed cap " +
                                   std::to_string(position_cap));
        return finish(std::move(decision));
    }

    const double unit_delta = static_cast<double>(side) * context.delta_per_unit;
    if (std::abs(unit_delta) > kEpsilon) {
        const double limit = limits_.net_delta_limit;
        const double net = projected_net_delta_;
        const double direction = unit_delta > 0.0 ? 1.0 : -1.0;
        const double projected = net + static_cast<double>(qty) * unit_delta;

        if (std::abs(projected) > limit) {
            if (std::abs(net) > limit && net * direction >= 0.0) {
                decision.verdict = Verdict::Vetoed;
                decision.intervention = true;
                decision.reason = join(decision.reason,
                                       "net delta " + std::to_string(net) + " already beyond limit");
                return finish(std::move(decision));
            }

            const double room = (limit - net * direction) / std::abs(unit_delta);
            const auto max_qty = static_cast<std::int64_t>(std::floor(room + kEpsilon));
            if (max_qty < qty) {
                decision.reason = join(decision.reason,
                                       "net delta cap " + std::to_string(limit) + " allows " +
                                           std::to_string(std::max<std::int64_t>(max_qty, 0)));
                if (max_qty <= 0) {
                    decision.verdict = Verdict::Vetoed;
                    return finish(std::move(decision));
                }
                qty = max_qty;
                decision.verdict = Verdict::Clipped;
            }
        }
    }

    Order approved = order;
    approved.quantity = side * qty;
    projected_net_delta_ += static_cast<double>(qty) * unit_delta;
    decision.order = std::move(approved);
    return finish(std::move(decision));
}

RiskDecision RiskGovernor::finish(RiskDecision decision) {
    switch (decision.verdict) {
    case Verdict::Approved:
        ++counters_.approved;
        break;
    case Verdict::Clipped:
        ++counters_.clipped;
        spdlog::warn("Risk clipped order to {} {}: {}",
                     decision.order->action(),
                     std::llabs(decision.order->quantity),
                     decision.reason);
        break;
    case Verdict::Vetoed:
        ++counters_.vetoed;
        if (decision.intervention) {
            intervention_ = true;
            spdlog::error("Risk veto, intervention required: {}", decision.reason);
        } else {
            spdlog::warn("Risk veto: {}", decision.reason);
        }
        break;
    case Verdict::Rejected:
        ++counters_.rejected;
        spdlog::warn("Risk rejected order: {}", decision.reason);
        break;
    }
    return decision;
}

double RiskGovernor::projected_net_delta() const noexcept {
    return projected_net_delta_;
}

bool RiskGovernor::intervention_required() const noexcept {
    return intervention_;
}

const RiskCounters& RiskGovernor::counters() const noexcept {
    return counters_;
}

const RiskLimits& RiskGovernor::limits() const noexcept {
    return limits_;
}

} // namespace volarb
