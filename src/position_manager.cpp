#include <volarb/position_manager.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>

namespace volarb {

namespace {

int sign_of(std::int64_t quantity) {
    return quantity > 0 ? 1 : (quantity < 0 ? -1 : 0);
}

const char* side_name(int side) {
    return side > 0 ? "long" : "short";
}

} // namespace

const char* to_string(PositionState state) {
    switch (state) {
    case PositionState::Flat:
        return "FLAT";
    case PositionState::Opening:
        return "OPENING";
    case PositionState::Held:
        return "HELD";
    case PositionState::Scaling:
        return "SCALING";
    case PositionState::Unwinding:
        return "UNWINDING";
    }
    return "UNKNOWN";
}

PositionManager::PositionManager(const EngineConfig& config)
    : qty_per_trade_(config.limits.options_qty_per_trade),
      max_position_(config.limits.max_option_position),
      close_threshold_(config.close_threshold),
      scale_step_(config.scale_step),
      profit_target_fraction_(config.profit_target_fraction) {}

void PositionManager::observe(const Instrument& instrument, const Position* observed) {
    PositionRecord& record = records_[instrument.id];
    const std::int64_t quantity = observed != nullptr ? observed->quantity : 0;
    const double average_price = observed != nullptr ? observed->average_price : 0.0;

    if (quantity == 0) {
        if (record.state == PositionState::Unwinding || record.state == PositionState::Held ||
            record.state == PositionState::Scaling) {
            spdlog::info("Closed {} {}", side_name(sign_of(record.quantity)), instrument.id);
        } else if (record.state == PositionState::Opening) {
            spdlog::debug("Open order for {} not filled, back to FLAT", instrument.id);
        }
        record = PositionRecord{};
        return;
    }

    const bool flipped = record.quantity != 0 && sign_of(record.quantity) != sign_of(quantity);
    switch (record.state) {
    case PositionState::Flat:
    case PositionState::Opening:
        record.state = PositionState::Held;
        if (record.pending_magnitude != 0.0) {
            record.entry_magnitude = record.pending_magnitude;
            record.reference_magnitude = std::abs(record.pending_magnitude);
        } else {
            record.entry_magnitude.reset();
            record.reference_magnitude = 0.0;
        }
        record.entry_price.reset();
        break;
    case PositionState::Scaling:
        record.state = PositionState::Held;
        // The widened edge becomes the reference only once the scale-in filled.
        if (sign_of(quantity) == sign_of(record.quantity) && std::llabs(quantity) > std::llabs(record.quantity)) {
            record.reference_magnitude = std::abs(record.pending_magnitude);
        }
        break;
    case PositionState::Held:
    case PositionState::Unwinding:
        break;
    }
    if (flipped) {
        // Position crossed zero outside our control; treat it as a fresh entry.
        spdlog::warn("Position in {} changed side ({} -> {})", instrument.id, record.quantity, quantity);
        record.state = PositionState::Held;
        record.entry_magnitude.reset();
        record.reference_magnitude = 0.0;
    }

    record.pending_magnitude = 0.0;
    record.quantity = quantity;
    if (average_price > 0.0) {
        record.entry_price = average_price;
    }
}

std::optional<Order> PositionManager::decide(const Instrument& instrument,
                                             const Signal& signal,
                                             const MarketQuote& quote) {
    PositionRecord& record = records_[instrument.id];

    switch (record.state) {
    case PositionState::Flat: {
        if (signal.direction == Direction::None) {
            return std::nullopt;
        }
        const int side = sign(signal.direction);
        record.state = PositionState::Opening;
        record.pending_magnitude = signal.magnitude;
        spdlog::info("Opening {} {} at {:.2f} with target {:.2f}",
                     side_name(side),
                     instrument.id,
                     quote.mid,
                     quote.mid + signal.magnitude);
        return market_order(instrument.id, side * qty_per_trade_);
    }
    case PositionState::Held:
        return decide_held(instrument, record, signal, quote);
    case PositionState::Unwinding:
        if (record.quantity == 0) {
            return std::nullopt;
        }
        return market_order(instrument.id, -record.quantity);
    case PositionState::Opening:
    case PositionState::Scaling:
        // An order is already outstanding; the next snapshot settles it.
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<Order> PositionManager::decide_held(const Instrument& instrument,
                                                  PositionRecord& record,
                                                  const Signal& signal,
                                                  const MarketQuote& quote) {
    if (!record.entry_magnitude) {
        record.entry_magnitude = signal.magnitude;
        record.reference_magnitude = std::abs(signal.magnitude);
    }
    if (!record.entry_price) {
        record.entry_price = quote.mid;
    }

    const int held = sign_of(record.quantity);
    const double edge = signal.magnitude * static_cast<double>(held);

    if (edge < 0.0) {
        return start_unwind(instrument, record, "signal reversed", quote.mid);
    }
    if (std::abs(signal.magnitude) < close_threshold_) {
        return start_unwind(instrument, record, "spread converged", quote.mid);
    }

    const double entry_edge = std::abs(*record.entry_magnitude);
    const double captured = (quote.mid - *record.entry_price) * static_cast<double>(held);
    if (entry_edge > 0.0 && captured >= profit_target_fraction_ * entry_edge) {
        return start_unwind(instrument, record, "profit target met", quote.mid);
    }

    const double current = std::abs(signal.magnitude);
    const bool same_direction = sign(signal.direction) == held;
    const bool widened = current > record.reference_magnitude && current >= record.reference_magnitude + scale_step_;
    if (same_direction && widened && std::llabs(record.quantity) + qty_per_trade_ <= max_position_) {
        record.state = PositionState::Scaling;
        record.pending_magnitude = signal.magnitude;
        spdlog::info("Scaling {} {} at {:.2f}, edge widened to {:.3f}",
                     side_name(held),
                     instrument.id,
                     quote.mid,
                     current);
        return market_order(instrument.id, held * qty_per_trade_);
    }

    return std::nullopt;
}

Order PositionManager::start_unwind(const Instrument& instrument,
                                    PositionRecord& record,
                                    const char* reason,
                                    double mid) {
    record.state = PositionState::Unwinding;
    spdlog::info("Closing {} {} at {:.2f}: {}", side_name(sign_of(record.quantity)), instrument.id, mid, reason);
    return market_order(instrument.id, -record.quantity);
}

PositionState PositionManager::state(const std::string& instrument) const {
    const auto it = records_.find(instrument);
    return it == records_.end() ? PositionState::Flat : it->second.state;
}

const PositionRecord* PositionManager::record(const std::string& instrument) const {
    const auto it = records_.find(instrument);
    return it == records_.end() ? nullptr : &it->second;
}

} // namespace volarb
