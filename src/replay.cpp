#include <volarb/replay.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace volarb {

ReplayExchange::ReplayExchange(const InstrumentBook& book, double fee_per_unit)
    : fee_per_unit_(fee_per_unit) {
    if (!std::isfinite(fee_per_unit_) || fee_per_unit_ < 0.0) {
        throw std::invalid_argument("fee_per_unit must be non-negative");
    }
    multipliers_.emplace(book.underlying().id, book.underlying().multiplier);
    for (const auto& option : book.options()) {
        multipliers_.emplace(option.id, option.multiplier);
    }
}

std::optional<Fill> ReplayExchange::submit(const Order& order, const MarketQuote* quote) {
    const auto multiplier = multipliers_.find(order.instrument);
    if (multiplier == multipliers_.end()) {
        spdlog::warn("Replay exchange rejected order for unknown instrument {}", order.instrument);
        return std::nullopt;
    }
    if (order.quantity == 0 || quote == nullptr) {
        return std::nullopt;
    }

    const bool buy = order.is_buy();
    const double touch = buy ? quote->ask : quote->bid;
    double price = touch > 0.0 ? touch : quote->mid;
    if (!(price > 0.0)) {
        return std::nullopt;
    }

    if (order.type == OrderType::Limit) {
        if (!order.price || touch <= 0.0) {
            return std::nullopt;
        }
        const bool marketable = buy ? touch <= *order.price : touch >= *order.price;
        if (!marketable) {
            return std::nullopt;
        }
        price = touch;
    }

    Fill fill{.instrument = order.instrument, .quantity = order.quantity, .price = price};
    apply(fill, multiplier->second);
    return fill;
}

void ReplayExchange::apply(const Fill& fill, double multiplier) {
    Position& position = positions_[fill.instrument];
    position.instrument = fill.instrument;

    const std::int64_t before = position.quantity;
    const std::int64_t after = before + fill.quantity;
    if (before == 0 || (before > 0) == (fill.quantity > 0)) {
        const double held = static_cast<double>(std::llabs(before));
        const double added = static_cast<double>(std::llabs(fill.quantity));
        position.average_price = (position.average_price * held + fill.price * added) / (held + added);
    } else if (after == 0) {
        position.average_price = 0.0;
    } else if ((after > 0) != (before > 0)) {
        position.average_price = fill.price;
    }
    position.quantity = after;

    cash_ -= static_cast<double>(fill.quantity) * fill.price * multiplier;
    cash_ -= static_cast<double>(std::llabs(fill.quantity)) * fee_per_unit_;
}

void ReplayExchange::mark(const std::vector<MarketQuote>& quotes) {
    for (const auto& quote : quotes) {
        if (quote.mid > 0.0) {
            marks_[quote.instrument] = quote.mid;
        }
    }
}

const PositionMap& ReplayExchange::positions() const noexcept {
    return positions_;
}

double ReplayExchange::cash() const noexcept {
    return cash_;
}

double ReplayExchange::net_liquidation_value() const {
    double value = cash_;
    for (const auto& [id, position] : positions_) {
        const auto mark = marks_.find(id);
        if (position.quantity == 0 || mark == marks_.end()) {
            continue;
        }
        value += static_cast<double>(position.quantity) * mark->second * multipliers_.at(id);
    }
    return value;
}

ReplaySummary run_replay(Engine& engine, ReplayExchange& exchange, const std::vector<MarketFrame>& frames) {
    ReplaySummary summary;
    const std::int64_t session_ticks = engine.config().ticks_per_session;

    for (const auto& frame : frames) {
        MarketSnapshot snapshot;
        snapshot.tick = frame.tick;
        snapshot.status = frame.tick < session_ticks ? MarketStatus::Active : MarketStatus::Stopped;
        for (const auto& quote : frame.quotes) {
            snapshot.quotes.insert_or_assign(quote.instrument, quote);
        }
        snapshot.positions = exchange.positions();
        snapshot.news = frame.news;

        exchange.mark(frame.quotes);
        const TickReport report = engine.on_tick(snapshot);
        ++summary.ticks;
        summary.last_tick = frame.tick;

        for (const auto& order : report.orders) {
            ++summary.orders;
            const auto fill = exchange.submit(order, snapshot.quote(order.instrument));
            if (!fill) {
                spdlog::debug("{} {} {} {} not filled",
                              to_string(order.type),
                              order.action(),
                              std::llabs(order.quantity),
                              order.instrument);
                continue;
            }
            ++summary.fills;
            spdlog::debug("Filled {} {} {} at {:.2f}", order.action(), std::llabs(fill->quantity), fill->instrument, fill->price);
        }

        if (!report.active) {
            break;
        }
    }

    summary.net_liquidation_value = exchange.net_liquidation_value();
    summary.positions = exchange.positions();
    spdlog::info("TERMINATED at tick {} with {:.2f}", summary.last_tick, summary.net_liquidation_value);
    return summary;
}

} // namespace volarb
