#include <volarb/engine.hpp>

#include <volarb/bs.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace volarb {

namespace {

EngineConfig validated(EngineConfig config) {
    config.validate();
    return config;
}

} // namespace

Engine::Engine(EngineConfig config)
    : Engine(config, make_option_chain(config.underlying, config.strikes, config.shares_per_contract)) {}

Engine::Engine(EngineConfig config, InstrumentBook book)
    : config_(validated(std::move(config))),
      book_(std::move(book)),
      vol_(config_.seed_volatility),
      positions_(config_),
      hedger_(config_),
      risk_(config_.limits) {}

TickReport Engine::on_tick(const MarketSnapshot& snapshot) {
    TickReport report;
    report.tick = snapshot.tick;
    report.active = snapshot.status == MarketStatus::Active;

    for (const auto& item : snapshot.news) {
        vol_.update(item);
    }
    report.volatility = vol_.current();

    if (!report.active) {
        spdlog::info("Market {} at tick {}, no actions", to_string(snapshot.status), snapshot.tick);
        return report;
    }

    for (const auto& option : book_.options()) {
        const auto it = snapshot.positions.find(option.id);
        positions_.observe(option, it == snapshot.positions.end() ? nullptr : &it->second);
    }

    const Instrument& underlying = book_.underlying();
    const MarketQuote* spot_quote = snapshot.quote(underlying.id);
    if (spot_quote == nullptr || !(spot_quote->mid > 0.0)) {
        spdlog::warn("No usable quote for {} at tick {}, skipping tick", underlying.id, snapshot.tick);
        report.skipped = book_.options().size();
        return report;
    }
    if (!report.volatility) {
        spdlog::debug("Waiting for a realized volatility announcement (tick {})", snapshot.tick);
        report.skipped = book_.options().size();
        return report;
    }

    report.time_to_expiry = snapshot.time_to_expiry_years.value_or(time_to_expiry_years(config_, snapshot.tick));
    const double spot = spot_quote->mid;

    struct Candidate {
        const Instrument* instrument;
        const MarketQuote* quote;
        Signal signal;
    };
    std::vector<Candidate> candidates;
    candidates.reserve(book_.options().size());

    for (const auto& option : book_.options()) {
        const MarketQuote* quote = snapshot.quote(option.id);
        if (quote == nullptr || !(quote->mid > 0.0)) {
            spdlog::debug("No quote for {} at tick {}", option.id, snapshot.tick);
            ++report.skipped;
            continue;
        }
        try {
            const bs::TheoreticalValue theo =
                bs::price(spot, option.strike, report.time_to_expiry, *report.volatility, config_.risk_free_rate, option.kind);
            report.theoreticals.emplace(option.id, theo);
            candidates.push_back(Candidate{&option, quote, evaluate(theo.price, quote->mid, config_.open_threshold)});
            ++report.priced;
        } catch (const std::invalid_argument& ex) {
            spdlog::warn("Pricing failed for {} at tick {}: {}", option.id, snapshot.tick, ex.what());
            ++report.skipped;
        }
    }

    const Position underlying_position = [&] {
        const auto it = snapshot.positions.find(underlying.id);
        return it == snapshot.positions.end() ? Position{.instrument = underlying.id} : it->second;
    }();

    DeltaExposure exposure =
        compute_exposure(book_, snapshot.positions, report.theoreticals, underlying_position.quantity);
    report.net_delta = exposure.net();
    risk_.begin_tick(report.net_delta);

    for (const auto& candidate : candidates) {
        const auto order = positions_.decide(*candidate.instrument, candidate.signal, *candidate.quote);
        if (!order) {
            continue;
        }
        const auto& theo = report.theoreticals.at(candidate.instrument->id);
        submit(report,
               *order,
               RiskContext{.is_option = true,
                           .position = snapshot.position(candidate.instrument->id),
                           .delta_per_unit = theo.delta * candidate.instrument->multiplier});
    }

    // Hedge against the book as it stands once this tick's option orders fill.
    exposure.option_delta = risk_.projected_net_delta() - exposure.underlying_delta;
    const auto hedge = hedger_.rehedge(exposure, underlying_position, spot_quote);
    if (hedge) {
        submit(report,
               *hedge,
               RiskContext{.is_option = false, .position = underlying_position.quantity, .delta_per_unit = 1.0});
    }

    report.projected_net_delta = risk_.projected_net_delta();
    return report;
}

void Engine::submit(TickReport& report, const Order& order, const RiskContext& context) {
    RiskDecision decision = risk_.clip(order, context);
    if (decision.order) {
        report.orders.push_back(*decision.order);
    }
    report.decisions.push_back(std::move(decision));
}

const EngineConfig& Engine::config() const noexcept {
    return config_;
}

const InstrumentBook& Engine::book() const noexcept {
    return book_;
}

const RealizedVolTracker& Engine::volatility() const noexcept {
    return vol_;
}

const PositionManager& Engine::positions() const noexcept {
    return positions_;
}

const RiskGovernor& Engine::risk() const noexcept {
    return risk_;
}

} // namespace volarb
