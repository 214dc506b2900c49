#include <volarb/instrument.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace volarb {

namespace {

bool parse_strike(std::string_view token, double& value) {
    if (token.empty()) {
        return false;
    }
    try {
        const std::string text(token);
        size_t idx = 0;
        value = std::stod(text, &idx);
        if (idx != text.size() || !std::isfinite(value) || value <= 0.0) {
            return false;
        }
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

std::string format_strike(double strike) {
    if (strike == std::floor(strike)) {
        return fmt::format("{:.0f}", strike);
    }
    return fmt::format("{}", strike);
}

} // namespace

const char* to_string(InstrumentKind kind) {
    switch (kind) {
    case InstrumentKind::Underlying:
        return "underlying";
    case InstrumentKind::Call:
        return "call";
    case InstrumentKind::Put:
        return "put";
    }
    return "unknown";
}

std::optional<Instrument> parse_option_ticker(std::string_view ticker,
                                              std::string_view underlying,
                                              double multiplier) {
    if (underlying.empty() || ticker.size() < underlying.size() + 2) {
        return std::nullopt;
    }
    if (ticker.substr(0, underlying.size()) != underlying) {
        return std::nullopt;
    }

    const char suffix = ticker.back();
    InstrumentKind kind = InstrumentKind::Underlying;
    if (suffix == 'C') {
        kind = InstrumentKind::Call;
    } else if (suffix == 'P') {
        kind = InstrumentKind::Put;
    } else {
        return std::nullopt;
    }

    const std::string_view strike_token =
        ticker.substr(underlying.size(), ticker.size() - underlying.size() - 1);
    double strike = 0.0;
    if (!parse_strike(strike_token, strike)) {
        return std::nullopt;
    }

    return Instrument{.id = std::string(ticker), .kind = kind, .strike = strike, .multiplier = multiplier};
}

InstrumentBook::InstrumentBook(Instrument underlying)
    : underlying_(std::move(underlying)) {
    if (underlying_.is_option()) {
        throw std::invalid_argument("instrument book requires a non-option underlying");
    }
    if (underlying_.id.empty()) {
        throw std::invalid_argument("underlying id must not be empty");
    }
}

void InstrumentBook::add_option(Instrument option) {
    if (!option.is_option()) {
        throw std::invalid_argument("add_option requires a call or put");
    }
    if (!(option.strike > 0.0) || !(option.multiplier > 0.0)) {
        throw std::invalid_argument("option '" + option.id + "' needs positive strike and multiplier");
    }
    if (option.id == underlying_.id || index_.contains(option.id)) {
        throw std::invalid_argument("duplicate instrument id '" + option.id + "'");
    }
    index_.emplace(option.id, options_.size());
    options_.push_back(std::move(option));
}

const Instrument& InstrumentBook::underlying() const noexcept {
    return underlying_;
}

const std::vector<Instrument>& InstrumentBook::options() const noexcept {
    return options_;
}

const Instrument* InstrumentBook::find(std::string_view id) const {
    if (id == underlying_.id) {
        return &underlying_;
    }
    const auto it = index_.find(std::string(id));
    if (it == index_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

std::size_t InstrumentBook::size() const noexcept {
    return options_.size() + 1;
}

InstrumentBook make_option_chain(const std::string& underlying,
                                 const std::vector<double>& strikes,
                                 double shares_per_contract) {
    InstrumentBook book(Instrument{.id = underlying, .kind = InstrumentKind::Underlying, .strike = 0.0, .multiplier = 1.0});
    for (const double strike : strikes) {
        const std::string k = format_strike(strike);
        book.add_option(Instrument{.id = underlying + k + "C",
                                   .kind = InstrumentKind::Call,
                                   .strike = strike,
                                   .multiplier = shares_per_contract});
        book.add_option(Instrument{.id = underlying + k + "P",
                                   .kind = InstrumentKind::Put,
                                   .strike = strike,
                                   .multiplier = shares_per_contract});
    }
    return book;
}

} // namespace volarb
