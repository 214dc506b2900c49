#include <volarb/vol_tracker.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace volarb {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

std::optional<double> to_double(const std::string& token) {
    try {
        size_t idx = 0;
        const double value = std::stod(token, &idx);
        if (idx != token.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::int64_t> find_week(const std::string& text) {
    static const std::regex week_expression(R"(\bweek\s+(\d+)\b)", kFlags);
    std::smatch match;
    if (!std::regex_search(text, match, week_expression)) {
        return std::nullopt;
    }
    try {
        return static_cast<std::int64_t>(std::stoll(match[1].str()));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

std::vector<VolPattern> default_vol_patterns() {
    std::vector<VolPattern> patterns;
    patterns.push_back(VolPattern{
        "realized-volatility-sentence",
        std::regex(R"(reali[sz]ed\s+volatility[^.%]*?\b(?:is|was|will\s+be|of|at|to)\s+(\d+(?:\.\d+)?)\s*(%?))",
                   kFlags)});
    patterns.push_back(VolPattern{
        "realized-volatility-field",
        std::regex(R"(reali[sz]ed\s+vol(?:atility)?\s*[:=]\s*(\d+(?:\.\d+)?)\s*(%?))", kFlags)});
    patterns.push_back(VolPattern{
        "rv-field",
        std::regex(R"(\bRV\s*[:=]\s*(\d+(?:\.\d+)?)\s*(%?))", kFlags)});
    return patterns;
}

std::optional<Announcement> parse_announcement(std::string_view text, const std::vector<VolPattern>& patterns) {
    const std::string body(text);
    for (const auto& pattern : patterns) {
        std::smatch match;
        if (!std::regex_search(body, match, pattern.expression)) {
            continue;
        }
        const auto raw = to_double(match[1].str());
        if (!raw) {
            continue;
        }
        double value = *raw;
        const bool percent = match.size() > 2 && match[2].matched && match[2].length() > 0;
        if (percent || value >= 1.0) {
            value /= 100.0;
        }
        if (!(value > 0.0)) {
            return std::nullopt;
        }
        return Announcement{.volatility = value, .week = find_week(body), .pattern = pattern.name};
    }
    return std::nullopt;
}

RealizedVolTracker::RealizedVolTracker(std::optional<double> seed, std::vector<VolPattern> patterns)
    : patterns_(std::move(patterns)) {
    if (seed) {
        if (!std::isfinite(*seed) || *seed <= 0.0) {
            throw std::invalid_argument("seed volatility must be positive");
        }
        state_.volatility = *seed;
    }
}

bool RealizedVolTracker::update(std::string_view text, std::optional<std::int64_t> sequence, std::int64_t tick) {
    const auto announcement = parse_announcement(text, patterns_);
    if (!announcement) {
        ++parse_misses_;
        spdlog::warn("No realized volatility found in announcement '{}'", text);
        return false;
    }

    const bool stale_week = announcement->week && state_.week && *announcement->week <= *state_.week;
    const bool stale_sequence = sequence && state_.sequence && *sequence <= *state_.sequence;
    if (stale_week || stale_sequence) {
        ++stale_;
        spdlog::debug("Ignoring stale volatility announcement (week {}, sequence {})",
                      announcement->week.value_or(-1),
                      sequence.value_or(-1));
        return false;
    }

    if (announcement->week) {
        state_.week = announcement->week;
    }
    if (sequence) {
        state_.sequence = sequence;
    }
    state_.updated_tick = tick;

    const bool changed = !state_.volatility || *state_.volatility != announcement->volatility;
    state_.volatility = announcement->volatility;
    if (changed) {
        spdlog::info("Realized volatility now {:.4f} ({})", announcement->volatility, announcement->pattern);
    }
    return changed;
}

bool RealizedVolTracker::update(const NewsItem& item) {
    return update(item.body, item.id, item.tick);
}

std::optional<double> RealizedVolTracker::current() const noexcept {
    return state_.volatility;
}

const VolState& RealizedVolTracker::state() const noexcept {
    return state_;
}

std::size_t RealizedVolTracker::parse_misses() const noexcept {
    return parse_misses_;
}

std::size_t RealizedVolTracker::stale_announcements() const noexcept {
    return stale_;
}

} // namespace volarb
