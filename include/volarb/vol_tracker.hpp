#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <volarb/market.hpp>

namespace volarb {

// A recognized phrasing. Capture group 1 holds the number, group 2 an optional '%'.
struct VolPattern {
    std::string name;
    std::regex expression;
};

std::vector<VolPattern> default_vol_patterns();

struct Announcement {
    double volatility = 0.0;            // annualized, decimal
    std::optional<std::int64_t> week;   // period named in the text, if any
    std::string pattern;                // name of the matching phrasing
};

// First matching pattern wins. A value with a '%' sign, or any bare value of
// 1 or more, is a percentage ("1" is 1%, "1.5" is 1.5%); a bare value below 1
// is a decimal ("0.25" is 25%). Returns nullopt for text without a usable value.
std::optional<Announcement> parse_announcement(std::string_view text, const std::vector<VolPattern>& patterns);

struct VolState {
    std::optional<double> volatility;
    std::optional<std::int64_t> week;
    std::optional<std::int64_t> sequence;
    std::int64_t updated_tick = -1;
};

class RealizedVolTracker {
public:
    explicit RealizedVolTracker(std::optional<double> seed = std::nullopt,
                                std::vector<VolPattern> patterns = default_vol_patterns());

    // Applies the announcement if it parses and is newer than the last applied
    // one (by week when the text names one, and by sequence when given).
    // Returns whether the estimate changed. Never throws on bad text.
    bool update(std::string_view text,
                std::optional<std::int64_t> sequence = std::nullopt,
                std::int64_t tick = -1);
    bool update(const NewsItem& item);

    [[nodiscard]] std::optional<double> current() const noexcept;
    [[nodiscard]] const VolState& state() const noexcept;
    [[nodiscard]] std::size_t parse_misses() const noexcept;
    [[nodiscard]] std::size_t stale_announcements() const noexcept;

private:
    std::vector<VolPattern> patterns_;
    VolState state_;
    std::size_t parse_misses_ = 0;
    std::size_t stale_ = 0;
};

} // namespace volarb
