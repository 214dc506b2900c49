#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

using Catch::Approx;

#include <cmath>
#include <cstdlib>

#include <volarb/config.hpp>
#include <volarb/order.hpp>
#include <volarb/risk_governor.hpp>

namespace {

volarb::RiskLimits make_limits() {
    volarb::RiskLimits limits;
    limits.options_qty_per_trade = 90;
    limits.shares_order_limit = 10000;
    limits.net_delta_limit = 5000.0;
    limits.max_option_position = 180;
    limits.max_underlying_position = 50000;
    return limits;
}

volarb::RiskContext shares(std::int64_t position = 0) {
    return volarb::RiskContext{.is_option = false, .position = position, .delta_per_unit = 1.0};
}

} // namespace

TEST_CASE("Hedge within the per-order cap passes unchanged") {
    volarb::RiskGovernor governor(make_limits());
    governor.begin_tick(7000.0);

    const auto decision = governor.clip(volarb::market_order("RTM", -7000), shares());

    REQUIRE(decision.verdict == volarb::Verdict::Approved);
    REQUIRE(decision.order.has_value());
    REQUIRE(decision.order->quantity == -7000);
    REQUIRE(governor.projected_net_delta() == Approx(0.0));
}

TEST_CASE("Hedge above the per-order cap is clipped and leaves residual delta") {
    auto limits = make_limits();
    limits.shares_order_limit = 4000;
    volarb::RiskGovernor governor(limits);
    governor.begin_tick(7000.0);

    const auto decision = governor.clip(volarb::market_order("RTM", -7000), shares());

    REQUIRE(decision.verdict == volarb::Verdict::Clipped);
    REQUIRE(decision.order->quantity == -4000);
    REQUIRE(governor.projected_net_delta() == Approx(3000.0));
    REQUIRE(std::abs(governor.projected_net_delta()) <= limits.net_delta_limit);
    REQUIRE(governor.counters().clipped == 1);
}

TEST_CASE("Per-order caps never increase and bound every order") {
    volarb::RiskGovernor governor(make_limits());
    governor.begin_tick(0.0);

    const auto small = governor.clip(volarb::market_order("RTM50C", 10),
                                     volarb::RiskContext{.is_option = true, .position = 0, .delta_per_unit = 50.0});
    REQUIRE(small.order->quantity == 10);

    const auto large = governor.clip(volarb::market_order("RTM50P", -500),
                                     volarb::RiskContext{.is_option = true, .position = 0, .delta_per_unit = -50.0});
    REQUIRE(large.verdict == volarb::Verdict::Clipped);
    REQUIRE(large.order->quantity == -90);
    REQUIRE(std::llabs(large.order->quantity) <= make_limits().options_qty_per_trade);
}

TEST_CASE("Orders that would push net delta past the cap are scaled down") {
    volarb::RiskGovernor governor(make_limits());
    governor.begin_tick(3000.0);

    // 90 calls at 52 delta-shares each would add 4680.
    const auto decision = governor.clip(volarb::market_order("RTM50C", 90),
                                        volarb::RiskContext{.is_option = true, .position = 0, .delta_per_unit = 52.0});

    REQUIRE(decision.verdict == volarb::Verdict::Clipped);
    REQUIRE(decision.order->quantity == 38); // floor(2000 / 52)
    REQUIRE(governor.projected_net_delta() <= 5000.0);
    REQUIRE(governor.projected_net_delta() == Approx(3000.0 + 38 * 52.0));
}

TEST_CASE("Orders with no room left are vetoed without intervention") {
    volarb::RiskGovernor governor(make_limits());
    governor.begin_tick(4990.0);

    const auto decision = governor.clip(volarb::market_order("RTM50C", 90),
                                        volarb::RiskContext{.is_option = true, .position = 0, .delta_per_unit = 52.0});

    REQUIRE(decision.verdict == volarb::Verdict::Vetoed);
    REQUIRE_FALSE(decision.order.has_value());
    REQUIRE_FALSE(decision.intervention);
    REQUIRE_FALSE(governor.intervention_required());
    REQUIRE(governor.projected_net_delta() == Approx(4990.0));
}

TEST_CASE("Breached book vetoes exposure-increasing orders and flags intervention") {
    volarb::RiskGovernor governor(make_limits());
    governor.begin_tick(-6000.0);

    const auto decision = governor.clip(volarb::market_order("RTM50P", 10),
                                        volarb::RiskContext{.is_option = true, .position = 0, .delta_per_unit = -48.0});

    REQUIRE(decision.verdict == volarb::Verdict::Vetoed);
    REQUIRE(decision.intervention);
    REQUIRE(governor.intervention_required());
    REQUIRE(governor.counters().vetoed == 1);
    REQUIRE_FALSE(decision.reason.empty());
}

TEST_CASE("Breached book still accepts reducing orders") {
    volarb::RiskGovernor governor(make_limits());
    governor.begin_tick(7000.0);

    const auto partial = governor.clip(volarb::market_order("RTM", -1000), shares());
    REQUIRE(partial.verdict == volarb::Verdict::Approved);
    REQUIRE(governor.projected_net_delta() == Approx(6000.0));
    REQUIRE_FALSE(governor.intervention_required());

    const auto rest = governor.clip(volarb::market_order("RTM", -10000), shares(-1000));
    REQUIRE(rest.verdict == volarb::Verdict::Approved);
    REQUIRE(governor.projected_net_delta() == Approx(-4000.0));
}

TEST_CASE("Reducing orders are clipped where they would overshoot the far bound") {
    auto limits = make_limits();
    limits.shares_order_limit = 20000;
    volarb::RiskGovernor governor(limits);
    governor.begin_tick(7000.0);

    const auto decision = governor.clip(volarb::market_order("RTM", -15000), shares());

    REQUIRE(decision.verdict == volarb::Verdict::Clipped);
    REQUIRE(decision.order->quantity == -12000);
    REQUIRE(governor.projected_net_delta() == Approx(-5000.0));
}

TEST_CASE("Position cap rejects instead of clipping") {
    volarb::RiskGovernor governor(make_limits());
    governor.begin_tick(0.0);

    const auto rejected = governor.clip(volarb::market_order("RTM50C", 90),
                                        volarb::RiskContext{.is_option = true, .position = 120, .delta_per_unit = 10.0});
    REQUIRE(rejected.verdict == volarb::Verdict::Rejected);
    REQUIRE_FALSE(rejected.order.has_value());

    const auto reducing = governor.clip(volarb::market_order("RTM50C", -90),
                                        volarb::RiskContext{.is_option = true, .position = 120, .delta_per_unit = 10.0});
    REQUIRE(reducing.verdict == volarb::Verdict::Approved);
    REQUIRE(reducing.order->quantity == -90);
    REQUIRE(governor.counters().rejected == 1);
}

TEST_CASE("Zero quantity orders are vetoed and reported") {
    volarb::RiskGovernor governor(make_limits());
    governor.begin_tick(0.0);

    const auto decision = governor.clip(volarb::market_order("RTM", 0), shares());
    REQUIRE(decision.verdict == volarb::Verdict::Vetoed);
    REQUIRE(decision.reason == "zero quantity");
}

TEST_CASE("Limit order price survives clipping") {
    auto limits = make_limits();
    limits.shares_order_limit = 500;
    volarb::RiskGovernor governor(limits);
    governor.begin_tick(0.0);

    const auto decision = governor.clip(volarb::limit_order("RTM", -800, 50.12), shares(800));
    REQUIRE(decision.verdict == volarb::Verdict::Clipped);
    REQUIRE(decision.order->quantity == -500);
    REQUIRE(decision.order->type == volarb::OrderType::Limit);
    REQUIRE(*decision.order->price == Approx(50.12));
}
