#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

using Catch::Approx;

#include <stdexcept>

#include <volarb/bs.hpp>

namespace {
constexpr double kTolerance = 1e-6;
}

TEST_CASE("Black-Scholes at-the-money call with zero rate matches reference values") {
    const auto theo = volarb::bs::price(50.0, 50.0, 0.25, 0.20, 0.0, volarb::InstrumentKind::Call);

    REQUIRE(theo.price == Approx(1.993880583837246).margin(kTolerance));
    REQUIRE(theo.delta == Approx(0.5199388058383725).margin(kTolerance));
}

TEST_CASE("Black-Scholes put prices and deltas match reference values") {
    const auto atm = volarb::bs::price(50.0, 50.0, 0.25, 0.20, 0.0, volarb::InstrumentKind::Put);
    REQUIRE(atm.price == Approx(1.993880583837246).margin(kTolerance));
    REQUIRE(atm.delta == Approx(-0.4800611941616275).margin(kTolerance));

    const auto itm = volarb::bs::price(50.0, 52.0, 0.25, 0.20, 0.0, volarb::InstrumentKind::Put);
    REQUIRE(itm.price == Approx(3.1880529927220316).margin(kTolerance));
    REQUIRE(itm.delta == Approx(-0.6339024906561779).margin(kTolerance));
}

TEST_CASE("Black-Scholes uses the supplied risk-free rate") {
    const auto theo = volarb::bs::price(100.0, 100.0, 1.0, 0.20, 0.05, volarb::InstrumentKind::Call);

    REQUIRE(theo.price == Approx(10.4505835721856).margin(kTolerance));
    REQUIRE(theo.delta == Approx(0.636830651175619).margin(kTolerance));
}

TEST_CASE("Put-call parity holds at zero rate") {
    const auto call = volarb::bs::price(50.0, 48.0, 0.1, 0.35, 0.0, volarb::InstrumentKind::Call);
    const auto put = volarb::bs::price(50.0, 48.0, 0.1, 0.35, 0.0, volarb::InstrumentKind::Put);

    REQUIRE(call.price - put.price == Approx(2.0).margin(kTolerance));
    REQUIRE(call.delta - put.delta == Approx(1.0).margin(kTolerance));
}

TEST_CASE("At expiry the value is intrinsic and delta is a step") {
    using volarb::InstrumentKind;

    const auto call_itm = volarb::bs::price(52.0, 50.0, 0.0, 0.20, 0.0, InstrumentKind::Call);
    REQUIRE(call_itm.price == 2.0);
    REQUIRE(call_itm.delta == 1.0);

    const auto call_otm = volarb::bs::price(48.0, 50.0, 0.0, 0.20, 0.0, InstrumentKind::Call);
    REQUIRE(call_otm.price == 0.0);
    REQUIRE(call_otm.delta == 0.0);

    const auto put_itm = volarb::bs::price(48.0, 50.0, 0.0, 0.20, 0.0, InstrumentKind::Put);
    REQUIRE(put_itm.price == 2.0);
    REQUIRE(put_itm.delta == -1.0);

    const auto put_otm = volarb::bs::price(52.0, 50.0, 0.0, 0.20, 0.0, InstrumentKind::Put);
    REQUIRE(put_otm.price == 0.0);
    REQUIRE(put_otm.delta == 0.0);

    const auto at_strike = volarb::bs::price(50.0, 50.0, 0.0, 0.20, 0.0, InstrumentKind::Call);
    REQUIRE(at_strike.price == 0.0);
    REQUIRE(at_strike.delta == 0.0);
}

TEST_CASE("Pricing is deterministic for identical inputs") {
    const auto first = volarb::bs::price(50.3, 51.0, 0.07, 0.27, 0.0, volarb::InstrumentKind::Put);
    const auto second = volarb::bs::price(50.3, 51.0, 0.07, 0.27, 0.0, volarb::InstrumentKind::Put);

    REQUIRE(first.price == second.price);
    REQUIRE(first.delta == second.delta);
}

TEST_CASE("Pricing rejects degenerate inputs") {
    using volarb::InstrumentKind;

    REQUIRE_THROWS_AS(volarb::bs::price(0.0, 50.0, 0.25, 0.2, 0.0, InstrumentKind::Call), std::invalid_argument);
    REQUIRE_THROWS_AS(volarb::bs::price(50.0, -1.0, 0.25, 0.2, 0.0, InstrumentKind::Call), std::invalid_argument);
    REQUIRE_THROWS_AS(volarb::bs::price(50.0, 50.0, -0.01, 0.2, 0.0, InstrumentKind::Call), std::invalid_argument);
    REQUIRE_THROWS_AS(volarb::bs::price(50.0, 50.0, 0.25, 0.0, 0.0, InstrumentKind::Put), std::invalid_argument);
    REQUIRE_THROWS_AS(volarb::bs::price(50.0, 50.0, 0.25, 0.2, 0.0, InstrumentKind::Underlying),
                      std::invalid_argument);
}

TEST_CASE("normal_cdf is symmetric around zero") {
    REQUIRE(volarb::bs::normal_cdf(0.0) == Approx(0.5).margin(kTolerance));
    REQUIRE(volarb::bs::normal_cdf(1.0) + volarb::bs::normal_cdf(-1.0) == Approx(1.0).margin(kTolerance));
    REQUIRE(volarb::bs::normal_cdf(1.96) == Approx(0.9750021).margin(kTolerance));
}
