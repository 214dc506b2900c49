#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

using Catch::Approx;

#include <stdexcept>
#include <vector>

#include <volarb/bs.hpp>
#include <volarb/config.hpp>
#include <volarb/engine.hpp>
#include <volarb/instrument.hpp>
#include <volarb/market.hpp>
#include <volarb/order.hpp>
#include <volarb/replay.hpp>

namespace {

volarb::InstrumentBook single_strike_book() {
    return volarb::make_option_chain("RTM", {50.0}, 100.0);
}

} // namespace

TEST_CASE("Exchange rejects a negative fee") {
    REQUIRE_THROWS_AS(volarb::ReplayExchange(single_strike_book(), -0.01), std::invalid_argument);
}

TEST_CASE("Market orders fill at the touch and pay the fee") {
    volarb::ReplayExchange exchange{single_strike_book(), 0.02};
    const auto quote = volarb::make_quote("RTM50C", 1.48, 1.52, 1.50, 0);

    const auto buy = exchange.submit(volarb::market_order("RTM50C", 90), &quote);
    REQUIRE(buy.has_value());
    REQUIRE(buy->price == Approx(1.52));
    REQUIRE(exchange.cash() == Approx(-90.0 * 1.52 * 100.0 - 90.0 * 0.02));

    const auto sell = exchange.submit(volarb::market_order("RTM50C", -30), &quote);
    REQUIRE(sell->price == Approx(1.48));

    const auto& position = exchange.positions().at("RTM50C");
    REQUIRE(position.quantity == 60);
    REQUIRE(position.average_price == Approx(1.52));
}

TEST_CASE("Limit orders fill only when marketable") {
    volarb::ReplayExchange exchange{single_strike_book(), 0.0};
    const auto quote = volarb::make_quote("RTM", 49.99, 50.01, 50.00, 0);

    REQUIRE_FALSE(exchange.submit(volarb::limit_order("RTM", 100, 49.90), &quote).has_value());
    REQUIRE_FALSE(exchange.submit(volarb::limit_order("RTM", -100, 50.00), &quote).has_value());

    const auto fill = exchange.submit(volarb::limit_order("RTM", 100, 50.05), &quote);
    REQUIRE(fill.has_value());
    REQUIRE(fill->price == Approx(50.01));
    REQUIRE(exchange.positions().at("RTM").quantity == 100);
}

TEST_CASE("Unknown instruments and missing quotes do not fill") {
    volarb::ReplayExchange exchange{single_strike_book(), 0.02};
    const auto quote = volarb::make_quote("RTM49C", 1.9, 2.0, 1.95, 0);

    REQUIRE_FALSE(exchange.submit(volarb::market_order("RTM49C", 10), &quote).has_value());
    REQUIRE_FALSE(exchange.submit(volarb::market_order("RTM50C", 10), nullptr).has_value());
    REQUIRE(exchange.positions().empty());
    REQUIRE(exchange.cash() == 0.0);
}

TEST_CASE("Crossing zero resets the average price") {
    volarb::ReplayExchange exchange{single_strike_book(), 0.0};
    const auto first = volarb::make_quote("RTM", 49.99, 50.01, 50.00, 0);
    const auto second = volarb::make_quote("RTM", 50.49, 50.51, 50.50, 1);

    exchange.submit(volarb::market_order("RTM", 300), &first);
    exchange.submit(volarb::market_order("RTM", -500), &second);

    const auto& position = exchange.positions().at("RTM");
    REQUIRE(position.quantity == -200);
    REQUIRE(position.average_price == Approx(50.49));
}

TEST_CASE("Net liquidation value marks open positions at mid") {
    volarb::ReplayExchange exchange{single_strike_book(), 0.02};
    const auto quote = volarb::make_quote("RTM50C", 1.48, 1.52, 1.50, 0);
    exchange.submit(volarb::market_order("RTM50C", 10), &quote);

    exchange.mark({volarb::make_quote("RTM50C", 1.58, 1.62, 1.60, 1)});
    const double expected = -10.0 * 1.52 * 100.0 - 10.0 * 0.02 + 10.0 * 1.60 * 100.0;
    REQUIRE(exchange.net_liquidation_value() == Approx(expected));
}

TEST_CASE("Replay trades the session and stops at the end") {
    volarb::EngineConfig config;
    config.strikes = {50.0};
    config.seed_volatility = 0.20;
    volarb::Engine engine{config};
    volarb::ReplayExchange exchange{engine.book(), config.market_fee};

    const auto fair = volarb::bs::price(50.0, 50.0, volarb::time_to_expiry_years(config, 0), 0.20, 0.0,
                                        volarb::InstrumentKind::Call);
    const double mid = fair.price - 0.10;

    std::vector<volarb::MarketFrame> frames(3);
    frames[0].tick = 0;
    frames[0].quotes = {volarb::make_quote("RTM", 49.99, 50.01, 50.00, 0),
                        volarb::make_quote("RTM50C", mid - 0.01, mid + 0.01, mid, 0)};
    frames[1].tick = 300;
    frames[1].quotes = {volarb::make_quote("RTM", 49.99, 50.01, 50.00, 300),
                        volarb::make_quote("RTM50C", 0.99, 1.01, 1.00, 300)};
    frames[2].tick = 301;
    frames[2].quotes = {volarb::make_quote("RTM50C", 0.49, 0.51, 0.50, 301)};

    const auto summary = volarb::run_replay(engine, exchange, frames);

    REQUIRE(summary.ticks == 2);
    REQUIRE(summary.last_tick == 300);
    REQUIRE(summary.orders == 1);
    REQUIRE(summary.fills == 1);
    REQUIRE(summary.positions.at("RTM50C").quantity == 90);

    const double cash = -90.0 * (mid + 0.01) * 100.0 - 90.0 * 0.02;
    REQUIRE(summary.net_liquidation_value == Approx(cash + 90.0 * 1.00 * 100.0));
}
