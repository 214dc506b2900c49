#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <exception>
#include <string>
#include <vector>

#include <volarb/config.hpp>
#include <volarb/engine.hpp>
#include <volarb/kdb_session.hpp>
#include <volarb/market.hpp>
#include <volarb/replay.hpp>

int main(int argc, char** argv) {
    CLI::App app{"volarb - options volatility arbitrage over a recorded session"};
    app.set_config("--config", "", "Read options from an INI or TOML file");

    volarb::EngineConfig config;
    std::string quotes_path;
    std::string news_path;
    volarb::kdb::Endpoint kdb_endpoint;
    bool connect_to_kdb = false;
    double seed_volatility = 0.0;
    std::string log_level = "info";

    app.add_option("-q,--quotes", quotes_path, "Quotes CSV (tick,ticker,bid,ask,last)");
    app.add_option("-n,--news", news_path, "News CSV (tick,id,body)");
    app.add_flag("--connect-kdb", connect_to_kdb, "Load quotes and news from getQuotes[]/getNews[] on kdb+");
    app.add_option("--kdb-host", kdb_endpoint.host, "kdb+ host")->default_val(kdb_endpoint.host);
    app.add_option("--kdb-port", kdb_endpoint.port, "kdb+ port")->default_val(kdb_endpoint.port);
    app.add_option("--kdb-auth", kdb_endpoint.credentials, "kdb+ credentials in user:password form");
    app.add_option("--kdb-timeout-ms", kdb_endpoint.timeout_ms, "kdb+ connect timeout, 0 blocks")
        ->default_val(kdb_endpoint.timeout_ms);

    app.add_option("--underlying", config.underlying, "Underlying ticker")->default_val(config.underlying);
    app.add_option("--strikes", config.strikes, "Listed strikes")->delimiter(',');
    app.add_option("--shares-per-contract", config.shares_per_contract)->default_val(config.shares_per_contract);
    app.add_option("--options-qty-per-trade", config.limits.options_qty_per_trade)
        ->default_val(config.limits.options_qty_per_trade);
    app.add_option("--shares-order-limit", config.limits.shares_order_limit)
        ->default_val(config.limits.shares_order_limit);
    app.add_option("--net-delta-limit", config.limits.net_delta_limit)->default_val(config.limits.net_delta_limit);
    app.add_option("--max-option-position", config.limits.max_option_position)
        ->default_val(config.limits.max_option_position);
    app.add_option("--max-underlying-position", config.limits.max_underlying_position)
        ->default_val(config.limits.max_underlying_position);
    app.add_option("--open-threshold", config.open_threshold, "Absolute mispricing to open")
        ->default_val(config.open_threshold);
    app.add_option("--close-threshold", config.close_threshold, "Absolute mispricing to close")
        ->default_val(config.close_threshold);
    app.add_option("--scale-step", config.scale_step)->default_val(config.scale_step);
    app.add_option("--profit-target", config.profit_target_fraction, "Fraction of entry edge that closes a position")
        ->default_val(config.profit_target_fraction);
    app.add_option("--risk-free-rate", config.risk_free_rate)->default_val(config.risk_free_rate);
    app.add_option("--hedge-ratio", config.hedge_ratio)->default_val(config.hedge_ratio);
    app.add_option("--market-fee", config.market_fee)->default_val(config.market_fee);
    app.add_option("--ticks-per-session", config.ticks_per_session)->default_val(config.ticks_per_session);
    app.add_option("--ticks-per-year", config.ticks_per_year)->default_val(config.ticks_per_year);
    app.add_option("--seed-volatility", seed_volatility, "Volatility to use before the first announcement");
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error")->default_val(log_level);

    try {
        CLI11_PARSE(app, argc, argv);

        spdlog::set_level(spdlog::level::from_str(log_level));
        if (seed_volatility > 0.0) {
            config.seed_volatility = seed_volatility;
        }
        config.validate();

        std::vector<volarb::MarketQuote> quotes;
        std::vector<volarb::NewsItem> news;
        if (connect_to_kdb) {
            const volarb::kdb::Session session(kdb_endpoint);
            spdlog::info("Connected to kdb+ at {}.", volarb::kdb::to_string(session.endpoint()));
            quotes = session.quotes();
            news = session.news();
        } else {
            if (quotes_path.empty()) {
                spdlog::error("Either --quotes or --connect-kdb is required");
                return 1;
            }
            if (!volarb::load_quotes_csv(quotes_path, quotes)) {
                return 1;
            }
            if (!news_path.empty() && !volarb::load_news_csv(news_path, news)) {
                return 1;
            }
        }

        volarb::Engine engine(config);
        spdlog::info("Trading {} instruments on {}.", engine.book().size(), engine.book().underlying().id);

        const std::vector<volarb::MarketFrame> frames = volarb::build_frames(quotes, news, engine.book());
        spdlog::info("Loaded {} quotes and {} news items over {} ticks.", quotes.size(), news.size(), frames.size());

        volarb::ReplayExchange exchange(engine.book(), config.market_fee);
        const volarb::ReplaySummary summary = volarb::run_replay(engine, exchange, frames);

        const auto& risk = engine.risk().counters();
        spdlog::info("==================== Session ====================");
        spdlog::info("Ticks: {}  Orders: {}  Fills: {}", summary.ticks, summary.orders, summary.fills);
        spdlog::info("Risk: {} approved, {} clipped, {} vetoed, {} rejected",
                     risk.approved,
                     risk.clipped,
                     risk.vetoed,
                     risk.rejected);
        spdlog::info("Volatility announcements: {} parse misses, {} stale",
                     engine.volatility().parse_misses(),
                     engine.volatility().stale_announcements());
        if (engine.risk().intervention_required()) {
            spdlog::error("Net delta limit was breached; manual intervention required.");
        }

        spdlog::info("==================== Positions ====================");
        spdlog::info(fmt::format("{:>10} | {:>8} | {:>10} | {}", "Ticker", "Qty", "Avg", "State"));
        std::vector<std::string> tickers{engine.book().underlying().id};
        for (const auto& option : engine.book().options()) {
            tickers.push_back(option.id);
        }
        for (const auto& ticker : tickers) {
            const auto it = summary.positions.find(ticker);
            if (it == summary.positions.end() || it->second.quantity == 0) {
                continue;
            }
            const char* state = ticker == engine.book().underlying().id
                                    ? "HEDGE"
                                    : volarb::to_string(engine.positions().state(ticker));
            spdlog::info(fmt::format("{:>10} | {:>8} | {:>10.4f} | {}",
                                     ticker,
                                     it->second.quantity,
                                     it->second.average_price,
                                     state));
        }
        spdlog::info("Net liquidation value: {:.2f}", summary.net_liquidation_value);
    } catch (const CLI::ParseError& parse_error) {
        return app.exit(parse_error);
    } catch (const std::exception& ex) {
        spdlog::error("volarb failed: {}", ex.what());
        return 1;
    }

    return 0;
}
