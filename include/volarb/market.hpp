#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <volarb/instrument.hpp>

namespace volarb {

enum class MarketStatus : std::uint8_t { Active = 0, Paused = 1, Stopped = 2 };

struct MarketQuote {
    std::string instrument;
    double bid = 0.0;
    double ask = 0.0;
    double mid = 0.0;
    double last = 0.0;
    std::int64_t tick = 0;
};

// mid falls back to the one-sided price or the last trade when the book is empty on a side.
MarketQuote make_quote(std::string instrument, double bid, double ask, double last, std::int64_t tick);

struct Position {
    std::string instrument;
    std::int64_t quantity = 0;   // signed, positive = long
    double average_price = 0.0;  // VWAP of the open quantity
};

struct NewsItem {
    std::int64_t id = 0;
    std::int64_t tick = 0;
    std::string body;
};

struct MarketSnapshot {
    std::int64_t tick = 0;
    MarketStatus status = MarketStatus::Active;
    std::optional<double> time_to_expiry_years; // derived from the session clock when absent
    std::unordered_map<std::string, MarketQuote> quotes;
    std::unordered_map<std::string, Position> positions;
    std::vector<NewsItem> news;

    const MarketQuote* quote(const std::string& instrument) const;
    std::int64_t position(const std::string& instrument) const;
};

// Quotes and news observed at one tick of a recorded session.
struct MarketFrame {
    std::int64_t tick = 0;
    std::vector<MarketQuote> quotes;
    std::vector<NewsItem> news;
};

const char* to_string(MarketStatus status);

bool load_quotes_csv(const std::string& path, std::vector<MarketQuote>& quotes);

bool load_news_csv(const std::string& path, std::vector<NewsItem>& news);

// Groups quotes and news by tick, news in id order. Quotes for tickers outside
// the book are dropped with one warning per ticker.
std::vector<MarketFrame> build_frames(const std::vector<MarketQuote>& quotes,
                                      const std::vector<NewsItem>& news,
                                      const InstrumentBook& book);

} // namespace volarb
