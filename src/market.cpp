#include <volarb/market.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace volarb {

namespace {

std::string trim(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::string{};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return std::string(input.substr(begin, end - begin + 1));
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, ',')) {
        fields.emplace_back(trim(field));
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

bool parse_double(const std::string& token, double& value) {
    if (token.empty()) {
        return false;
    }
    try {
        size_t idx = 0;
        value = std::stod(token, &idx);
        if (idx != token.size() || !std::isfinite(value)) {
            return false;
        }
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool parse_int64(const std::string& token, std::int64_t& value) {
    if (token.empty()) {
        return false;
    }
    try {
        size_t idx = 0;
        const long long raw = std::stoll(token, &idx, 10);
        if (idx != token.size()) {
            return false;
        }
        value = static_cast<std::int64_t>(raw);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string unquote(std::string text) {
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

} // namespace

MarketQuote make_quote(std::string instrument, double bid, double ask, double last, std::int64_t tick) {
    double mid = last;
    if (bid > 0.0 && ask > 0.0) {
        mid = 0.5 * (bid + ask);
    } else if (bid > 0.0) {
        mid = bid;
    } else if (ask > 0.0) {
        mid = ask;
    }
    return MarketQuote{.instrument = std::move(instrument),
                       .bid = bid,
                       .ask = ask,
                       .mid = mid,
                       .last = last,
                       .tick = tick};
}

const MarketQuote* MarketSnapshot::quote(const std::string& instrument) const {
    const auto it = quotes.find(instrument);
    return it == quotes.end() ? nullptr : &it->second;
}

std::int64_t MarketSnapshot::position(const std::string& instrument) const {
    const auto it = positions.find(instrument);
    return it == positions.end() ? 0 : it->second.quantity;
}

const char* to_string(MarketStatus status) {
    switch (status) {
    case MarketStatus::Active:
        return "ACTIVE";
    case MarketStatus::Paused:
        return "PAUSED";
    case MarketStatus::Stopped:
        return "STOPPED";
    }
    return "UNKNOWN";
}

bool load_quotes_csv(const std::string& path, std::vector<MarketQuote>& quotes) {
    quotes.clear();

    std::ifstream input(path);
    if (!input.is_open()) {
        spdlog::error("Failed to open quotes CSV: {}", path);
        return false;
    }

    std::string line;
    if (!std::getline(input, line)) {
        spdlog::error("Quotes CSV missing header row");
        return false;
    }

    static const char* expected[] = {"tick", "ticker", "bid", "ask", "last"};
    const auto header = split_csv_line(line);
    if (header.size() != std::size(expected)) {
        spdlog::error("Unexpected quotes header column count");
        return false;
    }
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] != expected[i]) {
            spdlog::error("Quotes header mismatch at column {}", i);
            return false;
        }
    }

    std::size_t row_index = 1;
    while (std::getline(input, line)) {
        ++row_index;
        if (is_blank(line)) {
            continue;
        }
        const auto fields = split_csv_line(line);
        if (fields.size() != std::size(expected)) {
            spdlog::error("Unexpected field count in quotes row {}", row_index);
            quotes.clear();
            return false;
        }

        std::int64_t tick = 0;
        if (!parse_int64(fields[0], tick) || tick < 0) {
            spdlog::error("Invalid tick in quotes row {}", row_index);
            quotes.clear();
            return false;
        }
        if (fields[1].empty()) {
            spdlog::error("Empty ticker in quotes row {}", row_index);
            quotes.clear();
            return false;
        }

        double bid = 0.0;
        double ask = 0.0;
        double last = 0.0;
        if (!parse_double(fields[2], bid) || !parse_double(fields[3], ask) || !parse_double(fields[4], last) ||
            bid < 0.0 || ask < 0.0 || last < 0.0) {
            spdlog::error("Invalid prices for '{}' in quotes row {}", fields[1], row_index);
            quotes.clear();
            return false;
        }
        if (bid > 0.0 && ask > 0.0 && bid > ask) {
            spdlog::error("Crossed quote for '{}' in quotes row {}", fields[1], row_index);
            quotes.clear();
            return false;
        }

        quotes.push_back(make_quote(fields[1], bid, ask, last, tick));
    }

    if (quotes.empty()) {
        spdlog::error("No data rows found in quotes CSV");
        return false;
    }
    return true;
}

bool load_news_csv(const std::string& path, std::vector<NewsItem>& news) {
    news.clear();

    std::ifstream input(path);
    if (!input.is_open()) {
        spdlog::error("Failed to open news CSV: {}", path);
        return false;
    }

    std::string line;
    if (!std::getline(input, line)) {
        spdlog::error("News CSV missing header row");
        return false;
    }
    const auto header = split_csv_line(line);
    if (header.size() != 3 || header[0] != "tick" || header[1] != "id" || header[2] != "body") {
        spdlog::error("News header must be 'tick,id,body'");
        return false;
    }

    std::size_t row_index = 1;
    while (std::getline(input, line)) {
        ++row_index;
        if (is_blank(line)) {
            continue;
        }

        // The body is free text and keeps its commas.
        const auto first = line.find(',');
        const auto second = first == std::string::npos ? std::string::npos : line.find(',', first + 1);
        if (second == std::string::npos) {
            spdlog::error("Unexpected field count in news row {}", row_index);
            news.clear();
            return false;
        }

        NewsItem item;
        if (!parse_int64(trim(std::string_view(line).substr(0, first)), item.tick) ||
            !parse_int64(trim(std::string_view(line).substr(first + 1, second - first - 1)), item.id)) {
            spdlog::error("Invalid tick or id in news row {}", row_index);
            news.clear();
            return false;
        }
        item.body = unquote(trim(std::string_view(line).substr(second + 1)));
        news.push_back(std::move(item));
    }

    return true;
}

std::vector<MarketFrame> build_frames(const std::vector<MarketQuote>& quotes,
                                      const std::vector<NewsItem>& news,
                                      const InstrumentBook& book) {
    std::map<std::int64_t, MarketFrame> by_tick;
    std::set<std::string> dropped;
    for (const auto& quote : quotes) {
        if (book.find(quote.instrument) == nullptr) {
            dropped.insert(quote.instrument);
            continue;
        }
        auto& frame = by_tick[quote.tick];
        frame.tick = quote.tick;
        frame.quotes.push_back(quote);
    }
    for (const auto& item : news) {
        auto& frame = by_tick[item.tick];
        frame.tick = item.tick;
        frame.news.push_back(item);
    }

    for (const auto& ticker : dropped) {
        const auto option = parse_option_ticker(ticker, book.underlying().id, 1.0);
        if (option) {
            spdlog::warn("Dropping quotes for {}: {} {:g} is not in the option chain",
                         ticker,
                         to_string(option->kind),
                         option->strike);
        } else {
            spdlog::warn("Dropping quotes for unknown ticker {}", ticker);
        }
    }

    std::vector<MarketFrame> frames;
    frames.reserve(by_tick.size());
    for (auto& [tick, frame] : by_tick) {
        std::sort(frame.news.begin(), frame.news.end(), [](const NewsItem& a, const NewsItem& b) {
            return a.id < b.id;
        });
        frames.push_back(std::move(frame));
    }
    return frames;
}

} // namespace volarb
