#include <cmath>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

#include <volarb/kdb_tables.hpp>

namespace volarb::kdb {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

// Column vectors of a simple (unkeyed) table, checked against the expected names in order.
std::vector<K> columns_of(K table, std::initializer_list<const char*> expected, const char* source) {
    require(table != nullptr && table->t == XT, std::string(source) + " did not return a table");
    K dict = table->k;
    require(dict != nullptr && dict->t == XD, std::string(source) + ": malformed table");
    K names = kK(dict)[0];
    K values = kK(dict)[1];
    require(names->t == KS && values->t == 0, std::string(source) + ": malformed table");
    require(static_cast<std::size_t>(names->n) == expected.size(),
            std::string(source) + " returned " + std::to_string(names->n) + " columns, expected " +
                std::to_string(expected.size()));

    std::vector<K> columns;
    columns.reserve(expected.size());
    J i = 0;
    for (const char* name : expected) {
        require(std::string(kS(names)[i]) == name,
                std::string(source) + ": column " + std::to_string(i) + " is `" + kS(names)[i] + ", expected `" + name);
        columns.push_back(kK(values)[i]);
        ++i;
    }
    return columns;
}

bool is_integral(K column) {
    return column->t == KI || column->t == KJ;
}

std::int64_t integral_at(K column, J row) {
    return column->t == KJ ? static_cast<std::int64_t>(kJ(column)[row]) : static_cast<std::int64_t>(kI(column)[row]);
}

// q float null (0n) and non-positive prices mean an empty side.
double price_at(K column, J row) {
    const double value = kF(column)[row];
    return std::isfinite(value) && value > 0.0 ? value : 0.0;
}

std::string text_at(K column, J row) {
    K cell = kK(column)[row];
    if (cell->t == -KC) {
        return std::string(1, static_cast<char>(cell->g));
    }
    require(cell->t == KC, "getNews: body at row " + std::to_string(row) + " is not a string");
    return std::string(reinterpret_cast<const char*>(kC(cell)), static_cast<std::size_t>(cell->n));
}

} // namespace

std::vector<MarketQuote> decode_quotes(K table) {
    const auto columns = columns_of(table, {"tick", "ticker", "bid", "ask", "last"}, "getQuotes");
    K ticks = columns[0];
    K tickers = columns[1];

    require(is_integral(ticks), "getQuotes: tick must be int or long");
    require(tickers->t == KS, "getQuotes: ticker must be symbol");
    for (std::size_t c = 2; c < columns.size(); ++c) {
        require(columns[c]->t == KF, "getQuotes: prices must be float");
    }
    const J rows = ticks->n;
    for (K column : columns) {
        require(column->n == rows, "getQuotes: ragged columns");
    }

    std::vector<MarketQuote> quotes;
    quotes.reserve(static_cast<std::size_t>(rows));
    for (J row = 0; row < rows; ++row) {
        const std::int64_t tick = integral_at(ticks, row);
        require(tick >= 0, "getQuotes: negative tick at row " + std::to_string(row));
        quotes.push_back(make_quote(kS(tickers)[row],
                                    price_at(columns[2], row),
                                    price_at(columns[3], row),
                                    price_at(columns[4], row),
                                    tick));
    }
    return quotes;
}

std::vector<NewsItem> decode_news(K table) {
    const auto columns = columns_of(table, {"tick", "id", "body"}, "getNews");
    K ticks = columns[0];
    K ids = columns[1];
    K bodies = columns[2];

    require(is_integral(ticks) && is_integral(ids), "getNews: tick and id must be int or long");
    require(bodies->t == 0, "getNews: body must be a list of strings");
    require(ids->n == ticks->n && bodies->n == ticks->n, "getNews: ragged columns");

    std::vector<NewsItem> news;
    news.reserve(static_cast<std::size_t>(ticks->n));
    for (J row = 0; row < ticks->n; ++row) {
        news.push_back(NewsItem{.id = integral_at(ids, row), .tick = integral_at(ticks, row), .body = text_at(bodies, row)});
    }
    return news;
}

} // namespace volarb::kdb
