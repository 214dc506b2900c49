#pragma once

#include <vector>

#include <volarb/market.hpp>

// k.h defines short macros; it goes after every other header.
#ifndef KXVER
#define KXVER 3
#endif
extern "C" {
#include "k.h"
}

namespace volarb::kdb {

// Recorded top-of-book quotes: table with columns tick (int/long),
// ticker (symbol), bid, ask, last (float). Nulls and non-positive prices
// become an empty side. Throws std::runtime_error on any other schema.
std::vector<MarketQuote> decode_quotes(K table);

// Recorded news: columns tick, id (int/long), body (string).
std::vector<NewsItem> decode_news(K table);

} // namespace volarb::kdb
