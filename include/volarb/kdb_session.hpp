#pragma once

#include <string>
#include <vector>

#include <volarb/market.hpp>

namespace volarb::kdb {

struct Endpoint {
    std::string host = "localhost";
    int port = 5000;
    std::string credentials; // user:password, empty for none
    int timeout_ms = 0;      // 0 blocks until the q process answers
};

std::string to_string(const Endpoint& endpoint);

// Open handle to the q process serving a recorded session through
// getQuotes[] and getNews[]. Closed on destruction.
class Session {
public:
    explicit Session(Endpoint endpoint);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Session(Session&& other) noexcept;
    Session& operator=(Session&& other) noexcept;

    [[nodiscard]] const Endpoint& endpoint() const noexcept;
    [[nodiscard]] bool is_open() const noexcept;

    std::vector<MarketQuote> quotes() const;
    std::vector<NewsItem> news() const;

private:
    void close() noexcept;

    Endpoint endpoint_;
    int handle_ = -1;
};

} // namespace volarb::kdb
