#include <volarb/kdb_session.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <volarb/kdb_tables.hpp>

namespace volarb::kdb {

namespace {

using KGuard = std::unique_ptr<std::remove_pointer_t<K>, decltype(&r0)>;

const char* open_failure(int handle) {
    switch (handle) {
    case 0:
        return "authentication failed";
    case -1:
        return "connection error";
    case -2:
        return "timeout";
    default:
        return "unknown error";
    }
}

// Runs a niladic q function and returns the owned result, or throws with the q error text.
KGuard run(int handle, const char* function) {
    if (handle <= 0) {
        throw std::runtime_error(std::string("kdb+ session closed before ") + function);
    }
    K result = k(handle, const_cast<S>(function), static_cast<K>(nullptr));
    if (result == nullptr) {
        throw std::runtime_error(std::string("kdb+ connection lost during ") + function);
    }
    KGuard guard(result, &r0);
    if (result->t == -128) {
        throw std::runtime_error(std::string(function) + ": " + (result->s != nullptr ? result->s : "q error"));
    }
    return guard;
}

} // namespace

std::string to_string(const Endpoint& endpoint) {
    return endpoint.host + ":" + std::to_string(endpoint.port);
}

Session::Session(Endpoint endpoint)
    : endpoint_(std::move(endpoint)) {
    if (endpoint_.port <= 0 || endpoint_.port > 65535) {
        throw std::invalid_argument("kdb+ port out of range: " + std::to_string(endpoint_.port));
    }

    auto* host = const_cast<S>(endpoint_.host.c_str());
    auto* credentials = const_cast<S>(endpoint_.credentials.c_str());
    const int handle = endpoint_.timeout_ms > 0 ? khpun(host, endpoint_.port, credentials, endpoint_.timeout_ms)
                                                : khpu(host, endpoint_.port, credentials);
    if (handle <= 0) {
        throw std::runtime_error("Cannot open kdb+ session at " + to_string(endpoint_) + ": " + open_failure(handle));
    }
    handle_ = handle;
    spdlog::debug("kdb+ session {} open on handle {}", to_string(endpoint_), handle_);
}

Session::~Session() {
    close();
}

Session::Session(Session&& other) noexcept
    : endpoint_(std::move(other.endpoint_)),
      handle_(std::exchange(other.handle_, -1)) {}

Session& Session::operator=(Session&& other) noexcept {
    if (this != &other) {
        close();
        endpoint_ = std::move(other.endpoint_);
        handle_ = std::exchange(other.handle_, -1);
    }
    return *this;
}

const Endpoint& Session::endpoint() const noexcept {
    return endpoint_;
}

bool Session::is_open() const noexcept {
    return handle_ > 0;
}

std::vector<MarketQuote> Session::quotes() const {
    const KGuard table = run(handle_, "getQuotes[]");
    return decode_quotes(table.get());
}

std::vector<NewsItem> Session::news() const {
    const KGuard table = run(handle_, "getNews[]");
    return decode_news(table.get());
}

void Session::close() noexcept {
    if (handle_ <= 0) {
        return;
    }
    kclose(handle_);
    handle_ = -1;
    m9();
}

} // namespace volarb::kdb
