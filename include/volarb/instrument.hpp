#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace volarb {

enum class InstrumentKind : std::uint8_t { Underlying = 0, Call = 1, Put = 2 };

struct Instrument {
    std::string id;
    InstrumentKind kind = InstrumentKind::Underlying;
    double strike = 0.0;
    double multiplier = 1.0; // shares per unit

    [[nodiscard]] bool is_option() const noexcept {
        return kind != InstrumentKind::Underlying;
    }
    [[nodiscard]] bool is_call() const noexcept {
        return kind == InstrumentKind::Call;
    }
};

const char* to_string(InstrumentKind kind);

// Parses the exchange convention <UNDERLYING><STRIKE><C|P>, e.g. RTM48C.
std::optional<Instrument> parse_option_ticker(std::string_view ticker,
                                              std::string_view underlying,
                                              double multiplier);

// Instrument set for one session: a single underlying plus its listed options.
class InstrumentBook {
public:
    explicit InstrumentBook(Instrument underlying);

    void add_option(Instrument option);

    const Instrument& underlying() const noexcept;
    const std::vector<Instrument>& options() const noexcept;
    const Instrument* find(std::string_view id) const;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    Instrument underlying_;
    std::vector<Instrument> options_;
    std::unordered_map<std::string, std::size_t> index_;
};

InstrumentBook make_option_chain(const std::string& underlying,
                                 const std::vector<double>& strikes,
                                 double shares_per_contract);

} // namespace volarb
