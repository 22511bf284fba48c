#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"

namespace fundarb {

/**
 * Per-venue source of funding data.
 *
 * Symbols are in the venue's own spelling ("ETHUSDT" on Aster, "ETH" on
 * Hyperliquid). Every query is independently fallible: an empty optional or a
 * thrown exception both mean "unavailable for this cycle".
 */
class FundingDataProvider {
public:
    virtual ~FundingDataProvider() = default;

    virtual Exchange exchange() const = 0;

    virtual std::vector<std::string> available_symbols() = 0;

    virtual std::optional<Rate> current_funding_rate(const std::string& symbol) = 0;
    virtual std::optional<Rate> predicted_funding_rate(const std::string& symbol) = 0;
    virtual std::optional<Price> mark_price(const std::string& symbol) = 0;
    virtual std::optional<Notional> open_interest(const std::string& symbol) = 0;
};

} // namespace fundarb
