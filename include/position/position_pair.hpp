#pragma once

#include <string>
#include <fmt/format.h>
#include "common/types.hpp"

namespace fundarb {

// Open-time and stickiness key: "ETH-LIGHTER-HYPERLIQUID"
inline std::string position_key(const std::string& symbol, Exchange long_exchange, Exchange short_exchange) {
    return fmt::format("{}-{}-{}", symbol, exchange_to_string(long_exchange), exchange_to_string(short_exchange));
}

enum class Side {
    LONG,
    SHORT
};

// One leg as reported by a venue
struct PositionLeg {
    std::string symbol;
    Exchange exchange{Exchange::HYPERLIQUID};
    Side side{Side::LONG};
    Notional size_usd{0};
};

/**
 * Hedged pair currently held on two venues. Read from the exchanges at the
 * start of every cycle; the engine never owns it.
 */
struct OpenPositionPair {
    std::string symbol;
    Exchange long_exchange{Exchange::LIGHTER};
    Exchange short_exchange{Exchange::HYPERLIQUID};
    Notional notional_size{0};          // Per leg, USD
    double leverage{1.0};
    WallClock entry_timestamp;
    double entry_spread{0};             // short - long at entry

    // Reported by the venues
    Notional current_value{0};
    Notional current_collateral{0};

    // Sunk so far, USD
    double entry_costs{0};
    double funding_earned{0};

    std::string key() const { return position_key(symbol, long_exchange, short_exchange); }

    bool same_pair(Exchange long_ex, Exchange short_ex) const {
        return long_exchange == long_ex && short_exchange == short_ex;
    }

    double hours_held(WallClock at) const { return hours_between(entry_timestamp, at); }
};

} // namespace fundarb
