#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <limits>
#include <stdexcept>
#include <cstdint>
#include <algorithm>
#include <cctype>

namespace fundarb {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline double hours_between(WallClock from, WallClock to) {
    return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
}

// Funding rate per hourly period, as a decimal (0.0001 = 0.01%)
using Rate = double;
using Price = double;
using Notional = double;  // USD

// Funding settles hourly on every supported venue
constexpr double PERIODS_PER_YEAR = 24.0 * 365.0;

// "Never breaks even"
constexpr double NEVER = std::numeric_limits<double>::infinity();

// Supported perpetual venues
enum class Exchange {
    ASTER,
    LIGHTER,
    HYPERLIQUID,
    EXTENDED
};

constexpr Exchange ALL_EXCHANGES[] = {
    Exchange::ASTER, Exchange::LIGHTER, Exchange::HYPERLIQUID, Exchange::EXTENDED
};

inline std::string exchange_to_string(Exchange e) {
    switch (e) {
        case Exchange::ASTER: return "ASTER";
        case Exchange::LIGHTER: return "LIGHTER";
        case Exchange::HYPERLIQUID: return "HYPERLIQUID";
        case Exchange::EXTENDED: return "EXTENDED";
    }
    return "UNKNOWN";
}

inline std::optional<Exchange> exchange_from_string(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (Exchange e : ALL_EXCHANGES) {
        if (exchange_to_string(e) == s) return e;
    }
    return std::nullopt;
}

// Order types that matter for cost modeling
enum class OrderType {
    LIMIT,   // Maker, adds liquidity
    MARKET   // Taker, crosses the spread
};

/**
 * Raised when upstream code breaks a contract the engine relies on
 * (same venue on both legs, two exchange pairs for one symbol).
 */
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace fundarb
