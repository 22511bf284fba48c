#pragma once

#include <string>
#include <vector>
#include <optional>
#include <fmt/format.h>
#include "common/types.hpp"

namespace fundarb {

// ============================================================================
// Cross-Exchange Funding Rate Arbitrage: value types
//
// Long the venue with the lowest (most negative) funding rate, short the venue
// with the highest. Longs receive funding when the rate is negative, shorts
// when it is positive, so the hedged pair collects short_rate - long_rate
// every hourly period.
// ============================================================================

struct ExchangeFundingRate {
    Exchange exchange{Exchange::HYPERLIQUID};
    std::string symbol;             // Normalized, e.g. "ETH"
    Rate current_rate{0};
    Rate predicted_rate{0};
    Price mark_price{0};            // 0 when unavailable
    Notional open_interest{0};      // USD, 0 when unavailable
    WallClock timestamp;
};

struct FundingRateComparison {
    std::string symbol;
    std::vector<ExchangeFundingRate> rates;
    ExchangeFundingRate highest;
    ExchangeFundingRate lowest;
    double spread{0};               // highest.current_rate - lowest.current_rate
    WallClock timestamp;
};

enum class Recommendation {
    STRONG_BUY,
    BUY,
    HOLD,
    SKIP
};

inline std::string recommendation_to_string(Recommendation r) {
    switch (r) {
        case Recommendation::STRONG_BUY: return "strong_buy";
        case Recommendation::BUY: return "buy";
        case Recommendation::HOLD: return "hold";
        case Recommendation::SKIP: return "skip";
    }
    return "unknown";
}

struct ArbitrageOpportunity {
    std::string symbol;
    Exchange long_exchange{Exchange::LIGHTER};
    Exchange short_exchange{Exchange::HYPERLIQUID};
    Rate long_rate{0};              // Negative = we receive on the long leg
    Rate short_rate{0};             // Positive = we receive on the short leg
    double spread{0};
    double expected_return{0};      // Annualized, |spread| * PERIODS_PER_YEAR

    std::optional<Price> long_mark_price;
    std::optional<Price> short_mark_price;
    std::optional<Notional> long_open_interest;
    std::optional<Notional> short_open_interest;
    WallClock timestamp;

    // Attached by prediction enrichment
    std::optional<double> predicted_spread;
    std::optional<double> prediction_confidence;
    std::optional<double> predicted_break_even_hours;
    std::optional<double> reliable_horizon_hours;
    std::optional<double> prediction_score;
    std::optional<Recommendation> prediction_recommendation;

    // Throws InvariantViolation when both legs sit on the same venue
    void validate() const {
        if (long_exchange == short_exchange) {
            throw InvariantViolation(fmt::format(
                "Opportunity {} uses {} for both legs", symbol, exchange_to_string(long_exchange)));
        }
    }

    // Spread as long - short, used when the caller needs the signed value
    double signed_spread() const { return long_rate - short_rate; }

    double hourly_return_rate() const { return expected_return / PERIODS_PER_YEAR; }

    // Average mark across both legs, 0 when neither is known
    Price average_mark_price() const {
        if (long_mark_price && short_mark_price) return (*long_mark_price + *short_mark_price) / 2;
        return long_mark_price.value_or(short_mark_price.value_or(0.0));
    }

    Notional min_open_interest() const {
        return std::min(long_open_interest.value_or(0.0), short_open_interest.value_or(0.0));
    }

    std::string pair_label() const {
        return fmt::format("{} {}/{}", symbol, exchange_to_string(long_exchange),
                           exchange_to_string(short_exchange));
    }
};

// Costs for one side of a round trip (entry or exit), both legs included
struct TradeCosts {
    double fees{0};
    double slippage{0};
    double basis_risk_cost{0};
    double total{0};
};

struct ExecutionPlan {
    std::string symbol;
    Exchange long_exchange{Exchange::LIGHTER};
    Exchange short_exchange{Exchange::HYPERLIQUID};
    Notional position_size_usd{0};  // Per leg
    double leverage{1.0};

    TradeCosts entry_costs;
    TradeCosts exit_costs;
    TradeCosts estimated_costs;     // entry + exit

    double hourly_return{0};        // USD per period at the current spread
    double expected_net_return{0};  // USD per period after amortizing round-trip costs
    std::optional<double> break_even_hours;

    double collateral_required() const { return position_size_usd / leverage; }
};

} // namespace fundarb
