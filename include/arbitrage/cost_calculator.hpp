#pragma once

#include <optional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "arbitrage/opportunity.hpp"

namespace fundarb {

/**
 * Pure cost model for a two-leg funding position: fees, square-root market
 * impact slippage, our own effect on the funding rate, and break-even time.
 * No I/O and no state beyond the fee schedule.
 */
class CostCalculator {
public:
    explicit CostCalculator(const StrategyConfig& config);

    // Slippage in USD for one leg. Open interest is the liquidity proxy.
    // Needs a top of book; plan pricing only has marks and uses entry_costs/exit_costs.
    double slippage_cost(Notional position_size_usd, Price best_bid, Price best_ask,
                         Notional open_interest, OrderType order_type) const;

    // Predicted shift of the venue's funding rate caused by our position
    double funding_rate_impact(Notional position_size_usd, Notional open_interest,
                               Rate current_rate) const;

    double fees(Notional position_size_usd, Exchange exchange, bool is_maker) const;

    double maker_fee_rate(Exchange exchange) const { return config_.maker_fee_rate(exchange); }
    double taker_fee_rate(Exchange exchange) const { return config_.taker_fee_rate(exchange); }

    // nullopt = never breaks even
    static std::optional<double> break_even_hours(double total_costs, double hourly_return);

    // Round-trip pieces: maker fees in (limit at mark), taker fees out
    TradeCosts entry_costs(Notional notional, Exchange long_exchange, Exchange short_exchange,
                           Notional long_liquidity, Notional short_liquidity,
                           double basis_divergence_bps = 0) const;
    TradeCosts exit_costs(Notional notional, Exchange long_exchange, Exchange short_exchange,
                          Notional long_liquidity, Notional short_liquidity,
                          double basis_divergence_bps = 0) const;

    // Entry + exit as a percentage of notional
    double round_trip_cost_percent(Notional notional, Exchange long_exchange, Exchange short_exchange,
                                   Notional long_liquidity, Notional short_liquidity,
                                   double basis_divergence_bps = 0) const;

    const StrategyConfig& config() const { return config_; }

private:
    StrategyConfig config_;

    static constexpr double MAX_SLIPPAGE = 0.02;            // 2% cap
    static constexpr double MAKER_SLIPPAGE = 0.0001;        // 1bp for resting orders
    static constexpr double TAKER_FALLBACK_SLIPPAGE = 0.0005;
    static constexpr double DEFAULT_SPREAD_PERCENT = 0.001;
    static constexpr double RATE_IMPACT_PER_OI = 0.001;     // 10bps shift at 100% of OI
    static constexpr double MAX_RATE_IMPACT = 0.0005;       // 5bps

    TradeCosts round_trip_leg(Notional notional, Exchange long_exchange, Exchange short_exchange,
                              Notional long_liquidity, Notional short_liquidity,
                              double basis_divergence_bps, bool is_entry) const;

    double impact_slippage(Notional notional, Notional liquidity) const;
};

} // namespace fundarb
