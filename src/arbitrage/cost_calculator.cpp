#include "arbitrage/cost_calculator.hpp"
#include <cmath>
#include <algorithm>

namespace fundarb {

CostCalculator::CostCalculator(const StrategyConfig& config)
    : config_(config)
{
}

double CostCalculator::slippage_cost(Notional position_size_usd, Price best_bid, Price best_ask,
                                     Notional open_interest, OrderType order_type) const {
    double spread = best_ask - best_bid;
    double mid = (best_bid + best_ask) / 2;
    double spread_percent = mid > 0 ? spread / mid : DEFAULT_SPREAD_PERCENT;

    // Market orders pay half the spread, resting orders only a small floor
    double base = order_type == OrderType::MARKET ? spread_percent / 2 : MAKER_SLIPPAGE;

    if (open_interest > 0) {
        double liquidity_ratio = std::min(position_size_usd / open_interest, 1.0);
        double impact = std::min(std::sqrt(liquidity_ratio) * spread_percent * 2, MAX_SLIPPAGE);
        return position_size_usd * (base + impact);
    }

    // No OI: flat conservative estimate
    double flat = order_type == OrderType::MARKET ? TAKER_FALLBACK_SLIPPAGE : MAKER_SLIPPAGE;
    return position_size_usd * flat;
}

double CostCalculator::funding_rate_impact(Notional position_size_usd, Notional open_interest,
                                           Rate current_rate) const {
    if (open_interest <= 0 || !std::isfinite(current_rate)) {
        return 0.0;
    }

    double impact = (position_size_usd / open_interest) * RATE_IMPACT_PER_OI;
    impact = std::min(impact, MAX_RATE_IMPACT);
    return std::isfinite(impact) ? impact : 0.0;
}

double CostCalculator::fees(Notional position_size_usd, Exchange exchange, bool is_maker) const {
    double rate = is_maker ? maker_fee_rate(exchange) : taker_fee_rate(exchange);
    return position_size_usd * rate;
}

std::optional<double> CostCalculator::break_even_hours(double total_costs, double hourly_return) {
    if (hourly_return <= 0) {
        return std::nullopt;
    }
    if (total_costs <= 0) {
        return 0.0;
    }
    return total_costs / hourly_return;
}

TradeCosts CostCalculator::entry_costs(Notional notional, Exchange long_exchange, Exchange short_exchange,
                                       Notional long_liquidity, Notional short_liquidity,
                                       double basis_divergence_bps) const {
    return round_trip_leg(notional, long_exchange, short_exchange,
                          long_liquidity, short_liquidity, basis_divergence_bps, true);
}

TradeCosts CostCalculator::exit_costs(Notional notional, Exchange long_exchange, Exchange short_exchange,
                                      Notional long_liquidity, Notional short_liquidity,
                                      double basis_divergence_bps) const {
    return round_trip_leg(notional, long_exchange, short_exchange,
                          long_liquidity, short_liquidity, basis_divergence_bps, false);
}

double CostCalculator::round_trip_cost_percent(Notional notional, Exchange long_exchange,
                                               Exchange short_exchange, Notional long_liquidity,
                                               Notional short_liquidity,
                                               double basis_divergence_bps) const {
    if (notional <= 0) return 0.0;

    auto entry = entry_costs(notional, long_exchange, short_exchange,
                             long_liquidity, short_liquidity, basis_divergence_bps);
    auto exit = exit_costs(notional, long_exchange, short_exchange,
                           long_liquidity, short_liquidity, basis_divergence_bps);
    return (entry.total + exit.total) / notional * 100;
}

TradeCosts CostCalculator::round_trip_leg(Notional notional, Exchange long_exchange,
                                          Exchange short_exchange, Notional long_liquidity,
                                          Notional short_liquidity, double basis_divergence_bps,
                                          bool is_entry) const {
    TradeCosts costs;

    costs.fees = fees(notional, long_exchange, is_entry) + fees(notional, short_exchange, is_entry);
    costs.slippage = impact_slippage(notional, long_liquidity) +
                     impact_slippage(notional, short_liquidity);

    // Mark divergence between the venues is paid once per side
    costs.basis_risk_cost = std::abs(basis_divergence_bps) / 10000.0 * notional;

    costs.total = costs.fees + costs.slippage + costs.basis_risk_cost;
    return costs;
}

double CostCalculator::impact_slippage(Notional notional, Notional liquidity) const {
    if (liquidity <= 0) {
        return notional * MAX_SLIPPAGE;
    }

    double percent = config_.base_slippage + config_.sqrt_impact_factor * std::sqrt(notional / liquidity);
    return notional * std::min(percent, MAX_SLIPPAGE);
}

} // namespace fundarb
