#include "arbitrage/predicted_break_even.hpp"
#include <cmath>
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fundarb {

namespace {

int sign(double v) {
    return (v > 0) - (v < 0);
}

bool finite_bounds(const std::optional<RatePrediction>& low_leg, const std::optional<RatePrediction>& high_leg,
                   bool low_uses_lower) {
    if (!low_leg || !high_leg) return false;
    double a = low_uses_lower ? low_leg->lower_bound : low_leg->upper_bound;
    double b = low_uses_lower ? high_leg->upper_bound : high_leg->lower_bound;
    return std::isfinite(a) && std::isfinite(b);
}

} // anonymous namespace

PredictedBreakEvenCalculator::PredictedBreakEvenCalculator(const CostCalculator& costs,
                                                           ForecastAdapter forecasts,
                                                           const Config& config)
    : costs_(costs)
    , forecasts_(std::move(forecasts))
    , config_(config)
{
}

PredictedBreakEven PredictedBreakEvenCalculator::calculate(const ArbitrageOpportunity& opportunity,
                                                           Notional position_size_usd,
                                                           double total_costs) const {
    PredictedBreakEven result;

    auto forecast = forecasts_.spread_forecast(opportunity.symbol, opportunity.long_exchange,
                                               opportunity.short_exchange);
    double current = opportunity.signed_spread();

    result.confidence = forecast.confidence;
    result.long_prediction = forecast.long_prediction;
    result.short_prediction = forecast.short_prediction;
    result.predicted_spread = forecast.predicted_spread().value_or(current);

    // Worst case: long at its lower bound, short at its upper bound
    double worst_spread = finite_bounds(forecast.long_prediction, forecast.short_prediction, true)
        ? forecast.long_prediction->lower_bound - forecast.short_prediction->upper_bound
        : current * config_.worst_case_haircut;
    double best_spread = finite_bounds(forecast.long_prediction, forecast.short_prediction, false)
        ? forecast.long_prediction->upper_bound - forecast.short_prediction->lower_bound
        : current * config_.best_case_bonus;

    result.reliable_horizon_hours = reliable_horizon(result.confidence);

    result.predicted_break_even_hours = break_even(total_costs, result.predicted_spread, position_size_usd);
    result.worst_case_break_even_hours = break_even(total_costs, worst_spread, position_size_usd);
    result.best_case_break_even_hours = break_even(total_costs, best_spread, position_size_usd);

    // Low confidence stretches the break-even we believe (2x at 50%)
    result.confidence_adjusted_break_even_hours = std::isfinite(result.predicted_break_even_hours)
        ? result.predicted_break_even_hours / std::max(0.5, result.confidence)
        : NEVER;

    result.is_prediction_reliable =
        result.confidence >= costs_.config().min_prediction_confidence;

    spdlog::debug("{} predicted spread {:.6f} conf {:.2f} BE {:.1f}h (worst {:.1f}h, best {:.1f}h)",
                  opportunity.pair_label(), result.predicted_spread, result.confidence,
                  result.predicted_break_even_hours, result.worst_case_break_even_hours,
                  result.best_case_break_even_hours);
    return result;
}

OpportunityScore PredictedBreakEvenCalculator::score(const ArbitrageOpportunity& opportunity,
                                                     Notional position_size_usd,
                                                     double total_costs) const {
    return score(opportunity, calculate(opportunity, position_size_usd, total_costs));
}

OpportunityScore PredictedBreakEvenCalculator::score(const ArbitrageOpportunity& opportunity,
                                                     const PredictedBreakEven& break_even) const {
    OpportunityScore result;

    result.components.spread_score = spread_score(break_even.predicted_spread);
    result.components.confidence_score = break_even.confidence;
    result.components.break_even_score = break_even_score(break_even.confidence_adjusted_break_even_hours);
    result.components.liquidity_score = liquidity_score(opportunity);

    result.score = result.components.spread_score * WEIGHT_SPREAD +
                   result.components.confidence_score * WEIGHT_CONFIDENCE +
                   result.components.break_even_score * WEIGHT_BREAK_EVEN +
                   result.components.liquidity_score * WEIGHT_LIQUIDITY;

    recommend(result, break_even, opportunity);
    return result;
}

double PredictedBreakEvenCalculator::spread_score(double spread) {
    // 0.05% per period saturates
    return std::min(1.0, std::abs(spread) / 0.0005);
}

double PredictedBreakEvenCalculator::break_even_score(double break_even_hours) {
    if (!std::isfinite(break_even_hours)) return 0.0;
    if (break_even_hours <= 0) return 1.0;
    return std::max(0.0, 1.0 - break_even_hours / (24.0 * 7));
}

double PredictedBreakEvenCalculator::liquidity_score(const ArbitrageOpportunity& opportunity) {
    Notional min_oi = opportunity.min_open_interest();
    if (min_oi <= 0) return 0.1;

    // $1M -> 0.33, $100M -> 1.0
    return std::min(1.0, std::log10(std::max(min_oi / 100000.0, 1.0)) / 3.0);
}

double PredictedBreakEvenCalculator::current_spread(const ArbitrageOpportunity& opportunity) const {
    // Stored spread is a magnitude; orient it like the predicted spread (long - short)
    double oriented = opportunity.signed_spread();
    if (opportunity.spread != 0) {
        return oriented < 0 ? -std::abs(opportunity.spread) : std::abs(opportunity.spread);
    }
    return oriented;
}

double PredictedBreakEvenCalculator::reliable_horizon(double confidence) const {
    return std::round(config_.default_reliable_horizon * std::max(0.5, confidence));
}

double PredictedBreakEvenCalculator::break_even(double total_costs, double spread,
                                                Notional position_size_usd) const {
    double hourly_return = std::abs(spread) * position_size_usd;
    if (hourly_return <= config_.min_spread_threshold * 1000) {
        return NEVER;
    }
    return CostCalculator::break_even_hours(total_costs, hourly_return).value_or(NEVER);
}

void PredictedBreakEvenCalculator::recommend(OpportunityScore& result, const PredictedBreakEven& break_even,
                                             const ArbitrageOpportunity& opportunity) const {
    double be = break_even.confidence_adjusted_break_even_hours;
    double horizon = break_even.reliable_horizon_hours;
    double current = current_spread(opportunity);
    double max_days = costs_.config().max_worst_case_break_even_days;
    double max_hours = max_days * 24;
    bool actionable = std::abs(current) > config_.min_actionable_spread;

    if (!std::isfinite(be)) {
        if (actionable) {
            result.recommendation = Recommendation::BUY;
            result.reason = fmt::format("Prediction unavailable but current spread {:.4f}% is favorable",
                                        current * 100);
        } else {
            result.recommendation = Recommendation::HOLD;
            result.reason = "No break-even and current spread is minimal";
        }
        return;
    }

    // Deploy into a forecast reversal only if we are paid back before it
    int current_sign = sign(current);
    int predicted_sign = sign(break_even.predicted_spread);
    if (current_sign != 0 && predicted_sign != 0 && current_sign != predicted_sign) {
        if (be > horizon) {
            result.recommendation = Recommendation::SKIP;
            result.reason = fmt::format("Spread will reverse: BE {:.1f}h > reversal {:.1f}h", be, horizon);
        } else {
            result.recommendation = Recommendation::BUY;
            result.reason = fmt::format("Break-even {:.1f}h before reversal {:.1f}h", be, horizon);
        }
        return;
    }

    if (!break_even.is_prediction_reliable) {
        if (actionable && be < max_hours) {
            result.recommendation = Recommendation::BUY;
            result.reason = fmt::format("Low prediction confidence but current spread {:.4f}% with BE {:.1f}h",
                                        current * 100, be);
        } else if (actionable) {
            result.recommendation = Recommendation::HOLD;
            result.reason = fmt::format("Current spread favorable but BE {:.1f}h is long", be);
        } else {
            result.recommendation = Recommendation::HOLD;
            result.reason = fmt::format("Prediction unreliable ({:.0f}%) and current spread minimal",
                                        break_even.confidence * 100);
        }
        return;
    }

    if (break_even.worst_case_break_even_hours / 24 > max_days * 2) {
        result.recommendation = Recommendation::HOLD;
        result.reason = fmt::format("Worst-case BE {:.1f} days is too long",
                                    break_even.worst_case_break_even_hours / 24);
        return;
    }

    if (be < 12) {
        result.recommendation = Recommendation::STRONG_BUY;
        result.reason = fmt::format("Fast break-even {:.1f}h, spread stable", be);
        return;
    }

    if (result.score >= 0.7 && be < 48 && break_even.confidence >= 0.7) {
        result.recommendation = Recommendation::STRONG_BUY;
        result.reason = fmt::format("High score {:.2f}, BE {:.1f}h, {:.0f}% confidence",
                                    result.score, be, break_even.confidence * 100);
        return;
    }

    if (be < horizon) {
        result.recommendation = Recommendation::BUY;
        result.reason = fmt::format("Break-even {:.1f}h within horizon {:.1f}h", be, horizon);
        return;
    }

    if (be < max_hours) {
        result.recommendation = Recommendation::BUY;
        result.reason = fmt::format("Break-even {:.1f}h, no reversal predicted", be);
        return;
    }

    result.recommendation = Recommendation::HOLD;
    result.reason = fmt::format("Long BE {:.1f}h, consider if capital is idle", be);
}

} // namespace fundarb
