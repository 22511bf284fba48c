#include "arbitrage/opportunity_evaluator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cmath>

namespace fundarb {

OpportunityEvaluator::OpportunityEvaluator(const CostCalculator& costs,
                                           const PredictedBreakEvenCalculator& break_even,
                                           HistoryAdapter history, ForecastAdapter forecasts)
    : costs_(costs)
    , break_even_(break_even)
    , history_(std::move(history))
    , forecasts_(std::move(forecasts))
{
}

ExecutionPlan OpportunityEvaluator::price_plan(const ArbitrageOpportunity& opportunity,
                                               Notional position_size_usd, double leverage) const {
    ExecutionPlan plan;
    plan.symbol = opportunity.symbol;
    plan.long_exchange = opportunity.long_exchange;
    plan.short_exchange = opportunity.short_exchange;
    plan.position_size_usd = position_size_usd;
    plan.leverage = leverage;

    // OI stands in for book depth
    Notional long_liquidity = opportunity.long_open_interest.value_or(config().default_liquidity_usd);
    Notional short_liquidity = opportunity.short_open_interest.value_or(config().default_liquidity_usd);

    double basis_bps = 0;
    if (opportunity.long_mark_price && opportunity.short_mark_price) {
        double mid = opportunity.average_mark_price();
        if (mid > 0) {
            basis_bps = std::abs(*opportunity.long_mark_price - *opportunity.short_mark_price) / mid * 10000;
        }
    }

    plan.entry_costs = costs_.entry_costs(position_size_usd, opportunity.long_exchange, opportunity.short_exchange,
                                          long_liquidity, short_liquidity, basis_bps);
    plan.exit_costs = costs_.exit_costs(position_size_usd, opportunity.long_exchange, opportunity.short_exchange,
                                        long_liquidity, short_liquidity, basis_bps);

    plan.estimated_costs.fees = plan.entry_costs.fees + plan.exit_costs.fees;
    plan.estimated_costs.slippage = plan.entry_costs.slippage + plan.exit_costs.slippage;
    plan.estimated_costs.basis_risk_cost = plan.entry_costs.basis_risk_cost + plan.exit_costs.basis_risk_cost;
    plan.estimated_costs.total = plan.entry_costs.total + plan.exit_costs.total;

    // Our own size pushes both venues' rates against us
    double impact = costs_.funding_rate_impact(position_size_usd, opportunity.long_open_interest.value_or(0.0),
                                               opportunity.long_rate) +
                    costs_.funding_rate_impact(position_size_usd, opportunity.short_open_interest.value_or(0.0),
                                               opportunity.short_rate);
    double effective_spread = std::max(0.0, std::abs(opportunity.spread) - impact);

    plan.hourly_return = effective_spread * position_size_usd;
    plan.expected_net_return = plan.hourly_return - plan.estimated_costs.total / config().target_hold_hours;
    plan.break_even_hours = CostCalculator::break_even_hours(plan.estimated_costs.total, plan.hourly_return);
    return plan;
}

std::optional<ExecutionPlan> OpportunityEvaluator::build_plan(const ArbitrageOpportunity& opportunity,
                                                              Notional position_size_usd, double leverage) const {
    if (position_size_usd < config().min_position_size_usd) {
        spdlog::debug("No plan for {}: size ${:.2f} below minimum ${:.2f}", opportunity.pair_label(),
                      position_size_usd, config().min_position_size_usd);
        return std::nullopt;
    }

    auto plan = price_plan(opportunity, position_size_usd, leverage);

    if (!plan.break_even_hours || *plan.break_even_hours > config().max_break_even_hours) {
        spdlog::debug("No plan for {}: break-even {} exceeds {:.0f}h", opportunity.pair_label(),
                      plan.break_even_hours ? fmt::format("{:.1f}h", *plan.break_even_hours) : "never",
                      config().max_break_even_hours);
        return std::nullopt;
    }
    return plan;
}

Notional OpportunityEvaluator::max_portfolio_usd(const ArbitrageOpportunity& opportunity) const {
    Notional min_oi = opportunity.min_open_interest();
    if (min_oi > 0) {
        return std::min(config().max_position_size_usd, min_oi * config().max_open_interest_share);
    }
    return config().max_position_size_usd;
}

EvaluatedOpportunity OpportunityEvaluator::evaluate(const ArbitrageOpportunity& opportunity,
                                                    const std::optional<ExecutionPlan>& plan) const {
    EvaluatedOpportunity result;
    result.opportunity = opportunity;
    result.plan = plan;
    result.max_portfolio_usd = max_portfolio_usd(opportunity);

    // Without a plan, still report what the trade would have looked like
    ExecutionPlan priced = plan ? *plan : price_plan(opportunity, *result.max_portfolio_usd, config().leverage);
    result.position_value_usd = priced.position_size_usd;
    result.net_return = priced.expected_net_return;
    result.break_even_hours = priced.break_even_hours;

    result.history = evaluate_with_history(opportunity, plan);
    return result;
}

HistoricalEvaluation OpportunityEvaluator::evaluate_with_history(const ArbitrageOpportunity& opportunity,
                                                                 const std::optional<ExecutionPlan>& plan) const {
    HistoricalEvaluation result;
    result.long_metrics = history_.metrics(opportunity.symbol, opportunity.long_exchange);
    result.short_metrics = history_.metrics(opportunity.symbol, opportunity.short_exchange);

    if (result.long_metrics && result.short_metrics) {
        result.consistency_score = (result.long_metrics->consistency_score +
                                    result.short_metrics->consistency_score) / 2;
    } else if (result.long_metrics) {
        result.consistency_score = result.long_metrics->consistency_score;
    } else if (result.short_metrics) {
        result.consistency_score = result.short_metrics->consistency_score;
    }

    // Pessimistic: both legs at their historical minimum
    if (plan && result.long_metrics && result.short_metrics) {
        double worst_spread = std::abs(result.short_metrics->min_rate - result.long_metrics->min_rate);
        double worst_hourly = worst_spread * plan->position_size_usd;
        if (worst_hourly > 0) {
            result.worst_case_break_even_hours = plan->estimated_costs.total / worst_hourly;
        }
    }
    return result;
}

double OpportunityEvaluator::worst_case_liquidity_score(const ArbitrageOpportunity& opportunity) {
    Notional min_oi = opportunity.min_open_interest();
    if (min_oi <= 0) return 0.1;
    return std::clamp(std::log10(std::max(min_oi / 1000.0, 1.0)) / 10.0, 0.0, 1.0);
}

std::optional<WorstCaseSelection> OpportunityEvaluator::select_worst_case(
    const std::vector<EvaluatedOpportunity>& candidates) const {

    std::vector<WorstCaseSelection> scored;
    for (const auto& candidate : candidates) {
        if (!candidate.plan) continue;

        WorstCaseSelection entry;
        entry.opportunity = candidate.opportunity;
        entry.plan = *candidate.plan;
        entry.history = evaluate_with_history(candidate.opportunity, candidate.plan);

        double worst = entry.history.worst_case_break_even_hours.value_or(NEVER);
        if (std::isfinite(worst) && worst > 0) {
            entry.score = entry.history.consistency_score *
                          std::abs(entry.history.average_historical_rate()) *
                          worst_case_liquidity_score(candidate.opportunity) / worst;
        }
        scored.push_back(std::move(entry));
    }

    if (scored.empty()) {
        return std::nullopt;
    }

    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });
    auto best = std::move(scored.front());

    double worst_days = best.history.worst_case_break_even_hours
        ? *best.history.worst_case_break_even_hours / 24
        : NEVER;
    if (worst_days > config().max_worst_case_break_even_days) {
        spdlog::warn("Best worst-case candidate {} breaks even in {:.1f} days (> {:.0f}), skipping",
                     best.opportunity.pair_label(), worst_days, config().max_worst_case_break_even_days);
        return std::nullopt;
    }

    best.reason = fmt::format("Worst-case selection: consistency {:.1f}%, worst-case break-even {:.1f} days, score {:.4f}",
                              best.history.consistency_score * 100, worst_days, best.score);
    spdlog::info("Selected {}: {}", best.opportunity.pair_label(), best.reason);
    return best;
}

std::optional<SelectedOpportunity> OpportunityEvaluator::rank_and_select(
    const std::vector<EvaluatedOpportunity>& evaluated) const {
    auto best = select_worst_case(evaluated);
    if (!best) {
        return std::nullopt;
    }

    SelectedOpportunity selected;
    selected.opportunity = best->opportunity;
    selected.plan = best->plan;
    selected.max_portfolio_usd = best->plan.position_size_usd;
    selected.collateral = best->plan.collateral_required();
    selected.fill = FillStatus::FULL;
    selected.reason = best->reason;
    return selected;
}

RemainingBreakEven OpportunityEvaluator::remaining_break_even(const OpenPositionPair& position,
                                                              std::optional<double> current_spread,
                                                              double cumulative_loss) const {
    RemainingBreakEven result;
    result.hours_held = std::max(0.0, position.hours_held(wall_now()));
    result.funding_earned = position.funding_earned;

    // Closing still costs taker fees on both legs
    double exit_estimate = costs_.fees(position.notional_size, position.long_exchange, false) +
                           costs_.fees(position.notional_size, position.short_exchange, false);
    result.remaining_cost = position.entry_costs + exit_estimate + cumulative_loss - position.funding_earned;

    if (result.remaining_cost <= 0) {
        result.remaining_break_even_hours = 0;
    } else if (!current_spread || *current_spread <= 0 || position.notional_size <= 0) {
        result.remaining_break_even_hours = NEVER;
    } else {
        result.remaining_break_even_hours = result.remaining_cost / (*current_spread * position.notional_size);
    }
    return result;
}

RebalanceDecision OpportunityEvaluator::should_rebalance(const OpenPositionPair& current,
                                                         std::optional<double> current_spread,
                                                         const ArbitrageOpportunity& new_opportunity,
                                                         const ExecutionPlan& new_plan,
                                                         double cumulative_loss) const {
    auto p1 = remaining_break_even(current, current_spread, cumulative_loss);
    double p1_hours = p1.remaining_break_even_hours;
    double p1_outstanding = std::max(0.0, p1.remaining_cost);

    double new_hourly = new_opportunity.hourly_return_rate() * new_plan.position_size_usd;
    double p2_cost = p1_outstanding + new_plan.estimated_costs.fees + new_plan.estimated_costs.slippage;
    double p2_hours = new_hourly > 0 ? p2_cost / new_hourly : NEVER;

    auto finite_or_none = [](double h) -> std::optional<double> {
        if (std::isfinite(h)) return h;
        return std::nullopt;
    };

    RebalanceDecision decision;
    decision.current_break_even_hours = finite_or_none(p1_hours);
    decision.new_break_even_hours = finite_or_none(p2_hours);

    if (new_plan.expected_net_return > 0) {
        decision.should_rebalance = true;
        decision.new_break_even_hours.reset();
        decision.reason = fmt::format("New opportunity is instantly profitable (${:.4f}/period)",
                                      new_plan.expected_net_return);
    } else if (p1.remaining_cost <= 0) {
        decision.should_rebalance = false;
        decision.current_break_even_hours = 0.0;
        decision.reason = "Current position already profitable, new position not instantly profitable";
    } else if (!std::isfinite(p1_hours)) {
        decision.should_rebalance = std::isfinite(p2_hours);
        decision.reason = decision.should_rebalance
            ? fmt::format("Current position never breaks even, new one does in {:.2f}h", p2_hours)
            : "Both positions never break even";
    } else if (!std::isfinite(p2_hours)) {
        decision.should_rebalance = false;
        decision.reason = fmt::format("New position never breaks even (current remaining {:.2f}h)", p1_hours);
    } else if (p2_hours < p1_hours) {
        decision.should_rebalance = true;
        decision.reason = fmt::format("P2 TTBE {:.2f}h < P1 remaining {:.2f}h, saves {:.2f}h",
                                      p2_hours, p1_hours, p1_hours - p2_hours);
    } else {
        decision.should_rebalance = false;
        decision.reason = fmt::format("P1 remaining {:.2f}h <= P2 TTBE {:.2f}h", p1_hours, p2_hours);
    }

    spdlog::info("{} {} -> {}: {}", decision.should_rebalance ? "Rebalance" : "Hold",
                 current.key(), new_opportunity.pair_label(), decision.reason);
    return decision;
}

ArbitrageOpportunity OpportunityEvaluator::enrich_with_predictions(const ArbitrageOpportunity& opportunity,
                                                                   Notional position_size_usd,
                                                                   double total_costs) const {
    if (!break_even_.is_prediction_available()) {
        return opportunity;
    }

    auto break_even = break_even_.calculate(opportunity, position_size_usd, total_costs);
    auto score = break_even_.score(opportunity, break_even);

    ArbitrageOpportunity enriched = opportunity;
    enriched.predicted_spread = break_even.predicted_spread;
    enriched.prediction_confidence = break_even.confidence;
    enriched.predicted_break_even_hours = break_even.confidence_adjusted_break_even_hours;
    enriched.reliable_horizon_hours = break_even.reliable_horizon_hours;
    enriched.prediction_score = score.score;
    enriched.prediction_recommendation = score.recommendation;

    spdlog::debug("{} prediction: {} ({})", opportunity.pair_label(),
                  recommendation_to_string(score.recommendation), score.reason);
    return enriched;
}

std::vector<ArbitrageOpportunity> OpportunityEvaluator::filter_by_prediction_quality(
    const std::vector<ArbitrageOpportunity>& opportunities,
    double min_confidence, double max_break_even_hours) const {

    std::vector<ArbitrageOpportunity> kept;
    for (const auto& opp : opportunities) {
        // Not enriched: judged on history alone
        if (!opp.prediction_confidence) {
            kept.push_back(opp);
            continue;
        }

        if (*opp.prediction_confidence < min_confidence) {
            spdlog::debug("Filtering {}: confidence {:.0f}% < {:.0f}%", opp.pair_label(),
                          *opp.prediction_confidence * 100, min_confidence * 100);
            continue;
        }
        if (opp.predicted_break_even_hours && *opp.predicted_break_even_hours > max_break_even_hours) {
            spdlog::debug("Filtering {}: break-even {:.1f}h > {:.0f}h", opp.pair_label(),
                          *opp.predicted_break_even_hours, max_break_even_hours);
            continue;
        }
        if (opp.prediction_recommendation == Recommendation::SKIP) {
            spdlog::debug("Filtering {}: recommendation is skip", opp.pair_label());
            continue;
        }
        kept.push_back(opp);
    }
    return kept;
}

std::vector<ArbitrageOpportunity> OpportunityEvaluator::rank_by_prediction_score(
    std::vector<ArbitrageOpportunity> opportunities) {
    std::stable_sort(opportunities.begin(), opportunities.end(), [](const auto& a, const auto& b) {
        if (a.prediction_score && b.prediction_score) return *a.prediction_score > *b.prediction_score;
        if (a.prediction_score || b.prediction_score) return a.prediction_score.has_value();
        return a.spread > b.spread;
    });
    return opportunities;
}

PredictionEnhancedEvaluation OpportunityEvaluator::evaluate_with_predictions(
    const ArbitrageOpportunity& opportunity, const std::optional<ExecutionPlan>& plan) const {

    PredictionEnhancedEvaluation result;
    result.history = evaluate_with_history(opportunity, plan);

    auto forecast = forecasts_.spread_forecast(opportunity.symbol, opportunity.long_exchange,
                                               opportunity.short_exchange);
    if (forecast.available()) {
        PredictionEvaluation prediction;
        prediction.predicted_spread = *forecast.predicted_spread();
        prediction.confidence = forecast.confidence;
        prediction.regime = forecast.regime;

        if (plan && prediction.predicted_spread != 0) {
            double hourly = std::abs(prediction.predicted_spread) * plan->position_size_usd;
            if (hourly > 0) {
                prediction.predicted_break_even_hours = plan->estimated_costs.total / hourly;
            }
        }
        result.prediction = prediction;
    }

    result.combined_score = combined_score(result.history, result.prediction);
    return result;
}

double OpportunityEvaluator::combined_score(const HistoricalEvaluation& history,
                                            const std::optional<PredictionEvaluation>& prediction) {
    constexpr double WEEK_HOURS = 24.0 * 7;

    double score = history.consistency_score;

    if (history.worst_case_break_even_hours && std::isfinite(*history.worst_case_break_even_hours)) {
        double factor = std::max(0.0, 1.0 - *history.worst_case_break_even_hours / WEEK_HOURS);
        score *= 0.7 + 0.3 * factor;
    }

    // Forecast weight grows with confidence, up to 40%
    if (prediction && prediction->confidence > 0.5) {
        double prediction_weight = prediction->confidence * 0.4;

        double prediction_score = std::min(1.0, std::abs(prediction->predicted_spread) * 10000);
        if (prediction->predicted_break_even_hours && std::isfinite(*prediction->predicted_break_even_hours)) {
            double factor = std::max(0.0, 1.0 - *prediction->predicted_break_even_hours / WEEK_HOURS);
            prediction_score *= 0.7 + 0.3 * factor;
        }

        if (prediction->regime == MarketRegime::MEAN_REVERTING) {
            prediction_score *= 1.1;
        } else if (prediction->regime == MarketRegime::EXTREME_DISLOCATION) {
            prediction_score *= 0.8;
        }

        score = (1 - prediction_weight) * score + prediction_weight * prediction_score;
    }

    return std::clamp(score, 0.0, 1.0);
}

std::optional<PredictedSelection> OpportunityEvaluator::select_best_with_predictions(
    const std::vector<EvaluatedOpportunity>& candidates) const {

    std::vector<PredictedSelection> scored;
    for (const auto& candidate : candidates) {
        if (!candidate.plan) continue;

        PredictedSelection entry;
        entry.opportunity = candidate.opportunity;
        entry.plan = *candidate.plan;
        entry.evaluation = evaluate_with_predictions(candidate.opportunity, candidate.plan);
        scored.push_back(std::move(entry));
    }

    if (scored.empty()) {
        return std::nullopt;
    }

    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.evaluation.combined_score > b.evaluation.combined_score;
    });
    auto best = std::move(scored.front());

    const auto& evaluation = best.evaluation;
    std::vector<std::string> parts;
    parts.push_back(fmt::format("combined score {:.1f}%", evaluation.combined_score * 100));
    parts.push_back(fmt::format("consistency {:.1f}%", evaluation.history.consistency_score * 100));
    if (evaluation.history.worst_case_break_even_hours) {
        parts.push_back(fmt::format("worst-case BE {:.1f}d", *evaluation.history.worst_case_break_even_hours / 24));
    }
    if (evaluation.prediction) {
        parts.push_back(fmt::format("predicted spread {:.4f}%", evaluation.prediction->predicted_spread * 100));
        parts.push_back(fmt::format("regime {}", regime_to_string(evaluation.prediction->regime)));
        parts.push_back(fmt::format("confidence {:.0f}%", evaluation.prediction->confidence * 100));
    }
    best.reason = fmt::format("{}", fmt::join(parts, ", "));

    spdlog::info("Selected {}: {}", best.opportunity.pair_label(), best.reason);
    return best;
}

} // namespace fundarb
