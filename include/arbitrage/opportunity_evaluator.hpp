#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "arbitrage/opportunity.hpp"
#include "arbitrage/cost_calculator.hpp"
#include "arbitrage/predicted_break_even.hpp"
#include "prediction/forecast_adapter.hpp"
#include "position/position_pair.hpp"

namespace fundarb {

// ============================================================================
// Opportunity Evaluator
//
// Prices candidates, attaches history and forecasts, and picks the one that
// still pays when each leg falls back to its historical minimum rate. Also
// decides whether an open pair is worth abandoning for a new one, counting
// the costs already sunk into it.
// ============================================================================

struct HistoricalEvaluation {
    std::optional<HistoricalMetrics> long_metrics;
    std::optional<HistoricalMetrics> short_metrics;
    double consistency_score{0};
    std::optional<double> worst_case_break_even_hours;

    // Mean of both legs' average rate, 0 unless both are known
    double average_historical_rate() const {
        if (!long_metrics || !short_metrics) return 0.0;
        return (long_metrics->average_rate + short_metrics->average_rate) / 2;
    }
};

struct EvaluatedOpportunity {
    ArbitrageOpportunity opportunity;
    std::optional<ExecutionPlan> plan;
    double net_return{0};                       // USD per period after amortized costs
    Notional position_value_usd{0};
    std::optional<double> break_even_hours;
    std::optional<Notional> max_portfolio_usd;  // Largest sensible notional per leg
    HistoricalEvaluation history;
};

enum class FillStatus {
    FULL,
    PARTIAL
};

inline std::string fill_status_to_string(FillStatus f) {
    return f == FillStatus::FULL ? "FULL" : "PARTIAL";
}

// A candidate chosen for capital, by worst-case ranking or by the ladder
struct SelectedOpportunity {
    ArbitrageOpportunity opportunity;
    std::optional<ExecutionPlan> plan;
    std::optional<Notional> max_portfolio_usd;  // Scaled to the collateral actually granted
    bool is_existing{false};
    Notional current_value{0};
    Notional current_collateral{0};
    Notional collateral{0};                     // New collateral to deploy
    FillStatus fill{FillStatus::FULL};
    std::string reason;
};

struct WorstCaseSelection {
    ArbitrageOpportunity opportunity;
    ExecutionPlan plan;
    HistoricalEvaluation history;
    double score{0};
    std::string reason;
};

struct RemainingBreakEven {
    double remaining_cost{0};                   // USD still to recover, may be negative
    double remaining_break_even_hours{NEVER};
    double hours_held{0};
    double funding_earned{0};
};

struct RebalanceDecision {
    bool should_rebalance{false};
    std::string reason;
    std::optional<double> current_break_even_hours;
    std::optional<double> new_break_even_hours;

    explicit operator bool() const { return should_rebalance; }
};

struct PredictionEvaluation {
    double predicted_spread{0};
    double confidence{0};
    std::optional<double> predicted_break_even_hours;
    MarketRegime regime{MarketRegime::MEAN_REVERTING};
};

struct PredictionEnhancedEvaluation {
    HistoricalEvaluation history;
    std::optional<PredictionEvaluation> prediction;
    double combined_score{0};
};

struct PredictedSelection {
    ArbitrageOpportunity opportunity;
    ExecutionPlan plan;
    PredictionEnhancedEvaluation evaluation;
    std::string reason;
};

class OpportunityEvaluator {
public:
    OpportunityEvaluator(const CostCalculator& costs, const PredictedBreakEvenCalculator& break_even,
                         HistoryAdapter history, ForecastAdapter forecasts);

    // Priced plan, or nullopt when below minimum size or never breaking even
    // within max_break_even_hours
    std::optional<ExecutionPlan> build_plan(const ArbitrageOpportunity& opportunity,
                                            Notional position_size_usd, double leverage) const;

    // Plan figures without the feasibility gate
    ExecutionPlan price_plan(const ArbitrageOpportunity& opportunity, Notional position_size_usd,
                             double leverage) const;

    // min(max_position_size_usd, min OI * max_open_interest_share)
    Notional max_portfolio_usd(const ArbitrageOpportunity& opportunity) const;

    EvaluatedOpportunity evaluate(const ArbitrageOpportunity& opportunity,
                                  const std::optional<ExecutionPlan>& plan) const;

    HistoricalEvaluation evaluate_with_history(const ArbitrageOpportunity& opportunity,
                                               const std::optional<ExecutionPlan>& plan) const;

    std::optional<WorstCaseSelection> select_worst_case(const std::vector<EvaluatedOpportunity>& candidates) const;

    std::optional<SelectedOpportunity> rank_and_select(const std::vector<EvaluatedOpportunity>& evaluated) const;

    RemainingBreakEven remaining_break_even(const OpenPositionPair& position,
                                            std::optional<double> current_spread,
                                            double cumulative_loss) const;

    RebalanceDecision should_rebalance(const OpenPositionPair& current, std::optional<double> current_spread,
                                       const ArbitrageOpportunity& new_opportunity,
                                       const ExecutionPlan& new_plan, double cumulative_loss) const;

    // Prediction layer. Without a predictor opportunities pass through untouched.
    ArbitrageOpportunity enrich_with_predictions(const ArbitrageOpportunity& opportunity,
                                                 Notional position_size_usd, double total_costs) const;

    std::vector<ArbitrageOpportunity> filter_by_prediction_quality(
        const std::vector<ArbitrageOpportunity>& opportunities,
        double min_confidence = 0.6, double max_break_even_hours = 168.0) const;

    static std::vector<ArbitrageOpportunity> rank_by_prediction_score(std::vector<ArbitrageOpportunity> opportunities);

    PredictionEnhancedEvaluation evaluate_with_predictions(const ArbitrageOpportunity& opportunity,
                                                           const std::optional<ExecutionPlan>& plan) const;

    std::optional<PredictedSelection> select_best_with_predictions(
        const std::vector<EvaluatedOpportunity>& candidates) const;

    static double combined_score(const HistoricalEvaluation& history,
                                 const std::optional<PredictionEvaluation>& prediction);

    static double worst_case_liquidity_score(const ArbitrageOpportunity& opportunity);

    const CostCalculator& costs() const { return costs_; }

private:
    CostCalculator costs_;
    PredictedBreakEvenCalculator break_even_;
    HistoryAdapter history_;
    ForecastAdapter forecasts_;

    const StrategyConfig& config() const { return costs_.config(); }
};

} // namespace fundarb
