#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"
#include "arbitrage/opportunity.hpp"
#include "arbitrage/cost_calculator.hpp"
#include "prediction/forecast_adapter.hpp"

namespace fundarb {

// ============================================================================
// Prediction-based break-even
//
// Break-even from a single funding snapshot overstates how long a spread will
// pay. Here the ensemble forecast supplies the expected spread, a pessimistic
// and an optimistic bound, and a confidence that both shortens the horizon we
// trust and stretches the break-even we believe.
//
// Infinite hours mean "never breaks even".
// ============================================================================

struct PredictedBreakEven {
    double predicted_break_even_hours{NEVER};
    double confidence{ForecastAdapter::FALLBACK_CONFIDENCE};
    double predicted_spread{0};                 // long - short
    double worst_case_break_even_hours{NEVER};
    double best_case_break_even_hours{NEVER};
    double reliable_horizon_hours{0};
    double confidence_adjusted_break_even_hours{NEVER};
    bool is_prediction_reliable{false};

    std::optional<RatePrediction> long_prediction;
    std::optional<RatePrediction> short_prediction;
};

struct OpportunityScore {
    double score{0};

    struct Components {
        double spread_score{0};
        double confidence_score{0};
        double break_even_score{0};
        double liquidity_score{0};
    };
    Components components;

    Recommendation recommendation{Recommendation::HOLD};
    std::string reason;
};

// Prediction tuning (defined outside class for default parameter).
// The reliability threshold and the day limit come from StrategyConfig.
struct PredictionConfig {
    double default_reliable_horizon = 24.0;     // Hours at full confidence
    double min_spread_threshold = 0.00001;      // Hourly return floor is this * 1000 USD
    double worst_case_haircut = 0.7;
    double best_case_bonus = 1.3;
    double min_actionable_spread = 0.0001;      // 1bp
};

class PredictedBreakEvenCalculator {
public:
    using Config = PredictionConfig;

    PredictedBreakEvenCalculator(const CostCalculator& costs, ForecastAdapter forecasts,
                                 const Config& config = Config());

    PredictedBreakEven calculate(const ArbitrageOpportunity& opportunity,
                                 Notional position_size_usd, double total_costs) const;

    OpportunityScore score(const ArbitrageOpportunity& opportunity,
                           Notional position_size_usd, double total_costs) const;

    // Scores an already computed break-even without asking the predictor again
    OpportunityScore score(const ArbitrageOpportunity& opportunity,
                           const PredictedBreakEven& break_even) const;

    bool is_prediction_available() const { return forecasts_.available(); }

    // Component scores, each 0-1
    static double spread_score(double spread);
    static double break_even_score(double break_even_hours);
    static double liquidity_score(const ArbitrageOpportunity& opportunity);

private:
    CostCalculator costs_;
    ForecastAdapter forecasts_;
    Config config_;

    static constexpr double WEIGHT_SPREAD = 0.3;
    static constexpr double WEIGHT_CONFIDENCE = 0.25;
    static constexpr double WEIGHT_BREAK_EVEN = 0.3;
    static constexpr double WEIGHT_LIQUIDITY = 0.15;

    double current_spread(const ArbitrageOpportunity& opportunity) const;
    double reliable_horizon(double confidence) const;
    double break_even(double total_costs, double spread, Notional position_size_usd) const;

    void recommend(OpportunityScore& result, const PredictedBreakEven& break_even,
                   const ArbitrageOpportunity& opportunity) const;
};

} // namespace fundarb
