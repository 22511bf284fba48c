#pragma once

#include <memory>
#include <string>
#include <optional>
#include "common/types.hpp"
#include "providers/rate_predictor.hpp"
#include "providers/historical_metrics.hpp"

namespace fundarb {

// Both legs of a pair as seen by the predictor
struct SpreadForecast {
    std::optional<RatePrediction> long_prediction;
    std::optional<RatePrediction> short_prediction;
    double confidence{0.5};         // Neutral when the model is unavailable
    MarketRegime regime{MarketRegime::MEAN_REVERTING};

    bool available() const { return long_prediction.has_value() && short_prediction.has_value(); }

    std::optional<double> predicted_spread() const {
        if (!available()) return std::nullopt;
        return long_prediction->predicted_rate - short_prediction->predicted_rate;
    }
};

/**
 * Single place where a missing or failing predictor turns into the neutral
 * fallback. Callers never check for a null predictor themselves.
 */
class ForecastAdapter {
public:
    static constexpr double FALLBACK_CONFIDENCE = 0.5;

    explicit ForecastAdapter(std::shared_ptr<EnsembleRatePredictor> predictor = nullptr);

    bool available() const { return predictor_ != nullptr; }

    // Both legs or nothing; confidence is the weaker leg's
    SpreadForecast spread_forecast(const std::string& symbol, Exchange long_exchange,
                                   Exchange short_exchange) const;

private:
    std::shared_ptr<EnsembleRatePredictor> predictor_;

    std::optional<RatePrediction> predict_leg(const std::string& symbol, Exchange exchange) const;
};

/**
 * Same contract for the historical metrics cache.
 */
class HistoryAdapter {
public:
    explicit HistoryAdapter(std::shared_ptr<HistoricalMetricsProvider> provider = nullptr);

    bool available() const { return provider_ != nullptr; }

    std::optional<HistoricalMetrics> metrics(const std::string& symbol, Exchange exchange) const;

private:
    std::shared_ptr<HistoricalMetricsProvider> provider_;
};

} // namespace fundarb
