#include "prediction/forecast_adapter.hpp"
#include <cmath>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace fundarb {

ForecastAdapter::ForecastAdapter(std::shared_ptr<EnsembleRatePredictor> predictor)
    : predictor_(std::move(predictor))
{
}

SpreadForecast ForecastAdapter::spread_forecast(const std::string& symbol, Exchange long_exchange,
                                                Exchange short_exchange) const {
    SpreadForecast forecast;
    if (!predictor_) {
        return forecast;
    }

    auto long_leg = predict_leg(symbol, long_exchange);
    auto short_leg = predict_leg(symbol, short_exchange);
    if (!long_leg || !short_leg) {
        spdlog::debug("No complete forecast for {} {}/{}, using current rates", symbol,
                      exchange_to_string(long_exchange), exchange_to_string(short_exchange));
        return forecast;
    }

    forecast.long_prediction = long_leg;
    forecast.short_prediction = short_leg;
    forecast.confidence = std::clamp(std::min(long_leg->confidence, short_leg->confidence), 0.0, 1.0);
    forecast.regime = long_leg->regime;
    return forecast;
}

std::optional<RatePrediction> ForecastAdapter::predict_leg(const std::string& symbol,
                                                           Exchange exchange) const {
    try {
        auto prediction = predictor_->predict(symbol, exchange);
        if (prediction && !std::isfinite(prediction->predicted_rate)) {
            spdlog::debug("Discarding non-finite prediction for {} on {}", symbol,
                          exchange_to_string(exchange));
            return std::nullopt;
        }
        return prediction;
    } catch (const std::exception& e) {
        spdlog::debug("Prediction failed for {} on {}: {}", symbol, exchange_to_string(exchange), e.what());
        return std::nullopt;
    }
}

HistoryAdapter::HistoryAdapter(std::shared_ptr<HistoricalMetricsProvider> provider)
    : provider_(std::move(provider))
{
}

std::optional<HistoricalMetrics> HistoryAdapter::metrics(const std::string& symbol,
                                                         Exchange exchange) const {
    if (!provider_) {
        return std::nullopt;
    }

    try {
        return provider_->historical_metrics(symbol, exchange);
    } catch (const std::exception& e) {
        spdlog::debug("Historical metrics failed for {} on {}: {}", symbol,
                      exchange_to_string(exchange), e.what());
        return std::nullopt;
    }
}

} // namespace fundarb
