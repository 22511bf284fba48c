#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"

namespace fundarb {

// Behavioral classification of a funding series
enum class MarketRegime {
    MEAN_REVERTING,
    TRENDING,
    HIGH_VOLATILITY,
    EXTREME_DISLOCATION
};

inline std::string regime_to_string(MarketRegime r) {
    switch (r) {
        case MarketRegime::MEAN_REVERTING: return "mean_reverting";
        case MarketRegime::TRENDING: return "trending";
        case MarketRegime::HIGH_VOLATILITY: return "high_volatility";
        case MarketRegime::EXTREME_DISLOCATION: return "extreme_dislocation";
    }
    return "unknown";
}

inline std::optional<MarketRegime> regime_from_string(const std::string& s) {
    if (s == "mean_reverting") return MarketRegime::MEAN_REVERTING;
    if (s == "trending") return MarketRegime::TRENDING;
    if (s == "high_volatility") return MarketRegime::HIGH_VOLATILITY;
    if (s == "extreme_dislocation") return MarketRegime::EXTREME_DISLOCATION;
    return std::nullopt;
}

struct RatePrediction {
    Rate predicted_rate{0};
    Rate lower_bound{0};
    Rate upper_bound{0};
    double confidence{0};           // 0-1
    MarketRegime regime{MarketRegime::MEAN_REVERTING};
};

/**
 * Output contract of the ensemble funding-rate predictor. Model fitting
 * happens elsewhere; the engine only consumes point estimates and bounds.
 */
class EnsembleRatePredictor {
public:
    virtual ~EnsembleRatePredictor() = default;

    virtual std::optional<RatePrediction> predict(const std::string& symbol, Exchange exchange) = 0;
};

} // namespace fundarb
