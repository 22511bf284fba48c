#pragma once

#include <memory>
#include <vector>
#include "providers/funding_data_provider.hpp"
#include "providers/balance_provider.hpp"
#include "providers/rate_predictor.hpp"
#include "providers/historical_metrics.hpp"

namespace fundarb {

// Everything the engine reads from the outside world
struct MarketProviders {
    std::vector<std::shared_ptr<FundingDataProvider>> funding;
    std::shared_ptr<BalanceProvider> balances;
    std::shared_ptr<EnsembleRatePredictor> predictor;       // Optional
    std::shared_ptr<HistoricalMetricsProvider> history;     // Optional
};

} // namespace fundarb
