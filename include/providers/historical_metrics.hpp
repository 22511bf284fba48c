#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"

namespace fundarb {

struct HistoricalMetrics {
    Rate min_rate{0};
    Rate max_rate{0};
    Rate average_rate{0};
    double std_dev{0};
    double consistency_score{0};    // 0-1, share of periods keeping the same sign
    int data_points{0};
};

class HistoricalMetricsProvider {
public:
    virtual ~HistoricalMetricsProvider() = default;

    virtual std::optional<HistoricalMetrics> historical_metrics(const std::string& symbol,
                                                                Exchange exchange) = 0;
};

} // namespace fundarb
