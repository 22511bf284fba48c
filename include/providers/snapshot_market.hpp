#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "position/position_pair.hpp"
#include "providers/market_providers.hpp"

namespace fundarb {

// One venue's view of one market, each field independently missing
struct SnapshotQuote {
    std::optional<Rate> funding_rate;
    std::optional<Rate> predicted_rate;
    std::optional<Price> mark_price;
    std::optional<Notional> open_interest;
};

struct SnapshotVenue {
    Exchange exchange{Exchange::HYPERLIQUID};
    std::optional<Notional> balance;
    std::map<std::string, SnapshotQuote> markets;   // Keyed by the venue's own symbol
};

struct SnapshotData {
    WallClock timestamp;
    std::map<Exchange, SnapshotVenue> venues;
    std::map<std::string, std::map<Exchange, RatePrediction>> predictions;
    std::map<std::string, std::map<Exchange, HistoricalMetrics>> history;
    std::vector<OpenPositionPair> positions;
};

/**
 * Frozen market state read from a JSON file, served through the same provider
 * interfaces the live venue adapters implement.
 *
 * Layout:
 *   { "timestamp": "...",
 *     "venues": { "ASTER": { "balance": 5000,
 *                            "markets": { "ETHUSDT": { "funding_rate": -0.0003, ... } } } },
 *     "predictions": { "ETH": { "ASTER": { "predicted_rate": ..., "regime": "trending" } } },
 *     "history": { "ETH": { "ASTER": { "min_rate": ..., "consistency_score": ... } } },
 *     "positions": [ { "symbol": "ETH", "long_exchange": "ASTER", ... } ] }
 *
 * "predictions" and "history" are optional; without them the engine runs with
 * no predictor and no history provider.
 */
class SnapshotMarket {
public:
    explicit SnapshotMarket(SnapshotData data);

    // Throws std::runtime_error on unreadable or malformed files
    static SnapshotMarket load(const std::string& path);
    static SnapshotMarket parse(const nlohmann::json& j);

    MarketProviders providers() const;

    const std::vector<OpenPositionPair>& positions() const { return data_->positions; }
    WallClock timestamp() const { return data_->timestamp; }
    size_t venue_count() const { return data_->venues.size(); }

private:
    std::shared_ptr<const SnapshotData> data_;
};

} // namespace fundarb
