#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "arbitrage/opportunity.hpp"
#include "providers/funding_data_provider.hpp"

namespace fundarb {

// ============================================================================
// Funding Rate Aggregator
//
// Fans out to every venue's funding provider, maps venue symbols onto one
// normalized name ("ETHUSDT", "ETH-PERP" and "ETH" are all "ETH") and turns
// per-venue rates into ArbitrageOpportunity candidates. A venue that fails or
// times out is simply absent from that cycle's view.
// ============================================================================

struct ExchangeSymbolMapping {
    std::string normalized_symbol;
    std::map<Exchange, std::string> exchange_symbols;   // Venue spelling per exchange

    size_t exchange_count() const { return exchange_symbols.size(); }
};

class FundingRateAggregator {
public:
    FundingRateAggregator(std::vector<std::shared_ptr<FundingDataProvider>> providers,
                          const DiscoveryConfig& config = DiscoveryConfig());

    // ETHUSDT -> ETH, ETH-PERP -> ETH, BTCUSD -> BTC
    static std::string normalize_symbol(const std::string& symbol);

    // Assets listed on at least two venues and on the allow-list, sorted.
    // Rebuilds the symbol mappings.
    std::vector<std::string> discover_common_assets();

    std::optional<std::string> exchange_symbol(const std::string& normalized, Exchange exchange) const;
    std::optional<ExchangeSymbolMapping> symbol_mapping(const std::string& normalized) const;

    // One entry per venue that answered; venues without a mapping are not asked
    std::vector<ExchangeFundingRate> funding_rates(const std::string& symbol);

    std::optional<FundingRateComparison> compare_funding_rates(const std::string& symbol);

    // short.current - long.current, nullopt when either leg is unavailable
    std::optional<double> current_spread(const std::string& symbol, Exchange long_exchange,
                                         Exchange short_exchange);

    // Sorted by expected return, best first
    std::vector<ArbitrageOpportunity> find_arbitrage_opportunities(const std::vector<std::string>& symbols,
                                                                   double min_spread);

    const DiscoveryConfig& config() const { return config_; }

    struct Stats {
        uint64_t discoveries{0};
        uint64_t symbols_scanned{0};
        uint64_t symbols_failed{0};
        uint64_t rates_fetched{0};
        uint64_t venue_failures{0};         // Missing current rate, error or timeout
        uint64_t opportunities_found{0};
        uint64_t duplicates_collapsed{0};
    };

    Stats stats() const;

private:
    DiscoveryConfig config_;
    std::vector<std::shared_ptr<FundingDataProvider>> providers_;

    // normalized symbol -> mapping
    std::map<std::string, ExchangeSymbolMapping> mappings_;
    Stats stats_;
    mutable std::mutex mutex_;

    // Float noise allowed when comparing a spread against min_spread
    static constexpr double SPREAD_EPSILON = 1e-12;

    std::vector<ArbitrageOpportunity> opportunities_for(const std::string& symbol, double min_spread);
    bool is_allowed(const std::string& normalized) const;
};

} // namespace fundarb
