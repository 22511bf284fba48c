#include "arbitrage/funding_rate_aggregator.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <future>
#include <set>
#include <thread>
#include <tuple>

namespace fundarb {

namespace {

void erase_first(std::string& s, const std::string& token) {
    auto pos = s.find(token);
    if (pos != std::string::npos) {
        s.erase(pos, token.size());
    }
}

// Optional fields degrade to a fallback; anything thrown is logged and dropped
template <typename T, typename Fn>
std::optional<T> ask_venue(Fn fn, std::chrono::milliseconds timeout, const char* what,
                           Exchange exchange, const std::string& symbol) {
    try {
        return time_utils::call_with_timeout<T>(std::move(fn), timeout);
    } catch (const std::exception& e) {
        spdlog::debug("{} unavailable for {} on {}: {}", what, symbol, exchange_to_string(exchange), e.what());
        return std::nullopt;
    }
}

std::optional<ExchangeFundingRate> fetch_rate(std::shared_ptr<FundingDataProvider> provider,
                                              const std::string& venue_symbol,
                                              const std::string& normalized,
                                              std::chrono::milliseconds timeout) {
    Exchange exchange = provider->exchange();

    auto current = ask_venue<Rate>([provider, venue_symbol]() {
        return provider->current_funding_rate(venue_symbol);
    }, timeout, "Funding rate", exchange, normalized);

    // Without the current rate the venue has nothing to offer this cycle
    if (!current || !std::isfinite(*current)) {
        return std::nullopt;
    }

    auto predicted = ask_venue<Rate>([provider, venue_symbol]() {
        return provider->predicted_funding_rate(venue_symbol);
    }, timeout, "Predicted rate", exchange, normalized);
    auto mark = ask_venue<Price>([provider, venue_symbol]() {
        return provider->mark_price(venue_symbol);
    }, timeout, "Mark price", exchange, normalized);
    auto oi = ask_venue<Notional>([provider, venue_symbol]() {
        return provider->open_interest(venue_symbol);
    }, timeout, "Open interest", exchange, normalized);

    ExchangeFundingRate rate;
    rate.exchange = exchange;
    rate.symbol = normalized;
    rate.current_rate = *current;
    rate.predicted_rate = predicted && std::isfinite(*predicted) ? *predicted : *current;
    rate.mark_price = mark.value_or(0.0);
    rate.open_interest = oi.value_or(0.0);
    rate.timestamp = wall_now();
    return rate;
}

ArbitrageOpportunity make_opportunity(const std::string& symbol, const ExchangeFundingRate& long_leg,
                                      const ExchangeFundingRate& short_leg, double spread) {
    ArbitrageOpportunity opp;
    opp.symbol = symbol;
    opp.long_exchange = long_leg.exchange;
    opp.short_exchange = short_leg.exchange;
    opp.long_rate = long_leg.current_rate;
    opp.short_rate = short_leg.current_rate;
    opp.spread = spread;
    opp.expected_return = spread * PERIODS_PER_YEAR;

    if (long_leg.mark_price > 0) opp.long_mark_price = long_leg.mark_price;
    if (short_leg.mark_price > 0) opp.short_mark_price = short_leg.mark_price;
    if (long_leg.open_interest > 0) opp.long_open_interest = long_leg.open_interest;
    if (short_leg.open_interest > 0) opp.short_open_interest = short_leg.open_interest;

    opp.timestamp = wall_now();
    opp.validate();
    return opp;
}

} // anonymous namespace

FundingRateAggregator::FundingRateAggregator(std::vector<std::shared_ptr<FundingDataProvider>> providers,
                                             const DiscoveryConfig& config)
    : config_(config)
    , providers_(std::move(providers))
{
    spdlog::info("FundingRateAggregator initialized with {} venues, batch={} delay={}ms timeout={}ms",
                 providers_.size(), config_.batch_size, config_.batch_delay_ms, config_.request_timeout_ms);
}

std::string FundingRateAggregator::normalize_symbol(const std::string& symbol) {
    std::string s = symbol;
    erase_first(s, "USDT");
    erase_first(s, "USDC");
    erase_first(s, "-PERP");
    erase_first(s, "PERP");

    if (s.size() > 3 && s.compare(s.size() - 3, 3, "USD") == 0) {
        s.erase(s.size() - 3);
    }

    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::vector<std::string> FundingRateAggregator::discover_common_assets() {
    spdlog::info("Discovering assets across {} venues", providers_.size());

    try {
        std::chrono::milliseconds timeout(config_.request_timeout_ms);

        std::vector<std::future<std::vector<std::string>>> listings;
        for (const auto& provider : providers_) {
            listings.push_back(std::async(std::launch::async, [provider, timeout]() {
                auto symbols = ask_venue<std::vector<std::string>>([provider]() {
                    return std::optional<std::vector<std::string>>(provider->available_symbols());
                }, timeout, "Symbol list", provider->exchange(), "*");
                return symbols.value_or(std::vector<std::string>{});
            }));
        }

        std::map<std::string, ExchangeSymbolMapping> mappings;
        for (size_t i = 0; i < providers_.size(); i++) {
            Exchange exchange = providers_[i]->exchange();
            for (const auto& venue_symbol : listings[i].get()) {
                std::string normalized = normalize_symbol(venue_symbol);
                auto& mapping = mappings[normalized];
                mapping.normalized_symbol = normalized;
                mapping.exchange_symbols[exchange] = venue_symbol;
            }
        }

        std::vector<std::string> common;
        for (const auto& [normalized, mapping] : mappings) {
            if (mapping.exchange_count() < 2) continue;

            if (!is_allowed(normalized)) {
                spdlog::debug("Skipping {} (not in allowed assets list)", normalized);
                continue;
            }
            common.push_back(normalized);
        }
        std::sort(common.begin(), common.end());

        {
            std::lock_guard<std::mutex> lock(mutex_);
            mappings_ = std::move(mappings);
            stats_.discoveries++;
        }

        spdlog::info("Discovered {} common assets: {}", common.size(), fmt::join(common, ", "));
        return common;
    } catch (const std::exception& e) {
        spdlog::error("Asset discovery failed: {}. Falling back to {}", e.what(),
                      fmt::join(config_.fallback_assets, ", "));
        return config_.fallback_assets;
    }
}

std::optional<std::string> FundingRateAggregator::exchange_symbol(const std::string& normalized,
                                                                  Exchange exchange) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mappings_.find(normalized);
    if (it == mappings_.end()) return std::nullopt;

    auto venue = it->second.exchange_symbols.find(exchange);
    if (venue == it->second.exchange_symbols.end()) return std::nullopt;
    return venue->second;
}

std::optional<ExchangeSymbolMapping> FundingRateAggregator::symbol_mapping(const std::string& normalized) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mappings_.find(normalized);
    if (it == mappings_.end()) return std::nullopt;
    return it->second;
}

std::vector<ExchangeFundingRate> FundingRateAggregator::funding_rates(const std::string& symbol) {
    std::chrono::milliseconds timeout(config_.request_timeout_ms);

    std::vector<std::future<std::optional<ExchangeFundingRate>>> pending;
    for (const auto& provider : providers_) {
        auto venue_symbol = exchange_symbol(symbol, provider->exchange());
        if (!venue_symbol) continue;

        pending.push_back(std::async(std::launch::async, fetch_rate, provider, *venue_symbol, symbol, timeout));
    }

    std::vector<ExchangeFundingRate> rates;
    uint64_t failures = 0;
    for (auto& f : pending) {
        auto rate = f.get();
        if (rate) {
            rates.push_back(*rate);
        } else {
            failures++;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.rates_fetched += rates.size();
        stats_.venue_failures += failures;
    }

    if (rates.empty()) {
        spdlog::debug("No funding rates for {}", symbol);
    }
    return rates;
}

std::optional<FundingRateComparison> FundingRateAggregator::compare_funding_rates(const std::string& symbol) {
    auto rates = funding_rates(symbol);
    if (rates.empty()) {
        return std::nullopt;
    }

    auto by_rate = [](const ExchangeFundingRate& a, const ExchangeFundingRate& b) {
        return a.current_rate < b.current_rate;
    };

    FundingRateComparison comparison;
    comparison.symbol = symbol;
    comparison.highest = *std::max_element(rates.begin(), rates.end(), by_rate);
    comparison.lowest = *std::min_element(rates.begin(), rates.end(), by_rate);
    comparison.spread = comparison.highest.current_rate - comparison.lowest.current_rate;
    comparison.rates = std::move(rates);
    comparison.timestamp = wall_now();
    return comparison;
}

std::optional<double> FundingRateAggregator::current_spread(const std::string& symbol, Exchange long_exchange,
                                                            Exchange short_exchange) {
    auto rates = funding_rates(symbol);

    std::optional<Rate> long_rate;
    std::optional<Rate> short_rate;
    for (const auto& r : rates) {
        if (r.exchange == long_exchange) long_rate = r.current_rate;
        if (r.exchange == short_exchange) short_rate = r.current_rate;
    }

    if (!long_rate || !short_rate) {
        return std::nullopt;
    }
    return *short_rate - *long_rate;
}

std::vector<ArbitrageOpportunity> FundingRateAggregator::find_arbitrage_opportunities(
    const std::vector<std::string>& symbols, double min_spread) {

    std::vector<ArbitrageOpportunity> found;
    size_t batch_size = static_cast<size_t>(std::max(1, config_.batch_size));

    for (size_t i = 0; i < symbols.size(); i += batch_size) {
        size_t end = std::min(i + batch_size, symbols.size());

        std::vector<std::future<std::vector<ArbitrageOpportunity>>> batch;
        for (size_t j = i; j < end; j++) {
            const std::string& symbol = symbols[j];
            batch.push_back(std::async(std::launch::async, [this, symbol, min_spread]() {
                return opportunities_for(symbol, min_spread);
            }));
        }

        // A symbol that fails is dropped, the rest of the batch still counts
        for (size_t k = 0; k < batch.size(); k++) {
            try {
                auto opportunities = batch[k].get();
                found.insert(found.end(), opportunities.begin(), opportunities.end());
            } catch (const InvariantViolation&) {
                throw;
            } catch (const std::exception& e) {
                spdlog::warn("Scan of {} failed: {}", symbols[i + k], e.what());
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.symbols_failed++;
            }
        }

        spdlog::debug("Scanned {}/{} symbols, {} opportunities so far", end, symbols.size(), found.size());

        // Rate-limit pause, not after the last batch
        if (end < symbols.size() && config_.batch_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.batch_delay_ms));
        }
    }

    // Both constructions can land on the same pair; keep the first
    std::set<std::tuple<std::string, Exchange, Exchange>> seen;
    std::vector<ArbitrageOpportunity> unique;
    uint64_t collapsed = 0;
    for (auto& opp : found) {
        if (seen.insert({opp.symbol, opp.long_exchange, opp.short_exchange}).second) {
            unique.push_back(std::move(opp));
        } else {
            collapsed++;
        }
    }

    std::stable_sort(unique.begin(), unique.end(), [](const auto& a, const auto& b) {
        return a.expected_return > b.expected_return;
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.symbols_scanned += symbols.size();
        stats_.opportunities_found += unique.size();
        stats_.duplicates_collapsed += collapsed;
    }

    spdlog::info("Found {} opportunities across {} symbols (min spread {:.4f}%)",
                 unique.size(), symbols.size(), min_spread * 100);
    return unique;
}

FundingRateAggregator::Stats FundingRateAggregator::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::vector<ArbitrageOpportunity> FundingRateAggregator::opportunities_for(const std::string& symbol,
                                                                           double min_spread) {
    std::vector<ArbitrageOpportunity> result;

    auto comparison = compare_funding_rates(symbol);
    if (!comparison || comparison->rates.size() < 2) {
        return result;
    }
    const auto& rates = comparison->rates;

    // Directional: long where longs are paid most, short where shorts are paid most
    const ExchangeFundingRate* best_long = nullptr;
    const ExchangeFundingRate* best_short = nullptr;
    for (const auto& r : rates) {
        if (r.current_rate < 0 && (!best_long || r.current_rate < best_long->current_rate)) {
            best_long = &r;
        }
        if (r.current_rate > 0 && (!best_short || r.current_rate > best_short->current_rate)) {
            best_short = &r;
        }
    }

    if (best_long && best_short && best_long->exchange != best_short->exchange) {
        double spread = std::abs(best_long->current_rate - best_short->current_rate);
        if (spread + SPREAD_EPSILON >= min_spread) {
            result.push_back(make_opportunity(symbol, *best_long, *best_short, spread));
        }
    }

    // Extreme: lowest vs highest, whatever their signs
    const auto& highest = comparison->highest;
    const auto& lowest = comparison->lowest;
    if (highest.exchange != lowest.exchange) {
        double spread = highest.current_rate - lowest.current_rate;
        if (spread + SPREAD_EPSILON >= min_spread) {
            result.push_back(make_opportunity(symbol, lowest, highest, spread));
        }
    }

    return result;
}

bool FundingRateAggregator::is_allowed(const std::string& normalized) const {
    const auto& allowed = config_.allowed_assets.empty() ? default_allowed_assets() : config_.allowed_assets;
    return std::find(allowed.begin(), allowed.end(), normalized) != allowed.end();
}

} // namespace fundarb
