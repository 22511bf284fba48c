#pragma once

#include <map>
#include <set>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include "common/types.hpp"
#include "arbitrage/opportunity.hpp"
#include "providers/funding_data_provider.hpp"
#include "providers/balance_provider.hpp"
#include "providers/rate_predictor.hpp"
#include "providers/historical_metrics.hpp"

namespace fundarb {
namespace testing {

struct FakeQuote {
    std::optional<Rate> current;
    std::optional<Rate> predicted;
    std::optional<Price> mark;
    std::optional<Notional> open_interest;
};

// Venue with canned quotes; can be told to throw or stall
class FakeFundingProvider : public FundingDataProvider {
public:
    explicit FakeFundingProvider(Exchange exchange) : exchange_(exchange) {}

    FakeFundingProvider& quote(const std::string& venue_symbol, FakeQuote q) {
        quotes_[venue_symbol] = q;
        return *this;
    }

    FakeFundingProvider& rate(const std::string& venue_symbol, Rate current,
                              std::optional<Notional> open_interest = std::nullopt) {
        return quote(venue_symbol, {current, std::nullopt, std::nullopt, open_interest});
    }

    void set_throws(bool throws) { throws_ = throws; }
    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    Exchange exchange() const override { return exchange_; }

    std::vector<std::string> available_symbols() override {
        misbehave();
        std::vector<std::string> symbols;
        for (const auto& [symbol, q] : quotes_) symbols.push_back(symbol);
        return symbols;
    }

    std::optional<Rate> current_funding_rate(const std::string& symbol) override {
        misbehave();
        auto it = quotes_.find(symbol);
        return it == quotes_.end() ? std::nullopt : it->second.current;
    }

    std::optional<Rate> predicted_funding_rate(const std::string& symbol) override {
        misbehave();
        auto it = quotes_.find(symbol);
        return it == quotes_.end() ? std::nullopt : it->second.predicted;
    }

    std::optional<Price> mark_price(const std::string& symbol) override {
        misbehave();
        auto it = quotes_.find(symbol);
        return it == quotes_.end() ? std::nullopt : it->second.mark;
    }

    std::optional<Notional> open_interest(const std::string& symbol) override {
        misbehave();
        auto it = quotes_.find(symbol);
        return it == quotes_.end() ? std::nullopt : it->second.open_interest;
    }

private:
    Exchange exchange_;
    std::map<std::string, FakeQuote> quotes_;
    bool throws_{false};
    std::chrono::milliseconds delay_{0};

    void misbehave() const {
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        if (throws_) throw std::runtime_error("venue unreachable");
    }
};

class FakeBalanceProvider : public BalanceProvider {
public:
    FakeBalanceProvider& set(Exchange exchange, Notional balance) {
        balances_[exchange] = balance;
        return *this;
    }

    std::optional<Notional> balance(Exchange exchange) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_++;
        auto it = balances_.find(exchange);
        if (it == balances_.end()) return std::nullopt;
        return it->second;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::map<Exchange, Notional> balances_;
    int calls_{0};
    mutable std::mutex mutex_;
};

class FakePredictor : public EnsembleRatePredictor {
public:
    FakePredictor& set(const std::string& symbol, Exchange exchange, RatePrediction prediction) {
        predictions_[{symbol, exchange}] = prediction;
        return *this;
    }

    void set_throws(bool throws) { throws_ = throws; }

    std::optional<RatePrediction> predict(const std::string& symbol, Exchange exchange) override {
        if (throws_) throw std::runtime_error("model not loaded");
        auto it = predictions_.find({symbol, exchange});
        if (it == predictions_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::pair<std::string, Exchange>, RatePrediction> predictions_;
    bool throws_{false};
};

class FakeHistory : public HistoricalMetricsProvider {
public:
    FakeHistory& set(const std::string& symbol, Exchange exchange, HistoricalMetrics metrics) {
        metrics_[{symbol, exchange}] = metrics;
        return *this;
    }

    std::optional<HistoricalMetrics> historical_metrics(const std::string& symbol, Exchange exchange) override {
        auto it = metrics_.find({symbol, exchange});
        if (it == metrics_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::pair<std::string, Exchange>, HistoricalMetrics> metrics_;
};

inline RatePrediction prediction(Rate predicted, Rate lower, Rate upper, double confidence,
                                 MarketRegime regime = MarketRegime::MEAN_REVERTING) {
    RatePrediction p;
    p.predicted_rate = predicted;
    p.lower_bound = lower;
    p.upper_bound = upper;
    p.confidence = confidence;
    p.regime = regime;
    return p;
}

inline HistoricalMetrics metrics(Rate min_rate, Rate average_rate, double consistency) {
    HistoricalMetrics m;
    m.min_rate = min_rate;
    m.max_rate = average_rate * 2;
    m.average_rate = average_rate;
    m.consistency_score = consistency;
    m.data_points = 720;
    return m;
}

// Opportunity as the aggregator would emit it
inline ArbitrageOpportunity opportunity(const std::string& symbol, Exchange long_exchange,
                                        Exchange short_exchange, Rate long_rate, Rate short_rate,
                                        std::optional<Notional> open_interest = std::nullopt) {
    ArbitrageOpportunity opp;
    opp.symbol = symbol;
    opp.long_exchange = long_exchange;
    opp.short_exchange = short_exchange;
    opp.long_rate = long_rate;
    opp.short_rate = short_rate;
    opp.spread = std::abs(short_rate - long_rate);
    opp.expected_return = opp.spread * PERIODS_PER_YEAR;
    opp.long_open_interest = open_interest;
    opp.short_open_interest = open_interest;
    opp.timestamp = wall_now();
    return opp;
}

} // namespace testing
} // namespace fundarb
