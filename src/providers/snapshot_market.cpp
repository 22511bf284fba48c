#include "providers/snapshot_market.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

namespace fundarb {

namespace {

// ============================================================================
// Provider views over the shared snapshot
// ============================================================================

class SnapshotFundingProvider : public FundingDataProvider {
public:
    SnapshotFundingProvider(std::shared_ptr<const SnapshotData> data, Exchange exchange)
        : data_(std::move(data)), exchange_(exchange) {}

    Exchange exchange() const override { return exchange_; }

    std::vector<std::string> available_symbols() override {
        std::vector<std::string> symbols;
        for (const auto& [symbol, quote] : venue().markets) {
            symbols.push_back(symbol);
        }
        return symbols;
    }

    std::optional<Rate> current_funding_rate(const std::string& symbol) override {
        auto q = quote(symbol);
        return q ? q->funding_rate : std::nullopt;
    }

    std::optional<Rate> predicted_funding_rate(const std::string& symbol) override {
        auto q = quote(symbol);
        return q ? q->predicted_rate : std::nullopt;
    }

    std::optional<Price> mark_price(const std::string& symbol) override {
        auto q = quote(symbol);
        return q ? q->mark_price : std::nullopt;
    }

    std::optional<Notional> open_interest(const std::string& symbol) override {
        auto q = quote(symbol);
        return q ? q->open_interest : std::nullopt;
    }

private:
    std::shared_ptr<const SnapshotData> data_;
    Exchange exchange_;

    const SnapshotVenue& venue() const { return data_->venues.at(exchange_); }

    const SnapshotQuote* quote(const std::string& symbol) const {
        const auto& markets = venue().markets;
        auto it = markets.find(symbol);
        return it == markets.end() ? nullptr : &it->second;
    }
};

class SnapshotBalanceProvider : public BalanceProvider {
public:
    explicit SnapshotBalanceProvider(std::shared_ptr<const SnapshotData> data) : data_(std::move(data)) {}

    std::optional<Notional> balance(Exchange exchange) override {
        auto it = data_->venues.find(exchange);
        if (it == data_->venues.end()) return std::nullopt;
        return it->second.balance;
    }

private:
    std::shared_ptr<const SnapshotData> data_;
};

class SnapshotPredictor : public EnsembleRatePredictor {
public:
    explicit SnapshotPredictor(std::shared_ptr<const SnapshotData> data) : data_(std::move(data)) {}

    std::optional<RatePrediction> predict(const std::string& symbol, Exchange exchange) override {
        auto it = data_->predictions.find(symbol);
        if (it == data_->predictions.end()) return std::nullopt;
        auto leg = it->second.find(exchange);
        if (leg == it->second.end()) return std::nullopt;
        return leg->second;
    }

private:
    std::shared_ptr<const SnapshotData> data_;
};

class SnapshotHistory : public HistoricalMetricsProvider {
public:
    explicit SnapshotHistory(std::shared_ptr<const SnapshotData> data) : data_(std::move(data)) {}

    std::optional<HistoricalMetrics> historical_metrics(const std::string& symbol, Exchange exchange) override {
        auto it = data_->history.find(symbol);
        if (it == data_->history.end()) return std::nullopt;
        auto leg = it->second.find(exchange);
        if (leg == it->second.end()) return std::nullopt;
        return leg->second;
    }

private:
    std::shared_ptr<const SnapshotData> data_;
};

// ============================================================================
// Parsing helpers
// ============================================================================

Exchange parse_exchange(const std::string& name) {
    auto exchange = exchange_from_string(name);
    if (!exchange) {
        throw std::runtime_error("Unknown exchange in snapshot: " + name);
    }
    return *exchange;
}

// Missing and null both mean "unavailable"
std::optional<double> optional_number(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<double>();
}

SnapshotQuote parse_quote(const nlohmann::json& j) {
    SnapshotQuote q;
    q.funding_rate = optional_number(j, "funding_rate");
    q.predicted_rate = optional_number(j, "predicted_rate");
    q.mark_price = optional_number(j, "mark_price");
    q.open_interest = optional_number(j, "open_interest");
    return q;
}

RatePrediction parse_prediction(const nlohmann::json& j) {
    RatePrediction p;
    p.predicted_rate = j.at("predicted_rate").get<double>();
    p.lower_bound = j.value("lower_bound", p.predicted_rate);
    p.upper_bound = j.value("upper_bound", p.predicted_rate);
    p.confidence = j.value("confidence", 0.5);

    std::string regime = j.value("regime", "mean_reverting");
    auto parsed = regime_from_string(regime);
    if (!parsed) {
        throw std::runtime_error("Unknown market regime in snapshot: " + regime);
    }
    p.regime = *parsed;
    return p;
}

HistoricalMetrics parse_metrics(const nlohmann::json& j) {
    HistoricalMetrics m;
    m.min_rate = j.value("min_rate", m.min_rate);
    m.max_rate = j.value("max_rate", m.max_rate);
    m.average_rate = j.value("average_rate", m.average_rate);
    m.std_dev = j.value("std_dev", m.std_dev);
    m.consistency_score = j.value("consistency_score", m.consistency_score);
    m.data_points = j.value("data_points", m.data_points);
    return m;
}

OpenPositionPair parse_position(const nlohmann::json& j) {
    OpenPositionPair p;
    p.symbol = j.at("symbol").get<std::string>();
    p.long_exchange = parse_exchange(j.at("long_exchange").get<std::string>());
    p.short_exchange = parse_exchange(j.at("short_exchange").get<std::string>());
    p.notional_size = j.value("notional_size", p.notional_size);
    p.leverage = j.value("leverage", p.leverage);
    if (j.contains("entry_timestamp")) {
        p.entry_timestamp = time_utils::from_iso8601(j["entry_timestamp"].get<std::string>());
    }
    p.entry_spread = j.value("entry_spread", p.entry_spread);
    p.current_value = j.value("current_value", p.current_value);
    p.current_collateral = j.value("current_collateral", p.current_collateral);
    p.entry_costs = j.value("entry_costs", p.entry_costs);
    p.funding_earned = j.value("funding_earned", p.funding_earned);
    return p;
}

// symbol -> exchange -> T
template <typename T, typename Parse>
std::map<std::string, std::map<Exchange, T>> parse_per_leg(const nlohmann::json& j, Parse parse) {
    std::map<std::string, std::map<Exchange, T>> result;
    for (const auto& [symbol, legs] : j.items()) {
        for (const auto& [name, value] : legs.items()) {
            result[symbol][parse_exchange(name)] = parse(value);
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// SnapshotMarket
// ============================================================================

SnapshotMarket::SnapshotMarket(SnapshotData data)
    : data_(std::make_shared<const SnapshotData>(std::move(data)))
{
}

SnapshotMarket SnapshotMarket::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open snapshot file: " + path);
    }

    try {
        nlohmann::json j;
        file >> j;
        auto market = parse(j);
        spdlog::info("Loaded snapshot {} ({} venues, {} open pairs)", path, market.venue_count(),
                     market.positions().size());
        return market;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("Malformed snapshot {}: {}", path, e.what()));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(fmt::format("Malformed snapshot {}: {}", path, e.what()));
    }
}

SnapshotMarket SnapshotMarket::parse(const nlohmann::json& j) {
    SnapshotData data;
    data.timestamp = j.contains("timestamp")
                         ? time_utils::from_iso8601(j["timestamp"].get<std::string>())
                         : wall_now();

    for (const auto& [name, venue_json] : j.at("venues").items()) {
        SnapshotVenue venue;
        venue.exchange = parse_exchange(name);
        venue.balance = optional_number(venue_json, "balance");
        if (venue_json.contains("markets")) {
            for (const auto& [symbol, quote] : venue_json["markets"].items()) {
                venue.markets[symbol] = parse_quote(quote);
            }
        }
        data.venues[venue.exchange] = std::move(venue);
    }

    if (j.contains("predictions")) {
        data.predictions = parse_per_leg<RatePrediction>(j["predictions"], parse_prediction);
    }
    if (j.contains("history")) {
        data.history = parse_per_leg<HistoricalMetrics>(j["history"], parse_metrics);
    }
    if (j.contains("positions")) {
        for (const auto& position : j["positions"]) {
            data.positions.push_back(parse_position(position));
        }
    }

    return SnapshotMarket(std::move(data));
}

MarketProviders SnapshotMarket::providers() const {
    MarketProviders providers;
    for (const auto& [exchange, venue] : data_->venues) {
        providers.funding.push_back(std::make_shared<SnapshotFundingProvider>(data_, exchange));
    }
    providers.balances = std::make_shared<SnapshotBalanceProvider>(data_);
    if (!data_->predictions.empty()) {
        providers.predictor = std::make_shared<SnapshotPredictor>(data_);
    }
    if (!data_->history.empty()) {
        providers.history = std::make_shared<SnapshotHistory>(data_);
    }
    return providers;
}

} // namespace fundarb
