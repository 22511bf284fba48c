#include "position/stickiness_manager.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <set>

namespace fundarb {

namespace {

StickinessEvaluationResult keep_pair(std::string reason) {
    return {true, StickinessAction::KEEP, std::move(reason)};
}

StickinessEvaluationResult close_pair(std::string reason) {
    return {false, StickinessAction::CLOSE, std::move(reason)};
}

} // anonymous namespace

PositionStickinessManager::PositionStickinessManager(const StrategyConfig& strategy, const Config& config,
                                                     SpreadLookup spread_lookup,
                                                     PositionOpenTimeStore& open_times)
    : strategy_(strategy)
    , config_(config)
    , spread_lookup_(std::move(spread_lookup))
    , open_times_(open_times)
{
    spdlog::info("PositionStickinessManager: close<{:.4f}%, min hold {:.1f}h, churn x{:.1f}",
                 config_.close_threshold * 100, config_.min_hold_hours, config_.churn_cost_multiplier);
}

void PositionStickinessManager::record_position_open(const std::string& symbol, Exchange long_exchange,
                                                     Exchange short_exchange, WallClock at) {
    open_times_.record_open(position_key(symbol, long_exchange, short_exchange), at);
}

bool PositionStickinessManager::remove_position_open(const std::string& symbol, Exchange long_exchange,
                                                     Exchange short_exchange) {
    return open_times_.remove_open(position_key(symbol, long_exchange, short_exchange));
}

std::optional<double> PositionStickinessManager::position_age_hours(const std::string& symbol,
                                                                    Exchange long_exchange,
                                                                    Exchange short_exchange,
                                                                    WallClock at) const {
    return open_times_.age_hours(position_key(symbol, long_exchange, short_exchange), at);
}

double PositionStickinessManager::churn_cost(Exchange long_exchange, Exchange short_exchange) const {
    return (strategy_.maker_fee_rate(long_exchange) + strategy_.maker_fee_rate(short_exchange)) * 2;
}

std::optional<double> PositionStickinessManager::current_spread(const std::string& symbol,
                                                                Exchange long_exchange,
                                                                Exchange short_exchange) const {
    if (!spread_lookup_) {
        return std::nullopt;
    }

    try {
        return spread_lookup_(symbol, long_exchange, short_exchange);
    } catch (const std::exception& e) {
        spdlog::debug("Spread lookup failed for {}: {}", symbol, e.what());
        return std::nullopt;
    }
}

StickinessEvaluationResult PositionStickinessManager::should_keep_position(
    const std::string& symbol, Exchange long_exchange, Exchange short_exchange,
    std::optional<double> best_alternative_spread, WallClock at) const {

    auto spread = current_spread(symbol, long_exchange, short_exchange);
    auto age = position_age_hours(symbol, long_exchange, short_exchange, at);

    spdlog::debug("Evaluating {}: spread={} age={}", position_key(symbol, long_exchange, short_exchange),
                  spread ? fmt::format("{:.4f}%", *spread * 100) : "unknown",
                  age ? fmt::format("{:.1f}h", *age) : "unknown");

    return evaluate(symbol, long_exchange, short_exchange, spread, age, best_alternative_spread);
}

StickinessEvaluationResult PositionStickinessManager::evaluate(const std::string& symbol,
                                                               Exchange long_exchange,
                                                               Exchange short_exchange,
                                                               std::optional<double> current_spread,
                                                               std::optional<double> age_hours,
                                                               std::optional<double> best_alternative_spread) const {
    if (!current_spread) {
        return keep_pair(fmt::format("Cannot determine current spread for {}, keeping", symbol));
    }
    double spread = *current_spread;

    if (spread < config_.close_threshold * 2) {
        return close_pair(fmt::format("{} spread {:.4f}% is severely negative, closing", symbol, spread * 100));
    }

    if (age_hours && *age_hours < config_.min_hold_hours) {
        if (spread > 0) {
            return keep_pair(fmt::format("{} is young ({:.1f}h) and profitable, keeping", symbol, *age_hours));
        }
        if (spread > config_.close_threshold) {
            return keep_pair(fmt::format("{} is young ({:.1f}h) and above close threshold, keeping", symbol, *age_hours));
        }
    }

    if (spread > config_.close_threshold) {
        if (best_alternative_spread) {
            double improvement = *best_alternative_spread - spread;
            double required = churn_cost(long_exchange, short_exchange) * config_.churn_cost_multiplier;

            // A tie at the threshold counts as enough
            if (improvement + 1e-12 >= required) {
                return {false, StickinessAction::REPLACE,
                        fmt::format("{} alternative is {:.4f}% better (needs {:.4f}%), replacing",
                                    symbol, improvement * 100, required * 100)};
            }
        }
        return keep_pair(fmt::format("{} spread {:.4f}% above close threshold, keeping", symbol, spread * 100));
    }

    return close_pair(fmt::format("{} spread {:.4f}% at or below close threshold, closing", symbol, spread * 100));
}

PositionFilterResult PositionStickinessManager::filter_positions_to_close(
    const std::vector<PositionLeg>& candidates,
    const std::map<std::string, OpenPositionPair>& positions_by_symbol,
    std::optional<double> best_alternative_spread, WallClock at) const {

    PositionFilterResult result;

    std::set<std::string> symbols;
    for (const auto& leg : candidates) {
        symbols.insert(leg.symbol);
    }

    for (const auto& symbol : symbols) {
        std::vector<PositionLeg> legs;
        for (const auto& leg : candidates) {
            if (leg.symbol == symbol) legs.push_back(leg);
        }

        auto pair = positions_by_symbol.find(symbol);
        if (pair == positions_by_symbol.end()) {
            result.to_close.insert(result.to_close.end(), legs.begin(), legs.end());
            result.reasons[symbol] = "Single-leg position, closing";
            continue;
        }

        auto decision = should_keep_position(symbol, pair->second.long_exchange, pair->second.short_exchange,
                                             best_alternative_spread, at);
        result.reasons[symbol] = decision.reason;

        auto& target = decision.should_keep ? result.to_keep : result.to_close;
        target.insert(target.end(), legs.begin(), legs.end());

        spdlog::info("{} {}: {}", decision.should_keep ? "KEEPING" : "CLOSING", symbol, decision.reason);
    }

    return result;
}

} // namespace fundarb
