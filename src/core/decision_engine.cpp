#include "core/decision_engine.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>

namespace fundarb {

namespace {

SpreadLookup spread_lookup_from(std::shared_ptr<FundingRateAggregator> aggregator) {
    return [aggregator](const std::string& symbol, Exchange long_exchange, Exchange short_exchange) {
        return aggregator->current_spread(symbol, long_exchange, short_exchange);
    };
}

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// JSON has no infinity
nlohmann::json hours_json(const std::optional<double>& hours) {
    if (!hours || !std::isfinite(*hours)) return nullptr;
    return *hours;
}

} // anonymous namespace

// ============================================================================
// Report serialization
// ============================================================================

void to_json(nlohmann::json& j, const ArbitrageOpportunity& o) {
    j = nlohmann::json{
        {"symbol", o.symbol},
        {"long_exchange", exchange_to_string(o.long_exchange)},
        {"short_exchange", exchange_to_string(o.short_exchange)},
        {"long_rate", o.long_rate},
        {"short_rate", o.short_rate},
        {"spread", o.spread},
        {"expected_return", o.expected_return},
        {"long_open_interest", optional_json(o.long_open_interest)},
        {"short_open_interest", optional_json(o.short_open_interest)},
        {"timestamp", time_utils::to_iso8601(o.timestamp)}
    };

    if (o.prediction_confidence) {
        j["prediction"] = {
            {"predicted_spread", optional_json(o.predicted_spread)},
            {"confidence", *o.prediction_confidence},
            {"break_even_hours", hours_json(o.predicted_break_even_hours)},
            {"reliable_horizon_hours", optional_json(o.reliable_horizon_hours)},
            {"score", optional_json(o.prediction_score)},
            {"recommendation", o.prediction_recommendation
                                   ? recommendation_to_string(*o.prediction_recommendation) : "none"}
        };
    }
}

void to_json(nlohmann::json& j, const CycleReport& r) {
    nlohmann::json evaluated = nlohmann::json::array();
    for (const auto& e : r.evaluated) {
        evaluated.push_back({
            {"pair", e.opportunity.pair_label()},
            {"expected_return", e.opportunity.expected_return},
            {"has_plan", e.plan.has_value()},
            {"net_return", e.net_return},
            {"position_value_usd", e.position_value_usd},
            {"break_even_hours", hours_json(e.break_even_hours)},
            {"max_portfolio_usd", optional_json(e.max_portfolio_usd)},
            {"consistency_score", e.history.consistency_score},
            {"worst_case_break_even_hours", hours_json(e.history.worst_case_break_even_hours)}
        });
    }

    nlohmann::json stickiness = nlohmann::json::array();
    for (const auto& d : r.stickiness) {
        stickiness.push_back({
            {"position", d.position.key()},
            {"action", stickiness_action_to_string(d.result.action)},
            {"reason", d.result.reason}
        });
    }

    j = nlohmann::json{
        {"cycle", r.cycle},
        {"status", cycle_status_to_string(r.status)},
        {"symbols", r.symbols},
        {"opportunities", r.opportunities},
        {"evaluated", evaluated},
        {"stickiness", stickiness},
        {"allocation", r.allocation},
        {"total_capital", r.total_capital},
        {"elapsed_ms", r.elapsed_ms}
    };
}

// ============================================================================
// DecisionEngine
// ============================================================================

DecisionEngine::DecisionEngine(const Config& config, MarketProviders providers,
                               std::shared_ptr<PositionOpenTimeStore> open_times)
    : config_(config)
    , balance_provider_(providers.balances)
    , context_(std::move(open_times), std::chrono::minutes(config.ladder.cooldown_minutes))
    , aggregator_(std::make_shared<FundingRateAggregator>(providers.funding, config.discovery))
    , costs_(config.strategy)
    , break_even_(costs_, ForecastAdapter(providers.predictor))
    , evaluator_(costs_, break_even_, HistoryAdapter(providers.history), ForecastAdapter(providers.predictor))
    , stickiness_(config.strategy, config.stickiness, spread_lookup_from(aggregator_), context_.open_times())
    , ladder_(config.strategy)
{
    spdlog::info("DecisionEngine initialized: {} venue(s), predictor {}, history {}, leverage {:.1f}x",
                 providers.funding.size(), providers.predictor ? "on" : "off",
                 providers.history ? "on" : "off", config_.strategy.leverage);
}

CycleReport DecisionEngine::run_cycle(const std::vector<OpenPositionPair>& existing_positions,
                                      std::optional<Notional> capital_override) {
    time_utils::LatencyTimer timer;
    timer.start();

    context_.begin_cycle();

    CycleReport report;
    report.cycle = context_.cycle_count();

    auto finish = [&](CycleStatus status) {
        timer.stop();
        report.status = status;
        report.elapsed_ms = timer.elapsed_ms();

        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.cycles++;
        if (status == CycleStatus::ALLOCATED) stats_.cycles_allocated++;
        if (status == CycleStatus::NO_DATA) stats_.cycles_without_data++;

        spdlog::info("Cycle {} {}: {} opportunities, {} ladder candidates, {} selected, ${:.2f} of ${:.2f} in {}",
                     report.cycle, cycle_status_to_string(status), report.opportunities.size(),
                     report.evaluated.size(), report.allocation.selected.size(),
                     report.allocation.allocated_collateral(), report.total_capital,
                     time_utils::format_duration_ms(report.elapsed_ms));
        return report;
    };

    // Two pairs on one symbol is a bug upstream, refuse to plan on top of it
    auto by_symbol = LadderAllocator::group_positions_by_symbol(existing_positions);

    if (assets_.empty()) {
        assets_ = aggregator_->discover_common_assets();
    }
    report.symbols = assets_;
    if (assets_.empty()) {
        spdlog::warn("Cycle {}: no common assets across venues", report.cycle);
        return finish(CycleStatus::NO_DATA);
    }

    uint64_t fetched_before = aggregator_->stats().rates_fetched;
    report.opportunities = discover_opportunities(assets_, config_.discovery.min_spread);
    bool any_rates = aggregator_->stats().rates_fetched > fetched_before;

    // Open pairs are reviewed even when nothing new is on offer
    report.stickiness = review_positions(existing_positions, report.opportunities);

    if (!any_rates) {
        spdlog::warn("Cycle {}: no venue returned funding rates", report.cycle);
        return finish(CycleStatus::NO_DATA);
    }
    if (report.opportunities.empty()) {
        return finish(CycleStatus::NO_OPPORTUNITIES);
    }

    const auto& strategy = config_.strategy;
    auto candidates = evaluator_.filter_by_prediction_quality(enrich(report.opportunities),
                                                              strategy.min_prediction_confidence,
                                                              strategy.max_break_even_hours);

    std::vector<EvaluatedOpportunity> evaluated;
    evaluated.reserve(candidates.size());
    for (const auto& opportunity : candidates) {
        auto plan = evaluator_.build_plan(opportunity, position_size_for(opportunity), strategy.leverage);
        evaluated.push_back(evaluator_.evaluate(opportunity, plan));
    }

    auto timeout = std::chrono::milliseconds(config_.discovery.request_timeout_ms);
    const auto& balances = context_.balances(balance_provider_, timeout);
    report.total_capital = capital_override ? *capital_override : capital_from(balances);

    report.evaluated = ladder_.filter_for_ladder(evaluated, balances, context_.cooldowns(),
                                                 strategy.max_break_even_hours, strategy.leverage);

    for (const auto& decision : report.stickiness) {
        if (!decision.result.should_keep) {
            by_symbol.erase(decision.position.symbol);
        }
    }
    report.allocation = ladder_.allocate(report.evaluated, by_symbol, report.total_capital, strategy.leverage);

    return finish(report.allocation.selected.empty() ? CycleStatus::HELD : CycleStatus::ALLOCATED);
}

std::vector<ArbitrageOpportunity> DecisionEngine::discover_opportunities(const std::vector<std::string>& symbols,
                                                                         double min_spread) {
    return aggregator_->find_arbitrage_opportunities(symbols, min_spread);
}

EvaluatedOpportunity DecisionEngine::evaluate(const ArbitrageOpportunity& opportunity,
                                              const std::optional<ExecutionPlan>& plan) const {
    return evaluator_.evaluate(opportunity, plan);
}

std::optional<SelectedOpportunity> DecisionEngine::rank_and_select(
    const std::vector<EvaluatedOpportunity>& evaluated) const {
    return evaluator_.rank_and_select(evaluated);
}

StickinessEvaluationResult DecisionEngine::should_keep_position(const OpenPositionPair& position,
                                                                std::optional<double> best_alternative_spread) const {
    return stickiness_.should_keep_position(position.symbol, position.long_exchange, position.short_exchange,
                                            best_alternative_spread);
}

LadderAllocationResult DecisionEngine::allocate(const std::vector<EvaluatedOpportunity>& ranked,
                                                const std::vector<OpenPositionPair>& existing_positions,
                                                Notional total_capital) const {
    return ladder_.allocate(ranked, LadderAllocator::group_positions_by_symbol(existing_positions),
                            total_capital, config_.strategy.leverage);
}

void DecisionEngine::record_execution(const SelectedOpportunity& selected, WallClock at) {
    const auto& opp = selected.opportunity;

    // A top-up keeps the pair's original age
    if (!selected.is_existing) {
        stickiness_.record_position_open(opp.symbol, opp.long_exchange, opp.short_exchange, at);
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.executions_recorded++;
}

void DecisionEngine::record_close(const OpenPositionPair& position) {
    if (!stickiness_.remove_position_open(position.symbol, position.long_exchange, position.short_exchange)) {
        spdlog::debug("Closed {} had no tracked open time", position.key());
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.positions_closed++;
}

void DecisionEngine::mark_failed(const ArbitrageOpportunity& opportunity, WallClock at) {
    context_.cooldowns().mark(
        CooldownStore::cooldown_key(opportunity.symbol, opportunity.long_exchange, opportunity.short_exchange), at);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.failures_marked++;
}

void DecisionEngine::refresh_assets() {
    assets_.clear();
}

DecisionEngine::Stats DecisionEngine::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

Notional DecisionEngine::position_size_for(const ArbitrageOpportunity& opportunity) const {
    return evaluator_.max_portfolio_usd(opportunity);
}

std::vector<ArbitrageOpportunity> DecisionEngine::enrich(const std::vector<ArbitrageOpportunity>& opportunities) const {
    std::vector<ArbitrageOpportunity> enriched;
    enriched.reserve(opportunities.size());

    for (const auto& opportunity : opportunities) {
        auto size = position_size_for(opportunity);
        auto priced = evaluator_.price_plan(opportunity, size, config_.strategy.leverage);
        enriched.push_back(evaluator_.enrich_with_predictions(opportunity, size, priced.estimated_costs.total));
    }
    return enriched;
}

std::vector<StickinessDecision> DecisionEngine::review_positions(
    const std::vector<OpenPositionPair>& existing_positions,
    const std::vector<ArbitrageOpportunity>& opportunities) {

    std::vector<StickinessDecision> decisions;

    // Pairs closed outside the engine must not keep their old open time
    std::set<std::string> live_keys;
    for (const auto& position : existing_positions) {
        live_keys.insert(position.key());
    }
    size_t evicted = context_.open_times().retain_open(live_keys);
    if (evicted > 0) {
        spdlog::info("Evicted {} open time(s) for pairs no longer reported", evicted);
    }

    for (const auto& position : existing_positions) {
        // Best spread on any other pair
        std::optional<double> best_alternative;
        for (const auto& opp : opportunities) {
            if (position_key(opp.symbol, opp.long_exchange, opp.short_exchange) == position.key()) continue;
            if (!best_alternative || opp.spread > *best_alternative) {
                best_alternative = opp.spread;
            }
        }

        // Seed the age of pairs opened before this process started
        if (!stickiness_.position_age_hours(position.symbol, position.long_exchange, position.short_exchange) &&
            position.entry_timestamp != WallClock{}) {
            stickiness_.record_position_open(position.symbol, position.long_exchange, position.short_exchange,
                                             position.entry_timestamp);
        }

        auto result = should_keep_position(position, best_alternative);
        spdlog::info("{} {}: {}", stickiness_action_to_string(result.action), position.key(), result.reason);

        if (!result.should_keep) {
            record_close(position);
        }
        decisions.push_back({position, std::move(result)});
    }

    return decisions;
}

Notional DecisionEngine::capital_from(const std::map<Exchange, Notional>& balances) const {
    Notional total = 0;
    for (const auto& [exchange, balance] : balances) {
        total += balance;
    }
    return total * config_.strategy.balance_usage_percent;
}

} // namespace fundarb
