#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "arbitrage/opportunity.hpp"
#include "arbitrage/cost_calculator.hpp"
#include "arbitrage/predicted_break_even.hpp"
#include "arbitrage/funding_rate_aggregator.hpp"
#include "arbitrage/opportunity_evaluator.hpp"
#include "core/cycle_context.hpp"
#include "position/position_pair.hpp"
#include "position/stickiness_manager.hpp"
#include "position/ladder_allocator.hpp"
#include "providers/market_providers.hpp"

namespace fundarb {

// ============================================================================
// Decision Engine
//
// One call to run_cycle() is one scheduler tick: discover, price, filter,
// decide which open pairs survive, then ladder the remaining capital. The
// resulting plan goes to an execution layer that lives elsewhere; it reports
// back through record_execution / record_close / mark_failed.
// ============================================================================

enum class CycleStatus {
    ALLOCATED,          // Capital assigned to at least one rung
    HELD,               // Opportunities seen, nothing worth new capital
    NO_OPPORTUNITIES,   // Rates read, no spread above the minimum
    NO_DATA             // No venue answered
};

inline std::string cycle_status_to_string(CycleStatus s) {
    switch (s) {
        case CycleStatus::ALLOCATED: return "ALLOCATED";
        case CycleStatus::HELD: return "HELD";
        case CycleStatus::NO_OPPORTUNITIES: return "NO_OPPORTUNITIES";
        case CycleStatus::NO_DATA: return "NO_DATA";
    }
    return "UNKNOWN";
}

struct StickinessDecision {
    OpenPositionPair position;
    StickinessEvaluationResult result;
};

struct CycleReport {
    uint64_t cycle{0};
    CycleStatus status{CycleStatus::NO_DATA};
    std::vector<std::string> symbols;
    std::vector<ArbitrageOpportunity> opportunities;    // Before prediction filtering
    std::vector<EvaluatedOpportunity> evaluated;        // Ladder candidates, ranked
    std::vector<StickinessDecision> stickiness;
    LadderAllocationResult allocation;
    Notional total_capital{0};
    int64_t elapsed_ms{0};

    // Pairs the execution layer should unwind
    std::vector<OpenPositionPair> positions_to_close() const {
        std::vector<OpenPositionPair> closing;
        for (const auto& d : stickiness) {
            if (!d.result.should_keep) closing.push_back(d.position);
        }
        return closing;
    }
};

void to_json(nlohmann::json& j, const ArbitrageOpportunity& o);
void to_json(nlohmann::json& j, const CycleReport& r);

class DecisionEngine {
public:
    DecisionEngine(const Config& config, MarketProviders providers,
                   std::shared_ptr<PositionOpenTimeStore> open_times = nullptr);

    // Full cycle. capital_override replaces the balance-derived capital.
    CycleReport run_cycle(const std::vector<OpenPositionPair>& existing_positions,
                          std::optional<Notional> capital_override = std::nullopt);

    // Building blocks, usable on their own
    std::vector<ArbitrageOpportunity> discover_opportunities(const std::vector<std::string>& symbols,
                                                             double min_spread);

    EvaluatedOpportunity evaluate(const ArbitrageOpportunity& opportunity,
                                  const std::optional<ExecutionPlan>& plan) const;

    std::optional<SelectedOpportunity> rank_and_select(const std::vector<EvaluatedOpportunity>& evaluated) const;

    StickinessEvaluationResult should_keep_position(const OpenPositionPair& position,
                                                    std::optional<double> best_alternative_spread) const;

    LadderAllocationResult allocate(const std::vector<EvaluatedOpportunity>& ranked,
                                    const std::vector<OpenPositionPair>& existing_positions,
                                    Notional total_capital) const;

    // Execution feedback
    void record_execution(const SelectedOpportunity& selected, WallClock at = wall_now());
    void record_close(const OpenPositionPair& position);
    void mark_failed(const ArbitrageOpportunity& opportunity, WallClock at = wall_now());

    // Drops the cached asset list so the next cycle re-discovers
    void refresh_assets();

    const std::vector<std::string>& assets() const { return assets_; }
    const Config& config() const { return config_; }
    CycleContext& context() { return context_; }
    const OpportunityEvaluator& evaluator() const { return evaluator_; }
    FundingRateAggregator& aggregator() { return *aggregator_; }

    struct Stats {
        uint64_t cycles{0};
        uint64_t cycles_allocated{0};
        uint64_t cycles_without_data{0};
        uint64_t positions_closed{0};
        uint64_t executions_recorded{0};
        uint64_t failures_marked{0};
    };

    Stats stats() const;

private:
    Config config_;
    std::shared_ptr<BalanceProvider> balance_provider_;

    CycleContext context_;
    std::shared_ptr<FundingRateAggregator> aggregator_;
    CostCalculator costs_;
    PredictedBreakEvenCalculator break_even_;
    OpportunityEvaluator evaluator_;
    PositionStickinessManager stickiness_;
    LadderAllocator ladder_;

    std::vector<std::string> assets_;
    Stats stats_;
    mutable std::mutex stats_mutex_;

    Notional position_size_for(const ArbitrageOpportunity& opportunity) const;
    std::vector<ArbitrageOpportunity> enrich(const std::vector<ArbitrageOpportunity>& opportunities) const;
    std::vector<StickinessDecision> review_positions(const std::vector<OpenPositionPair>& existing_positions,
                                                     const std::vector<ArbitrageOpportunity>& opportunities);
    Notional capital_from(const std::map<Exchange, Notional>& balances) const;
};

} // namespace fundarb
