#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "arbitrage/opportunity_evaluator.hpp"
#include "core/cycle_context.hpp"
#include "position/position_pair.hpp"

namespace fundarb {

struct LadderAllocationResult {
    std::vector<SelectedOpportunity> selected;
    Notional remaining_capital{0};
    Notional cumulative_capital_used{0};

    Notional allocated_collateral() const {
        Notional total = 0;
        for (const auto& s : selected) total += s.collateral;
        return total;
    }
};

void to_json(nlohmann::json& j, const SelectedOpportunity& s);
void to_json(nlohmann::json& j, const LadderAllocationResult& r);

/**
 * Waterfall allocation of collateral across ranked opportunities.
 *
 * Rung 1 is filled to its max before rung 2 sees a dollar. Existing pairs are
 * topped up in place; a symbol already held on another exchange pair is
 * skipped so no third leg is ever opened. Output depends only on the inputs.
 */
class LadderAllocator {
public:
    explicit LadderAllocator(const StrategyConfig& config);

    // Drops cooled-down pairs, unplannable entries and pairs without collateral
    // on both venues, then ranks by expected return (ties within 0.001 broken
    // by max portfolio, missing = unlimited)
    std::vector<EvaluatedOpportunity> filter_for_ladder(const std::vector<EvaluatedOpportunity>& evaluated,
                                                        const std::map<Exchange, Notional>& balances,
                                                        const CooldownStore& cooldowns,
                                                        double max_break_even_hours, double leverage,
                                                        WallClock at = wall_now()) const;

    LadderAllocationResult allocate(const std::vector<EvaluatedOpportunity>& ranked,
                                    const std::map<std::string, OpenPositionPair>& existing_by_symbol,
                                    Notional total_capital, double leverage) const;

    // Throws InvariantViolation when a symbol is held on two different pairs
    static std::map<std::string, OpenPositionPair> group_positions_by_symbol(const std::vector<OpenPositionPair>& pairs);

private:
    StrategyConfig config_;

    static constexpr double DUST_USD = 0.01;
    static constexpr double RETURN_TIE = 0.001;
};

} // namespace fundarb
