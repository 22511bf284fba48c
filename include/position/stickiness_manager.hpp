#pragma once

#include <map>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "core/cycle_context.hpp"
#include "position/position_pair.hpp"

namespace fundarb {

enum class StickinessAction {
    KEEP,
    CLOSE,
    REPLACE     // Close to make room for a clearly better pair
};

inline std::string stickiness_action_to_string(StickinessAction a) {
    switch (a) {
        case StickinessAction::KEEP: return "KEEP";
        case StickinessAction::CLOSE: return "CLOSE";
        case StickinessAction::REPLACE: return "REPLACE";
    }
    return "UNKNOWN";
}

struct StickinessEvaluationResult {
    bool should_keep{true};
    StickinessAction action{StickinessAction::KEEP};
    std::string reason;
};

struct PositionFilterResult {
    std::vector<PositionLeg> to_close;
    std::vector<PositionLeg> to_keep;
    std::map<std::string, std::string> reasons;     // symbol -> why
};

// short.current - long.current for a pair, nullopt when unobtainable
using SpreadLookup = std::function<std::optional<double>(const std::string& symbol,
                                                         Exchange long_exchange, Exchange short_exchange)>;

/**
 * Hysteresis over open pairs: hold through noise, close on a real collapse,
 * replace only when the alternative beats the current spread by more than
 * the round-trip fees it would cost to switch.
 */
class PositionStickinessManager {
public:
    using Config = StickinessConfig;

    PositionStickinessManager(const StrategyConfig& strategy, const Config& config,
                              SpreadLookup spread_lookup, PositionOpenTimeStore& open_times);

    void record_position_open(const std::string& symbol, Exchange long_exchange, Exchange short_exchange,
                              WallClock at = wall_now());
    bool remove_position_open(const std::string& symbol, Exchange long_exchange, Exchange short_exchange);

    std::optional<double> position_age_hours(const std::string& symbol, Exchange long_exchange,
                                             Exchange short_exchange, WallClock at = wall_now()) const;

    // Fees to close this pair and open another, as a rate
    double churn_cost(Exchange long_exchange, Exchange short_exchange) const;

    std::optional<double> current_spread(const std::string& symbol, Exchange long_exchange,
                                         Exchange short_exchange) const;

    StickinessEvaluationResult should_keep_position(const std::string& symbol, Exchange long_exchange,
                                                    Exchange short_exchange,
                                                    std::optional<double> best_alternative_spread,
                                                    WallClock at = wall_now()) const;

    // Decision from already known inputs, no lookups
    StickinessEvaluationResult evaluate(const std::string& symbol, Exchange long_exchange,
                                        Exchange short_exchange, std::optional<double> current_spread,
                                        std::optional<double> age_hours,
                                        std::optional<double> best_alternative_spread) const;

    // Single-leg candidates close unconditionally, paired ones go through the hysteresis
    PositionFilterResult filter_positions_to_close(const std::vector<PositionLeg>& candidates,
                                                   const std::map<std::string, OpenPositionPair>& positions_by_symbol,
                                                   std::optional<double> best_alternative_spread,
                                                   WallClock at = wall_now()) const;

    const Config& config() const { return config_; }

private:
    StrategyConfig strategy_;
    Config config_;
    SpreadLookup spread_lookup_;
    PositionOpenTimeStore& open_times_;
};

} // namespace fundarb
