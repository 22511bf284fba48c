#include "position/ladder_allocator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace fundarb {

void to_json(nlohmann::json& j, const SelectedOpportunity& s) {
    j = nlohmann::json{
        {"symbol", s.opportunity.symbol},
        {"long_exchange", exchange_to_string(s.opportunity.long_exchange)},
        {"short_exchange", exchange_to_string(s.opportunity.short_exchange)},
        {"expected_return", s.opportunity.expected_return},
        {"is_existing", s.is_existing},
        {"current_collateral", s.current_collateral},
        {"collateral", s.collateral},
        {"fill", fill_status_to_string(s.fill)}
    };
    if (s.max_portfolio_usd) {
        j["max_portfolio_usd"] = *s.max_portfolio_usd;
    } else {
        j["max_portfolio_usd"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const LadderAllocationResult& r) {
    j = nlohmann::json{
        {"selected", r.selected},
        {"remaining_capital", r.remaining_capital},
        {"cumulative_capital_used", r.cumulative_capital_used}
    };
}

LadderAllocator::LadderAllocator(const StrategyConfig& config)
    : config_(config)
{
}

std::vector<EvaluatedOpportunity> LadderAllocator::filter_for_ladder(
    const std::vector<EvaluatedOpportunity>& evaluated,
    const std::map<Exchange, Notional>& balances,
    const CooldownStore& cooldowns,
    double max_break_even_hours, double leverage, WallClock at) const {

    double min_collateral = config_.min_position_size_usd / leverage;
    auto balance_on = [&balances](Exchange e) {
        auto it = balances.find(e);
        return it == balances.end() ? 0.0 : it->second;
    };

    std::vector<EvaluatedOpportunity> ladder;
    for (const auto& item : evaluated) {
        const auto& opp = item.opportunity;

        auto key = CooldownStore::cooldown_key(opp.symbol, opp.long_exchange, opp.short_exchange);
        if (auto minutes = cooldowns.remaining_minutes(key, at)) {
            spdlog::debug("Skipping cooled-down {}, retry in {}m", key, *minutes);
            continue;
        }

        bool acceptable_break_even = !item.plan && item.break_even_hours &&
                                     std::isfinite(*item.break_even_hours) &&
                                     *item.break_even_hours <= max_break_even_hours;
        if (!item.plan && !acceptable_break_even) {
            continue;
        }

        if (balance_on(opp.long_exchange) < min_collateral || balance_on(opp.short_exchange) < min_collateral) {
            spdlog::debug("Skipping {}: under ${:.2f} collateral on a leg", opp.pair_label(), min_collateral);
            continue;
        }

        ladder.push_back(item);
    }

    std::stable_sort(ladder.begin(), ladder.end(), [](const auto& a, const auto& b) {
        double diff = b.opportunity.expected_return - a.opportunity.expected_return;
        if (std::abs(diff) > RETURN_TIE) return diff < 0;
        return a.max_portfolio_usd.value_or(NEVER) > b.max_portfolio_usd.value_or(NEVER);
    });
    return ladder;
}

LadderAllocationResult LadderAllocator::allocate(const std::vector<EvaluatedOpportunity>& ranked,
                                                 const std::map<std::string, OpenPositionPair>& existing_by_symbol,
                                                 Notional total_capital, double leverage) const {
    LadderAllocationResult result;
    result.remaining_capital = total_capital;

    spdlog::info("Ladder allocation: ${:.2f} capital, {} existing pair(s), {} candidate(s)",
                 total_capital, existing_by_symbol.size(), ranked.size());

    for (const auto& item : ranked) {
        const auto& opp = item.opportunity;

        Notional max_portfolio = item.max_portfolio_usd.value_or(result.remaining_capital * leverage);
        Notional max_collateral = max_portfolio / leverage;

        auto existing = existing_by_symbol.find(opp.symbol);
        bool on_symbol = existing != existing_by_symbol.end();
        bool held = on_symbol && existing->second.current_collateral > 0;

        if (held && existing->second.same_pair(opp.long_exchange, opp.short_exchange)) {
            const auto& pair = existing->second;
            Notional needed = max_collateral - pair.current_collateral;

            if (needed <= DUST_USD) {
                // Already at max, next rung
                result.cumulative_capital_used += max_collateral;
                continue;
            }

            Notional top_up = std::min(needed, result.remaining_capital);
            if (top_up < DUST_USD) {
                break;
            }

            bool full = top_up >= needed - DUST_USD;

            SelectedOpportunity selected;
            selected.opportunity = opp;
            selected.plan = item.plan;
            selected.max_portfolio_usd = (pair.current_collateral + top_up) * leverage;
            selected.is_existing = true;
            selected.current_value = pair.current_value;
            selected.current_collateral = pair.current_collateral;
            selected.collateral = top_up;
            selected.fill = full ? FillStatus::FULL : FillStatus::PARTIAL;
            selected.reason = fmt::format("top up {} by ${:.2f}", pair.key(), top_up);

            result.remaining_capital -= top_up;
            result.cumulative_capital_used += full ? max_collateral : top_up;

            spdlog::info("  {}: adding ${:.2f} ({}) | remaining ${:.2f}", opp.symbol, top_up,
                         fill_status_to_string(selected.fill), result.remaining_capital);
            result.selected.push_back(std::move(selected));

            if (!full) break;
            continue;
        }

        // One pair per symbol, whatever its collateral
        if (on_symbol && !existing->second.same_pair(opp.long_exchange, opp.short_exchange)) {
            spdlog::warn("Skipping {}: already held as {}", opp.pair_label(), existing->second.key());
            result.cumulative_capital_used += max_collateral;
            continue;
        }

        if (result.remaining_capital <= DUST_USD) {
            break;
        }

        Notional collateral = std::min(result.remaining_capital, max_collateral);
        bool full = collateral >= max_collateral - DUST_USD;

        SelectedOpportunity selected;
        selected.opportunity = opp;
        selected.plan = item.plan;
        selected.max_portfolio_usd = collateral * leverage;
        selected.collateral = collateral;
        selected.fill = full ? FillStatus::FULL : FillStatus::PARTIAL;
        selected.reason = fmt::format("new {} ${:.2f}/{:.2f} collateral", opp.pair_label(), collateral, max_collateral);

        result.remaining_capital -= collateral;
        result.cumulative_capital_used += collateral;

        spdlog::info("  {}: NEW ${:.2f} (${:.2f}/{:.2f} collateral, {}) | remaining ${:.2f}", opp.symbol,
                     collateral * leverage, collateral, max_collateral, fill_status_to_string(selected.fill),
                     result.remaining_capital);
        result.selected.push_back(std::move(selected));

        if (!full) break;
    }

    return result;
}

std::map<std::string, OpenPositionPair> LadderAllocator::group_positions_by_symbol(
    const std::vector<OpenPositionPair>& pairs) {
    std::map<std::string, OpenPositionPair> by_symbol;

    for (const auto& pair : pairs) {
        auto it = by_symbol.find(pair.symbol);
        if (it == by_symbol.end()) {
            by_symbol.emplace(pair.symbol, pair);
            continue;
        }

        if (!it->second.same_pair(pair.long_exchange, pair.short_exchange)) {
            throw InvariantViolation(fmt::format("{} is held as both {} and {}", pair.symbol,
                                                 it->second.key(), pair.key()));
        }
        spdlog::warn("Duplicate report for {}, keeping the first", pair.key());
    }
    return by_symbol;
}

} // namespace fundarb
