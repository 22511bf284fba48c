#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace fundarb {

using FeeSchedule = std::map<Exchange, double>;

struct StrategyConfig {
    // Fee rates as decimals (0.0002 = 0.02%)
    FeeSchedule maker_fee_rates{
        {Exchange::ASTER, 0.0001},
        {Exchange::LIGHTER, 0.0},
        {Exchange::HYPERLIQUID, 0.00015},
        {Exchange::EXTENDED, 0.0}
    };
    FeeSchedule taker_fee_rates{
        {Exchange::ASTER, 0.00035},
        {Exchange::LIGHTER, 0.0},
        {Exchange::HYPERLIQUID, 0.00045},
        {Exchange::EXTENDED, 0.00025}
    };
    double default_fee_rate{0.0005};          // Used for venues missing from the schedules

    // Sizing
    double min_position_size_usd{10.0};
    double max_position_size_usd{50000.0};
    double max_open_interest_share{0.05};     // Stay under 5% of OI per leg
    double leverage{2.0};
    double balance_usage_percent{0.9};        // Share of reported balances that may be deployed

    // Break-even bounds
    double max_break_even_hours{168.0};       // 7 days
    double max_worst_case_break_even_days{7.0};
    double target_hold_hours{24.0};           // Horizon used to amortize round-trip costs
    double min_prediction_confidence{0.6};

    // Slippage model
    double base_slippage{0.0001};             // 1bp
    double sqrt_impact_factor{0.005};         // 0.5% at 100% liquidity usage
    double default_liquidity_usd{500000.0};   // Liquidity proxy when OI is unknown

    double maker_fee_rate(Exchange exchange) const;
    double taker_fee_rate(Exchange exchange) const;
};

struct StickinessConfig {
    double close_threshold{-0.0005};          // Close below -0.05% spread
    double min_hold_hours{4.0};
    double churn_cost_multiplier{2.0};        // Need 2x churn cost in improvement to switch
};

struct DiscoveryConfig {
    double min_spread{0.0001};                // 1bp hourly
    int batch_size{5};
    int batch_delay_ms{1000};
    int request_timeout_ms{5000};
    std::vector<std::string> allowed_assets;  // Empty = built-in high-liquidity list
    std::vector<std::string> fallback_assets{"ETH", "BTC"};
};

struct LadderConfig {
    int cooldown_minutes{30};                 // Failed pairs are skipped this long
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};            // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{false};
    bool json_format{true};                   // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    StrategyConfig strategy;
    StickinessConfig stickiness;
    DiscoveryConfig discovery;
    LadderConfig ladder;
    LoggingConfig logging;

    std::string snapshot_path{"./data/sample_snapshot.json"};

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// High-liquidity assets eligible for discovery when no allow-list is configured
const std::vector<std::string>& default_allowed_assets();

// JSON serialization
void to_json(nlohmann::json& j, const StrategyConfig& c);
void from_json(const nlohmann::json& j, StrategyConfig& c);
void to_json(nlohmann::json& j, const StickinessConfig& c);
void from_json(const nlohmann::json& j, StickinessConfig& c);
void to_json(nlohmann::json& j, const DiscoveryConfig& c);
void from_json(const nlohmann::json& j, DiscoveryConfig& c);
void to_json(nlohmann::json& j, const LadderConfig& c);
void from_json(const nlohmann::json& j, LadderConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace fundarb
