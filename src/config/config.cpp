#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace fundarb {

double StrategyConfig::maker_fee_rate(Exchange exchange) const {
    auto it = maker_fee_rates.find(exchange);
    return it != maker_fee_rates.end() ? it->second : default_fee_rate;
}

double StrategyConfig::taker_fee_rate(Exchange exchange) const {
    auto it = taker_fee_rates.find(exchange);
    return it != taker_fee_rates.end() ? it->second : default_fee_rate;
}

const std::vector<std::string>& default_allowed_assets() {
    static const std::vector<std::string> assets{
        "0G", "2Z", "AAVE", "ADA", "AERO", "AI16Z", "APEX", "APT", "ARB", "ASTER",
        "AVAX", "AVNT", "BCH", "BERA", "BNB", "BTC", "CC", "CRV", "DOGE", "DOT",
        "DYDX", "EIGEN", "ENA", "ETH", "ETHFI", "FARTCOIN", "FIL", "GMX", "GRASS", "HBAR",
        "HYPE", "ICP", "IP", "JUP", "KAITO", "LAUNCHCOIN", "LDO", "LINEA", "LINK", "LTC",
        "MEGA", "MET", "MKR", "MNT", "MON", "MORPHO", "NEAR", "ONDO", "OP", "PAXG",
        "PENDLE", "PENGU", "POL", "POPCAT", "PROVE", "PUMP", "PYTH", "RESOLV", "S", "SEI",
        "SKY", "SOL", "SPX", "STBL", "STRK", "SUI", "SYRUP", "TAO", "TIA", "TON",
        "TRUMP", "TRX", "UNI", "VIRTUAL", "VVV", "WIF", "WLD", "WLFI", "XPL", "XRP",
        "YZY", "ZEC", "ZK", "ZORA", "ZRO"
    };
    return assets;
}

namespace {

nlohmann::json fees_to_json(const FeeSchedule& fees) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [exchange, rate] : fees) {
        j[exchange_to_string(exchange)] = rate;
    }
    return j;
}

FeeSchedule fees_from_json(const nlohmann::json& j) {
    FeeSchedule fees;
    for (const auto& [name, rate] : j.items()) {
        auto exchange = exchange_from_string(name);
        if (!exchange) {
            throw std::runtime_error("Unknown exchange in fee schedule: " + name);
        }
        fees[*exchange] = rate.get<double>();
    }
    return fees;
}

} // namespace

void to_json(nlohmann::json& j, const StrategyConfig& c) {
    j = nlohmann::json{
        {"maker_fee_rates", fees_to_json(c.maker_fee_rates)},
        {"taker_fee_rates", fees_to_json(c.taker_fee_rates)},
        {"default_fee_rate", c.default_fee_rate},
        {"min_position_size_usd", c.min_position_size_usd},
        {"max_position_size_usd", c.max_position_size_usd},
        {"max_open_interest_share", c.max_open_interest_share},
        {"leverage", c.leverage},
        {"balance_usage_percent", c.balance_usage_percent},
        {"max_break_even_hours", c.max_break_even_hours},
        {"max_worst_case_break_even_days", c.max_worst_case_break_even_days},
        {"target_hold_hours", c.target_hold_hours},
        {"min_prediction_confidence", c.min_prediction_confidence},
        {"base_slippage", c.base_slippage},
        {"sqrt_impact_factor", c.sqrt_impact_factor},
        {"default_liquidity_usd", c.default_liquidity_usd}
    };
}

void from_json(const nlohmann::json& j, StrategyConfig& c) {
    if (j.contains("maker_fee_rates")) c.maker_fee_rates = fees_from_json(j.at("maker_fee_rates"));
    if (j.contains("taker_fee_rates")) c.taker_fee_rates = fees_from_json(j.at("taker_fee_rates"));
    if (j.contains("default_fee_rate")) j.at("default_fee_rate").get_to(c.default_fee_rate);
    if (j.contains("min_position_size_usd")) j.at("min_position_size_usd").get_to(c.min_position_size_usd);
    if (j.contains("max_position_size_usd")) j.at("max_position_size_usd").get_to(c.max_position_size_usd);
    if (j.contains("max_open_interest_share")) j.at("max_open_interest_share").get_to(c.max_open_interest_share);
    if (j.contains("leverage")) j.at("leverage").get_to(c.leverage);
    if (j.contains("balance_usage_percent")) j.at("balance_usage_percent").get_to(c.balance_usage_percent);
    if (j.contains("max_break_even_hours")) j.at("max_break_even_hours").get_to(c.max_break_even_hours);
    if (j.contains("max_worst_case_break_even_days")) j.at("max_worst_case_break_even_days").get_to(c.max_worst_case_break_even_days);
    if (j.contains("target_hold_hours")) j.at("target_hold_hours").get_to(c.target_hold_hours);
    if (j.contains("min_prediction_confidence")) j.at("min_prediction_confidence").get_to(c.min_prediction_confidence);
    if (j.contains("base_slippage")) j.at("base_slippage").get_to(c.base_slippage);
    if (j.contains("sqrt_impact_factor")) j.at("sqrt_impact_factor").get_to(c.sqrt_impact_factor);
    if (j.contains("default_liquidity_usd")) j.at("default_liquidity_usd").get_to(c.default_liquidity_usd);
}

void to_json(nlohmann::json& j, const StickinessConfig& c) {
    j = nlohmann::json{
        {"close_threshold", c.close_threshold},
        {"min_hold_hours", c.min_hold_hours},
        {"churn_cost_multiplier", c.churn_cost_multiplier}
    };
}

void from_json(const nlohmann::json& j, StickinessConfig& c) {
    if (j.contains("close_threshold")) j.at("close_threshold").get_to(c.close_threshold);
    if (j.contains("min_hold_hours")) j.at("min_hold_hours").get_to(c.min_hold_hours);
    if (j.contains("churn_cost_multiplier")) j.at("churn_cost_multiplier").get_to(c.churn_cost_multiplier);
}

void to_json(nlohmann::json& j, const DiscoveryConfig& c) {
    j = nlohmann::json{
        {"min_spread", c.min_spread},
        {"batch_size", c.batch_size},
        {"batch_delay_ms", c.batch_delay_ms},
        {"request_timeout_ms", c.request_timeout_ms},
        {"allowed_assets", c.allowed_assets},
        {"fallback_assets", c.fallback_assets}
    };
}

void from_json(const nlohmann::json& j, DiscoveryConfig& c) {
    if (j.contains("min_spread")) j.at("min_spread").get_to(c.min_spread);
    if (j.contains("batch_size")) j.at("batch_size").get_to(c.batch_size);
    if (j.contains("batch_delay_ms")) j.at("batch_delay_ms").get_to(c.batch_delay_ms);
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(c.request_timeout_ms);
    if (j.contains("allowed_assets")) j.at("allowed_assets").get_to(c.allowed_assets);
    if (j.contains("fallback_assets")) j.at("fallback_assets").get_to(c.fallback_assets);
}

void to_json(nlohmann::json& j, const LadderConfig& c) {
    j = nlohmann::json{
        {"cooldown_minutes", c.cooldown_minutes}
    };
}

void from_json(const nlohmann::json& j, LadderConfig& c) {
    if (j.contains("cooldown_minutes")) j.at("cooldown_minutes").get_to(c.cooldown_minutes);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"strategy", c.strategy},
        {"stickiness", c.stickiness},
        {"discovery", c.discovery},
        {"ladder", c.ladder},
        {"logging", c.logging},
        {"snapshot_path", c.snapshot_path}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("strategy")) j.at("strategy").get_to(c.strategy);
    if (j.contains("stickiness")) j.at("stickiness").get_to(c.stickiness);
    if (j.contains("discovery")) j.at("discovery").get_to(c.discovery);
    if (j.contains("ladder")) j.at("ladder").get_to(c.ladder);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("snapshot_path")) j.at("snapshot_path").get_to(c.snapshot_path);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    for (const auto* schedule : {&strategy.maker_fee_rates, &strategy.taker_fee_rates}) {
        for (const auto& [exchange, rate] : *schedule) {
            if (rate < 0 || rate >= 0.01) {
                spdlog::error("Fee rate for {} must be in [0, 1%), got {}",
                              exchange_to_string(exchange), rate);
                return false;
            }
        }
    }

    if (strategy.leverage < 1.0) {
        spdlog::error("leverage must be >= 1");
        return false;
    }

    if (strategy.min_position_size_usd <= 0 ||
        strategy.min_position_size_usd > strategy.max_position_size_usd) {
        spdlog::error("min_position_size_usd must be positive and <= max_position_size_usd");
        return false;
    }

    if (strategy.balance_usage_percent <= 0 || strategy.balance_usage_percent > 1.0) {
        spdlog::error("balance_usage_percent must be in (0, 1]");
        return false;
    }

    if (strategy.target_hold_hours <= 0 || strategy.max_break_even_hours <= 0) {
        spdlog::error("target_hold_hours and max_break_even_hours must be positive");
        return false;
    }

    if (strategy.max_worst_case_break_even_days <= 0) {
        spdlog::error("max_worst_case_break_even_days must be positive");
        return false;
    }

    if (strategy.min_prediction_confidence < 0 || strategy.min_prediction_confidence > 1.0) {
        spdlog::error("min_prediction_confidence must be in [0, 1]");
        return false;
    }

    if (strategy.max_open_interest_share > 0.25) {
        spdlog::warn("max_open_interest_share is > 25% of OI, expect heavy funding impact");
    }

    if (stickiness.close_threshold >= 0) {
        spdlog::error("close_threshold must be negative");
        return false;
    }

    if (stickiness.min_hold_hours < 0 || stickiness.churn_cost_multiplier < 0) {
        spdlog::error("min_hold_hours and churn_cost_multiplier must be non-negative");
        return false;
    }

    if (discovery.batch_size < 1) {
        spdlog::error("batch_size must be >= 1");
        return false;
    }

    if (discovery.batch_delay_ms < 0 || discovery.request_timeout_ms <= 0) {
        spdlog::error("batch_delay_ms must be >= 0 and request_timeout_ms > 0");
        return false;
    }

    if (discovery.min_spread < 0) {
        spdlog::error("min_spread must be non-negative");
        return false;
    }

    if (ladder.cooldown_minutes < 0) {
        spdlog::error("cooldown_minutes must be non-negative");
        return false;
    }

    return true;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace fundarb
