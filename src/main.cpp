#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <filesystem>
#include <cmath>
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "core/decision_engine.hpp"
#include "providers/snapshot_market.hpp"

using namespace fundarb;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/fundarb.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("fundarb", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

std::string format_hours(const std::optional<double>& hours) {
    if (!hours || !std::isfinite(*hours)) return "never";
    return fmt::format("{:.1f}h", *hours);
}

void print_report(const CycleReport& report) {
    std::cout << "\n┌─────────────────────────────────────────────────────────────────────────────┐\n";
    std::cout << fmt::format("│ CYCLE {:<4} {:<65}│\n", report.cycle, cycle_status_to_string(report.status));
    std::cout << "└─────────────────────────────────────────────────────────────────────────────┘\n";

    std::cout << fmt::format("Assets scanned: {}\n\n", report.symbols.size());

    if (!report.opportunities.empty()) {
        std::cout << fmt::format("{:<8} {:<12} {:<12} {:>10} {:>10} {:>10}\n",
                                 "SYMBOL", "LONG", "SHORT", "SPREAD", "APR", "PREDICT");
        for (const auto& opp : report.opportunities) {
            std::string predicted = opp.prediction_recommendation
                                        ? recommendation_to_string(*opp.prediction_recommendation) : "-";
            std::cout << fmt::format("{:<8} {:<12} {:<12} {:>9.4f}% {:>9.1f}% {:>10}\n",
                                     opp.symbol, exchange_to_string(opp.long_exchange),
                                     exchange_to_string(opp.short_exchange), opp.spread * 100,
                                     opp.expected_return * 100, predicted);
        }
        std::cout << "\n";
    }

    for (const auto& decision : report.stickiness) {
        std::cout << fmt::format("{:<8} {}: {}\n", stickiness_action_to_string(decision.result.action),
                                 decision.position.key(), decision.result.reason);
    }

    if (!report.evaluated.empty()) {
        std::cout << "\nLadder candidates:\n";
        for (const auto& e : report.evaluated) {
            std::cout << fmt::format("  {:<30} break-even {:>8}  max ${:.0f}\n", e.opportunity.pair_label(),
                                     format_hours(e.break_even_hours), e.max_portfolio_usd.value_or(0.0));
        }
    }

    const auto& allocation = report.allocation;
    std::cout << fmt::format("\nCapital: ${:.2f}  allocated: ${:.2f}  remaining: ${:.2f}\n",
                             report.total_capital, allocation.allocated_collateral(),
                             allocation.remaining_capital);
    for (const auto& s : allocation.selected) {
        std::cout << fmt::format("  {:<30} {:<8} ${:>10.2f} collateral  {}\n", s.opportunity.pair_label(),
                                 fill_status_to_string(s.fill), s.collateral,
                                 s.is_existing ? "(top-up)" : "(new)");
    }
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    CLI::App app{"fundarb - Funding-rate arbitrage decision engine"};

    std::string config_path = Config::get_env("FUNDARB_CONFIG", "configs/fundarb.json");
    std::string snapshot_path;
    std::optional<double> capital;
    std::optional<double> min_spread;
    std::string log_level;
    bool dump_config = false;
    bool json_output = false;
    int cycles = 1;
    int interval_sec = 60;

    app.add_option("-c,--config", config_path, "Path to configuration file (default $FUNDARB_CONFIG)");
    app.add_option("-s,--snapshot", snapshot_path, "Market snapshot JSON (overrides snapshot_path)");
    app.add_option("--capital", capital, "Total collateral in USD (overrides balances)")
        ->check(CLI::PositiveNumber);
    app.add_option("--min-spread", min_spread, "Minimum hourly spread, e.g. 0.0001");
    app.add_option("--log-level", log_level, "debug, info, warn or error")
        ->check(CLI::IsMember({"debug", "info", "warn", "error"}));
    app.add_flag("--dump-config", dump_config, "Print the effective configuration and exit");
    app.add_flag("--json", json_output, "Print each cycle report as JSON");
    app.add_option("--cycles", cycles, "Cycles to run, 0 = until interrupted")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--interval", interval_sec, "Seconds between cycles")
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        } else if (app.count("--config") > 0) {
            std::cerr << "Config file not found: " << config_path << "\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    if (!snapshot_path.empty()) config.snapshot_path = snapshot_path;
    if (min_spread) config.discovery.min_spread = *min_spread;
    if (!log_level.empty()) config.logging.log_level = log_level;

    if (dump_config) {
        nlohmann::json j = config;
        std::cout << j.dump(2) << std::endl;
        return 0;
    }

    setup_logging(config.logging);

    if (!config.validate()) {
        spdlog::error("Invalid configuration, refusing to start");
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        auto market = SnapshotMarket::load(config.snapshot_path);
        DecisionEngine engine(config, market.providers());

        for (int cycle = 0; (cycles == 0 || cycle < cycles) && !g_shutdown.load(); cycle++) {
            if (cycle > 0) {
                for (int s = 0; s < interval_sec && !g_shutdown.load(); s++) {
                    std::this_thread::sleep_for(std::chrono::seconds(1));
                }
                if (g_shutdown.load()) break;
            }

            auto report = engine.run_cycle(market.positions(), capital);

            if (json_output) {
                nlohmann::json j = report;
                std::cout << j.dump(2) << std::endl;
            } else {
                print_report(report);
            }
        }

        auto stats = engine.stats();
        spdlog::info("Done: {} cycle(s), {} allocated, {} without data", stats.cycles,
                     stats.cycles_allocated, stats.cycles_without_data);
    } catch (const InvariantViolation& e) {
        spdlog::error("Invariant violated: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
