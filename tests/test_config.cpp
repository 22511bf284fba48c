#include <gtest/gtest.h>
#include "config/config.hpp"
#include <filesystem>
#include <fstream>

using namespace fundarb;

class ConfigTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = (std::filesystem::temp_directory_path() /
                 (std::string("fundarb_config_") + info->name() + ".json")).string();
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write(const std::string& contents) {
        std::ofstream file(path_);
        file << contents;
    }
};

TEST_F(ConfigTest, Defaults_AreValid) {
    Config config;
    EXPECT_TRUE(config.validate());
    EXPECT_DOUBLE_EQ(config.strategy.maker_fee_rate(Exchange::HYPERLIQUID), 0.00015);
    EXPECT_DOUBLE_EQ(config.strategy.taker_fee_rate(Exchange::ASTER), 0.00035);
}

TEST_F(ConfigTest, FeeRate_FallsBackForUnlistedVenue) {
    StrategyConfig strategy;
    strategy.taker_fee_rates.erase(Exchange::EXTENDED);
    EXPECT_DOUBLE_EQ(strategy.taker_fee_rate(Exchange::EXTENDED), strategy.default_fee_rate);
}

TEST_F(ConfigTest, SaveAndLoad_PreservesValues) {
    Config config;
    config.strategy.leverage = 3.0;
    config.strategy.maker_fee_rates[Exchange::LIGHTER] = 0.0002;
    config.stickiness.min_hold_hours = 6.0;
    config.discovery.allowed_assets = {"ETH", "SOL"};
    config.ladder.cooldown_minutes = 45;
    config.save(path_);

    auto loaded = Config::load(path_);
    EXPECT_DOUBLE_EQ(loaded.strategy.leverage, 3.0);
    EXPECT_DOUBLE_EQ(loaded.strategy.maker_fee_rate(Exchange::LIGHTER), 0.0002);
    EXPECT_DOUBLE_EQ(loaded.stickiness.min_hold_hours, 6.0);
    EXPECT_EQ(loaded.discovery.allowed_assets, (std::vector<std::string>{"ETH", "SOL"}));
    EXPECT_EQ(loaded.ladder.cooldown_minutes, 45);
}

TEST_F(ConfigTest, Load_MissingKeysKeepDefaults) {
    write(R"({"strategy": {"leverage": 4.0}, "discovery": {"min_spread": 0.0002}})");

    auto loaded = Config::load(path_);
    EXPECT_DOUBLE_EQ(loaded.strategy.leverage, 4.0);
    EXPECT_DOUBLE_EQ(loaded.discovery.min_spread, 0.0002);
    EXPECT_DOUBLE_EQ(loaded.strategy.max_break_even_hours, 168.0);
    EXPECT_DOUBLE_EQ(loaded.stickiness.close_threshold, -0.0005);
    EXPECT_EQ(loaded.discovery.batch_size, 5);
}

TEST_F(ConfigTest, Load_ThrowsOnMissingFile) {
    EXPECT_THROW(Config::load(path_ + ".absent"), std::runtime_error);
}

TEST_F(ConfigTest, Load_ThrowsOnUnknownExchange) {
    write(R"({"strategy": {"maker_fee_rates": {"BINANCE": 0.0001}}})");
    EXPECT_THROW(Config::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, Load_ThrowsOnInvalidValues) {
    write(R"({"stickiness": {"close_threshold": 0.001}})");
    EXPECT_THROW(Config::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, Validate_RejectsBadRanges) {
    Config config;
    config.strategy.leverage = 0.5;
    EXPECT_FALSE(config.validate());

    config = Config();
    config.strategy.min_position_size_usd = 100000.0;
    EXPECT_FALSE(config.validate());

    config = Config();
    config.strategy.balance_usage_percent = 1.5;
    EXPECT_FALSE(config.validate());

    config = Config();
    config.strategy.taker_fee_rates[Exchange::ASTER] = 0.02;
    EXPECT_FALSE(config.validate());

    config = Config();
    config.discovery.batch_size = 0;
    EXPECT_FALSE(config.validate());

    config = Config();
    config.ladder.cooldown_minutes = -1;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, Validate_RejectsBadPredictionThresholds) {
    Config config;
    config.strategy.max_worst_case_break_even_days = -1.0;
    EXPECT_FALSE(config.validate());

    config = Config();
    config.strategy.min_prediction_confidence = 1.2;
    EXPECT_FALSE(config.validate());

    config = Config();
    config.strategy.min_prediction_confidence = -0.1;
    EXPECT_FALSE(config.validate());

    config = Config();
    config.strategy.min_prediction_confidence = 1.0;
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, GetEnv_ReturnsDefaultWhenUnset) {
    EXPECT_EQ(Config::get_env("FUNDARB_TEST_UNSET_VARIABLE", "fallback"), "fallback");
}
