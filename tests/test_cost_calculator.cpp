#include <gtest/gtest.h>
#include <cmath>
#include "arbitrage/cost_calculator.hpp"

using namespace fundarb;

class CostCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.maker_fee_rates = {{Exchange::ASTER, 0.0001}, {Exchange::HYPERLIQUID, 0.00015}};
        config_.taker_fee_rates = {{Exchange::ASTER, 0.00035}, {Exchange::HYPERLIQUID, 0.00045}};
        config_.default_fee_rate = 0.0005;
        calc_ = std::make_unique<CostCalculator>(config_);
    }

    StrategyConfig config_;
    std::unique_ptr<CostCalculator> calc_;
};

TEST_F(CostCalculatorTest, Fees_UsesMakerAndTakerSchedules) {
    EXPECT_DOUBLE_EQ(calc_->fees(10000.0, Exchange::ASTER, true), 1.0);
    EXPECT_DOUBLE_EQ(calc_->fees(10000.0, Exchange::ASTER, false), 3.5);
    EXPECT_DOUBLE_EQ(calc_->fees(10000.0, Exchange::HYPERLIQUID, false), 4.5);
}

TEST_F(CostCalculatorTest, Fees_UnknownExchangeFallsBackToDefault) {
    EXPECT_DOUBLE_EQ(calc_->fees(10000.0, Exchange::LIGHTER, true), 5.0);
    EXPECT_DOUBLE_EQ(calc_->fees(10000.0, Exchange::EXTENDED, false), 5.0);
}

TEST_F(CostCalculatorTest, SlippageCost_MarketPaysHalfSpreadPlusImpact) {
    // bid 99.9 / ask 100.1: spread 0.2 on mid 100 -> 0.2%
    double cost = calc_->slippage_cost(1000.0, 99.9, 100.1, 100000.0, OrderType::MARKET);

    double spread_percent = 0.002;
    double impact = std::sqrt(1000.0 / 100000.0) * spread_percent * 2;
    EXPECT_NEAR(cost, 1000.0 * (spread_percent / 2 + impact), 1e-9);
}

TEST_F(CostCalculatorTest, SlippageCost_LimitUsesMakerFloor) {
    double cost = calc_->slippage_cost(1000.0, 99.9, 100.1, 100000.0, OrderType::LIMIT);

    double impact = std::sqrt(0.01) * 0.002 * 2;
    EXPECT_NEAR(cost, 1000.0 * (0.0001 + impact), 1e-9);
}

TEST_F(CostCalculatorTest, SlippageCost_FlatEstimateWithoutOpenInterest) {
    EXPECT_NEAR(calc_->slippage_cost(1000.0, 99.9, 100.1, 0.0, OrderType::MARKET), 0.5, 1e-9);
    EXPECT_NEAR(calc_->slippage_cost(1000.0, 99.9, 100.1, 0.0, OrderType::LIMIT), 0.1, 1e-9);
}

TEST_F(CostCalculatorTest, SlippageCost_ZeroMidUsesDefaultSpread) {
    double cost = calc_->slippage_cost(1000.0, 0.0, 0.0, 0.0, OrderType::LIMIT);
    EXPECT_NEAR(cost, 0.1, 1e-9);

    double market = calc_->slippage_cost(100.0, 0.0, 0.0, 100.0, OrderType::MARKET);
    // Full OI usage: 0.0005 half spread + min(1 * 0.001 * 2, 0.02)
    EXPECT_NEAR(market, 100.0 * (0.0005 + 0.002), 1e-9);
}

TEST_F(CostCalculatorTest, SlippageCost_NonIncreasingInOpenInterest) {
    double previous = calc_->slippage_cost(5000.0, 99.0, 101.0, 1000.0, OrderType::MARKET);
    for (double oi : {5000.0, 20000.0, 1e5, 1e6, 1e7, 1e9}) {
        double cost = calc_->slippage_cost(5000.0, 99.0, 101.0, oi, OrderType::MARKET);
        EXPECT_LE(cost, previous + 1e-12) << "open interest " << oi;
        previous = cost;
    }
}

TEST_F(CostCalculatorTest, SlippageCost_ImpactCappedAtTwoPercent) {
    // 10% spread, notional ten times OI
    double cost = calc_->slippage_cost(1000.0, 95.0, 105.0, 100.0, OrderType::LIMIT);
    EXPECT_NEAR(cost, 1000.0 * (0.0001 + 0.02), 1e-9);
}

TEST_F(CostCalculatorTest, FundingRateImpact_ProportionalToOpenInterestShare) {
    EXPECT_NEAR(calc_->funding_rate_impact(10000.0, 1000000.0, 0.0001), 0.00001, 1e-15);
}

TEST_F(CostCalculatorTest, FundingRateImpact_Capped) {
    EXPECT_DOUBLE_EQ(calc_->funding_rate_impact(1e6, 1e6, 0.0001), 0.0005);
}

TEST_F(CostCalculatorTest, FundingRateImpact_ZeroWithoutOpenInterestOrRate) {
    EXPECT_EQ(calc_->funding_rate_impact(1000.0, 0.0, 0.0001), 0.0);
    EXPECT_EQ(calc_->funding_rate_impact(1000.0, -5.0, 0.0001), 0.0);
    EXPECT_EQ(calc_->funding_rate_impact(1000.0, 1e6, std::nan("")), 0.0);
    EXPECT_EQ(calc_->funding_rate_impact(1000.0, 1e6, NEVER), 0.0);
}

TEST_F(CostCalculatorTest, BreakEvenHours_FollowsCostOverReturn) {
    EXPECT_FALSE(CostCalculator::break_even_hours(10.0, 0.0).has_value());
    EXPECT_FALSE(CostCalculator::break_even_hours(10.0, -1.0).has_value());
    EXPECT_EQ(CostCalculator::break_even_hours(0.0, 2.0).value_or(-1.0), 0.0);
    EXPECT_EQ(CostCalculator::break_even_hours(-3.0, 2.0).value_or(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(*CostCalculator::break_even_hours(10.0, 2.0), 5.0);
}

TEST_F(CostCalculatorTest, EntryCosts_MakerFeesAndSqrtImpact) {
    auto entry = calc_->entry_costs(10000.0, Exchange::ASTER, Exchange::HYPERLIQUID, 1e6, 4e6);

    EXPECT_NEAR(entry.fees, 10000.0 * (0.0001 + 0.00015), 1e-9);
    double long_slip = 10000.0 * (0.0001 + 0.005 * std::sqrt(0.01));
    double short_slip = 10000.0 * (0.0001 + 0.005 * std::sqrt(0.0025));
    EXPECT_NEAR(entry.slippage, long_slip + short_slip, 1e-9);
    EXPECT_EQ(entry.basis_risk_cost, 0.0);
    EXPECT_NEAR(entry.total, entry.fees + entry.slippage, 1e-9);
}

TEST_F(CostCalculatorTest, ExitCosts_TakerFeesAndBasisRisk) {
    auto exit = calc_->exit_costs(10000.0, Exchange::ASTER, Exchange::HYPERLIQUID, 1e6, 1e6, -5.0);

    EXPECT_NEAR(exit.fees, 10000.0 * (0.00035 + 0.00045), 1e-9);
    EXPECT_NEAR(exit.basis_risk_cost, 5.0, 1e-9);
    EXPECT_NEAR(exit.total, exit.fees + exit.slippage + exit.basis_risk_cost, 1e-9);
}

TEST_F(CostCalculatorTest, EntryCosts_NoLiquidityChargesMaximumSlippage) {
    auto entry = calc_->entry_costs(1000.0, Exchange::ASTER, Exchange::HYPERLIQUID, 0.0, 0.0);
    EXPECT_NEAR(entry.slippage, 2 * 1000.0 * 0.02, 1e-9);
}

TEST_F(CostCalculatorTest, RoundTripCostPercent_SumsBothSides) {
    auto entry = calc_->entry_costs(5000.0, Exchange::ASTER, Exchange::HYPERLIQUID, 1e6, 1e6);
    auto exit = calc_->exit_costs(5000.0, Exchange::ASTER, Exchange::HYPERLIQUID, 1e6, 1e6);

    double percent = calc_->round_trip_cost_percent(5000.0, Exchange::ASTER, Exchange::HYPERLIQUID, 1e6, 1e6);
    EXPECT_NEAR(percent, (entry.total + exit.total) / 5000.0 * 100, 1e-9);
    EXPECT_EQ(calc_->round_trip_cost_percent(0.0, Exchange::ASTER, Exchange::HYPERLIQUID, 1e6, 1e6), 0.0);
}
