#include <gtest/gtest.h>
#include <cmath>
#include "arbitrage/predicted_break_even.hpp"
#include "test_fakes.hpp"

using namespace fundarb;
using namespace fundarb::testing;

class PredictedBreakEvenTest : public ::testing::Test {
protected:
    void SetUp() override {
        predictor_ = std::make_shared<FakePredictor>();
        costs_ = std::make_unique<CostCalculator>(config_);
        with_model_ = std::make_unique<PredictedBreakEvenCalculator>(*costs_, ForecastAdapter(predictor_));
        without_model_ = std::make_unique<PredictedBreakEvenCalculator>(*costs_, ForecastAdapter());

        // Long ASTER at -0.03%, short HYPERLIQUID at +0.01%
        eth_ = opportunity("ETH", Exchange::ASTER, Exchange::HYPERLIQUID, -0.0003, 0.0001);
    }

    void predict(const RatePrediction& long_leg, const RatePrediction& short_leg) {
        predictor_->set("ETH", Exchange::ASTER, long_leg);
        predictor_->set("ETH", Exchange::HYPERLIQUID, short_leg);
    }

    StrategyConfig config_;
    std::shared_ptr<FakePredictor> predictor_;
    std::unique_ptr<CostCalculator> costs_;
    std::unique_ptr<PredictedBreakEvenCalculator> with_model_;
    std::unique_ptr<PredictedBreakEvenCalculator> without_model_;
    ArbitrageOpportunity eth_;
};

TEST_F(PredictedBreakEvenTest, Calculate_FallsBackToCurrentRatesWithoutModel) {
    auto be = without_model_->calculate(eth_, 10000.0, 10.0);

    EXPECT_DOUBLE_EQ(be.confidence, 0.5);
    EXPECT_NEAR(be.predicted_spread, -0.0004, 1e-12);
    EXPECT_NEAR(be.predicted_break_even_hours, 2.5, 1e-9);
    EXPECT_NEAR(be.confidence_adjusted_break_even_hours, 5.0, 1e-9);
    EXPECT_NEAR(be.worst_case_break_even_hours, 10.0 / 2.8, 1e-9);
    EXPECT_NEAR(be.best_case_break_even_hours, 10.0 / 5.2, 1e-9);
    EXPECT_DOUBLE_EQ(be.reliable_horizon_hours, 12.0);
    EXPECT_FALSE(be.is_prediction_reliable);
    EXPECT_FALSE(be.long_prediction.has_value());
    EXPECT_FALSE(without_model_->is_prediction_available());
}

TEST_F(PredictedBreakEvenTest, Calculate_UsesForecastAndBounds) {
    predict(prediction(-0.00028, -0.00035, -0.0002, 0.8), prediction(0.0001, 0.00008, 0.00012, 0.9));

    auto be = with_model_->calculate(eth_, 10000.0, 10.0);

    EXPECT_DOUBLE_EQ(be.confidence, 0.8);
    EXPECT_NEAR(be.predicted_spread, -0.00038, 1e-12);
    EXPECT_NEAR(be.predicted_break_even_hours, 10.0 / 3.8, 1e-9);
    EXPECT_NEAR(be.confidence_adjusted_break_even_hours, 10.0 / 3.8 / 0.8, 1e-9);
    EXPECT_NEAR(be.worst_case_break_even_hours, 10.0 / 4.7, 1e-9);
    EXPECT_NEAR(be.best_case_break_even_hours, 10.0 / 2.8, 1e-9);
    EXPECT_DOUBLE_EQ(be.reliable_horizon_hours, 19.0);
    EXPECT_TRUE(be.is_prediction_reliable);
    EXPECT_TRUE(with_model_->is_prediction_available());
}

TEST_F(PredictedBreakEvenTest, Calculate_OneMissingLegFallsBack) {
    predictor_->set("ETH", Exchange::ASTER, prediction(-0.00028, -0.00035, -0.0002, 0.8));

    auto be = with_model_->calculate(eth_, 10000.0, 10.0);

    EXPECT_DOUBLE_EQ(be.confidence, 0.5);
    EXPECT_NEAR(be.predicted_spread, -0.0004, 1e-12);
}

TEST_F(PredictedBreakEvenTest, Calculate_FailingModelFallsBack) {
    predict(prediction(-0.00028, -0.00035, -0.0002, 0.8), prediction(0.0001, 0.00008, 0.00012, 0.9));
    predictor_->set_throws(true);

    auto be = with_model_->calculate(eth_, 10000.0, 10.0);

    EXPECT_DOUBLE_EQ(be.confidence, 0.5);
    EXPECT_NEAR(be.predicted_spread, -0.0004, 1e-12);
}

TEST_F(PredictedBreakEvenTest, Calculate_NeverBelowHourlyReturnFloor) {
    // $10 at 0.04% is $0.004 per hour
    auto be = without_model_->calculate(eth_, 10.0, 1.0);

    EXPECT_TRUE(std::isinf(be.predicted_break_even_hours));
    EXPECT_TRUE(std::isinf(be.confidence_adjusted_break_even_hours));
}

TEST_F(PredictedBreakEvenTest, Calculate_ZeroCostsBreakEvenImmediately) {
    auto be = without_model_->calculate(eth_, 10000.0, 0.0);
    EXPECT_DOUBLE_EQ(be.predicted_break_even_hours, 0.0);
}

TEST_F(PredictedBreakEvenTest, ComponentScores) {
    EXPECT_DOUBLE_EQ(PredictedBreakEvenCalculator::spread_score(0.00025), 0.5);
    EXPECT_DOUBLE_EQ(PredictedBreakEvenCalculator::spread_score(-0.001), 1.0);

    EXPECT_DOUBLE_EQ(PredictedBreakEvenCalculator::break_even_score(84.0), 0.5);
    EXPECT_DOUBLE_EQ(PredictedBreakEvenCalculator::break_even_score(0.0), 1.0);
    EXPECT_DOUBLE_EQ(PredictedBreakEvenCalculator::break_even_score(500.0), 0.0);
    EXPECT_DOUBLE_EQ(PredictedBreakEvenCalculator::break_even_score(NEVER), 0.0);

    EXPECT_DOUBLE_EQ(PredictedBreakEvenCalculator::liquidity_score(eth_), 0.1);
    auto deep = opportunity("ETH", Exchange::ASTER, Exchange::HYPERLIQUID, -0.0003, 0.0001, 1e8);
    EXPECT_NEAR(PredictedBreakEvenCalculator::liquidity_score(deep), 1.0, 1e-12);
    auto shallow = opportunity("ETH", Exchange::ASTER, Exchange::HYPERLIQUID, -0.0003, 0.0001, 1e6);
    EXPECT_NEAR(PredictedBreakEvenCalculator::liquidity_score(shallow), 1.0 / 3.0, 1e-12);
}

TEST_F(PredictedBreakEvenTest, Score_WeightsComponents) {
    auto result = without_model_->score(eth_, 10000.0, 10.0);

    double expected = 0.8 * 0.3 + 0.5 * 0.25 + (1.0 - 5.0 / 168.0) * 0.3 + 0.1 * 0.15;
    EXPECT_NEAR(result.score, expected, 1e-9);
    EXPECT_DOUBLE_EQ(result.components.confidence_score, 0.5);
}

TEST_F(PredictedBreakEvenTest, Recommend_UnreliableButActionableIsBuy) {
    auto result = without_model_->score(eth_, 10000.0, 10.0);
    EXPECT_EQ(result.recommendation, Recommendation::BUY);
}

TEST_F(PredictedBreakEvenTest, Recommend_NeverWithActionableSpreadIsBuy) {
    auto result = without_model_->score(eth_, 10.0, 1.0);
    EXPECT_EQ(result.recommendation, Recommendation::BUY);
}

TEST_F(PredictedBreakEvenTest, Recommend_NeverWithTinySpreadIsHold) {
    auto thin = opportunity("ETH", Exchange::ASTER, Exchange::HYPERLIQUID, 0.0, 0.00005);
    auto result = without_model_->score(thin, 10.0, 1.0);
    EXPECT_EQ(result.recommendation, Recommendation::HOLD);
}

TEST_F(PredictedBreakEvenTest, Recommend_FastBreakEvenIsStrongBuy) {
    predict(prediction(-0.00028, -0.00035, -0.0002, 0.8), prediction(0.0001, 0.00008, 0.00012, 0.9));

    auto result = with_model_->score(eth_, 10000.0, 10.0);
    EXPECT_EQ(result.recommendation, Recommendation::STRONG_BUY);
}

TEST_F(PredictedBreakEvenTest, Recommend_ReversalAfterBreakEvenIsSkip) {
    // Forecast flips the spread: long - short goes to +0.03%
    predict(prediction(0.0002, 0.0001, 0.0003, 0.8), prediction(-0.0001, -0.0002, 0.0, 0.8));

    // BE 33.3h / 0.8 = 41.7h, reversal horizon 19h
    auto skip = with_model_->score(eth_, 10000.0, 100.0);
    EXPECT_EQ(skip.recommendation, Recommendation::SKIP);

    // BE 3.3h / 0.8 = 4.2h, paid back before the flip
    auto buy = with_model_->score(eth_, 10000.0, 10.0);
    EXPECT_EQ(buy.recommendation, Recommendation::BUY);
}

TEST_F(PredictedBreakEvenTest, Recommend_WorstCaseTooLongIsHold) {
    // Bounds allow the spread to vanish entirely
    predict(prediction(-0.0003, 0.0, -0.0002, 0.8), prediction(0.0001, 0.00005, 0.0, 0.8));

    auto result = with_model_->score(eth_, 10000.0, 10.0);
    EXPECT_EQ(result.recommendation, Recommendation::HOLD);
}

TEST_F(PredictedBreakEvenTest, Recommend_HighScoreWithinTwoDaysIsStrongBuy) {
    auto deep = opportunity("ETH", Exchange::ASTER, Exchange::HYPERLIQUID, -0.0004, 0.0001, 1e8);
    predict(prediction(-0.0004, -0.00045, -0.00035, 0.9), prediction(0.0001, 0.00008, 0.00012, 0.9));

    // Raw BE 18h, adjusted 20h
    auto result = with_model_->score(deep, 10000.0, 90.0);
    EXPECT_GE(result.score, 0.7);
    EXPECT_EQ(result.recommendation, Recommendation::STRONG_BUY);
}

TEST_F(PredictedBreakEvenTest, Recommend_WithinHorizonIsBuy) {
    predict(prediction(-0.0003, -0.00035, -0.00025, 0.65), prediction(0.0001, 0.00008, 0.00012, 0.65));

    // Raw BE 9.1h, adjusted 14h, horizon 16h
    auto result = with_model_->score(eth_, 10000.0, 36.4);
    EXPECT_EQ(result.recommendation, Recommendation::BUY);
}

TEST_F(PredictedBreakEvenTest, Recommend_BeyondMaxHoldIsHold) {
    predict(prediction(-0.0003, -0.0004, -0.00025, 0.8), prediction(0.0001, 0.00008, 0.00012, 0.8));

    // Raw BE 200h, adjusted 250h
    auto result = with_model_->score(eth_, 10000.0, 800.0);
    EXPECT_EQ(result.recommendation, Recommendation::HOLD);
}
