#include <gtest/gtest.h>

#include <random>
#include <vector>

#include "core/config.hpp"
#include "strategy/decision.hpp"
#include "strategy/risk.hpp"

using core::Direction;
using strategy::Factor;
using strategy::FactorJudgment;

namespace {

FactorJudgment judge(Factor f, Direction d, double strength) {
    FactorJudgment j;
    j.factor = f;
    j.direction = d;
    j.strength = strength;
    j.reasons.push_back("test");
    return j;
}

core::Weights equal_weights() {
    core::Weights w;
    w.trend = w.rsi = w.volume = w.structure = 1.0;
    return w;
}

} // namespace

// ---------------------------------------------------------------------------
// decide / consensus
// ---------------------------------------------------------------------------

TEST(DecisionTest, WeightedVotePicksBiggestBucket) {
    const std::vector<FactorJudgment> js{
        judge(Factor::Trend, Direction::Buy, 2.5),
        judge(Factor::Rsi, Direction::Sell, 3.0),
        judge(Factor::Volume, Direction::Neutral, 2.0),
        judge(Factor::Structure, Direction::Hold, 0.0),
    };
    const auto d = strategy::decide(js, core::Weights{});
    EXPECT_EQ(d.action, Direction::Buy);
    EXPECT_NEAR(d.scores.buy, 1.0, 1e-12);
    EXPECT_NEAR(d.scores.sell, 0.9, 1e-12);
    EXPECT_DOUBLE_EQ(d.scores.hold, 0.0);
    EXPECT_NEAR(d.strength, 1.0, 1e-12);
    EXPECT_NEAR(d.consensus, 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(d.confidence, 1.0 / 3.0, 1e-12);
}

TEST(DecisionTest, BelowActivationThresholdHolds) {
    const std::vector<FactorJudgment> js{
        judge(Factor::Trend, Direction::Buy, 2.0),   // 0.8 weighted
        judge(Factor::Rsi, Direction::Hold, 0.0),
        judge(Factor::Structure, Direction::Hold, 0.0),
    };
    const auto d = strategy::decide(js, core::Weights{});
    EXPECT_EQ(d.action, Direction::Hold);
    EXPECT_NEAR(d.strength, 0.8, 1e-12);

    const auto lower = strategy::decide(js, core::Weights{}, 0.5);
    EXPECT_EQ(lower.action, Direction::Buy);
}

TEST(DecisionTest, TiesResolveBuySellHold) {
    const auto w = equal_weights();
    auto d = strategy::decide({judge(Factor::Trend, Direction::Buy, 2.0),
                               judge(Factor::Rsi, Direction::Sell, 2.0)}, w);
    EXPECT_EQ(d.action, Direction::Buy);

    d = strategy::decide({judge(Factor::Rsi, Direction::Sell, 2.0),
                          judge(Factor::Structure, Direction::Hold, 2.0)}, w);
    EXPECT_EQ(d.action, Direction::Sell);
}

TEST(DecisionTest, AllZeroScoresHold) {
    const auto d = strategy::decide({judge(Factor::Trend, Direction::Hold, 0.0),
                                     judge(Factor::Rsi, Direction::Hold, 0.0)}, core::Weights{});
    EXPECT_EQ(d.action, Direction::Hold);
    EXPECT_DOUBLE_EQ(d.strength, 0.0);
    EXPECT_DOUBLE_EQ(d.confidence, 0.0);
}

TEST(DecisionTest, NeutralNeverScores) {
    const auto d = strategy::decide({judge(Factor::Volume, Direction::Neutral, 3.0)}, equal_weights());
    EXPECT_DOUBLE_EQ(d.scores.buy, 0.0);
    EXPECT_DOUBLE_EQ(d.scores.sell, 0.0);
    EXPECT_DOUBLE_EQ(d.scores.hold, 0.0);
    EXPECT_DOUBLE_EQ(d.consensus, 0.0);
}

TEST(DecisionTest, ConfidenceIsClampedToTen) {
    core::Weights w;
    w.trend = 10.0;
    const auto d = strategy::decide({judge(Factor::Trend, Direction::Buy, 5.0),
                                     judge(Factor::Rsi, Direction::Buy, 1.0),
                                     judge(Factor::Structure, Direction::Buy, 2.0)}, w);
    EXPECT_EQ(d.action, Direction::Buy);
    EXPECT_DOUBLE_EQ(d.consensus, 1.0);
    EXPECT_DOUBLE_EQ(d.confidence, 10.0);
}

TEST(DecisionTest, ConsensusIgnoresVolume) {
    EXPECT_DOUBLE_EQ(strategy::consensus({}), 0.0);
    EXPECT_DOUBLE_EQ(strategy::consensus({judge(Factor::Volume, Direction::Neutral, 1.0)}), 0.0);
    EXPECT_NEAR(strategy::consensus({judge(Factor::Trend, Direction::Buy, 1.0),
                                     judge(Factor::Rsi, Direction::Buy, 1.0),
                                     judge(Factor::Volume, Direction::Neutral, 1.0),
                                     judge(Factor::Structure, Direction::Sell, 1.0)}),
                2.0 / 3.0, 1e-12);
}

TEST(DecisionTest, WeightLookup) {
    const core::Weights w;
    EXPECT_DOUBLE_EQ(strategy::weight_of(w, Factor::Trend), 0.4);
    EXPECT_DOUBLE_EQ(strategy::weight_of(w, Factor::Rsi), 0.3);
    EXPECT_DOUBLE_EQ(strategy::weight_of(w, Factor::Volume), 0.2);
    EXPECT_DOUBLE_EQ(strategy::weight_of(w, Factor::Structure), 0.1);
}

// ---------------------------------------------------------------------------
// Risk levels
// ---------------------------------------------------------------------------

namespace {

ind::Levels levels(double support, double resistance) {
    ind::Levels lv;
    lv.support = support;
    lv.resistance = resistance;
    return lv;
}

} // namespace

TEST(RiskLevelsTest, BuyUsesAtrStop) {
    const auto r = strategy::compute_risk_levels(Direction::Buy, 100.0, 1.0, levels(90.0, 110.0),
                                                 core::AnalysisConfig{});
    EXPECT_DOUBLE_EQ(r.stop_loss, 98.0);
    EXPECT_DOUBLE_EQ(r.take_profit, 104.0);
    EXPECT_DOUBLE_EQ(r.risk_amount, 2.0);
    EXPECT_DOUBLE_EQ(r.reward_amount, 4.0);
    EXPECT_DOUBLE_EQ(r.risk_reward_ratio, 2.0);
    EXPECT_DOUBLE_EQ(r.atr_value, 1.0);
}

TEST(RiskLevelsTest, BuyStopTightensBelowSupport) {
    const auto r = strategy::compute_risk_levels(Direction::Buy, 100.0, 1.0, levels(99.5, 110.0),
                                                 core::AnalysisConfig{});
    EXPECT_NEAR(r.stop_loss, 99.5 * 0.99, 1e-12);
    EXPECT_LT(r.stop_loss, 100.0);
}

TEST(RiskLevelsTest, SellMirrorsBuy) {
    const auto r = strategy::compute_risk_levels(Direction::Sell, 100.0, 1.0, levels(90.0, 110.0),
                                                 core::AnalysisConfig{});
    EXPECT_DOUBLE_EQ(r.stop_loss, 102.0);
    EXPECT_DOUBLE_EQ(r.take_profit, 96.0);

    const auto tight = strategy::compute_risk_levels(Direction::Sell, 100.0, 1.0, levels(90.0, 100.5),
                                                     core::AnalysisConfig{});
    EXPECT_NEAR(tight.stop_loss, 100.5 * 1.01, 1e-12);
}

TEST(RiskLevelsTest, HoldIsSymmetric) {
    const auto r = strategy::compute_risk_levels(Direction::Hold, 100.0, 1.0, levels(90.0, 110.0),
                                                 core::AnalysisConfig{});
    EXPECT_DOUBLE_EQ(r.stop_loss, 98.0);
    EXPECT_DOUBLE_EQ(r.take_profit, 102.0);
    EXPECT_DOUBLE_EQ(r.risk_reward_ratio, 1.0);
}

TEST(RiskLevelsTest, ZeroAtrHasZeroRatio) {
    const auto r = strategy::compute_risk_levels(Direction::Hold, 100.0, 0.0, levels(90.0, 110.0),
                                                 core::AnalysisConfig{});
    EXPECT_DOUBLE_EQ(r.risk_amount, 0.0);
    EXPECT_DOUBLE_EQ(r.risk_reward_ratio, 0.0);
}

TEST(RiskLevelsTest, OrderingHoldsAcrossRandomMarkets) {
    std::mt19937 rng(3);
    std::uniform_real_distribution<double> price(50.0, 500.0);
    std::uniform_real_distribution<double> frac(0.001, 0.05);
    const core::AnalysisConfig cfg;

    for (int i = 0; i < 200; ++i) {
        const double p = price(rng);
        const double atr = p * frac(rng);
        const auto lv = levels(p * (1.0 - frac(rng)), p * (1.0 + frac(rng)));

        const auto buy = strategy::compute_risk_levels(Direction::Buy, p, atr, lv, cfg);
        EXPECT_LT(buy.stop_loss, p);
        EXPECT_GT(buy.take_profit, p);

        const auto sell = strategy::compute_risk_levels(Direction::Sell, p, atr, lv, cfg);
        EXPECT_GT(sell.stop_loss, p);
        EXPECT_LT(sell.take_profit, p);
    }
}
