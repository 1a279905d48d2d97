#include <gtest/gtest.h>

#include <string>

#include "core/config.hpp"
#include "indicators/engine.hpp"
#include "strategy/analyzers.hpp"
#include "test_bars.hpp"

using core::Direction;
using strategy::Factor;

namespace {

// Quiet market: no cross, neutral trend, RSI 50, average volume, price mid-range
ind::Snapshot quiet_snapshot() {
    ind::Snapshot s;
    s.current_price = 100.0;
    s.current_atr = 1.0;
    s.levels.support = 90.0;
    s.levels.resistance = 110.0;
    s.levels.pivot = 100.0;
    s.volume.current = 1000.0;
    s.volume.average = 1000.0;
    s.volume.ratio = 1.0;
    s.rsi_state.current = 50.0;
    return s;
}

bool has_reason(const strategy::FactorJudgment& j, const std::string& text) {
    for (const auto& r : j.reasons)
        if (r == text) return true;
    return false;
}

} // namespace

// ---------------------------------------------------------------------------
// Trend
// ---------------------------------------------------------------------------

TEST(TrendAnalyzerTest, CrossoverWins) {
    strategy::TrendAnalyzer a(9, 21);
    auto s = quiet_snapshot();
    s.cross.type = core::Cross::Bullish;
    s.cross.strength = 1.5;
    s.trend.direction = core::Trend::Bearish;
    s.trend.strength = 4.0;

    const auto j = a.analyze(s);
    EXPECT_EQ(j.factor, Factor::Trend);
    EXPECT_EQ(j.direction, Direction::Buy);
    EXPECT_DOUBLE_EQ(j.strength, 1.5);
    EXPECT_TRUE(has_reason(j, "EMA-9 crossed above EMA-21"));

    s.cross.type = core::Cross::Bearish;
    const auto k = a.analyze(s);
    EXPECT_EQ(k.direction, Direction::Sell);
    EXPECT_TRUE(has_reason(k, "EMA-9 crossed below EMA-21"));
}

TEST(TrendAnalyzerTest, StrongTrendCountsHalf) {
    strategy::TrendAnalyzer a(9, 21);
    auto s = quiet_snapshot();
    s.trend.direction = core::Trend::Bearish;
    s.trend.strength = 3.0;
    s.trend.separation_pct = 6.0;

    const auto j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Sell);
    EXPECT_DOUBLE_EQ(j.strength, 1.5);
    EXPECT_TRUE(has_reason(j, "Strong bearish trend (separation: 6.00%)"));
}

TEST(TrendAnalyzerTest, WeakTrendHolds) {
    strategy::TrendAnalyzer a(9, 21);
    auto s = quiet_snapshot();
    s.trend.direction = core::Trend::Bullish;
    s.trend.strength = 2.0;   // not above 2

    const auto j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Hold);
    EXPECT_DOUBLE_EQ(j.strength, 0.0);
    EXPECT_TRUE(has_reason(j, "No significant EMA signal"));
}

// ---------------------------------------------------------------------------
// RSI
// ---------------------------------------------------------------------------

TEST(RsiAnalyzerTest, OversoldBuysOverboughtSells) {
    strategy::RsiAnalyzer a(70.0, 30.0);
    auto s = quiet_snapshot();
    s.rsi_state.current = 0.0;
    s.rsi_state.zone = core::RsiZone::Oversold;
    auto j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Buy);
    EXPECT_DOUBLE_EQ(j.strength, 3.0);
    EXPECT_TRUE(has_reason(j, "RSI oversold at 0.0"));

    s.rsi_state.current = 85.0;
    s.rsi_state.zone = core::RsiZone::Overbought;
    j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Sell);
    EXPECT_DOUBLE_EQ(j.strength, 1.5);
    EXPECT_TRUE(has_reason(j, "RSI overbought at 85.0"));
}

TEST(RsiAnalyzerTest, SteadyDeclineIsOversoldBuy) {
    ind::IndicatorEngine engine{core::AnalysisConfig{}};
    auto snap = engine.compute(testbars::series(testbars::from_closes(testbars::falling(20))));
    ASSERT_TRUE(snap.ok()) << snap.error().describe();
    EXPECT_DOUBLE_EQ(snap.value().rsi_state.current, 0.0);
    EXPECT_EQ(snap.value().rsi_state.zone, core::RsiZone::Oversold);

    const auto j = strategy::RsiAnalyzer(70.0, 30.0).analyze(snap.value());
    EXPECT_EQ(j.direction, Direction::Buy);
    EXPECT_DOUBLE_EQ(j.strength, 3.0);
    EXPECT_TRUE(has_reason(j, "RSI oversold at 0.0"));
}

TEST(RsiAnalyzerTest, MomentumInsideNeutralZone) {
    strategy::RsiAnalyzer a(70.0, 30.0);
    auto s = quiet_snapshot();
    s.rsi_state.current = 50.0;
    s.rsi_state.momentum = 8.0;
    auto j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Buy);
    EXPECT_DOUBLE_EQ(j.strength, 0.8);

    s.rsi_state.current = 55.0;
    s.rsi_state.momentum = -25.0;
    j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Sell);
    EXPECT_DOUBLE_EQ(j.strength, 2.0);   // capped
}

TEST(RsiAnalyzerTest, MomentumGuardedByLevel) {
    strategy::RsiAnalyzer a(70.0, 30.0);
    auto s = quiet_snapshot();
    s.rsi_state.current = 65.0;
    s.rsi_state.momentum = 8.0;
    auto j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Hold);
    EXPECT_TRUE(has_reason(j, "RSI neutral at 65.0"));

    s.rsi_state.current = 35.0;
    s.rsi_state.momentum = -8.0;
    j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Hold);
}

// ---------------------------------------------------------------------------
// Volume
// ---------------------------------------------------------------------------

TEST(VolumeAnalyzerTest, AlwaysNeutral) {
    strategy::VolumeAnalyzer a;
    auto s = quiet_snapshot();

    s.volume.ratio = 2.0;
    s.volume.high = true;
    auto j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Neutral);
    EXPECT_DOUBLE_EQ(j.strength, 2.0);
    EXPECT_TRUE(has_reason(j, "High volume confirmation (2.0x average)"));

    s.volume.ratio = 3.0;
    EXPECT_DOUBLE_EQ(a.analyze(s).strength, 3.0);

    s.volume.ratio = 0.4;
    s.volume.high = false;
    j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Neutral);
    EXPECT_DOUBLE_EQ(j.strength, -1.0);

    s.volume.ratio = 1.0;
    j = a.analyze(s);
    EXPECT_DOUBLE_EQ(j.strength, 0.0);
    EXPECT_TRUE(has_reason(j, "Normal volume (1.0x average)"));
}

// ---------------------------------------------------------------------------
// Price structure
// ---------------------------------------------------------------------------

TEST(StructureAnalyzerTest, NearSupportAndResistance) {
    strategy::StructureAnalyzer a;
    auto s = quiet_snapshot();

    s.levels.support = 99.5;
    auto j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Buy);
    EXPECT_DOUBLE_EQ(j.strength, 2.0);
    EXPECT_TRUE(has_reason(j, "Price near support level ($99.50)"));

    s.levels.support = 90.0;
    s.levels.resistance = 100.5;
    j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Sell);
    EXPECT_TRUE(has_reason(j, "Price near resistance level ($100.50)"));

    s.levels.resistance = 110.0;
    j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Hold);
    EXPECT_DOUBLE_EQ(j.strength, 0.0);
    ASSERT_EQ(j.reasons.size(), 1u);
}

TEST(StructureAnalyzerTest, StrongTrendAddsContext) {
    strategy::StructureAnalyzer a;
    auto s = quiet_snapshot();
    s.trend.direction = core::Trend::Bullish;
    s.trend.strength = 4.0;

    const auto j = a.analyze(s);
    EXPECT_EQ(j.direction, Direction::Hold);
    EXPECT_TRUE(has_reason(j, "Strong bullish trend"));
}
