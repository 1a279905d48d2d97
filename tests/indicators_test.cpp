#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "core/config.hpp"
#include "indicators/atr.hpp"
#include "indicators/ema.hpp"
#include "indicators/engine.hpp"
#include "indicators/levels.hpp"
#include "indicators/rsi.hpp"
#include "indicators/trend.hpp"
#include "test_bars.hpp"

using core::Series;

// ---------------------------------------------------------------------------
// EMA
// ---------------------------------------------------------------------------

TEST(EmaTest, ConstantInputStaysConstant) {
    const Series v(30, 42.0);
    const auto e = ind::compute_ema(v, 9);
    ASSERT_EQ(e.size(), v.size());
    for (double x : e) EXPECT_DOUBLE_EQ(x, 42.0);
}

TEST(EmaTest, SeededWithFirstValue) {
    // p=3 -> k=0.5
    const auto e = ind::compute_ema({2.0, 4.0, 8.0}, 3);
    ASSERT_EQ(e.size(), 3u);
    EXPECT_DOUBLE_EQ(e[0], 2.0);
    EXPECT_DOUBLE_EQ(e[1], 3.0);
    EXPECT_DOUBLE_EQ(e[2], 5.5);
}

TEST(EmaTest, EmptyInputGivesEmptyOutput) {
    EXPECT_TRUE(ind::compute_ema({}, 9).empty());
}

// ---------------------------------------------------------------------------
// RSI
// ---------------------------------------------------------------------------

TEST(RsiTest, UndefinedForFirstPeriodEntries) {
    const auto closes = testbars::rising(20);
    const auto r = ind::compute_rsi(closes, 14);
    ASSERT_EQ(r.size(), closes.size());
    for (std::size_t i = 0; i < 14; ++i) EXPECT_FALSE(r[i].has_value()) << "index " << i;
    for (std::size_t i = 14; i < r.size(); ++i) EXPECT_TRUE(r[i].has_value()) << "index " << i;
}

TEST(RsiTest, KnownValue) {
    // changes +1, +2, -1 -> avg gain 1, avg loss 1/3 -> RS 3 -> 75
    const auto r = ind::compute_rsi({10.0, 11.0, 13.0, 12.0}, 3);
    ASSERT_TRUE(r[3].has_value());
    EXPECT_NEAR(*r[3], 75.0, 1e-9);
}

TEST(RsiTest, SaturatesOnOneSidedMoves) {
    const auto up = ind::compute_rsi(testbars::rising(20), 14);
    EXPECT_DOUBLE_EQ(*up.back(), 100.0);
    const auto down = ind::compute_rsi(testbars::falling(20), 14);
    EXPECT_DOUBLE_EQ(*down.back(), 0.0);
}

TEST(RsiTest, FlatWindowReadsFifty) {
    const auto r = ind::compute_rsi(Series(20, 5.0), 14);
    EXPECT_DOUBLE_EQ(*r.back(), 50.0);
}

TEST(RsiTest, StaysWithinBoundsOnRandomWalk) {
    const auto bars = testbars::random_walk(500, 7);
    Series closes;
    for (const auto& b : bars) closes.push_back(b.close);
    for (const auto& v : ind::compute_rsi(closes, 14)) {
        if (!v) continue;
        EXPECT_GE(*v, 0.0);
        EXPECT_LE(*v, 100.0);
    }
}

TEST(RsiTest, ConditionClassifiesZonesAndMomentum) {
    core::OptSeries rsi{std::nullopt, 60.0, 75.0};
    auto st = ind::rsi_condition(rsi, 70.0, 30.0);
    ASSERT_TRUE(st.ok());
    EXPECT_EQ(st.value().zone, core::RsiZone::Overbought);
    EXPECT_DOUBLE_EQ(st.value().momentum, 15.0);

    st = ind::rsi_condition({std::nullopt, 30.0}, 70.0, 30.0);
    ASSERT_TRUE(st.ok());
    EXPECT_EQ(st.value().zone, core::RsiZone::Oversold);
    EXPECT_DOUBLE_EQ(st.value().momentum, 0.0);

    st = ind::rsi_condition({50.0}, 70.0, 30.0);
    ASSERT_TRUE(st.ok());
    EXPECT_EQ(st.value().zone, core::RsiZone::Neutral);
}

TEST(RsiTest, ConditionFailsWithoutLastValue) {
    auto st = ind::rsi_condition({50.0, std::nullopt}, 70.0, 30.0);
    ASSERT_FALSE(st.ok());
    EXPECT_EQ(st.error().kind, core::ErrorKind::Indicator);
    EXPECT_FALSE(ind::rsi_condition({}, 70.0, 30.0).ok());
}

// ---------------------------------------------------------------------------
// ATR
// ---------------------------------------------------------------------------

TEST(AtrTest, TrueRangeUsesPreviousClose) {
    const Series h{10, 12, 11}, l{9, 10, 9}, c{9.5, 11, 10};
    const auto tr = ind::true_range(h, l, c);
    ASSERT_EQ(tr.size(), 3u);
    EXPECT_DOUBLE_EQ(tr[0], 1.0);
    EXPECT_DOUBLE_EQ(tr[1], 2.5);
    EXPECT_DOUBLE_EQ(tr[2], 2.0);

    auto atr = ind::compute_atr(h, l, c, 2);
    ASSERT_TRUE(atr.ok());
    const auto& a = atr.value();
    EXPECT_FALSE(a[0].has_value());
    EXPECT_FALSE(a[1].has_value());
    ASSERT_TRUE(a[2].has_value());
    EXPECT_DOUBLE_EQ(*a[2], 2.25);
}

TEST(AtrTest, NonNegativeOnRandomWalk) {
    const auto bs = testbars::series(testbars::random_walk(300, 11));
    auto atr = ind::compute_atr(bs.highs(), bs.lows(), bs.closes(), 14);
    ASSERT_TRUE(atr.ok());
    std::size_t defined = 0;
    for (const auto& v : atr.value()) {
        if (!v) continue;
        ++defined;
        EXPECT_GE(*v, 0.0);
    }
    EXPECT_EQ(defined, 300u - 14u);
}

TEST(AtrTest, MisalignedColumnsFail) {
    auto atr = ind::compute_atr({1, 2, 3}, {1, 2}, {1, 2, 3}, 2);
    ASSERT_FALSE(atr.ok());
    EXPECT_EQ(atr.error().kind, core::ErrorKind::Indicator);
}

// ---------------------------------------------------------------------------
// Support / resistance and volume
// ---------------------------------------------------------------------------

TEST(LevelsTest, PivotOverTrailingWindow) {
    const Series h{50, 12, 11}, l{1, 10, 9}, c{9.5, 11, 10};
    auto lv = ind::compute_levels(h, l, c, 2);
    ASSERT_TRUE(lv.ok());
    EXPECT_DOUBLE_EQ(lv.value().recent_high, 12.0);
    EXPECT_DOUBLE_EQ(lv.value().recent_low, 9.0);
    EXPECT_NEAR(lv.value().pivot, 31.0 / 3.0, 1e-12);
    EXPECT_NEAR(lv.value().resistance, 35.0 / 3.0, 1e-12);
    EXPECT_NEAR(lv.value().support, 26.0 / 3.0, 1e-12);
}

TEST(LevelsTest, LookbackLongerThanHistoryUsesEverything) {
    const Series h{50, 12, 11}, l{1, 10, 9}, c{9.5, 11, 10};
    auto lv = ind::compute_levels(h, l, c, 20);
    ASSERT_TRUE(lv.ok());
    EXPECT_DOUBLE_EQ(lv.value().recent_high, 50.0);
    EXPECT_DOUBLE_EQ(lv.value().recent_low, 1.0);
    EXPECT_LE(lv.value().support, lv.value().resistance);
}

TEST(VolumeProfileTest, DoubleAverageIsHighVolume) {
    Series v(19, 9.0);
    v.push_back(19.0);
    auto vp = ind::compute_volume_profile(v, 20);
    ASSERT_TRUE(vp.ok());
    EXPECT_DOUBLE_EQ(vp.value().average, 9.5);
    EXPECT_DOUBLE_EQ(vp.value().ratio, 2.0);
    EXPECT_TRUE(vp.value().high);
}

TEST(VolumeProfileTest, ZeroAverageReadsAsOne) {
    auto vp = ind::compute_volume_profile(Series(5, 0.0), 20);
    ASSERT_TRUE(vp.ok());
    EXPECT_DOUBLE_EQ(vp.value().ratio, 1.0);
    EXPECT_FALSE(vp.value().high);
    EXPECT_FALSE(ind::compute_volume_profile({}, 20).ok());
}

// ---------------------------------------------------------------------------
// Trend and crossover
// ---------------------------------------------------------------------------

TEST(TrendTest, DirectionAndStrength) {
    auto t = ind::compute_trend({100.0, 105.0}, {100.0, 100.0});
    ASSERT_TRUE(t.ok());
    EXPECT_EQ(t.value().direction, core::Trend::Bullish);
    EXPECT_NEAR(t.value().separation_pct, 5.0, 1e-12);
    EXPECT_NEAR(t.value().strength, 2.5, 1e-12);

    t = ind::compute_trend({80.0}, {100.0});
    ASSERT_TRUE(t.ok());
    EXPECT_EQ(t.value().direction, core::Trend::Bearish);
    EXPECT_DOUBLE_EQ(t.value().strength, 5.0);

    t = ind::compute_trend({100.0}, {100.0});
    ASSERT_TRUE(t.ok());
    EXPECT_EQ(t.value().direction, core::Trend::Neutral);
    EXPECT_DOUBLE_EQ(t.value().strength, 0.0);
}

TEST(TrendTest, ZeroLongEmaFails) {
    EXPECT_FALSE(ind::compute_trend({1.0}, {0.0}).ok());
    EXPECT_FALSE(ind::compute_trend({}, {}).ok());
}

TEST(CrossoverTest, DetectsBothDirections) {
    auto x = ind::detect_crossover({99.0, 101.0}, {100.0, 100.0});
    ASSERT_TRUE(x.ok());
    EXPECT_EQ(x.value().type, core::Cross::Bullish);
    EXPECT_NEAR(x.value().strength, 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(x.value().previous_separation, 1.0);

    x = ind::detect_crossover({100.0, 99.0}, {100.0, 100.0});
    ASSERT_TRUE(x.ok());
    EXPECT_EQ(x.value().type, core::Cross::Bearish);

    x = ind::detect_crossover({101.0, 102.0}, {100.0, 100.0});
    ASSERT_TRUE(x.ok());
    EXPECT_EQ(x.value().type, core::Cross::None);
    EXPECT_DOUBLE_EQ(x.value().strength, 0.0);
}

TEST(CrossoverTest, ShortSeriesHasNoCross) {
    auto x = ind::detect_crossover({1.0}, {1.0});
    ASSERT_TRUE(x.ok());
    EXPECT_EQ(x.value().type, core::Cross::None);
}

TEST(CrossoverTest, RisingSeriesCrossesAtSecondBar) {
    const auto closes = testbars::rising(100);
    const auto s = ind::compute_ema(closes, 9);
    const auto l = ind::compute_ema(closes, 21);
    auto x = ind::crossover_at(s, l, 1);
    ASSERT_TRUE(x.ok());
    EXPECT_EQ(x.value().type, core::Cross::Bullish);

    x = ind::detect_crossover(s, l);
    ASSERT_TRUE(x.ok());
    EXPECT_EQ(x.value().type, core::Cross::None);
}

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

TEST(IndicatorEngineTest, FallingSeriesSnapshot) {
    const auto bs = testbars::series(testbars::from_closes(testbars::falling(20)));
    ind::IndicatorEngine engine{core::AnalysisConfig{}};
    auto snap = engine.compute(bs);
    ASSERT_TRUE(snap.ok()) << snap.error().describe();
    const auto& s = snap.value();
    EXPECT_DOUBLE_EQ(s.current_price, 181.0);
    EXPECT_EQ(s.time_ms, bs.back().time_ms);
    EXPECT_DOUBLE_EQ(s.rsi_state.current, 0.0);
    EXPECT_EQ(s.rsi_state.zone, core::RsiZone::Oversold);
    EXPECT_EQ(s.trend.direction, core::Trend::Bearish);
    EXPECT_GT(s.current_atr, 0.0);
    EXPECT_EQ(s.ema_short.size(), bs.size());
}

TEST(IndicatorEngineTest, TooFewBarsIsIndicatorError) {
    const auto bs = testbars::series(testbars::from_closes(testbars::falling(14)));
    ind::IndicatorEngine engine{core::AnalysisConfig{}};
    auto snap = engine.compute(bs);
    ASSERT_FALSE(snap.ok());
    EXPECT_EQ(snap.error().kind, core::ErrorKind::Indicator);
}
