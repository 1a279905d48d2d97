#pragma once
#include <cstdint>
#include <utility>
#include "core/types.hpp"
#include "core/result.hpp"
#include "core/config.hpp"
#include "core/bar_series.hpp"
#include "indicators/rsi.hpp"
#include "indicators/levels.hpp"
#include "indicators/trend.hpp"

namespace ind {

// Everything the analyzers look at, computed fresh from one BarSeries.
// Series are index-aligned with the bars; the last element is "now".
struct Snapshot {
    core::Series ema_short;
    core::Series ema_long;
    core::OptSeries rsi;
    core::OptSeries atr;
    Levels levels;
    VolumeProfile volume;
    TrendInfo trend;
    CrossInfo cross;
    RsiState rsi_state;
    double current_price{};
    double current_atr{};
    std::int64_t time_ms{};
};

class IndicatorEngine {
public:
    explicit IndicatorEngine(core::AnalysisConfig cfg) : cfg_(std::move(cfg)) {}

    const core::AnalysisConfig& config() const { return cfg_; }

    // Fails with an Indicator error when the series cannot define a current
    // value for every indicator (too short for RSI/ATR, zero long EMA, ...).
    core::Result<Snapshot> compute(const core::BarSeries& bars) const;

private:
    core::AnalysisConfig cfg_;
};

} // namespace ind
