#include "indicators/engine.hpp"
#include <fmt/format.h>
#include "indicators/ema.hpp"
#include "indicators/atr.hpp"

namespace ind {

core::Result<Snapshot> IndicatorEngine::compute(const core::BarSeries& bars) const {
    if (bars.empty()) return core::indicator_error("no bars to analyze");

    const auto closes = bars.closes();
    const auto highs  = bars.highs();
    const auto lows   = bars.lows();

    Snapshot s;
    s.current_price = closes.back();
    s.time_ms       = bars.back().time_ms;
    s.ema_short     = compute_ema(closes, cfg_.ema_short_period);
    s.ema_long      = compute_ema(closes, cfg_.ema_long_period);
    s.rsi           = compute_rsi(closes, cfg_.rsi_period);

    auto atr = compute_atr(highs, lows, closes, cfg_.atr_period);
    if (!atr) return atr.error();
    s.atr = std::move(atr).value();
    if (!s.atr.back())
        return core::indicator_error(fmt::format("ATR({}) needs more than {} bars, got {}",
                                                 cfg_.atr_period, cfg_.atr_period, bars.size()));
    s.current_atr = *s.atr.back();

    auto levels = compute_levels(highs, lows, closes, cfg_.sr_lookback);
    if (!levels) return levels.error();
    s.levels = levels.value();

    auto volume = compute_volume_profile(bars.volumes(), cfg_.volume_period);
    if (!volume) return volume.error();
    s.volume = volume.value();

    auto trend = compute_trend(s.ema_short, s.ema_long);
    if (!trend) return trend.error();
    s.trend = trend.value();

    auto cross = detect_crossover(s.ema_short, s.ema_long);
    if (!cross) return cross.error();
    s.cross = cross.value();

    auto rsi = rsi_condition(s.rsi, cfg_.rsi_overbought, cfg_.rsi_oversold);
    if (!rsi) return rsi.error();
    s.rsi_state = rsi.value();

    return s;
}

} // namespace ind
