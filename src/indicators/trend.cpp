#include "indicators/trend.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace ind {

core::Result<TrendInfo> compute_trend(const core::Series& s, const core::Series& l){
    if (s.empty() || l.empty())
        return core::indicator_error("trend strength needs non-empty EMA series");
    TrendInfo t;
    t.ema_short = s.back();
    t.ema_long  = l.back();
    if (t.ema_long == 0.0)
        return core::indicator_error("trend strength undefined: long EMA is zero");

    t.separation_pct = std::abs(t.ema_short - t.ema_long) / t.ema_long * 100.0;
    if (t.ema_short > t.ema_long)      t.direction = core::Trend::Bullish;
    else if (t.ema_short < t.ema_long) t.direction = core::Trend::Bearish;
    else                               t.direction = core::Trend::Neutral;
    t.strength = (t.direction==core::Trend::Neutral? 0.0 : std::min(t.separation_pct/2.0, 5.0));
    return t;
}

core::Result<CrossInfo> crossover_at(const core::Series& s, const core::Series& l, std::size_t i){
    CrossInfo x;
    if (i < 1 || i >= s.size() || i >= l.size()) return x;

    const double cs = s[i], cl = l[i], ps = s[i-1], pl = l[i-1];
    x.current_separation  = std::abs(cs - cl);
    x.previous_separation = std::abs(ps - pl);

    if (ps <= pl && cs > cl)      x.type = core::Cross::Bullish;
    else if (ps >= pl && cs < cl) x.type = core::Cross::Bearish;

    if (x.type != core::Cross::None){
        if (cl == 0.0)
            return core::indicator_error(fmt::format("crossover strength undefined: long EMA is zero at {}", i));
        x.strength = std::min(x.current_separation / cl * 100.0, 5.0);
    }
    return x;
}

core::Result<CrossInfo> detect_crossover(const core::Series& s, const core::Series& l){
    const std::size_t n = std::min(s.size(), l.size());
    if (n < 2) return CrossInfo{};
    return crossover_at(s, l, n-1);
}

} // namespace ind
