#include "core/bar_series.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace core {

namespace {
template <class F>
Series column(const std::vector<Bar>& bars, F f) {
    Series out; out.reserve(bars.size());
    for (const auto& b : bars) out.push_back(f(b));
    return out;
}
} // namespace

Result<BarSeries> BarSeries::from_bars(std::vector<Bar> bars) {
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const Bar& b = bars[i];
        if (!std::isfinite(b.open) || !std::isfinite(b.high) || !std::isfinite(b.low)
            || !std::isfinite(b.close) || !std::isfinite(b.volume))
            return data_error(fmt::format("bar {} has a non-finite field", i));
        if (b.high < std::max({b.open, b.close, b.low}))
            return data_error(fmt::format("bar {}: high {} below open/close/low", i, b.high));
        if (b.low > std::min({b.open, b.close, b.high}))
            return data_error(fmt::format("bar {}: low {} above open/close/high", i, b.low));
        if (b.volume < 0)
            return data_error(fmt::format("bar {}: negative volume {}", i, b.volume));
        if (i > 0 && b.time_ms <= bars[i-1].time_ms)
            return data_error(fmt::format("bar {}: timestamp {} not after {}", i, b.time_ms, bars[i-1].time_ms));
    }
    return BarSeries(std::move(bars));
}

Series BarSeries::opens() const   { return column(bars_, [](const Bar& b){ return b.open; }); }
Series BarSeries::highs() const   { return column(bars_, [](const Bar& b){ return b.high; }); }
Series BarSeries::lows() const    { return column(bars_, [](const Bar& b){ return b.low; }); }
Series BarSeries::closes() const  { return column(bars_, [](const Bar& b){ return b.close; }); }
Series BarSeries::volumes() const { return column(bars_, [](const Bar& b){ return b.volume; }); }

} // namespace core
