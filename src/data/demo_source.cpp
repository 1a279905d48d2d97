#include "data/demo_source.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <vector>
#include <fmt/format.h>

namespace data {

namespace {
constexpr double kBasePrice = 200.0;
constexpr double kPi = 3.14159265358979323846;

double round2(double v){ return std::round(v*100.0)/100.0; }

double lin(std::size_t i, std::size_t n, double to){
    return n<2? 0.0 : to * static_cast<double>(i) / static_cast<double>(n-1);
}
} // namespace

const char* to_string(DemoScenario s){
    switch (s){
        case DemoScenario::Bullish:  return "bullish";
        case DemoScenario::Bearish:  return "bearish";
        case DemoScenario::Sideways: return "sideways";
        default:                     return "normal";
    }
}

std::optional<DemoScenario> parse_scenario(const std::string& s){
    if (s=="normal")   return DemoScenario::Normal;
    if (s=="bullish")  return DemoScenario::Bullish;
    if (s=="bearish")  return DemoScenario::Bearish;
    if (s=="sideways") return DemoScenario::Sideways;
    return std::nullopt;
}

core::Result<core::BarSeries> DemoBarSource::fetch(const core::TimeframeSpec& tf){
    const auto step = interval_ms(tf.interval);
    if (!step) return core::data_error(fmt::format("unknown candle interval '{}'", tf.interval));
    if (bars_ == 0) return core::data_error("demo bar count must be positive");

    std::mt19937 rng(seed_);
    auto uni = [&](double a, double b){ return std::uniform_real_distribution<double>(a, b)(rng); };
    auto gauss = [&](double sd){ return std::normal_distribution<double>(0.0, sd)(rng); };

    const std::size_t n = bars_;
    std::vector<double> closes(n);
    for (std::size_t i=0;i<n;++i){
        double c = kBasePrice;
        switch (scenario_){
            case DemoScenario::Normal:
                c += lin(i, n, 5.0) + gauss(2.0) + 3.0*std::sin(lin(i, n, 4.0*kPi));
                break;
            case DemoScenario::Bullish:  c += lin(i, n, 15.0) + gauss(1.0); break;
            case DemoScenario::Bearish:  c += lin(i, n, -15.0) + gauss(1.0); break;
            case DemoScenario::Sideways: c += gauss(0.5) + gauss(2.0); break;
        }
        closes[i] = c;
    }

    std::vector<core::Bar> bars; bars.reserve(n);
    const std::int64_t start = end_time_ms_ - static_cast<std::int64_t>(n-1) * *step;
    for (std::size_t i=0;i<n;++i){
        const double c = closes[i];
        const double vol = uni(0.5, 2.0);
        const double open = i==0? c + uni(-0.5, 0.5) : closes[i-1] + uni(-0.3, 0.3);

        core::Bar b;
        b.time_ms = start + static_cast<std::int64_t>(i) * *step;
        b.close = round2(c);
        b.open  = round2(open);
        b.high  = std::max({round2(c + uni(0.0, vol)), b.open, b.close});
        b.low   = std::min({round2(c - uni(0.0, vol)), b.open, b.close});

        // bigger moves trade more
        const double move = std::abs(c - (i>0? closes[i-1] : c));
        b.volume = std::floor(uni(1e6, 3e6) * (1.0 + move/c*10.0));
        bars.push_back(b);
    }
    return core::BarSeries::from_bars(std::move(bars));
}

} // namespace data
