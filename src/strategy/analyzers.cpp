#include "strategy/analyzers.hpp"
#include <algorithm>
#include <cmath>
#include <cctype>
#include <fmt/format.h>

using core::Direction;

namespace strategy {

FactorJudgment TrendAnalyzer::analyze(const ind::Snapshot& s) const {
    FactorJudgment j{Factor::Trend};
    const auto& x = s.cross;
    const auto& t = s.trend;

    if (x.type == core::Cross::Bullish){
        j.direction = Direction::Buy;
        j.strength  = x.strength;
        j.reasons.push_back(fmt::format("EMA-{} crossed above EMA-{}", short_p_, long_p_));
    } else if (x.type == core::Cross::Bearish){
        j.direction = Direction::Sell;
        j.strength  = x.strength;
        j.reasons.push_back(fmt::format("EMA-{} crossed below EMA-{}", short_p_, long_p_));
    } else if (t.direction == core::Trend::Bullish && t.strength > 2.0){
        // trend without a fresh cross counts half
        j.direction = Direction::Buy;
        j.strength  = t.strength * 0.5;
        j.reasons.push_back(fmt::format("Strong bullish trend (separation: {:.2f}%)", t.separation_pct));
    } else if (t.direction == core::Trend::Bearish && t.strength > 2.0){
        j.direction = Direction::Sell;
        j.strength  = t.strength * 0.5;
        j.reasons.push_back(fmt::format("Strong bearish trend (separation: {:.2f}%)", t.separation_pct));
    } else {
        j.reasons.push_back("No significant EMA signal");
    }
    return j;
}

FactorJudgment RsiAnalyzer::analyze(const ind::Snapshot& s) const {
    FactorJudgment j{Factor::Rsi};
    const double rsi = s.rsi_state.current;
    const double mom = s.rsi_state.momentum;

    switch (s.rsi_state.zone){
        case core::RsiZone::Oversold:
            j.direction = Direction::Buy;
            j.strength  = (oversold_ - rsi) / 10.0;
            j.reasons.push_back(fmt::format("RSI oversold at {:.1f}", rsi));
            return j;
        case core::RsiZone::Overbought:
            j.direction = Direction::Sell;
            j.strength  = (rsi - overbought_) / 10.0;
            j.reasons.push_back(fmt::format("RSI overbought at {:.1f}", rsi));
            return j;
        default: break;
    }

    if (mom > 5.0 && rsi < 60.0){
        j.direction = Direction::Buy;
        j.strength  = std::min(mom / 10.0, 2.0);
        j.reasons.push_back(fmt::format("Strong RSI momentum (+{:.1f})", mom));
    } else if (mom < -5.0 && rsi > 40.0){
        j.direction = Direction::Sell;
        j.strength  = std::min(std::abs(mom) / 10.0, 2.0);
        j.reasons.push_back(fmt::format("Negative RSI momentum ({:.1f})", mom));
    } else {
        j.reasons.push_back(fmt::format("RSI neutral at {:.1f}", rsi));
    }
    return j;
}

FactorJudgment VolumeAnalyzer::analyze(const ind::Snapshot& s) const {
    FactorJudgment j{Factor::Volume, Direction::Neutral};
    const double r = s.volume.ratio;
    if (s.volume.high){
        j.strength = std::min((r - 1.0) * 2.0, 3.0);
        j.reasons.push_back(fmt::format("High volume confirmation ({:.1f}x average)", r));
    } else if (r < 0.5){
        j.strength = -1.0;
        j.reasons.push_back(fmt::format("Low volume warning ({:.1f}x average)", r));
    } else {
        j.reasons.push_back(fmt::format("Normal volume ({:.1f}x average)", r));
    }
    return j;
}

FactorJudgment StructureAnalyzer::analyze(const ind::Snapshot& s) const {
    FactorJudgment j{Factor::Structure};
    const double price = s.current_price;
    const double sup = s.levels.support;
    const double res = s.levels.resistance;

    if (price <= sup * 1.01){
        j.direction = Direction::Buy;
        j.strength  = 2.0;
        j.reasons.push_back(fmt::format("Price near support level (${:.2f})", sup));
    } else if (price >= res * 0.99){
        j.direction = Direction::Sell;
        j.strength  = 2.0;
        j.reasons.push_back(fmt::format("Price near resistance level (${:.2f})", res));
    } else {
        j.reasons.push_back(fmt::format("Price between support (${:.2f}) and resistance (${:.2f})", sup, res));
    }

    if (s.trend.strength > 3.0){
        std::string dir = core::to_string(s.trend.direction);
        std::transform(dir.begin(), dir.end(), dir.begin(), [](unsigned char ch){ return std::tolower(ch); });
        j.reasons.push_back(fmt::format("Strong {} trend", dir));
    }
    return j;
}

} // namespace strategy
