#include "strategy/decision.hpp"
#include <algorithm>

using core::Direction;

namespace strategy {

double weight_of(const core::Weights& w, Factor f){
    switch (f){
        case Factor::Trend:  return w.trend;
        case Factor::Rsi:    return w.rsi;
        case Factor::Volume: return w.volume;
        default:             return w.structure;
    }
}

double consensus(const std::vector<FactorJudgment>& js){
    int buy=0, sell=0, hold=0, n=0;
    for (const auto& j : js){
        if (j.factor == Factor::Volume) continue;
        ++n;
        if (j.direction==Direction::Buy) ++buy;
        else if (j.direction==Direction::Sell) ++sell;
        else if (j.direction==Direction::Hold) ++hold;
    }
    if (n==0) return 0.0;
    return static_cast<double>(std::max({buy, sell, hold})) / n;
}

Decision decide(const std::vector<FactorJudgment>& js, const core::Weights& w, double threshold){
    Decision d;
    for (const auto& j : js){
        const double ws = j.strength * weight_of(w, j.factor);
        switch (j.direction){
            case Direction::Buy:  d.scores.buy  += ws; break;
            case Direction::Sell: d.scores.sell += ws; break;
            case Direction::Hold: d.scores.hold += ws; break;
            default: break;   // NEUTRAL: confirmation only
        }
    }

    Direction best = Direction::Buy; double top = d.scores.buy;
    if (d.scores.sell > top){ best = Direction::Sell; top = d.scores.sell; }
    if (d.scores.hold > top){ best = Direction::Hold; top = d.scores.hold; }

    d.action   = (best != Direction::Hold && top < threshold) ? Direction::Hold : best;
    d.strength = top;
    d.consensus  = consensus(js);
    d.confidence = std::clamp(d.strength * d.consensus, 0.0, 10.0);
    return d;
}

} // namespace strategy
