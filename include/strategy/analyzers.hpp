#pragma once
#include <cstddef>
#include "strategy/analyzer.hpp"

namespace strategy {

// Crossover first, then strong trend (strength > 2) at half weight, else HOLD
class TrendAnalyzer final : public IAnalyzer {
    std::size_t short_p_, long_p_;
public:
    TrendAnalyzer(std::size_t short_p, std::size_t long_p): short_p_(short_p), long_p_(long_p) {}
    Factor factor() const override { return Factor::Trend; }
    FactorJudgment analyze(const ind::Snapshot&) const override;
};

// Oversold -> BUY, overbought -> SELL, otherwise momentum (+/-5) with 60/40 guards
class RsiAnalyzer final : public IAnalyzer {
    double overbought_, oversold_;
public:
    RsiAnalyzer(double overbought, double oversold): overbought_(overbought), oversold_(oversold) {}
    Factor factor() const override { return Factor::Rsi; }
    FactorJudgment analyze(const ind::Snapshot&) const override;
};

// Confirmation only: always NEUTRAL, strength from the volume ratio
class VolumeAnalyzer final : public IAnalyzer {
public:
    Factor factor() const override { return Factor::Volume; }
    FactorJudgment analyze(const ind::Snapshot&) const override;
};

// Price within 1% of support (BUY) or resistance (SELL)
class StructureAnalyzer final : public IAnalyzer {
public:
    Factor factor() const override { return Factor::Structure; }
    FactorJudgment analyze(const ind::Snapshot&) const override;
};

} // namespace strategy
