#pragma once
#include <string>
#include <vector>
#include "core/types.hpp"
#include "indicators/engine.hpp"

namespace strategy {

enum class Factor { Trend, Rsi, Volume, Structure };

inline const char* to_string(Factor f) {
    switch (f) {
        case Factor::Trend:  return "EMA_TREND";
        case Factor::Rsi:    return "RSI";
        case Factor::Volume: return "VOLUME";
        default:             return "PRICE_STRUCTURE";
    }
}

// Verdict of one factor. Strength is >= 0 except for the volume factor,
// which uses -1 as a low-volume penalty.
struct FactorJudgment {
    Factor factor{Factor::Trend};
    core::Direction direction{core::Direction::Hold};
    double strength{0.0};
    std::vector<std::string> reasons;   // never empty
};

// Analyzer interface: one implementation per factor. Stateless, so a single
// instance may judge any number of snapshots.
class IAnalyzer {
public:
    virtual ~IAnalyzer() = default;

    virtual Factor factor() const = 0;

    virtual FactorJudgment analyze(const ind::Snapshot&) const = 0;
};

} // namespace strategy
