#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "strategy/analyzer.hpp"
#include "strategy/decision.hpp"
#include "strategy/risk.hpp"

namespace strategy {

struct MarketContext {
    core::Trend trend{core::Trend::Neutral};
    double trend_strength{0.0};
    core::RsiZone rsi_zone{core::RsiZone::Neutral};
    bool high_volume{false};
    double support{0.0};
    double resistance{0.0};
};

// Output of one analysis. direction is BUY, SELL, HOLD or ERROR; on ERROR only
// time_ms, error and recommendation carry meaning.
struct CompositeSignal {
    std::int64_t time_ms{};
    double current_price{0.0};
    core::Direction direction{core::Direction::Hold};
    double strength{0.0};
    double confidence{0.0};
    double consensus{0.0};
    Scores scores{};
    std::vector<FactorJudgment> components;   // trend, rsi, volume, structure
    RiskLevels risk{};
    MarketContext context{};
    std::string recommendation;
    std::string error;

    bool is_error() const { return direction == core::Direction::Error; }
    const FactorJudgment* component(Factor f) const {
        for (const auto& c : components) if (c.factor == f) return &c;
        return nullptr;
    }
};

} // namespace strategy
