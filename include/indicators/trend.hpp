#pragma once
#include <cstddef>
#include "core/types.hpp"
#include "core/result.hpp"

namespace ind {

struct TrendInfo {
    core::Trend direction{core::Trend::Neutral};
    double strength{0.0};        // min(separation/2, 5), 0 when neutral
    double separation_pct{0.0};  // |short - long| / long * 100
    double ema_short{};
    double ema_long{};
};

// Trend from the last values of the short and long EMA.
// Fails on empty series or a zero long EMA.
core::Result<TrendInfo> compute_trend(const core::Series& ema_short, const core::Series& ema_long);

struct CrossInfo {
    core::Cross type{core::Cross::None};
    double strength{0.0};            // min(separation %, 5), 0 without a cross
    double current_separation{0.0};  // absolute price distance
    double previous_separation{0.0};
};

// Crossover between index i-1 and i. None/0 when i < 1 or out of range.
core::Result<CrossInfo> crossover_at(const core::Series& ema_short, const core::Series& ema_long, std::size_t i);

// Crossover at the last index
core::Result<CrossInfo> detect_crossover(const core::Series& ema_short, const core::Series& ema_long);

} // namespace ind
