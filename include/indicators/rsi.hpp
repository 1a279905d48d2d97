#pragma once
#include <cstddef>
#include "core/types.hpp"
#include "core/result.hpp"

namespace ind {

// RSI with simple rolling means of gains and losses over p changes.
// The first p entries are empty. A window without losses saturates at 100,
// a window without any movement reads 50.
core::OptSeries compute_rsi(const core::Series& closes, std::size_t p);

struct RsiState {
    double current{50.0};
    double momentum{0.0};      // current - previous, 0 without a previous value
    core::RsiZone zone{core::RsiZone::Neutral};
};

// Classifies the last RSI value. Fails when the last value is not available.
core::Result<RsiState> rsi_condition(const core::OptSeries& rsi, double overbought, double oversold);

} // namespace ind
