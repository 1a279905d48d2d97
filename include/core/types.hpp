#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>

namespace core {

// OHLCV bar
struct Bar {
    std::int64_t time_ms{}; // bar open time (epoch ms)
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

using Series = std::vector<double>;
// Indicator output; empty where the rolling window is not yet full
using OptSeries = std::vector<std::optional<double>>;

// Direction of a factor judgment or of the composite signal.
// Neutral is only produced by the volume factor, Error only by the composer.
enum class Direction { Buy, Sell, Hold, Neutral, Error };

enum class Trend { Bullish, Bearish, Neutral };

enum class Cross { Bullish, Bearish, None };

enum class RsiZone { Overbought, Oversold, Neutral };

inline const char* to_string(Direction d) {
    switch (d) {
        case Direction::Buy:     return "BUY";
        case Direction::Sell:    return "SELL";
        case Direction::Hold:    return "HOLD";
        case Direction::Neutral: return "NEUTRAL";
        default:                 return "ERROR";
    }
}

inline const char* to_string(Trend t) {
    switch (t) {
        case Trend::Bullish: return "BULLISH";
        case Trend::Bearish: return "BEARISH";
        default:             return "NEUTRAL";
    }
}

inline const char* to_string(Cross c) {
    switch (c) {
        case Cross::Bullish: return "BULLISH";
        case Cross::Bearish: return "BEARISH";
        default:             return "NONE";
    }
}

inline const char* to_string(RsiZone z) {
    switch (z) {
        case RsiZone::Overbought: return "OVERBOUGHT";
        case RsiZone::Oversold:   return "OVERSOLD";
        default:                  return "NEUTRAL";
    }
}

} // namespace core
