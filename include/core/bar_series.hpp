#pragma once
#include <cstddef>
#include <vector>
#include "core/types.hpp"
#include "core/result.hpp"

namespace core {

// Validated, time-ordered OHLCV sequence. Only constructible through from_bars(),
// so every instance satisfies the OHLC ordering, volume >= 0 and strictly
// increasing timestamps.
class BarSeries {
public:
    static Result<BarSeries> from_bars(std::vector<Bar> bars);

    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const Bar& operator[](std::size_t i) const { return bars_[i]; }
    const Bar& back() const { return bars_.back(); }
    const std::vector<Bar>& bars() const { return bars_; }

    // column views
    Series opens() const;
    Series highs() const;
    Series lows() const;
    Series closes() const;
    Series volumes() const;

private:
    explicit BarSeries(std::vector<Bar> bars) : bars_(std::move(bars)) {}
    std::vector<Bar> bars_;
};

} // namespace core
