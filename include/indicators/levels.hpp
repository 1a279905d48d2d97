#pragma once
#include <cstddef>
#include "core/types.hpp"
#include "core/result.hpp"

namespace ind {

// Classic pivot levels over the trailing lookback bars
struct Levels {
    double support{};
    double resistance{};
    double pivot{};
    double recent_high{};
    double recent_low{};
};

core::Result<Levels> compute_levels(const core::Series& high, const core::Series& low,
                                    const core::Series& close, std::size_t lookback);

struct VolumeProfile {
    double current{};
    double average{};
    double ratio{1.0};
    bool high{false};    // ratio > 1.5
};

// Average over the trailing p volumes, current bar included
core::Result<VolumeProfile> compute_volume_profile(const core::Series& volume, std::size_t p);

} // namespace ind
