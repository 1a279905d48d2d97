#pragma once
#include <cstddef>
#include "core/types.hpp"
#include "core/result.hpp"

namespace ind {

// True range per bar; bar 0 has no previous close and uses high - low.
core::Series true_range(const core::Series& high, const core::Series& low, const core::Series& close);

// Rolling mean of the true range over p bars. The first p entries are empty.
// Fails when the three columns differ in length.
core::Result<core::OptSeries> compute_atr(const core::Series& high, const core::Series& low,
                                          const core::Series& close, std::size_t p);

} // namespace ind
