#pragma once
#include <cstddef>
#include "core/types.hpp"

namespace ind {

// Full EMA series with k = 2/(p+1). Seeded with the first input value, so every
// index is defined and out.size() == v.size().
core::Series compute_ema(const core::Series& v, std::size_t p);

} // namespace ind
