#include "indicators/ema.hpp"

namespace ind {

core::Series compute_ema(const core::Series& v, std::size_t p){
    core::Series out;
    if (v.empty()) return out;
    out.reserve(v.size());
    const double k = 2.0/(p+1.0);
    double e = v[0];
    out.push_back(e);
    for (std::size_t i=1;i<v.size();++i){
        e = v[i]*k + e*(1.0-k);
        out.push_back(e);
    }
    return out;
}

} // namespace ind
