#include "indicators/levels.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace ind {

core::Result<Levels> compute_levels(const core::Series& h, const core::Series& l,
                                    const core::Series& c, std::size_t lookback){
    if (c.empty() || h.size()!=c.size() || l.size()!=c.size())
        return core::indicator_error(fmt::format("support/resistance needs aligned non-empty columns: high={} low={} close={}",
                                                 h.size(), l.size(), c.size()));
    const std::size_t n = std::min(std::max<std::size_t>(lookback, 1), c.size());
    const std::size_t from = c.size()-n;

    Levels lv;
    lv.recent_high = *std::max_element(h.begin()+from, h.end());
    lv.recent_low  = *std::min_element(l.begin()+from, l.end());
    lv.pivot       = (lv.recent_high + lv.recent_low + c.back()) / 3.0;
    lv.resistance  = 2.0*lv.pivot - lv.recent_low;
    lv.support     = 2.0*lv.pivot - lv.recent_high;
    return lv;
}

core::Result<VolumeProfile> compute_volume_profile(const core::Series& v, std::size_t p){
    if (v.empty()) return core::indicator_error("volume profile needs at least one bar");
    const std::size_t n = std::min(std::max<std::size_t>(p, 1), v.size());
    double s=0.0;
    for (std::size_t i=v.size()-n;i<v.size();++i) s+=v[i];

    VolumeProfile vp;
    vp.current = v.back();
    vp.average = s/static_cast<double>(n);
    vp.ratio   = (vp.average>0? vp.current/vp.average : 1.0);
    vp.high    = vp.ratio > 1.5;
    return vp;
}

} // namespace ind
