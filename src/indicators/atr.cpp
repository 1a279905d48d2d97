#include "indicators/atr.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace ind {

core::Series true_range(const core::Series& h, const core::Series& l, const core::Series& c){
    const std::size_t n = std::min({h.size(), l.size(), c.size()});
    core::Series tr; tr.reserve(n);
    for (std::size_t i=0;i<n;++i){
        double r = h[i]-l[i];
        if (i>0){
            r = std::max({r, std::abs(h[i]-c[i-1]), std::abs(l[i]-c[i-1])});
        }
        tr.push_back(r);
    }
    return tr;
}

core::Result<core::OptSeries> compute_atr(const core::Series& h, const core::Series& l,
                                          const core::Series& c, std::size_t p){
    if (h.size()!=l.size() || h.size()!=c.size())
        return core::indicator_error(fmt::format("ATR columns misaligned: high={} low={} close={}",
                                                 h.size(), l.size(), c.size()));
    const auto tr = true_range(h, l, c);
    core::OptSeries out(tr.size());
    if (p == 0) return out;
    for (std::size_t t=p; t<tr.size(); ++t){
        double s=0.0;
        for (std::size_t i=t+1-p; i<=t; ++i) s+=tr[i];
        out[t] = s/static_cast<double>(p);
    }
    return out;
}

} // namespace ind
