#include "indicators/rsi.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace ind {

core::OptSeries compute_rsi(const core::Series& c, std::size_t p){
    core::OptSeries out(c.size());
    if (p == 0) return out;
    for (std::size_t t=p; t<c.size(); ++t){
        double g=0.0, l=0.0;
        for (std::size_t i=t+1-p; i<=t; ++i){
            const double d = c[i]-c[i-1];
            if (d>0) g+=d; else l-=d;
        }
        g /= static_cast<double>(p);
        l /= static_cast<double>(p);
        if (l==0.0){
            out[t] = (g==0.0? 50.0 : 100.0);
            continue;
        }
        const double rs = g/l;
        out[t] = std::clamp(100.0 - (100.0/(1.0+rs)), 0.0, 100.0);
    }
    return out;
}

core::Result<RsiState> rsi_condition(const core::OptSeries& rsi, double overbought, double oversold){
    if (rsi.empty() || !rsi.back())
        return core::indicator_error(fmt::format("RSI not available for the last bar ({} points)", rsi.size()));

    RsiState st;
    st.current = *rsi.back();
    if (rsi.size() >= 2 && rsi[rsi.size()-2])
        st.momentum = st.current - *rsi[rsi.size()-2];

    if (st.current >= overbought)    st.zone = core::RsiZone::Overbought;
    else if (st.current <= oversold) st.zone = core::RsiZone::Oversold;
    else                             st.zone = core::RsiZone::Neutral;
    return st;
}

} // namespace ind
