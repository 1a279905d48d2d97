#include "strategy/risk.hpp"
#include <algorithm>
#include <cmath>

namespace strategy {

RiskLevels compute_risk_levels(core::Direction dir, double price, double atr,
                               const ind::Levels& lv, const core::AnalysisConfig& cfg){
    RiskLevels r;
    r.atr_value = atr;
    const double d = atr * cfg.stop_loss_atr_multiplier;

    if (dir == core::Direction::Buy){
        r.stop_loss   = std::max(price - d, lv.support * 0.99);   // just below support
        r.take_profit = price + d * cfg.take_profit_ratio;
    } else if (dir == core::Direction::Sell){
        r.stop_loss   = std::min(price + d, lv.resistance * 1.01); // just above resistance
        r.take_profit = price - d * cfg.take_profit_ratio;
    } else {
        r.stop_loss   = price - d;
        r.take_profit = price + d;
    }

    r.risk_amount   = std::abs(price - r.stop_loss);
    r.reward_amount = std::abs(r.take_profit - price);
    r.risk_reward_ratio = (r.risk_amount > 0? r.reward_amount / r.risk_amount : 0.0);
    return r;
}

} // namespace strategy
