#pragma once
#include "core/types.hpp"
#include "core/config.hpp"
#include "indicators/levels.hpp"

namespace strategy {

struct RiskLevels {
    double stop_loss{0.0};
    double take_profit{0.0};
    double risk_amount{0.0};
    double reward_amount{0.0};
    double risk_reward_ratio{0.0};   // reward/risk, 0 when risk is 0
    double atr_value{0.0};
};

// ATR stop distance d = atr * stop_loss_atr_multiplier.
//  BUY : SL = max(price - d, support*0.99),    TP = price + d*take_profit_ratio
//  SELL: SL = min(price + d, resistance*1.01), TP = price - d*take_profit_ratio
//  else: SL = price - d,                        TP = price + d
RiskLevels compute_risk_levels(core::Direction dir, double price, double atr,
                               const ind::Levels& levels, const core::AnalysisConfig& cfg);

} // namespace strategy
