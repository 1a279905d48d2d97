#include "strategy/signal_json.hpp"

using json = nlohmann::json;

namespace strategy {

json to_json(const FactorJudgment& j){
    return json{
        {"factor", to_string(j.factor)},
        {"signal", core::to_string(j.direction)},
        {"strength", j.strength},
        {"reasons", j.reasons},
    };
}

json to_json(const RiskLevels& r){
    return json{
        {"stop_loss", r.stop_loss},
        {"take_profit", r.take_profit},
        {"risk_amount", r.risk_amount},
        {"reward_amount", r.reward_amount},
        {"risk_reward_ratio", r.risk_reward_ratio},
        {"atr_value", r.atr_value},
    };
}

json to_json(const CompositeSignal& s){
    json j{
        {"timestamp_ms", s.time_ms},
        {"signal", core::to_string(s.direction)},
        {"recommendation", s.recommendation},
    };
    if (s.is_error()){
        j["error"] = s.error;
        return j;
    }

    j["current_price"] = s.current_price;
    j["signal_strength"] = s.strength;
    j["confidence"] = s.confidence;
    j["consensus"] = s.consensus;
    j["scores"] = json{{"BUY", s.scores.buy}, {"SELL", s.scores.sell}, {"HOLD", s.scores.hold}};

    json comps = json::object();
    for (const auto& c : s.components) comps[to_string(c.factor)] = to_json(c);
    j["components"] = std::move(comps);

    j["risk_management"] = to_json(s.risk);
    j["market_context"] = json{
        {"trend_direction", core::to_string(s.context.trend)},
        {"trend_strength", s.context.trend_strength},
        {"rsi_condition", core::to_string(s.context.rsi_zone)},
        {"volume_status", s.context.high_volume? "HIGH" : "NORMAL"},
        {"support_level", s.context.support},
        {"resistance_level", s.context.resistance},
    };
    return j;
}

} // namespace strategy
