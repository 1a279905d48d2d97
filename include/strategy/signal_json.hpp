#pragma once
#include <nlohmann/json.hpp>
#include "strategy/signal.hpp"

namespace strategy {

// Stable field order (nlohmann::json sorts object keys), so equal signals
// always dump to the same text.
nlohmann::json to_json(const CompositeSignal& s);
nlohmann::json to_json(const FactorJudgment& j);
nlohmann::json to_json(const RiskLevels& r);

} // namespace strategy
