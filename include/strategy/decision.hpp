#pragma once
#include <vector>
#include "core/types.hpp"
#include "core/config.hpp"
#include "strategy/analyzer.hpp"

namespace strategy {

// Accumulated weighted strength per direction
struct Scores {
    double buy{0.0};
    double sell{0.0};
    double hold{0.0};
};

struct Decision {
    core::Direction action{core::Direction::Hold};
    double strength{0.0};
    double confidence{0.0};   // 0..10
    double consensus{0.0};    // 0..1
    Scores scores{};
};

double weight_of(const core::Weights& w, Factor f);

// Share of the directional factors (all but volume) that agree with the
// most common direction among them. 0 when there is no directional factor.
double consensus(const std::vector<FactorJudgment>& judgments);

// Weighted vote: strength*weight goes into the judgment's direction bucket
// (NEUTRAL never counts). The biggest bucket wins, ties go BUY, SELL, HOLD;
// a BUY/SELL winner below the activation threshold is downgraded to HOLD.
Decision decide(const std::vector<FactorJudgment>& judgments, const core::Weights& w,
                double activation_threshold = 1.0);

} // namespace strategy
