#pragma once
#include <memory>
#include <string>
#include <vector>
#include "core/bar_series.hpp"
#include "core/config.hpp"
#include "indicators/engine.hpp"
#include "strategy/analyzer.hpp"
#include "strategy/signal.hpp"

namespace strategy {

// "STRONG BUY - High confidence signal (Score: 7.5/10)" and friends
std::string recommendation_text(core::Direction dir, double confidence);

// Bars -> snapshot -> four factor judgments -> weighted decision + risk levels.
// Never throws on bad input: indicator failures come back as an ERROR signal.
class SignalGenerator {
public:
    explicit SignalGenerator(core::AnalysisConfig cfg);

    const core::AnalysisConfig& config() const { return engine_.config(); }

    CompositeSignal generate(const core::BarSeries& bars) const;

    // Composition step alone, for a snapshot computed elsewhere
    CompositeSignal compose(const ind::Snapshot& snap) const;

    static CompositeSignal error_signal(const core::Error& err, std::int64_t time_ms = 0);

private:
    ind::IndicatorEngine engine_;
    std::vector<std::unique_ptr<IAnalyzer>> analyzers_;
};

} // namespace strategy
