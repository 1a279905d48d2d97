#include "strategy/signal_generator.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "strategy/analyzers.hpp"

using core::Direction;

namespace strategy {

std::string recommendation_text(Direction dir, double confidence){
    if (dir == Direction::Error) return "Unable to generate signal due to data issues";
    if (dir != Direction::Buy && dir != Direction::Sell)
        return fmt::format("HOLD - No clear trading opportunity (Score: {:.1f}/10)", confidence);

    const char* side = core::to_string(dir);
    if (confidence >= 7.0) return fmt::format("STRONG {} - High confidence signal (Score: {:.1f}/10)", side, confidence);
    if (confidence >= 5.0) return fmt::format("{} - Moderate confidence signal (Score: {:.1f}/10)", side, confidence);
    return fmt::format("WEAK {} - Low confidence signal (Score: {:.1f}/10)", side, confidence);
}

SignalGenerator::SignalGenerator(core::AnalysisConfig cfg) : engine_(std::move(cfg)) {
    const auto& c = engine_.config();
    analyzers_.push_back(std::make_unique<TrendAnalyzer>(c.ema_short_period, c.ema_long_period));
    analyzers_.push_back(std::make_unique<RsiAnalyzer>(c.rsi_overbought, c.rsi_oversold));
    analyzers_.push_back(std::make_unique<VolumeAnalyzer>());
    analyzers_.push_back(std::make_unique<StructureAnalyzer>());
}

CompositeSignal SignalGenerator::error_signal(const core::Error& err, std::int64_t time_ms){
    CompositeSignal sig;
    sig.time_ms = time_ms;
    sig.direction = Direction::Error;
    sig.error = err.kind == core::ErrorKind::Signal ? err.message : err.describe();
    sig.recommendation = recommendation_text(Direction::Error, 0.0);
    return sig;
}

CompositeSignal SignalGenerator::generate(const core::BarSeries& bars) const {
    auto snap = engine_.compute(bars);
    if (!snap){
        const std::int64_t t = bars.empty()? 0 : bars.back().time_ms;
        return error_signal({core::ErrorKind::Signal,
                             "Failed to calculate indicators: " + snap.error().describe()}, t);
    }
    return compose(snap.value());
}

CompositeSignal SignalGenerator::compose(const ind::Snapshot& snap) const {
    const auto& cfg = engine_.config();

    CompositeSignal sig;
    sig.time_ms = snap.time_ms;
    sig.current_price = snap.current_price;
    for (const auto& a : analyzers_) sig.components.push_back(a->analyze(snap));

    Decision d = decide(sig.components, cfg.weights, cfg.activation_threshold);
    // without volatility the stop and target would sit on the entry price
    if ((d.action == Direction::Buy || d.action == Direction::Sell) && !(snap.current_atr > 0.0)){
        spdlog::debug("{} downgraded to HOLD: ATR is {}", core::to_string(d.action), snap.current_atr);
        d.action = Direction::Hold;
    }
    sig.direction  = d.action;
    sig.strength   = d.strength;
    sig.confidence = d.confidence;
    sig.consensus  = d.consensus;
    sig.scores     = d.scores;

    sig.risk = compute_risk_levels(d.action, snap.current_price, snap.current_atr, snap.levels, cfg);

    sig.context.trend          = snap.trend.direction;
    sig.context.trend_strength = snap.trend.strength;
    sig.context.rsi_zone       = snap.rsi_state.zone;
    sig.context.high_volume    = snap.volume.high;
    sig.context.support        = snap.levels.support;
    sig.context.resistance     = snap.levels.resistance;

    sig.recommendation = recommendation_text(d.action, d.confidence);
    return sig;
}

} // namespace strategy
