#include "app/session.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

using core::Direction;

namespace app {

Session::Session(core::AppConfig cfg, std::unique_ptr<data::IBarSource> source)
: cfg_(std::move(cfg)), source_(std::move(source)), generator_(cfg_.analysis),
  started_(std::chrono::system_clock::now()) {}

core::Result<strategy::CompositeSignal> Session::run_single(const std::string& timeframe){
    const auto* tf = cfg_.find_timeframe(timeframe);
    if (!tf) return core::config_error(fmt::format("unknown timeframe '{}'", timeframe));

    spdlog::info("Starting analysis: {} ({})", tf->description, source_->name());
    auto bars = source_->fetch(*tf);
    if (!bars){
        spdlog::error("Failed to fetch market data: {}", bars.error().describe());
        return bars.error();
    }
    auto valid = data::validate_for_analysis(std::move(bars).value(), cfg_.data.min_bars);
    if (!valid){
        spdlog::error("Data validation failed: {}", valid.error().message);
        return valid.error();
    }
    spdlog::info("Fetched {} data points", valid.value().size());

    auto sig = generator_.generate(valid.value());
    if (sig.is_error()){
        spdlog::error("Signal generation failed: {}", sig.error);
        return core::Error{core::ErrorKind::Signal, sig.error};
    }

    records_.push_back({sig.time_ms, sig.direction, sig.strength, sig.confidence});
    spdlog::info("{} signal, strength {:.2f}, confidence {:.1f}/10",
                 core::to_string(sig.direction), sig.strength, sig.confidence);
    return sig;
}

MultiResult Session::run_multi(){
    MultiResult out;
    for (const auto& tf : cfg_.timeframes)
        out.emplace_back(tf.key, run_single(tf.key));
    return out;
}

core::Result<BacktestReport> Session::run_backtest(const std::string& timeframe){
    auto r = run_single(timeframe);
    if (!r) return r.error();

    BacktestReport rep;
    rep.timeframe = timeframe;
    rep.signal = std::move(r).value();
    rep.signal_strength   = rep.signal.strength;
    rep.confidence        = rep.signal.confidence;
    rep.risk_reward_ratio = rep.signal.risk.risk_reward_ratio;
    rep.potential_risk    = rep.signal.risk.risk_amount;
    rep.potential_reward  = rep.signal.risk.reward_amount;
    return rep;
}

SessionSummary Session::summary() const {
    SessionSummary s;
    s.started = started_;
    s.runtime_minutes = std::chrono::duration<double>(std::chrono::system_clock::now() - started_).count() / 60.0;
    s.analyses = records_.size();
    for (const auto& r : records_){
        if (r.direction == Direction::Buy) ++s.buy;
        else if (r.direction == Direction::Sell) ++s.sell;
        else if (r.direction == Direction::Hold) ++s.hold;
    }
    return s;
}

std::string multi_consensus(const MultiResult& results){
    std::size_t buy=0, sell=0, hold=0, n=0;
    for (const auto& entry : results){
        const auto& r = entry.second;
        if (!r) continue;
        ++n;
        switch (r.value().direction){
            case Direction::Buy:  ++buy; break;
            case Direction::Sell: ++sell; break;
            default:              ++hold; break;
        }
    }
    if (n == 0) return "NO DATA";
    if (buy > sell && buy > hold)  return fmt::format("BUY CONSENSUS ({}/{})", buy, n);
    if (sell > buy && sell > hold) return fmt::format("SELL CONSENSUS ({}/{})", sell, n);
    return "MIXED/HOLD";
}

} // namespace app
