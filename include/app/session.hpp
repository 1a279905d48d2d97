#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "core/config.hpp"
#include "core/result.hpp"
#include "data/bar_source.hpp"
#include "strategy/signal_generator.hpp"

namespace app {

// One line of the in-memory session log
struct SignalRecord {
    std::int64_t time_ms{};
    core::Direction direction{core::Direction::Hold};
    double strength{0.0};
    double confidence{0.0};
};

struct BacktestReport {
    std::string timeframe;
    strategy::CompositeSignal signal;
    double signal_strength{0.0};
    double confidence{0.0};
    double risk_reward_ratio{0.0};
    double potential_risk{0.0};
    double potential_reward{0.0};
};

struct SessionSummary {
    std::chrono::system_clock::time_point started;
    double runtime_minutes{0.0};
    std::size_t analyses{0};
    std::size_t buy{0}, sell{0}, hold{0};
};

// timeframe key -> analysis outcome
using MultiResult = std::vector<std::pair<std::string, core::Result<strategy::CompositeSignal>>>;

// Drives analyses for the CLI: fetch, validate, generate, log. Keeps the
// signals of the current process only.
class Session {
public:
    Session(core::AppConfig cfg, std::unique_ptr<data::IBarSource> source);

    const core::AppConfig& config() const { return cfg_; }
    const data::IBarSource& source() const { return *source_; }

    // ERROR signals come back as an error result and are not recorded
    core::Result<strategy::CompositeSignal> run_single(const std::string& timeframe);

    MultiResult run_multi();

    // Re-runs a single analysis and attaches basic metrics
    core::Result<BacktestReport> run_backtest(const std::string& timeframe);

    const std::vector<SignalRecord>& records() const { return records_; }
    SessionSummary summary() const;

private:
    core::AppConfig cfg_;
    std::unique_ptr<data::IBarSource> source_;
    strategy::SignalGenerator generator_;
    std::chrono::system_clock::time_point started_;
    std::vector<SignalRecord> records_;
};

// "BUY CONSENSUS (2/3)", "SELL CONSENSUS (n/m)", "MIXED/HOLD" or "NO DATA"
std::string multi_consensus(const MultiResult& results);

} // namespace app
