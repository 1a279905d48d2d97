#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "data/bar_source.hpp"

namespace data {

enum class DemoScenario { Normal, Bullish, Bearish, Sideways };

const char* to_string(DemoScenario s);
std::optional<DemoScenario> parse_scenario(const std::string& s);

// Synthetic gold-ETF-like bars (base price 200): trend + gaussian noise, plus a
// two-cycle sine in the Normal scenario. Same seed, same bars.
class DemoBarSource final : public IBarSource {
public:
    DemoBarSource(std::uint32_t seed, std::size_t bars, DemoScenario scenario, std::int64_t end_time_ms)
    : seed_(seed), bars_(bars), scenario_(scenario), end_time_ms_(end_time_ms) {}

    std::string name() const override { return std::string("demo:") + to_string(scenario_); }
    core::Result<core::BarSeries> fetch(const core::TimeframeSpec& tf) override;

private:
    std::uint32_t seed_;
    std::size_t bars_;
    DemoScenario scenario_;
    std::int64_t end_time_ms_;   // time of the last bar
};

} // namespace data
