#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "data/bar_source.hpp"

namespace data {

// Alpha Vantage TIME_SERIES_INTRADAY. Needs an API key; the free tier allows a
// handful of calls per minute, so requests share the configured throttle.
class AlphaVantageBarSource final : public IBarSource {
public:
    explicit AlphaVantageBarSource(core::DataSettings cfg)
    : cfg_(std::move(cfg)), throttle_(cfg_.min_request_interval_s) {}

    std::string name() const override { return "alphavantage:" + cfg_.symbol; }
    core::Result<core::BarSeries> fetch(const core::TimeframeSpec& tf) override;

private:
    core::DataSettings cfg_;
    RequestThrottle throttle_;
};

// Intraday payload -> bars, oldest first, keeping only bars within window_ms of
// the newest one (window_ms <= 0 keeps everything). "Error Message" and "Note"
// (rate limit) replies are Data errors, as is any payload of the wrong shape.
core::Result<core::BarSeries> parse_alpha_vantage(const nlohmann::json& payload,
                                                  const std::string& av_interval,
                                                  std::int64_t window_ms);

} // namespace data
