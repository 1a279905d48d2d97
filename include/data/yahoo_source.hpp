#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "data/bar_source.hpp"

namespace data {

// Yahoo Finance chart API (GET /v8/finance/chart/<symbol>). Requests closer
// together than min_request_interval_s wait out the remainder.
class YahooBarSource final : public IBarSource {
public:
    explicit YahooBarSource(core::DataSettings cfg)
    : cfg_(std::move(cfg)), throttle_(cfg_.min_request_interval_s) {}

    std::string name() const override { return "yahoo:" + cfg_.symbol; }
    core::Result<core::BarSeries> fetch(const core::TimeframeSpec& tf) override;

private:
    core::DataSettings cfg_;
    RequestThrottle throttle_;
};

// Chart payload -> bars. Rows with null fields or out-of-order timestamps are
// dropped; a payload of the wrong shape is a Data error, never an exception.
core::Result<core::BarSeries> parse_yahoo_chart(const nlohmann::json& payload);

} // namespace data
