#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/bar_series.hpp"
#include "core/config.hpp"
#include "core/result.hpp"

namespace data {

// Where bars come from. fetch() is not const: sources may throttle requests.
class IBarSource {
public:
    virtual ~IBarSource() = default;

    virtual std::string name() const = 0;

    virtual core::Result<core::BarSeries> fetch(const core::TimeframeSpec& tf) = 0;
};

// "5m" -> 300000, "1h" -> 3600000, "1d" -> 86400000; empty on anything else
std::optional<std::int64_t> interval_ms(const std::string& interval);

// Keeps consecutive requests at least min_interval_s apart; wait() sleeps out
// the remainder and then stamps the new request time.
class RequestThrottle {
public:
    explicit RequestThrottle(double min_interval_s) : min_interval_s_(min_interval_s) {}
    void wait();

private:
    double min_interval_s_;
    std::optional<std::chrono::steady_clock::time_point> last_request_;
};

// Minimum-length gate in front of the analysis
core::Result<core::BarSeries> validate_for_analysis(core::BarSeries bars, std::size_t min_bars);

// Tries each source in order, first success wins.
class FallbackBarSource final : public IBarSource {
public:
    explicit FallbackBarSource(std::vector<std::unique_ptr<IBarSource>> chain) : chain_(std::move(chain)) {}

    std::string name() const override;
    core::Result<core::BarSeries> fetch(const core::TimeframeSpec& tf) override;

private:
    std::vector<std::unique_ptr<IBarSource>> chain_;
};

} // namespace data
