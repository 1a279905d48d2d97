#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include "core/result.hpp"

namespace core {

// Factor weights of the composite vote
struct Weights {
    double trend{0.4};
    double rsi{0.3};
    double volume{0.2};
    double structure{0.1};
};

// Upper bounds on window lengths and generated bar counts
constexpr std::size_t kMaxPeriod = 10'000;
constexpr std::size_t kMaxDemoBars = 1'000'000;

// Numeric parameters of the indicator engine and the signal composer.
// Passed by value at construction; nothing reads global state.
struct AnalysisConfig {
    std::size_t ema_short_period{9};
    std::size_t ema_long_period{21};
    std::size_t rsi_period{14};
    double rsi_overbought{70.0};
    double rsi_oversold{30.0};
    std::size_t atr_period{14};
    std::size_t sr_lookback{20};
    std::size_t volume_period{20};
    Weights weights{};
    double stop_loss_atr_multiplier{2.0};
    double take_profit_ratio{2.0};
    double activation_threshold{1.0};

    // Empty when the parameters are usable, otherwise the first problem found.
    std::optional<std::string> validate() const;
};

// Chart window: candle interval and history range of the data request
struct TimeframeSpec {
    std::string key;          // "1d", "2d", "5d"
    std::string interval;     // "5m"
    std::string range;        // "1d"
    std::string description;
    std::string av_interval;  // Alpha Vantage spelling of interval: "5min"
};

struct DataSettings {
    std::string symbol{"GLD"};
    std::string yahoo_base_url{"https://query1.finance.yahoo.com"};
    std::string alpha_vantage_base_url{"https://www.alphavantage.co/query"};
    std::string alpha_vantage_api_key;   // empty: Alpha Vantage is skipped
    int http_timeout_ms{10000};
    double min_request_interval_s{12.0};
    std::size_t min_bars{50};
    std::uint32_t demo_seed{42};
    std::size_t demo_bars{100};
};

struct LoggingSettings {
    std::string level{"info"};
    std::string file;          // empty: console only
};

struct AppConfig {
    AnalysisConfig analysis{};
    DataSettings data{};
    LoggingSettings logging{};
    std::vector<TimeframeSpec> timeframes{default_timeframes()};

    const TimeframeSpec* find_timeframe(const std::string& key) const;

    static std::vector<TimeframeSpec> default_timeframes();
};

// Reads a JSON config file; absent keys keep their defaults. Negative or
// fractional numbers for count/period keys are rejected.
Result<AppConfig> load_config(const std::string& path);

// Same, from JSON text (used by load_config and tests).
Result<AppConfig> parse_config(const std::string& text);

} // namespace core
