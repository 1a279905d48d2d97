#include "core/config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace core {

std::optional<std::string> AnalysisConfig::validate() const {
    if (ema_short_period == 0 || ema_long_period == 0)
        return std::string("EMA periods must be positive");
    if (ema_short_period >= ema_long_period)
        return fmt::format("short EMA period {} must be below long EMA period {}", ema_short_period, ema_long_period);
    if (rsi_period == 0 || atr_period == 0 || sr_lookback == 0 || volume_period == 0)
        return std::string("RSI, ATR, lookback and volume periods must be positive");
    for (std::size_t p : {ema_short_period, ema_long_period, rsi_period, atr_period, sr_lookback, volume_period})
        if (p > kMaxPeriod) return fmt::format("period {} exceeds the maximum of {}", p, kMaxPeriod);
    if (rsi_oversold < 0 || rsi_overbought > 100 || rsi_oversold >= rsi_overbought)
        return fmt::format("RSI levels {}/{} must satisfy 0 <= oversold < overbought <= 100", rsi_oversold, rsi_overbought);
    if (weights.trend < 0 || weights.rsi < 0 || weights.volume < 0 || weights.structure < 0)
        return std::string("weights must be non-negative");
    if (stop_loss_atr_multiplier <= 0 || take_profit_ratio <= 0)
        return std::string("stop-loss multiplier and take-profit ratio must be positive");
    if (activation_threshold < 0)
        return std::string("activation threshold must be non-negative");
    return std::nullopt;
}

std::vector<TimeframeSpec> AppConfig::default_timeframes() {
    return {
        {"1d", "5m",  "1d", "1-day chart with 5-minute candles", "5min"},
        {"2d", "15m", "2d", "2-day chart with 15-minute candles", "15min"},
        {"5d", "30m", "5d", "5-day (weekly) chart with 30-minute candles", "30min"},
    };
}

const TimeframeSpec* AppConfig::find_timeframe(const std::string& key) const {
    for (const auto& tf : timeframes)
        if (tf.key == key) return &tf;
    return nullptr;
}

namespace {

template <class T>
void read(const json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    const auto& v = j.at(key);
    // get<size_t>() would wrap -1 around
    if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (!v.is_number_unsigned())
            throw std::invalid_argument(fmt::format("'{}' must be a non-negative integer, got {}", key, v.dump()));
    }
    out = v.get<T>();
}

void read_analysis(const json& j, AnalysisConfig& a) {
    read(j, "ema_short_period", a.ema_short_period);
    read(j, "ema_long_period", a.ema_long_period);
    read(j, "rsi_period", a.rsi_period);
    read(j, "rsi_overbought", a.rsi_overbought);
    read(j, "rsi_oversold", a.rsi_oversold);
    read(j, "atr_period", a.atr_period);
    read(j, "sr_lookback", a.sr_lookback);
    read(j, "volume_period", a.volume_period);
    read(j, "stop_loss_atr_multiplier", a.stop_loss_atr_multiplier);
    read(j, "take_profit_ratio", a.take_profit_ratio);
    read(j, "activation_threshold", a.activation_threshold);
    if (j.contains("weights")) {
        const auto& w = j.at("weights");
        read(w, "trend", a.weights.trend);
        read(w, "rsi", a.weights.rsi);
        read(w, "volume", a.weights.volume);
        read(w, "structure", a.weights.structure);
    }
}

void read_data(const json& j, DataSettings& d) {
    read(j, "symbol", d.symbol);
    read(j, "yahoo_base_url", d.yahoo_base_url);
    read(j, "alpha_vantage_base_url", d.alpha_vantage_base_url);
    read(j, "alpha_vantage_api_key", d.alpha_vantage_api_key);
    read(j, "http_timeout_ms", d.http_timeout_ms);
    read(j, "min_request_interval_s", d.min_request_interval_s);
    read(j, "min_bars", d.min_bars);
    read(j, "demo_seed", d.demo_seed);
    read(j, "demo_bars", d.demo_bars);
}

} // namespace

Result<AppConfig> parse_config(const std::string& text) {
    AppConfig cfg;
    try {
        const json j = json::parse(text);
        if (!j.is_object()) return config_error("config root must be a JSON object");
        if (j.contains("analysis")) read_analysis(j.at("analysis"), cfg.analysis);
        if (j.contains("data")) read_data(j.at("data"), cfg.data);
        if (j.contains("logging")) {
            read(j.at("logging"), "level", cfg.logging.level);
            read(j.at("logging"), "file", cfg.logging.file);
        }
        if (j.contains("timeframes")) {
            cfg.timeframes.clear();
            for (const auto& t : j.at("timeframes")) {
                TimeframeSpec tf;
                tf.key = t.at("key").get<std::string>();
                tf.interval = t.at("interval").get<std::string>();
                tf.range = t.at("range").get<std::string>();
                read(t, "description", tf.description);
                read(t, "av_interval", tf.av_interval);
                cfg.timeframes.push_back(std::move(tf));
            }
        }
    } catch (const json::exception& e) {
        return config_error(fmt::format("invalid config: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        return config_error(fmt::format("invalid config: {}", e.what()));
    }

    if (auto problem = cfg.analysis.validate()) return config_error(*problem);
    if (cfg.timeframes.empty()) return config_error("at least one timeframe is required");
    if (cfg.data.min_bars == 0) return config_error("data.min_bars must be positive");
    if (cfg.data.demo_bars == 0 || cfg.data.demo_bars > kMaxDemoBars)
        return config_error(fmt::format("data.demo_bars must be between 1 and {}", kMaxDemoBars));
    if (cfg.data.http_timeout_ms <= 0) return config_error("data.http_timeout_ms must be positive");
    return cfg;
}

Result<AppConfig> load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) return config_error(fmt::format("cannot open config file '{}'", path));
    std::stringstream ss; ss << f.rdbuf();
    return parse_config(ss.str());
}

} // namespace core
