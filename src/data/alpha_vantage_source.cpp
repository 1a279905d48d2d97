#include "data/alpha_vantage_source.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <vector>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

using json = nlohmann::json;

namespace data {

namespace {
// days since 1970-01-01 for a proleptic Gregorian date
std::int64_t days_from_civil(int y, int m, int d){
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

// "YYYY-MM-DD HH:MM:SS" (or date only) read as UTC
bool parse_timestamp(const std::string& s, std::int64_t& out_ms){
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    const int n = std::sscanf(s.c_str(), "%4d-%2d-%2d %2d:%2d:%2d", &y, &mo, &d, &h, &mi, &sec);
    if (n != 3 && n != 6) return false;
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60 || h < 0 || mi < 0 || sec < 0)
        return false;
    const std::int64_t days = days_from_civil(y, mo, d);
    out_ms = ((days * 24 + h) * 60 + mi) * 60'000LL + sec * 1000LL;
    return true;
}

bool field(const json& row, const char* key, double& out){
    if (!row.contains(key)) return false;
    const auto& v = row.at(key);
    if (v.is_number()) { out = v.get<double>(); return true; }
    if (!v.is_string()) return false;
    std::size_t used = 0;
    const auto& s = v.get_ref<const std::string&>();
    out = std::stod(s, &used);
    return used == s.size();
}

core::Result<core::BarSeries> parse_series(const json& j, const std::string& av_interval, std::int64_t window_ms){
    if (!j.is_object()) return core::data_error("Alpha Vantage payload is not an object");
    if (j.contains("Error Message"))
        return core::data_error(fmt::format("Alpha Vantage error: {}", j.at("Error Message").dump()));
    if (j.contains("Note"))
        return core::data_error(fmt::format("Alpha Vantage rate limit: {}", j.at("Note").dump()));

    const std::string key = "Time Series (" + av_interval + ")";
    if (!j.contains(key) || !j.at(key).is_object() || j.at(key).empty())
        return core::data_error(fmt::format("No data received from Alpha Vantage ('{}' missing)", key));

    std::vector<core::Bar> bars; bars.reserve(j.at(key).size());
    std::size_t dropped = 0;
    for (const auto& item : j.at(key).items()){
        core::Bar b;
        const auto& row = item.value();
        bool ok = row.is_object() && parse_timestamp(item.key(), b.time_ms);
        try {
            ok = ok && field(row, "1. open", b.open) && field(row, "2. high", b.high)
                    && field(row, "3. low", b.low) && field(row, "4. close", b.close)
                    && field(row, "5. volume", b.volume);
        } catch (const std::invalid_argument&) {
            ok = false;
        } catch (const std::out_of_range&) {
            ok = false;
        }
        if (!ok){ ++dropped; continue; }
        b.high = std::max({b.high, b.open, b.close});
        b.low  = std::min({b.low, b.open, b.close});
        bars.push_back(b);
    }
    if (dropped) spdlog::debug("Alpha Vantage payload: dropped {} malformed rows", dropped);
    if (bars.empty()) return core::data_error("Alpha Vantage payload contained no complete bars");

    std::sort(bars.begin(), bars.end(), [](const core::Bar& a, const core::Bar& b){ return a.time_ms < b.time_ms; });
    bars.erase(std::unique(bars.begin(), bars.end(),
                           [](const core::Bar& a, const core::Bar& b){ return a.time_ms == b.time_ms; }),
               bars.end());
    if (window_ms > 0){
        const std::int64_t cutoff = bars.back().time_ms - window_ms;
        bars.erase(bars.begin(), std::find_if(bars.begin(), bars.end(),
                                              [cutoff](const core::Bar& b){ return b.time_ms >= cutoff; }));
    }
    return core::BarSeries::from_bars(std::move(bars));
}

} // namespace

core::Result<core::BarSeries> parse_alpha_vantage(const json& j, const std::string& av_interval, std::int64_t window_ms){
    try {
        return parse_series(j, av_interval, window_ms);
    } catch (const json::exception& e) {
        return core::data_error(fmt::format("Alpha Vantage payload has an unexpected shape: {}", e.what()));
    }
}

core::Result<core::BarSeries> AlphaVantageBarSource::fetch(const core::TimeframeSpec& tf){
    if (cfg_.alpha_vantage_api_key.empty()) return core::data_error("Alpha Vantage API key not configured");
    if (tf.av_interval.empty())
        return core::data_error(fmt::format("timeframe '{}' has no Alpha Vantage interval", tf.key));
    const auto window = interval_ms(tf.range);
    if (!window) return core::data_error(fmt::format("unsupported range '{}'", tf.range));

    throttle_.wait();
    cpr::Response r = cpr::Get(cpr::Url{cfg_.alpha_vantage_base_url},
                               cpr::Parameters{{"function", "TIME_SERIES_INTRADAY"},
                                               {"symbol", cfg_.symbol},
                                               {"interval", tf.av_interval},
                                               {"apikey", cfg_.alpha_vantage_api_key},
                                               {"outputsize", "full"}},
                               cpr::Timeout{cfg_.http_timeout_ms},
                               cpr::VerifySsl{true});
    // the key rides in the query string, so only the base URL is logged
    if (r.error)
        return core::data_error(fmt::format("GET {} failed: {}", cfg_.alpha_vantage_base_url, r.error.message));
    if (r.status_code != 200){
        spdlog::warn("GET {} : {} {}", cfg_.alpha_vantage_base_url, r.status_code, r.text.substr(0, 200));
        return core::data_error(fmt::format("Alpha Vantage HTTP {}", r.status_code));
    }
    try {
        auto bars = parse_alpha_vantage(json::parse(r.text), tf.av_interval, *window);
        if (bars) spdlog::info("Alpha Vantage: {} bars for {} ({})", bars.value().size(), cfg_.symbol, tf.av_interval);
        return bars;
    } catch (const json::exception& e) {
        return core::data_error(fmt::format("Alpha Vantage response not parseable: {}", e.what()));
    }
}

} // namespace data
