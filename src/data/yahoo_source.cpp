#include "data/yahoo_source.hpp"
#include <algorithm>
#include <vector>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

using json = nlohmann::json;

namespace data {

namespace {
bool number_at(const json& arr, std::size_t i, double& out){
    if (!arr.is_array() || i >= arr.size() || !arr[i].is_number()) return false;
    out = arr[i].get<double>();
    return true;
}

core::Result<core::BarSeries> parse_chart(const json& j){
    if (!j.is_object() || !j.contains("chart"))
        return core::data_error("chart payload missing 'chart'");
    const auto& chart = j.at("chart");
    if (chart.contains("error") && !chart.at("error").is_null())
        return core::data_error(fmt::format("Yahoo error: {}", chart.at("error").dump()));
    if (!chart.contains("result") || !chart.at("result").is_array() || chart.at("result").empty())
        return core::data_error("No data received from Yahoo Finance");

    const auto& res = chart.at("result").at(0);
    if (!res.is_object() || !res.contains("timestamp") || !res.contains("indicators"))
        return core::data_error("Yahoo result without timestamps or quotes");
    const auto& ts = res.at("timestamp");
    if (!ts.is_array()) return core::data_error("Yahoo timestamps are not an array");
    const auto& indicators = res.at("indicators");
    if (!indicators.is_object() || !indicators.contains("quote"))
        return core::data_error("Yahoo result without quote block");
    const auto& quotes = indicators.at("quote");
    if (!quotes.is_array() || quotes.empty()) return core::data_error("Yahoo result without quote block");
    const auto& q = quotes.at(0);
    if (!q.is_object()) return core::data_error("Yahoo quote block is not an object");
    const json empty = json::array();
    const auto& o = q.contains("open")   ? q.at("open")   : empty;
    const auto& h = q.contains("high")   ? q.at("high")   : empty;
    const auto& l = q.contains("low")    ? q.at("low")    : empty;
    const auto& c = q.contains("close")  ? q.at("close")  : empty;
    const auto& v = q.contains("volume") ? q.at("volume") : empty;

    std::vector<core::Bar> bars; bars.reserve(ts.size());
    std::size_t dropped = 0;
    for (std::size_t i=0;i<ts.size();++i){
        core::Bar b;
        if (!ts[i].is_number_integer()
            || !number_at(o,i,b.open) || !number_at(h,i,b.high) || !number_at(l,i,b.low)
            || !number_at(c,i,b.close) || !number_at(v,i,b.volume)){
            ++dropped; continue;
        }
        b.time_ms = ts[i].get<std::int64_t>() * 1000;
        // Yahoo occasionally rounds high/low inside the body
        b.high = std::max({b.high, b.open, b.close});
        b.low  = std::min({b.low, b.open, b.close});
        if (!bars.empty() && b.time_ms <= bars.back().time_ms){ ++dropped; continue; }
        bars.push_back(b);
    }
    if (dropped) spdlog::debug("Yahoo payload: dropped {} incomplete rows", dropped);
    if (bars.empty()) return core::data_error("Yahoo payload contained no complete bars");
    return core::BarSeries::from_bars(std::move(bars));
}

} // namespace

core::Result<core::BarSeries> parse_yahoo_chart(const json& j){
    try {
        return parse_chart(j);
    } catch (const json::exception& e) {
        return core::data_error(fmt::format("Yahoo payload has an unexpected shape: {}", e.what()));
    }
}

core::Result<core::BarSeries> YahooBarSource::fetch(const core::TimeframeSpec& tf){
    throttle_.wait();
    const std::string url = cfg_.yahoo_base_url + "/v8/finance/chart/" + cfg_.symbol;
    cpr::Response r = cpr::Get(cpr::Url{url},
                               cpr::Parameters{{"interval", tf.interval}, {"range", tf.range}},
                               cpr::Header{{"User-Agent", "Mozilla/5.0 goldsig"}},
                               cpr::Timeout{cfg_.http_timeout_ms},
                               cpr::VerifySsl{true});
    if (r.error) return core::data_error(fmt::format("GET {} failed: {}", url, r.error.message));
    if (r.status_code >= 400){
        spdlog::warn("GET {} : {} {}", url, r.status_code, r.text.substr(0, 200));
        return core::data_error(fmt::format("Yahoo HTTP {}", r.status_code));
    }
    try {
        return parse_yahoo_chart(json::parse(r.text));
    } catch (const json::exception& e) {
        return core::data_error(fmt::format("Yahoo response not parseable: {}", e.what()));
    }
}

} // namespace data
