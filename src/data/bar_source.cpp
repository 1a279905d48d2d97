#include "data/bar_source.hpp"
#include <cctype>
#include <thread>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace data {

std::optional<std::int64_t> interval_ms(const std::string& s){
    if (s.size() < 2 || s.size() > 8) return std::nullopt;
    const char unit = s.back();
    const std::string num = s.substr(0, s.size()-1);
    for (char ch : num) if (!std::isdigit(static_cast<unsigned char>(ch))) return std::nullopt;
    const std::int64_t n = std::stoll(num);
    if (n <= 0) return std::nullopt;
    switch (unit){
        case 'm': return n * 60'000;
        case 'h': return n * 3'600'000;
        case 'd': return n * 86'400'000;
        default:  return std::nullopt;
    }
}

void RequestThrottle::wait(){
    using namespace std::chrono;
    if (last_request_){
        const auto min_gap = duration<double>(min_interval_s_);
        const auto elapsed = steady_clock::now() - *last_request_;
        if (elapsed < min_gap){
            const auto pause = duration_cast<milliseconds>(min_gap - elapsed);
            spdlog::info("Rate limiting: waiting {:.1f} seconds", pause.count()/1000.0);
            std::this_thread::sleep_for(pause);
        }
    }
    last_request_ = steady_clock::now();
}

core::Result<core::BarSeries> validate_for_analysis(core::BarSeries bars, std::size_t min_bars){
    if (bars.size() < min_bars)
        return core::data_error(fmt::format("Insufficient data points: {} (minimum {} required)", bars.size(), min_bars));
    return bars;
}

std::string FallbackBarSource::name() const {
    std::string out = "fallback(";
    for (std::size_t i=0;i<chain_.size();++i){
        if (i) out += " -> ";
        out += chain_[i]->name();
    }
    return out + ")";
}

core::Result<core::BarSeries> FallbackBarSource::fetch(const core::TimeframeSpec& tf){
    std::string failures;
    for (auto& src : chain_){
        spdlog::info("Fetching {} bars from {}", tf.key, src->name());
        auto r = src->fetch(tf);
        if (r) {
            spdlog::info("{} returned {} bars", src->name(), r.value().size());
            return r;
        }
        spdlog::warn("{} failed: {}", src->name(), r.error().describe());
        if (!failures.empty()) failures += "; ";
        failures += src->name() + ": " + r.error().message;
    }
    return core::data_error(failures.empty()? std::string("no bar source configured") : "all sources failed: " + failures);
}

} // namespace data
