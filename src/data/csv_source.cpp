#include "data/csv_source.hpp"
#include <fstream>
#include <sstream>
#include <vector>
#include <stdexcept>
#include <fmt/format.h>

namespace data {

core::Result<core::BarSeries> parse_csv(std::istream& in){
    std::vector<core::Bar> bars;
    std::string line;
    std::size_t line_no = 1;
    // header row
    if (!std::getline(in, line)) return core::data_error("CSV is empty");

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back()=='\r') line.pop_back();
        if (line.empty()) continue;
        std::stringstream ss(line);
        std::string x; core::Bar b{};
        try {
            if (!std::getline(ss,x,',')) throw std::invalid_argument("time"); b.time_ms = std::stoll(x);
            if (!std::getline(ss,x,',')) throw std::invalid_argument("open"); b.open = std::stod(x);
            if (!std::getline(ss,x,',')) throw std::invalid_argument("high"); b.high = std::stod(x);
            if (!std::getline(ss,x,',')) throw std::invalid_argument("low"); b.low = std::stod(x);
            if (!std::getline(ss,x,',')) throw std::invalid_argument("close"); b.close = std::stod(x);
            if (!std::getline(ss,x,',')) throw std::invalid_argument("volume"); b.volume = std::stod(x);
        } catch (const std::exception& e) {
            return core::data_error(fmt::format("CSV line {}: bad or missing field ({})", line_no, e.what()));
        }
        bars.push_back(b);
    }
    if (bars.empty()) return core::data_error("CSV has no data rows");
    return core::BarSeries::from_bars(std::move(bars));
}

core::Result<core::BarSeries> CsvBarSource::fetch(const core::TimeframeSpec&){
    std::ifstream f(path_);
    if (!f.good()) return core::data_error(fmt::format("cannot open CSV '{}'", path_));
    return parse_csv(f);
}

} // namespace data
