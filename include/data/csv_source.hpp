#pragma once
#include <istream>
#include <string>
#include "data/bar_source.hpp"

namespace data {

// Header line, then "time_ms,open,high,low,close,volume" rows. Blank lines are
// skipped; a malformed row fails the whole load with its line number.
core::Result<core::BarSeries> parse_csv(std::istream& in);

// Bars from a local CSV file. The timeframe is ignored: the file is what it is.
class CsvBarSource final : public IBarSource {
public:
    explicit CsvBarSource(std::string path) : path_(std::move(path)) {}

    std::string name() const override { return "csv:" + path_; }
    core::Result<core::BarSeries> fetch(const core::TimeframeSpec& tf) override;

private:
    std::string path_;
};

} // namespace data
