#pragma once
#include <cstdint>
#include <string>
#include "core/config.hpp"
#include "app/session.hpp"
#include "strategy/signal.hpp"

namespace ui {

// Text rendering of analysis results. Every method returns the finished text;
// printing is the caller's business.
class ConsoleView {
public:
    explicit ConsoleView(bool color = true) : color_(color) {}

    std::string banner() const;
    std::string menu(const core::AppConfig& cfg) const;
    std::string signal(const strategy::CompositeSignal& s, const std::string& symbol) const;
    std::string multi(const app::MultiResult& results, const core::AppConfig& cfg) const;
    std::string backtest(const app::BacktestReport& rep) const;
    std::string summary(const app::SessionSummary& s) const;
    std::string info(const core::AppConfig& cfg, const std::string& source_name) const;
    std::string error(const std::string& msg) const;

private:
    std::string paint(core::Direction d, const std::string& text) const;
    std::string heading(const std::string& text) const;

    bool color_;
};

std::string format_time(std::int64_t time_ms);

} // namespace ui
