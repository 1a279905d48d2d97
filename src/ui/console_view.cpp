#include "ui/console_view.hpp"
#include <ctime>
#include <fmt/format.h>
#include <fmt/color.h>
#include <fmt/chrono.h>

using core::Direction;

namespace ui {

std::string format_time(std::int64_t time_ms){
    const std::time_t t = static_cast<std::time_t>(time_ms / 1000);
    return fmt::format("{:%Y-%m-%d %H:%M:%S} UTC", fmt::gmtime(t));
}

std::string ConsoleView::paint(Direction d, const std::string& text) const {
    if (!color_) return text;
    switch (d){
        case Direction::Buy:  return fmt::format(fg(fmt::terminal_color::bright_green), "{}", text);
        case Direction::Sell:
        case Direction::Error: return fmt::format(fg(fmt::terminal_color::bright_red), "{}", text);
        default:              return fmt::format(fg(fmt::terminal_color::bright_yellow), "{}", text);
    }
}

std::string ConsoleView::heading(const std::string& text) const {
    if (!color_) return text;
    return fmt::format(fg(fmt::terminal_color::bright_blue) | fmt::emphasis::bold, "{}", text);
}

std::string ConsoleView::banner() const {
    const std::string rule(62, '=');
    return heading(fmt::format("{}\n{:^62}\n{:^62}\n{}\n", rule, "GOLD SIGNAL",
                               "Technical analysis for gold (EMA / RSI / ATR)", rule));
}

std::string ConsoleView::menu(const core::AppConfig& cfg) const {
    std::string out = heading("SELECT CHART TIMEFRAME") + "\n\n";
    std::size_t i = 1;
    for (const auto& tf : cfg.timeframes)
        out += fmt::format("  {}. {:<4} {}\n", i++, tf.key, tf.description);
    out += fmt::format("  {}. Multi-timeframe analysis\n", i++);
    out += fmt::format("  {}. View configuration\n", i++);
    out += fmt::format("  {}. Exit\n", i);
    return out;
}

std::string ConsoleView::signal(const strategy::CompositeSignal& s, const std::string& symbol) const {
    if (s.is_error()) return error(s.error);

    const std::string rule(80, '=');
    std::string out;
    out += heading(fmt::format("{}\nGOLD TRADING ANALYSIS - {}\n{}", rule, format_time(s.time_ms), rule)) + "\n";

    out += fmt::format("\nMARKET: {}   Current price: ${:.2f}\n", symbol, s.current_price);

    out += "\n" + heading("TRADING SIGNAL") + "\n";
    out += fmt::format("  Signal:     {}\n", paint(s.direction, core::to_string(s.direction)));
    out += fmt::format("  Strength:   {:.2f}\n", s.strength);
    out += fmt::format("  Confidence: {:.1f}/10 (consensus {:.0f}%)\n", s.confidence, s.consensus*100.0);
    out += fmt::format("  {}\n", paint(s.direction, s.recommendation));

    out += "\n" + heading("TECHNICAL BREAKDOWN") + "\n";
    for (const auto& c : s.components){
        out += fmt::format("  {:<16} {:<8} strength {:>5.2f}\n", strategy::to_string(c.factor),
                           paint(c.direction, core::to_string(c.direction)), c.strength);
        for (const auto& r : c.reasons) out += fmt::format("      - {}\n", r);
    }

    const auto& rk = s.risk;
    out += "\n" + heading("RISK MANAGEMENT") + "\n";
    out += fmt::format("  Stop loss:    ${:.2f}\n", rk.stop_loss);
    out += fmt::format("  Take profit:  ${:.2f}\n", rk.take_profit);
    out += fmt::format("  Risk:         ${:.2f}\n", rk.risk_amount);
    out += fmt::format("  Reward:       ${:.2f}\n", rk.reward_amount);
    out += fmt::format("  Risk/Reward:  1:{:.2f}\n", rk.risk_reward_ratio);
    out += fmt::format("  ATR:          {:.2f}\n", rk.atr_value);

    const auto& cx = s.context;
    out += "\n" + heading("MARKET CONTEXT") + "\n";
    out += fmt::format("  Trend:      {} (strength {:.2f})\n", core::to_string(cx.trend), cx.trend_strength);
    out += fmt::format("  RSI:        {}\n", core::to_string(cx.rsi_zone));
    out += fmt::format("  Volume:     {}\n", cx.high_volume? "HIGH" : "NORMAL");
    out += fmt::format("  Support:    ${:.2f}\n", cx.support);
    out += fmt::format("  Resistance: ${:.2f}\n", cx.resistance);
    return out;
}

std::string ConsoleView::multi(const app::MultiResult& results, const core::AppConfig& cfg) const {
    std::string out = "\n" + heading("MULTI-TIMEFRAME ANALYSIS SUMMARY") + "\n" + std::string(70, '=') + "\n";
    std::size_t valid = 0;
    out += fmt::format("{:<45} {:<8} {:<10} {:<12} {:<10}\n", "Timeframe", "Signal", "Strength", "Confidence", "Price");
    out += std::string(90, '-') + "\n";
    for (const auto& entry : results){
        const auto* tf = cfg.find_timeframe(entry.first);
        const std::string label = tf? tf->description : entry.first;
        if (!entry.second){
            out += fmt::format("{:<45} {}\n", label, paint(Direction::Error, entry.second.error().message));
            continue;
        }
        ++valid;
        const auto& s = entry.second.value();
        // pad before painting so escape codes do not break the columns
        out += fmt::format("{:<45} {} {:<10} {:<12} ${:<10.2f}\n", label,
                           paint(s.direction, fmt::format("{:<8}", core::to_string(s.direction))),
                           fmt::format("{:.1f}", s.strength), fmt::format("{:.1f}/10", s.confidence),
                           s.current_price);
    }
    if (valid == 0) return out + error("No valid results to display");
    out += fmt::format("\nConsensus signal: {}\n", app::multi_consensus(results));
    return out;
}

std::string ConsoleView::backtest(const app::BacktestReport& rep) const {
    std::string out = "\n" + heading(fmt::format("BACKTEST ({})", rep.timeframe)) + "\n";
    out += fmt::format("  Signal strength:   {:.2f}\n", rep.signal_strength);
    out += fmt::format("  Confidence:        {:.1f}/10\n", rep.confidence);
    out += fmt::format("  Risk/Reward:       {:.2f}\n", rep.risk_reward_ratio);
    out += fmt::format("  Potential risk:    ${:.2f}\n", rep.potential_risk);
    out += fmt::format("  Potential reward:  ${:.2f}\n", rep.potential_reward);
    return out;
}

std::string ConsoleView::summary(const app::SessionSummary& s) const {
    std::string out = "\n" + heading("SESSION SUMMARY") + "\n";
    out += fmt::format("  Runtime:            {:.1f} minutes\n", s.runtime_minutes);
    out += fmt::format("  Analyses performed: {}\n", s.analyses);
    out += fmt::format("  Signal distribution: BUY({}) SELL({}) HOLD({})\n", s.buy, s.sell, s.hold);
    return out;
}

std::string ConsoleView::info(const core::AppConfig& cfg, const std::string& source_name) const {
    const auto& a = cfg.analysis;
    std::string out = "\n" + heading("SYSTEM INFORMATION") + "\n" + std::string(50, '=') + "\n";
    out += fmt::format("  Symbol:          {}\n", cfg.data.symbol);
    out += fmt::format("  Data source:     {}\n", source_name);
    out += fmt::format("  EMA periods:     {}, {}\n", a.ema_short_period, a.ema_long_period);
    out += fmt::format("  RSI settings:    {} period, {:.0f}-{:.0f} levels\n", a.rsi_period, a.rsi_oversold, a.rsi_overbought);
    out += fmt::format("  ATR period:      {}\n", a.atr_period);
    out += fmt::format("  Weights:         trend {:.2f}, rsi {:.2f}, volume {:.2f}, structure {:.2f}\n",
                       a.weights.trend, a.weights.rsi, a.weights.volume, a.weights.structure);
    out += fmt::format("  Risk management: {:.1f}x ATR stop, {:.1f} take-profit ratio\n",
                       a.stop_loss_atr_multiplier, a.take_profit_ratio);
    out += fmt::format("  Minimum bars:    {}\n", cfg.data.min_bars);
    return out;
}

std::string ConsoleView::error(const std::string& msg) const {
    return paint(Direction::Error, "ERROR: " + msg) + "\n";
}

} // namespace ui
