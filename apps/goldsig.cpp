#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "app/logging.hpp"
#include "app/session.hpp"
#include "data/alpha_vantage_source.hpp"
#include "data/bar_source.hpp"
#include "data/csv_source.hpp"
#include "data/demo_source.hpp"
#include "data/yahoo_source.hpp"
#include "strategy/signal_json.hpp"
#include "ui/console_view.hpp"

using json = nlohmann::json;

namespace {

constexpr int kOk = 0;
constexpr int kAnalysisFailed = 1;
constexpr int kUsage = 2;

struct CliOptions {
    std::string command{"interactive"};
    std::string arg;
    std::string config_path;
    std::string csv_path;
    std::optional<data::DemoScenario> demo;
    std::optional<std::string> log_level;
    bool json{false};
    bool color{true};
};

void print_usage(){
    std::cout <<
        "Usage: goldsig [options] [command]\n"
        "\n"
        "Commands:\n"
        "  interactive          menu driven session (default)\n"
        "  quick [timeframe]    single analysis (1d, 2d, 5d; default 1d)\n"
        "  multi                analysis on every configured timeframe\n"
        "  backtest [timeframe] single analysis plus basic metrics (default 5d)\n"
        "  info                 configuration overview\n"
        "\n"
        "Options:\n"
        "  --config <file>      JSON configuration\n"
        "  --csv <file>         read bars from CSV instead of Yahoo Finance\n"
        "  --demo [scenario]    synthetic bars: normal, bullish, bearish, sideways\n"
        "  --json               print results as JSON\n"
        "  --no-color           plain text output\n"
        "  --log-level <level>  trace, debug, info, warn, error, critical, off\n";
}

std::optional<CliOptions> parse_args(int argc, char** argv){
    CliOptions o;
    std::vector<std::string> positional;
    for (int i=1;i<argc;++i){
        const std::string a = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i+1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };
        if (a=="--config"){ auto v = next(); if (!v) return std::nullopt; o.config_path = *v; }
        else if (a=="--csv"){ auto v = next(); if (!v) return std::nullopt; o.csv_path = *v; }
        else if (a=="--log-level"){ auto v = next(); if (!v) return std::nullopt; o.log_level = *v; }
        else if (a=="--json") o.json = true;
        else if (a=="--no-color") o.color = false;
        else if (a=="--demo"){
            o.demo = data::DemoScenario::Normal;
            if (i+1 < argc){
                if (auto sc = data::parse_scenario(argv[i+1])){ o.demo = *sc; ++i; }
            }
        }
        else if (a=="-h" || a=="--help") return std::nullopt;
        else if (!a.empty() && a[0]=='-') { std::cerr << "Unknown option: " << a << "\n"; return std::nullopt; }
        else positional.push_back(a);
    }
    if (positional.size() > 2) return std::nullopt;
    if (!positional.empty()) o.command = positional[0];
    if (positional.size() == 2) o.arg = positional[1];
    if (!o.csv_path.empty() && o.demo) { std::cerr << "--csv and --demo are exclusive\n"; return std::nullopt; }
    return o;
}

std::int64_t now_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::unique_ptr<data::IBarSource> make_source(const CliOptions& o, const core::AppConfig& cfg){
    const auto& d = cfg.data;
    if (!o.csv_path.empty()) return std::make_unique<data::CsvBarSource>(o.csv_path);
    if (o.demo) return std::make_unique<data::DemoBarSource>(d.demo_seed, d.demo_bars, *o.demo, now_ms());

    // live data first, demo bars as the last resort
    std::vector<std::unique_ptr<data::IBarSource>> chain;
    if (!d.alpha_vantage_api_key.empty()) chain.push_back(std::make_unique<data::AlphaVantageBarSource>(d));
    chain.push_back(std::make_unique<data::YahooBarSource>(d));
    chain.push_back(std::make_unique<data::DemoBarSource>(d.demo_seed, d.demo_bars, data::DemoScenario::Normal, now_ms()));
    return std::make_unique<data::FallbackBarSource>(std::move(chain));
}

json error_json(const core::Error& e){
    return json{{"signal", "ERROR"}, {"error", e.describe()}};
}

int run_quick(app::Session& s, const ui::ConsoleView& view, const CliOptions& o, const std::string& tf){
    auto r = s.run_single(tf);
    if (o.json){
        std::cout << (r? strategy::to_json(r.value()) : error_json(r.error())).dump(2) << "\n";
    } else if (r){
        std::cout << view.signal(r.value(), s.config().data.symbol);
    } else {
        std::cout << view.error(r.error().describe());
    }
    return r? kOk : kAnalysisFailed;
}

int run_multi(app::Session& s, const ui::ConsoleView& view, const CliOptions& o){
    const auto results = s.run_multi();
    bool any = false;
    for (const auto& e : results) any = any || e.second.ok();
    if (o.json){
        json j = json::object();
        for (const auto& e : results)
            j[e.first] = e.second? strategy::to_json(e.second.value()) : error_json(e.second.error());
        j["consensus"] = app::multi_consensus(results);
        std::cout << j.dump(2) << "\n";
    } else {
        std::cout << view.multi(results, s.config());
    }
    return any? kOk : kAnalysisFailed;
}

int run_backtest(app::Session& s, const ui::ConsoleView& view, const CliOptions& o, const std::string& tf){
    auto r = s.run_backtest(tf);
    if (o.json){
        json j{{"mode", "BACKTEST"}, {"timeframe", tf}};
        if (r){
            const auto& rep = r.value();
            j["result"] = strategy::to_json(rep.signal);
            j["performance_metrics"] = json{
                {"signal_strength", rep.signal_strength},
                {"confidence_score", rep.confidence},
                {"risk_reward_ratio", rep.risk_reward_ratio},
                {"potential_risk", rep.potential_risk},
                {"potential_reward", rep.potential_reward},
            };
        } else {
            j["status"] = "FAILED";
            j["error"] = r.error().describe();
        }
        std::cout << j.dump(2) << "\n";
    } else if (r){
        std::cout << view.signal(r.value().signal, s.config().data.symbol) << view.backtest(r.value());
    } else {
        std::cout << view.error(r.error().describe());
    }
    return r? kOk : kAnalysisFailed;
}

int run_interactive(app::Session& s, const ui::ConsoleView& view, const CliOptions& o){
    const auto& tfs = s.config().timeframes;
    std::cout << view.banner();
    for (;;){
        std::cout << "\n" << view.menu(s.config()) << "\nEnter your choice: " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) break;
        std::size_t choice = 0;
        try { choice = std::stoul(line); } catch (const std::exception&) { choice = 0; }

        if (choice >= 1 && choice <= tfs.size()) run_quick(s, view, o, tfs[choice-1].key);
        else if (choice == tfs.size()+1) run_multi(s, view, o);
        else if (choice == tfs.size()+2) std::cout << view.info(s.config(), s.source().name());
        else if (choice == tfs.size()+3) break;
        else std::cout << view.error(fmt::format("Invalid choice. Please enter 1-{}.", tfs.size()+3));
    }
    std::cout << view.summary(s.summary());
    return kOk;
}

} // namespace

int main(int argc, char** argv){
    const auto opts = parse_args(argc, argv);
    if (!opts){ print_usage(); return kUsage; }

    core::AppConfig cfg;
    if (!opts->config_path.empty()){
        auto loaded = core::load_config(opts->config_path);
        if (!loaded){ std::cerr << loaded.error().describe() << "\n"; return kUsage; }
        cfg = std::move(loaded).value();
    }
    if (opts->log_level) cfg.logging.level = *opts->log_level;
    if (cfg.data.alpha_vantage_api_key.empty()){
        if (const char* key = std::getenv("ALPHA_VANTAGE_API_KEY")) cfg.data.alpha_vantage_api_key = key;
    }

    auto logging = app::init_logging(cfg.logging);
    if (!logging){ std::cerr << logging.error().describe() << "\n"; return kUsage; }

    app::Session session(cfg, make_source(*opts, cfg));
    const ui::ConsoleView view(opts->color && !opts->json);

    const std::string& cmd = opts->command;
    if (cmd == "quick")       return run_quick(session, view, *opts, opts->arg.empty()? "1d" : opts->arg);
    if (cmd == "multi")       return run_multi(session, view, *opts);
    if (cmd == "backtest")    return run_backtest(session, view, *opts, opts->arg.empty()? "5d" : opts->arg);
    if (cmd == "info")        { std::cout << view.info(session.config(), session.source().name()); return kOk; }
    if (cmd == "interactive") return run_interactive(session, view, *opts);

    spdlog::error("Unknown command: {}", cmd);
    print_usage();
    return kUsage;
}
