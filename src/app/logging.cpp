#include "app/logging.hpp"
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <fmt/format.h>

namespace app {

core::Result<bool> init_logging(const core::LoggingSettings& settings){
    const auto level = spdlog::level::from_str(settings.level);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && settings.level != "off")
        return core::config_error(fmt::format("unknown log level '{}'", settings.level));

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!settings.file.empty()){
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file, false));
        } catch (const spdlog::spdlog_ex& e) {
            return core::config_error(fmt::format("cannot open log file '{}': {}", settings.file, e.what()));
        }
    }

    auto logger = std::make_shared<spdlog::logger>("goldsig", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    return true;
}

} // namespace app
