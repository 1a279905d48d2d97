#pragma once
#include "core/config.hpp"
#include "core/result.hpp"

namespace app {

// Installs the default spdlog logger: colored stderr (stdout stays clean for
// --json output), plus a file sink when settings.file is set.
// Unknown level names are a Config error.
core::Result<bool> init_logging(const core::LoggingSettings& settings);

} // namespace app
