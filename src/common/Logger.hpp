#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace jds {

// Installs the "jds" console logger as spdlog's default. Call once at startup.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// "trace", "debug", "info", "warn", "error", "critical"; anything else is info.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace jds
