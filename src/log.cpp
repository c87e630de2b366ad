// =============================================================================
// log.cpp - spdlog setup from configuration
// =============================================================================

#include "pledge/log.hpp"
#include "pledge/config.hpp"

#include <string>

namespace pledge {
namespace log {

spdlog::level::level_enum parse_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw ConfigError("Unknown log level: " + std::string(name));
}

void init(std::string_view level) {
    spdlog::set_level(parse_level(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [pledge] [%^%l%$] %v");
}

} // namespace log
} // namespace pledge
