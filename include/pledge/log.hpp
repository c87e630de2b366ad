#ifndef PLEDGE_LOG_HPP
#define PLEDGE_LOG_HPP

#include <string_view>

#include <spdlog/spdlog.h>

namespace pledge {
namespace log {

// Map a config level name ("trace" .. "off") to spdlog; throws ConfigError
spdlog::level::level_enum parse_level(std::string_view name);

// Apply the configured level to the default logger
void init(std::string_view level);

} // namespace log
} // namespace pledge

#endif // PLEDGE_LOG_HPP
