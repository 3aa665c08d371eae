#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace shockmcp::logging
{

/// Case-insensitive level name ("debug", "INFO", "warning", "warn", "error", ...).
/// Unknown names map to info rather than silencing output.
spdlog::level::level_enum level_from_string(const std::string& name);

/// Apply the process-wide threshold and the line pattern
/// "<UTC timestamp> - <component> - <level> - <message>" to every logger.
void configure(const std::string& level_name);

/// Named stderr logger for one component, created on first use.
std::shared_ptr<spdlog::logger> get(const std::string& component);

} // namespace shockmcp::logging
