#include "shockmcp/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace shockmcp::logging
{

namespace
{
std::mutex g_create_mutex;
}

spdlog::level::level_enum level_from_string(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    auto level = spdlog::level::from_str(lower);
    // from_str answers "off" for anything it does not know
    if (level == spdlog::level::off && lower != "off")
        return spdlog::level::info;
    return level;
}

void configure(const std::string& level_name)
{
    spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%eZ - %n - %^%l%$ - %v",
                        spdlog::pattern_time_type::utc);
    spdlog::set_level(level_from_string(level_name));
}

std::shared_ptr<spdlog::logger> get(const std::string& component)
{
    std::lock_guard<std::mutex> lock(g_create_mutex);
    if (auto existing = spdlog::get(component))
        return existing;
    return spdlog::stderr_color_mt(component);
}

} // namespace shockmcp::logging
