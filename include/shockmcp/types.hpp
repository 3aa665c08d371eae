#pragma once
#include <nlohmann/json.hpp>
#include <array>
#include <optional>
#include <string>

namespace shockmcp
{

using Json = nlohmann::json;

/// The closed set of commands exposed as MCP tools.
enum class ToolName
{
    Shock,
    Vibrate,
    Beep,
    Stop
};

/// Catalog order used by tools/list and the root info endpoint.
constexpr std::array<ToolName, 4> ALL_TOOLS = {ToolName::Shock, ToolName::Vibrate, ToolName::Beep,
                                               ToolName::Stop};

inline std::string to_string(ToolName tool)
{
    switch (tool)
    {
    case ToolName::Shock:
        return "SHOCK";
    case ToolName::Vibrate:
        return "VIBRATE";
    case ToolName::Beep:
        return "BEEP";
    case ToolName::Stop:
        return "STOP";
    }
    return "STOP";
}

/// Exact, case-sensitive lookup; anything else is not a tool.
inline std::optional<ToolName> tool_name_from_string(const std::string& s)
{
    for (auto tool : ALL_TOOLS)
        if (to_string(tool) == s)
            return tool;
    return std::nullopt;
}

/// OpenShock control type for each tool (STOP=0, SHOCK=1, VIBRATE=2, BEEP=3).
inline int command_type(ToolName tool)
{
    switch (tool)
    {
    case ToolName::Stop:
        return 0;
    case ToolName::Shock:
        return 1;
    case ToolName::Vibrate:
        return 2;
    case ToolName::Beep:
        return 3;
    }
    return 0;
}

/// One typed entry of the `shockers` argument after normalization.
struct TargetSpec
{
    std::string id;
    int intensity{0};
    int duration{0}; ///< milliseconds
};

/// One element of the downstream `shocks` array.
struct DownstreamCommand
{
    std::string id;
    int type{0};
    int intensity{0};
    int duration{0};

    bool operator==(const DownstreamCommand& o) const
    {
        return id == o.id && type == o.type && intensity == o.intensity && duration == o.duration;
    }
};

/// Recorded whenever the safety clamp lowers a SHOCK intensity.
struct IntensityAdjustment
{
    std::string target_id;
    int requested{0};
    int applied{0};
};

// nlohmann::json adapters
inline void to_json(Json& j, const DownstreamCommand& c)
{
    j = Json{{"id", c.id}, {"type", c.type}, {"intensity", c.intensity}, {"duration", c.duration}};
}

inline void from_json(const Json& j, DownstreamCommand& c)
{
    c.id = j.at("id").get<std::string>();
    c.type = j.at("type").get<int>();
    c.intensity = j.at("intensity").get<int>();
    c.duration = j.at("duration").get<int>();
}

inline void to_json(Json& j, const IntensityAdjustment& a)
{
    j = Json{{"id", a.target_id}, {"requested", a.requested}, {"applied", a.applied}};
}

} // namespace shockmcp
