#include "shockmcp/tools/catalog.hpp"

namespace shockmcp::tools
{

namespace
{

Json id_property()
{
    return Json{{"type", "string"}, {"description", "Shocker ID"}};
}

Json intensity_property(const std::string& label, int maximum)
{
    return Json{{"type", "integer"},
                {"minimum", MIN_INTENSITY},
                {"maximum", maximum},
                {"description", label + " intensity (" + std::to_string(MIN_INTENSITY) + "-" +
                                    std::to_string(maximum) + ")"}};
}

Json duration_property()
{
    return Json{{"type", "integer"},
                {"minimum", MIN_DURATION_MS},
                {"maximum", MAX_DURATION_MS},
                {"description", "Duration in milliseconds (" + std::to_string(MIN_DURATION_MS) +
                                    "-" + std::to_string(MAX_DURATION_MS) + ")"}};
}

Json shockers_schema(const std::string& list_description, Json item_properties, Json required)
{
    Json items = {{"type", "object"},
                  {"properties", std::move(item_properties)},
                  {"required", std::move(required)}};
    return Json{{"type", "object"},
                {"properties",
                 {{"shockers",
                   {{"type", "array"},
                    {"description", list_description},
                    {"items", std::move(items)}}}}},
                {"required", Json::array({"shockers"})}};
}

} // namespace

void to_json(Json& j, const ToolDescriptor& t)
{
    j = Json{{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

ToolDescriptor ToolCatalog::describe(ToolName tool) const
{
    ToolDescriptor d;
    d.name = to_string(tool);
    switch (tool)
    {
    case ToolName::Shock:
    {
        int ceiling = clamp_.effective_ceiling();
        d.description = "Send shock command to OpenShock devices (max intensity: " +
                        std::to_string(ceiling) + ")";
        d.input_schema = shockers_schema("List of shockers to control",
                                         {{"id", id_property()},
                                          {"intensity", intensity_property("Shock", ceiling)},
                                          {"duration", duration_property()}},
                                         Json::array({"id", "intensity", "duration"}));
        break;
    }
    case ToolName::Vibrate:
        d.description = "Send vibrate command to OpenShock devices";
        d.input_schema =
            shockers_schema("List of shockers to control",
                            {{"id", id_property()},
                             {"intensity", intensity_property("Vibration", MAX_INTENSITY)},
                             {"duration", duration_property()}},
                            Json::array({"id", "intensity", "duration"}));
        break;
    case ToolName::Beep:
    {
        Json intensity = intensity_property("Beep", MAX_INTENSITY);
        intensity["default"] = DEFAULT_BEEP_INTENSITY;
        d.description = "Send beep/sound command to OpenShock devices";
        d.input_schema = shockers_schema(
            "List of shockers to control",
            {{"id", id_property()}, {"intensity", intensity}, {"duration", duration_property()}},
            Json::array({"id", "duration"}));
        break;
    }
    case ToolName::Stop:
        d.description = "Stop all commands on OpenShock devices";
        d.input_schema = shockers_schema("List of shocker IDs to stop", {{"id", id_property()}},
                                         Json::array({"id"}));
        break;
    }
    return d;
}

std::vector<ToolDescriptor> ToolCatalog::list_tools() const
{
    std::vector<ToolDescriptor> out;
    out.reserve(ALL_TOOLS.size());
    for (auto tool : ALL_TOOLS)
        out.push_back(describe(tool));
    return out;
}

} // namespace shockmcp::tools
