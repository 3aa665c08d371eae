#include "shockmcp/tools/catalog.hpp"

#include <cassert>
#include <string>

using namespace shockmcp;

static Json item_properties(const Json& schema)
{
    return schema.at("properties").at("shockers").at("items").at("properties");
}

int main()
{
    // Fixed order and one entry per command
    {
        safety::SafetyClamp clamp(0);
        tools::ToolCatalog catalog(clamp);
        auto list = catalog.list_tools();
        assert(list.size() == 4);
        assert(list[0].name == "SHOCK");
        assert(list[1].name == "VIBRATE");
        assert(list[2].name == "BEEP");
        assert(list[3].name == "STOP");
        for (const auto& t : list)
        {
            assert(!t.description.empty());
            assert(t.input_schema["type"] == "object");
            assert(t.input_schema["required"] == Json::array({"shockers"}));
            assert(t.input_schema["properties"]["shockers"]["type"] == "array");
        }
    }

    // Unlimited: SHOCK advertises 100
    {
        safety::SafetyClamp clamp(0);
        tools::ToolCatalog catalog(clamp);
        auto shock = catalog.describe(ToolName::Shock);
        assert(item_properties(shock.input_schema)["intensity"]["maximum"] == 100);
        assert(shock.description.find("max intensity: 100") != std::string::npos);
    }

    // Limited: SHOCK carries the ceiling in text and schema; the others stay at 100
    {
        safety::SafetyClamp clamp(35);
        tools::ToolCatalog catalog(clamp);
        auto list = catalog.list_tools();
        auto shock_props = item_properties(list[0].input_schema);
        assert(shock_props["intensity"]["maximum"] == 35);
        assert(shock_props["intensity"]["minimum"] == 1);
        assert(list[0].description.find("35") != std::string::npos);
        assert(shock_props["intensity"]["description"].get<std::string>().find("1-35") !=
               std::string::npos);
        assert(item_properties(list[1].input_schema)["intensity"]["maximum"] == 100);
        assert(item_properties(list[2].input_schema)["intensity"]["maximum"] == 100);
    }

    // Durations and required fields
    {
        safety::SafetyClamp clamp(0);
        tools::ToolCatalog catalog(clamp);
        auto list = catalog.list_tools();
        for (int i = 0; i < 3; ++i)
        {
            auto duration = item_properties(list[i].input_schema)["duration"];
            assert(duration["minimum"] == 300);
            assert(duration["maximum"] == 30000);
        }
        auto items = [&](int i)
        { return list[i].input_schema["properties"]["shockers"]["items"]; };
        assert(items(0)["required"] == Json::array({"id", "intensity", "duration"}));
        assert(items(1)["required"] == Json::array({"id", "intensity", "duration"}));
        assert(items(2)["required"] == Json::array({"id", "duration"}));
        assert(item_properties(list[2].input_schema)["intensity"]["default"] == 50);
        assert(items(3)["required"] == Json::array({"id"}));
        assert(!item_properties(list[3].input_schema).contains("intensity"));
    }

    // JSON form uses MCP field names
    {
        safety::SafetyClamp clamp(0);
        tools::ToolCatalog catalog(clamp);
        Json j = catalog.describe(ToolName::Stop);
        assert(j["name"] == "STOP");
        assert(j.contains("description"));
        assert(j.contains("inputSchema"));
    }

    return 0;
}
