#pragma once
#include "shockmcp/safety/clamp.hpp"
#include "shockmcp/types.hpp"

#include <string>
#include <vector>

namespace shockmcp::tools
{

constexpr int MIN_INTENSITY = 1;
constexpr int MAX_INTENSITY = 100;
constexpr int MIN_DURATION_MS = 300;
constexpr int MAX_DURATION_MS = 30000;
constexpr int DEFAULT_BEEP_INTENSITY = 50;

/// MCP tool entry as returned by tools/list.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    Json input_schema;
};

void to_json(Json& j, const ToolDescriptor& t);

/// The four device commands, described against the current safety ceiling.
///
/// Descriptors are rebuilt on every call; the SHOCK entry carries the ceiling both in
/// its description and as the `maximum` of its `intensity` property.
class ToolCatalog
{
  public:
    explicit ToolCatalog(const safety::SafetyClamp& clamp) : clamp_(clamp) {}

    std::vector<ToolDescriptor> list_tools() const;
    ToolDescriptor describe(ToolName tool) const;

  private:
    const safety::SafetyClamp& clamp_;
};

} // namespace shockmcp::tools
