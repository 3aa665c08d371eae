#include "shockmcp/safety/clamp.hpp"

#include <algorithm>

namespace shockmcp::safety
{

int SafetyClamp::effective_ceiling() const
{
    if (safety_limit_ <= 0)
        return MAX_INTENSITY;
    return std::min(safety_limit_, MAX_INTENSITY);
}

ClampDecision SafetyClamp::clamp(ToolName tool, int requested) const
{
    if (tool != ToolName::Shock)
        return {requested, false};

    int ceiling = effective_ceiling();
    if (requested > ceiling)
        return {ceiling, true};
    return {requested, false};
}

} // namespace shockmcp::safety
