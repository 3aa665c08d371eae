#include "shockmcp/safety/clamp.hpp"

#include <cassert>

using namespace shockmcp;
using shockmcp::safety::SafetyClamp;

int main()
{
    // Unlimited: ceiling is the hard maximum and nothing is adjusted
    {
        SafetyClamp clamp(0);
        assert(clamp.effective_ceiling() == 100);
        for (int r = 1; r <= 100; ++r)
        {
            auto d = clamp.clamp(ToolName::Shock, r);
            assert(d.applied == r);
            assert(!d.adjusted);
        }
    }

    // Limits above 100 behave as 100
    {
        SafetyClamp clamp(250);
        assert(clamp.safety_limit() == 250);
        assert(clamp.effective_ceiling() == 100);
        assert(!clamp.clamp(ToolName::Shock, 100).adjusted);
    }

    // Every limit: SHOCK above the limit is lowered to it, at or below passes through
    for (int limit = 1; limit <= 100; ++limit)
    {
        SafetyClamp clamp(limit);
        assert(clamp.effective_ceiling() == limit);
        for (int r = 1; r <= 100; ++r)
        {
            auto d = clamp.clamp(ToolName::Shock, r);
            if (r > limit)
            {
                assert(d.applied == limit);
                assert(d.adjusted);
            }
            else
            {
                assert(d.applied == r);
                assert(!d.adjusted);
            }
        }
    }

    // VIBRATE and BEEP are never touched, whatever the limit
    for (int limit = 0; limit <= 100; ++limit)
    {
        SafetyClamp clamp(limit);
        for (int r = 1; r <= 100; ++r)
        {
            auto v = clamp.clamp(ToolName::Vibrate, r);
            auto b = clamp.clamp(ToolName::Beep, r);
            assert(v.applied == r && !v.adjusted);
            assert(b.applied == r && !b.adjusted);
        }
    }

    // Scenario: limit 50, request 90
    {
        SafetyClamp clamp(50);
        auto d = clamp.clamp(ToolName::Shock, 90);
        assert(d.applied == 50);
        assert(d.adjusted);
    }

    return 0;
}
