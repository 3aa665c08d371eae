#pragma once
#include "shockmcp/types.hpp"

namespace shockmcp::safety
{

/// Outcome of clamping one requested intensity.
struct ClampDecision
{
    int applied{0};
    bool adjusted{false};
};

/// Upper bound for SHOCK intensity derived from the configured limit.
///
/// The limit is fixed at construction. Only SHOCK is ceiling-limited; VIBRATE and BEEP
/// pass through untouched whatever the limit, and STOP never reaches the clamp.
class SafetyClamp
{
  public:
    static constexpr int MAX_INTENSITY = 100;

    /// @param safety_limit 0 = unlimited, otherwise capped at MAX_INTENSITY
    explicit SafetyClamp(int safety_limit = 0) : safety_limit_(safety_limit) {}

    int safety_limit() const
    {
        return safety_limit_;
    }

    /// 100 when unlimited, otherwise min(limit, 100).
    int effective_ceiling() const;

    ClampDecision clamp(ToolName tool, int requested) const;

  private:
    int safety_limit_;
};

} // namespace shockmcp::safety
