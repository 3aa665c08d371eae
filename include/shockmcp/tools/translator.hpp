#pragma once
#include "shockmcp/safety/clamp.hpp"
#include "shockmcp/types.hpp"
#include "shockmcp/util/result.hpp"

#include <vector>

namespace shockmcp::tools
{

/// Commands for one tools/call, in target order, plus any clamp adjustments.
struct Translation
{
    std::vector<DownstreamCommand> commands;
    std::vector<IntensityAdjustment> adjustments;
};

/// Turns a tool invocation into a batch of OpenShock control commands.
///
/// All-or-nothing: the first invalid target fails the whole call and no commands are
/// produced.
class CommandTranslator
{
  public:
    explicit CommandTranslator(const safety::SafetyClamp& clamp) : clamp_(clamp) {}

    /// Normalize and validate the raw `shockers` array.
    ///
    /// Per target, in order: non-empty string `id`; for SHOCK/VIBRATE/BEEP both
    /// `intensity` and `duration` present as integers (BEEP fills an absent `intensity`
    /// with 50, an explicit null still counts as missing); then range checks
    /// (intensity 1..100, duration 300..30000 ms). STOP targets only need an id and
    /// always become intensity 0 / duration 300.
    static util::Result<std::vector<TargetSpec>> parse_targets(ToolName tool,
                                                               const Json& shockers);

    /// Map validated targets to commands, applying the safety clamp to SHOCK.
    Translation translate(ToolName tool, const std::vector<TargetSpec>& targets) const;

    /// parse_targets followed by translate.
    util::Result<Translation> translate(ToolName tool, const Json& shockers) const;

  private:
    const safety::SafetyClamp& clamp_;
};

} // namespace shockmcp::tools
