#include "shockmcp/tools/translator.hpp"

#include "shockmcp/tools/catalog.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace shockmcp::tools
{

namespace
{

constexpr int STOP_INTENSITY = 0;
constexpr int STOP_DURATION_MS = 300;

using util::Result;

// Present-and-not-null lookup; explicit nulls are treated as absent.
const Json* find_value(const Json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;
    return &*it;
}

std::optional<std::string> range_error(const char* field, const std::string& id, int64_t value,
                                       int lo, int hi, const char* unit)
{
    if (value >= lo && value <= hi)
        return std::nullopt;
    return std::string(field) + " for shocker '" + id + "' must be between " +
           std::to_string(lo) + " and " + std::to_string(hi) + unit + " (got " +
           std::to_string(value) + ")";
}

} // namespace

Result<std::vector<TargetSpec>> CommandTranslator::parse_targets(ToolName tool,
                                                                 const Json& shockers)
{
    using Targets = std::vector<TargetSpec>;
    const std::string tool_name = to_string(tool);

    if (!shockers.is_array())
        return Result<Targets>::failure("'shockers' must be an array");

    Targets targets;
    targets.reserve(shockers.size());
    for (const auto& raw : shockers)
    {
        if (!raw.is_object())
            return Result<Targets>::failure("Missing shocker ID");

        const Json* id = find_value(raw, "id");
        if (!id || !id->is_string() || id->get_ref<const std::string&>().empty())
            return Result<Targets>::failure("Missing shocker ID");

        TargetSpec spec;
        spec.id = id->get<std::string>();

        if (tool == ToolName::Stop)
        {
            spec.intensity = STOP_INTENSITY;
            spec.duration = STOP_DURATION_MS;
            targets.push_back(std::move(spec));
            continue;
        }

        // Absent key only: {"intensity": null} stays missing.
        Json normalized = raw;
        if (tool == ToolName::Beep && !normalized.contains("intensity"))
            normalized["intensity"] = DEFAULT_BEEP_INTENSITY;

        const Json* intensity = find_value(normalized, "intensity");
        const Json* duration = find_value(normalized, "duration");
        if (!intensity || !duration)
            return Result<Targets>::failure(tool_name + " requires intensity and duration");
        if (!intensity->is_number_integer())
            return Result<Targets>::failure(tool_name + " intensity must be an integer");
        if (!duration->is_number_integer())
            return Result<Targets>::failure(tool_name + " duration must be an integer");

        auto requested_intensity = intensity->get<int64_t>();
        auto requested_duration = duration->get<int64_t>();
        if (auto err = range_error("Intensity", spec.id, requested_intensity, MIN_INTENSITY,
                                   MAX_INTENSITY, ""))
            return Result<Targets>::failure(*err);
        if (auto err = range_error("Duration", spec.id, requested_duration, MIN_DURATION_MS,
                                   MAX_DURATION_MS, " ms"))
            return Result<Targets>::failure(*err);

        spec.intensity = static_cast<int>(requested_intensity);
        spec.duration = static_cast<int>(requested_duration);
        targets.push_back(std::move(spec));
    }
    return Result<Targets>::success(std::move(targets));
}

Translation CommandTranslator::translate(ToolName tool,
                                         const std::vector<TargetSpec>& targets) const
{
    Translation out;
    out.commands.reserve(targets.size());
    const int type = command_type(tool);

    for (const auto& target : targets)
    {
        DownstreamCommand cmd{target.id, type, target.intensity, target.duration};
        if (tool == ToolName::Stop)
        {
            cmd.intensity = STOP_INTENSITY;
            cmd.duration = STOP_DURATION_MS;
        }
        else if (tool == ToolName::Shock)
        {
            auto decision = clamp_.clamp(tool, target.intensity);
            if (decision.adjusted)
                out.adjustments.push_back({target.id, target.intensity, decision.applied});
            cmd.intensity = decision.applied;
        }
        out.commands.push_back(std::move(cmd));
    }
    return out;
}

Result<Translation> CommandTranslator::translate(ToolName tool, const Json& shockers) const
{
    auto targets = parse_targets(tool, shockers);
    if (!targets)
        return Result<Translation>::failure(targets.error());
    return Result<Translation>::success(translate(tool, targets.value()));
}

} // namespace shockmcp::tools
