#include "parkour/animation/BlendingConfig.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace parkour::animation
{

namespace
{
using json = nlohmann::json;

bool Fail(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
    return false;
}

// Missing keys and wrong types leave the field at its current value
void ReadFloat(const json& node, const char* key, float& value)
{
    if (node.contains(key) && node[key].is_number())
    {
        value = node[key].get<float>();
    }
}

void ReadBool(const json& node, const char* key, bool& value)
{
    if (node.contains(key) && node[key].is_boolean())
    {
        value = node[key].get<bool>();
    }
}

void ReadString(const json& node, const char* key, std::string& value)
{
    if (node.contains(key) && node[key].is_string())
    {
        value = node[key].get<std::string>();
    }
}

const json* Section(const json& root, const char* key)
{
    if (root.contains(key) && root[key].is_object())
    {
        return &root[key];
    }
    return nullptr;
}

void ApplyJson(const json& root, BlendingConfig& config)
{
    if (const json* node = Section(root, "speed_thresholds"))
    {
        ReadFloat(*node, "idle_threshold", config.thresholds.idleThreshold);
        ReadFloat(*node, "walk_speed", config.thresholds.walkSpeed);
        ReadFloat(*node, "run_speed", config.thresholds.runSpeed);
    }
    if (const json* node = Section(root, "cycle"))
    {
        ReadFloat(*node, "walk_base_hz", config.cycle.walkBaseHz);
        ReadFloat(*node, "walk_slope", config.cycle.walkSlope);
        ReadFloat(*node, "run_base_hz", config.cycle.runBaseHz);
        ReadFloat(*node, "run_slope", config.cycle.runSlope);
    }
    ReadString(root, "jump_action", config.jumpAction);
    ReadFloat(root, "landing_duration", config.landingDuration);
    if (const json* node = Section(root, "crossfade"))
    {
        ReadFloat(*node, "locomotion", config.crossfade.locomotion);
        ReadFloat(*node, "jump", config.crossfade.jump);
    }
    if (const json* node = Section(root, "clips"))
    {
        ReadString(*node, "idle", config.clips.idle);
        ReadString(*node, "walk", config.clips.walk);
        ReadString(*node, "run", config.clips.run);
        ReadString(*node, "standing_jump", config.clips.standingJump);
        ReadString(*node, "running_jump", config.clips.runningJump);
    }
    if (const json* node = Section(root, "foot_placement"))
    {
        ReadBool(*node, "enabled", config.footPlacement.enabled);
        ReadFloat(*node, "raycast_distance", config.footPlacement.raycastDistance);
        ReadFloat(*node, "foot_offset", config.footPlacement.footOffset);
        ReadFloat(*node, "update_interval", config.footPlacement.updateInterval);
        ReadFloat(*node, "min_slope_angle", config.footPlacement.minSlopeAngle);
    }
    if (const json* node = Section(root, "hand_placement"))
    {
        ReadBool(*node, "enabled", config.handPlacement.enabled);
        ReadFloat(*node, "raycast_distance", config.handPlacement.raycastDistance);
        ReadFloat(*node, "hand_offset", config.handPlacement.handOffset);
        ReadFloat(*node, "update_interval", config.handPlacement.updateInterval);
        ReadFloat(*node, "match_duration", config.handPlacement.matchDuration);
    }
    if (const json* node = Section(root, "target_matching"))
    {
        ReadFloat(*node, "window_start", config.targetMatching.windowStart);
        ReadFloat(*node, "window_end", config.targetMatching.windowEnd);
        if (node->contains("ik_iterations") && (*node)["ik_iterations"].is_number_unsigned())
        {
            config.targetMatching.ikIterations = (*node)["ik_iterations"].get<std::uint32_t>();
        }
    }
    if (const json* node = Section(root, "stride"))
    {
        ReadFloat(*node, "walk", config.stride.walk);
        ReadFloat(*node, "run", config.stride.run);
    }
    ReadBool(root, "verbose_trace", config.verboseTrace);
}

json ToJson(const BlendingConfig& config)
{
    json root;
    root["asset_version"] = 1;
    root["speed_thresholds"] = {
        {"idle_threshold", config.thresholds.idleThreshold},
        {"walk_speed", config.thresholds.walkSpeed},
        {"run_speed", config.thresholds.runSpeed},
    };
    root["cycle"] = {
        {"walk_base_hz", config.cycle.walkBaseHz},
        {"walk_slope", config.cycle.walkSlope},
        {"run_base_hz", config.cycle.runBaseHz},
        {"run_slope", config.cycle.runSlope},
    };
    root["jump_action"] = config.jumpAction;
    root["landing_duration"] = config.landingDuration;
    root["crossfade"] = {
        {"locomotion", config.crossfade.locomotion},
        {"jump", config.crossfade.jump},
    };
    root["clips"] = {
        {"idle", config.clips.idle},
        {"walk", config.clips.walk},
        {"run", config.clips.run},
        {"standing_jump", config.clips.standingJump},
        {"running_jump", config.clips.runningJump},
    };
    root["foot_placement"] = {
        {"enabled", config.footPlacement.enabled},
        {"raycast_distance", config.footPlacement.raycastDistance},
        {"foot_offset", config.footPlacement.footOffset},
        {"update_interval", config.footPlacement.updateInterval},
        {"min_slope_angle", config.footPlacement.minSlopeAngle},
    };
    root["hand_placement"] = {
        {"enabled", config.handPlacement.enabled},
        {"raycast_distance", config.handPlacement.raycastDistance},
        {"hand_offset", config.handPlacement.handOffset},
        {"update_interval", config.handPlacement.updateInterval},
        {"match_duration", config.handPlacement.matchDuration},
    };
    root["target_matching"] = {
        {"window_start", config.targetMatching.windowStart},
        {"window_end", config.targetMatching.windowEnd},
        {"ik_iterations", config.targetMatching.ikIterations},
    };
    root["stride"] = {
        {"walk", config.stride.walk},
        {"run", config.stride.run},
    };
    root["verbose_trace"] = config.verboseTrace;
    return root;
}

bool LoadFromJson(const json& root, BlendingConfig& config, std::string* outError)
{
    if (!root.is_object())
    {
        return Fail(outError, "Locomotion config root must be an object");
    }

    BlendingConfig candidate = config;
    ApplyJson(root, candidate);

    std::string validationError;
    if (!candidate.Validate(&validationError))
    {
        return Fail(outError, "Invalid locomotion config: " + validationError);
    }

    config = std::move(candidate);
    return true;
}
} // namespace

const std::string& ClipNames::For(LocomotionClip clip) const
{
    switch (clip)
    {
        case LocomotionClip::Idle: return idle;
        case LocomotionClip::Walk: return walk;
        case LocomotionClip::Run: return run;
        case LocomotionClip::StandingJump: return standingJump;
        case LocomotionClip::RunningJump: return runningJump;
        default: return idle;
    }
}

bool BlendingConfig::Validate(std::string* outError) const
{
    const SpeedThresholds& t = thresholds;
    if (!(t.idleThreshold >= 0.0F && t.idleThreshold < t.walkSpeed && t.walkSpeed < t.runSpeed))
    {
        std::ostringstream message;
        message << "speed thresholds must satisfy 0 <= idle < walk < run (got idle=" << t.idleThreshold
                << ", walk=" << t.walkSpeed << ", run=" << t.runSpeed << ")";
        return Fail(outError, message.str());
    }
    if (!(cycle.walkBaseHz > 0.0F && cycle.runBaseHz > 0.0F))
    {
        return Fail(outError, "cycle base frequencies must be > 0");
    }
    if (!(cycle.walkSlope >= 0.0F && cycle.runSlope >= 0.0F))
    {
        return Fail(outError, "cycle slopes must be >= 0");
    }
    if (jumpAction.empty())
    {
        return Fail(outError, "jump_action must not be empty");
    }
    if (!(landingDuration >= 0.0F))
    {
        return Fail(outError, "landing_duration must be >= 0");
    }
    if (!(crossfade.locomotion >= 0.0F && crossfade.jump >= 0.0F))
    {
        return Fail(outError, "crossfade durations must be >= 0");
    }
    if (clips.idle.empty() || clips.walk.empty() || clips.run.empty() || clips.standingJump.empty() ||
        clips.runningJump.empty())
    {
        return Fail(outError, "clip names must not be empty");
    }
    if (!footPlacement.Validate(outError) || !handPlacement.Validate(outError))
    {
        return false;
    }
    const TargetMatchingSettings& tm = targetMatching;
    if (!(tm.windowStart >= 0.0F && tm.windowStart < tm.windowEnd && tm.windowEnd <= 1.0F))
    {
        return Fail(outError, "target_matching window must satisfy 0 <= start < end <= 1");
    }
    if (tm.ikIterations == 0)
    {
        return Fail(outError, "target_matching.ik_iterations must be > 0");
    }
    if (!(stride.walk > 0.0F && stride.run >= stride.walk))
    {
        return Fail(outError, "stride lengths must satisfy 0 < walk <= run");
    }
    return true;
}

bool BlendingConfig::LoadFromJsonFile(const std::string& path, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        return Fail(outError, "Cannot open locomotion config: " + path);
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        return Fail(outError, std::string{"Invalid locomotion config JSON: "} + ex.what());
    }

    return LoadFromJson(root, *this, outError);
}

bool BlendingConfig::LoadFromJsonString(const std::string& text, std::string* outError)
{
    json root;
    try
    {
        root = json::parse(text);
    }
    catch (const std::exception& ex)
    {
        return Fail(outError, std::string{"Invalid locomotion config JSON: "} + ex.what());
    }

    return LoadFromJson(root, *this, outError);
}

bool BlendingConfig::SaveToJsonFile(const std::string& path, std::string* outError) const
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        return Fail(outError, "Cannot write locomotion config: " + path);
    }

    stream << ToJson(*this).dump(2) << "\n";
    return true;
}

std::string BlendingConfig::ToJsonString() const
{
    return ToJson(*this).dump(2);
}

} // namespace parkour::animation
