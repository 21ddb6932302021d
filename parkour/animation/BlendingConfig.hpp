#pragma once

#include "parkour/animation/AnimationPlayback.hpp"
#include "parkour/targeting/PlacementSettings.hpp"

#include <cstdint>
#include <string>

namespace parkour::animation
{

// Horizontal speed boundaries (m/s), must satisfy 0 <= idle < walk < run
struct SpeedThresholds
{
    float idleThreshold = 0.1F;
    float walkSpeed = 2.0F;
    float runSpeed = 8.0F;
};

// Step cycle frequency: base + slope * (speed - range start)
struct CycleSettings
{
    float walkBaseHz = 1.0F;
    float walkSlope = 0.5F;
    float runBaseHz = 2.0F;
    float runSlope = 0.3F;
};

struct CrossfadeSettings
{
    float locomotion = 0.2F;
    float jump = 0.1F;
};

struct ClipNames
{
    std::string idle = "idle";
    std::string walk = "walk";
    std::string run = "run";
    std::string standingJump = "standing_jump";
    std::string runningJump = "running_jump";

    [[nodiscard]] const std::string& For(LocomotionClip clip) const;
};

struct TargetMatchingSettings
{
    float windowStart = 0.0F;
    float windowEnd = 0.8F;
    std::uint32_t ikIterations = 20;
};

struct StrideSettings
{
    float walk = 0.6F;
    float run = 1.2F;
};

// Locomotion tuning, loaded once at startup and read-only afterwards
struct BlendingConfig
{
    SpeedThresholds thresholds;
    CycleSettings cycle;
    std::string jumpAction = "jump";
    float landingDuration = 0.15F;
    CrossfadeSettings crossfade;
    ClipNames clips;
    targeting::FootPlacementSettings footPlacement;
    targeting::HandPlacementSettings handPlacement;
    TargetMatchingSettings targetMatching;
    StrideSettings stride;
    bool verboseTrace = false;

    bool Validate(std::string* outError = nullptr) const;

    // On any failure the config is left unchanged
    bool LoadFromJsonFile(const std::string& path, std::string* outError = nullptr);
    bool LoadFromJsonString(const std::string& text, std::string* outError = nullptr);
    bool SaveToJsonFile(const std::string& path, std::string* outError = nullptr) const;
    [[nodiscard]] std::string ToJsonString() const;
};

} // namespace parkour::animation
