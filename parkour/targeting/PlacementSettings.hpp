#pragma once

#include <string>

namespace parkour::targeting
{

// Ground probing for the feet
struct FootPlacementSettings
{
    bool enabled = true;
    float raycastDistance = 2.0F;   // Max downward probe length (m)
    float footOffset = 0.05F;       // Clearance above the hit surface (m)
    float updateInterval = 0.1F;    // Seconds between probes
    float minSlopeAngle = 5.0F;     // Degrees; 0 disables the slope gate

    [[nodiscard]] static FootPlacementSettings Default() { return FootPlacementSettings{}; }
    // More sensitive, updates at 20 Hz
    [[nodiscard]] static FootPlacementSettings ForGentleSlopes();
    // Longer probes, less frequent updates
    [[nodiscard]] static FootPlacementSettings ForSteepTerrain();
    // Always active, even on flat ground
    [[nodiscard]] static FootPlacementSettings ForTesting();

    bool Validate(std::string* outError = nullptr) const;
};

// Wall probing for the hands along the character's facing
struct HandPlacementSettings
{
    bool enabled = true;
    float raycastDistance = 1.5F;
    float handOffset = 0.1F;        // Distance kept in front of the wall (m)
    float updateInterval = 0.1F;
    float matchDuration = 0.5F;     // Length of the reach (s)

    [[nodiscard]] static HandPlacementSettings Default() { return HandPlacementSettings{}; }
    [[nodiscard]] static HandPlacementSettings ForTesting();

    bool Validate(std::string* outError = nullptr) const;
};

} // namespace parkour::targeting
