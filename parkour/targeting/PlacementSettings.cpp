#include "parkour/targeting/PlacementSettings.hpp"

namespace parkour::targeting
{

namespace
{
bool Fail(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
    return false;
}
} // namespace

FootPlacementSettings FootPlacementSettings::ForGentleSlopes()
{
    FootPlacementSettings settings;
    settings.raycastDistance = 1.5F;
    settings.footOffset = 0.02F;
    settings.updateInterval = 0.05F;
    settings.minSlopeAngle = 2.0F;
    return settings;
}

FootPlacementSettings FootPlacementSettings::ForSteepTerrain()
{
    FootPlacementSettings settings;
    settings.raycastDistance = 3.0F;
    settings.footOffset = 0.08F;
    settings.updateInterval = 0.15F;
    settings.minSlopeAngle = 10.0F;
    return settings;
}

FootPlacementSettings FootPlacementSettings::ForTesting()
{
    FootPlacementSettings settings;
    settings.raycastDistance = 5.0F;
    settings.footOffset = 0.05F;
    settings.updateInterval = 0.1F;
    settings.minSlopeAngle = 0.0F;
    return settings;
}

bool FootPlacementSettings::Validate(std::string* outError) const
{
    if (!(raycastDistance > 0.0F))
    {
        return Fail(outError, "foot_placement.raycast_distance must be > 0");
    }
    if (!(footOffset >= 0.0F))
    {
        return Fail(outError, "foot_placement.foot_offset must be >= 0");
    }
    if (!(updateInterval > 0.0F))
    {
        return Fail(outError, "foot_placement.update_interval must be > 0");
    }
    if (!(minSlopeAngle >= 0.0F && minSlopeAngle < 90.0F))
    {
        return Fail(outError, "foot_placement.min_slope_angle must be in [0, 90)");
    }
    return true;
}

HandPlacementSettings HandPlacementSettings::ForTesting()
{
    HandPlacementSettings settings;
    settings.raycastDistance = 2.0F;
    settings.handOffset = 0.05F;
    settings.updateInterval = 0.05F;
    return settings;
}

bool HandPlacementSettings::Validate(std::string* outError) const
{
    if (!(raycastDistance > 0.0F))
    {
        return Fail(outError, "hand_placement.raycast_distance must be > 0");
    }
    if (!(handOffset >= 0.0F))
    {
        return Fail(outError, "hand_placement.hand_offset must be >= 0");
    }
    if (!(updateInterval > 0.0F))
    {
        return Fail(outError, "hand_placement.update_interval must be > 0");
    }
    if (!(matchDuration > 0.0F))
    {
        return Fail(outError, "hand_placement.match_duration must be > 0");
    }
    return true;
}

} // namespace parkour::targeting
