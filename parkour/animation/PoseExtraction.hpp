#pragma once

#include "parkour/animation/AnimationClip.hpp"
#include "parkour/animation/PoseLibrary.hpp"

#include <functional>
#include <string>
#include <vector>

namespace parkour::animation
{

// Which clip, at which time, becomes which canonical pose
struct ExtractionEntry
{
    std::string clipName;
    float timeSeconds = 0.0F;
    PoseId pose = PoseId::Idle;
    std::string notes;
};

[[nodiscard]] std::vector<ExtractionEntry> DefaultExtractionTable();

// Samples every animated joint of `clip` at `time`. Joint indices are mapped to
// bone names through `nodeNames`; joints without a name are skipped.
[[nodiscard]] Pose SamplePose(
    const AnimationClip& clip,
    const std::vector<std::string>& nodeNames,
    float time,
    const std::string& poseName
);

using ClipLookup = std::function<const AnimationClip*(const std::string& clipName)>;

// Fills `library` from the table. Entries whose clip is missing are reported and
// skipped. Returns the number of poses extracted.
std::size_t ExtractPoses(
    const std::vector<ExtractionEntry>& table,
    const ClipLookup& findClip,
    const std::vector<std::string>& nodeNames,
    PoseLibrary& library
);

} // namespace parkour::animation
