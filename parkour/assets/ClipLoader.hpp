#pragma once

#include "parkour/animation/AnimationClip.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace parkour::assets
{

struct ClipImportData
{
    bool loaded = false;
    std::string error;  // failure reason, or loader warnings on success

    std::vector<animation::AnimationClip> clips;
    // Node names indexed like AnimationChannel::jointIndex
    std::vector<std::string> nodeNames;
};

// Reads the animations of a .gltf/.glb file. Meshes and images are ignored.
class ClipLoader
{
public:
    [[nodiscard]] static ClipImportData LoadFromFile(const std::filesystem::path& path);
};

} // namespace parkour::assets
