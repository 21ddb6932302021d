#pragma once

#include "parkour/animation/Pose.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace parkour::animation
{

// One pose per PoseId, stored on disk as <dir>/<stem>.pose.json
class PoseLibrary
{
public:
    void AddPose(PoseId id, Pose pose);
    [[nodiscard]] const Pose* Get(PoseId id) const;
    [[nodiscard]] bool Contains(PoseId id) const { return m_poses.contains(id); }
    void Clear() { m_poses.clear(); }

    [[nodiscard]] std::size_t LoadedCount() const { return m_poses.size(); }
    [[nodiscard]] bool IsComplete() const;
    [[nodiscard]] std::vector<PoseId> MissingPoses() const;

    // Loads every pose file present; returns how many were read.
    // A malformed file is skipped and reported through outError.
    std::size_t LoadFromDirectory(const std::filesystem::path& directory, std::string* outError = nullptr);
    bool SaveToDirectory(const std::filesystem::path& directory, std::string* outError = nullptr) const;

    [[nodiscard]] static std::filesystem::path PosePath(const std::filesystem::path& directory, PoseId id);

    static std::optional<Pose> LoadPoseFile(const std::filesystem::path& path, std::string* outError = nullptr);
    static bool SavePoseFile(const std::filesystem::path& path, const Pose& pose, std::string* outError = nullptr);

    static std::optional<Pose> PoseFromJsonString(const std::string& text, std::string* outError = nullptr);
    [[nodiscard]] static std::string PoseToJsonString(const Pose& pose);

private:
    std::unordered_map<PoseId, Pose> m_poses;
};

} // namespace parkour::animation
