#include "parkour/animation/PoseLibrary.hpp"

#include <fstream>
#include <iostream>
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

json Vec3ToJson(const glm::vec3& value)
{
    return json::array({value.x, value.y, value.z});
}

// Stored x, y, z, w like glTF
json QuatToJson(const glm::quat& value)
{
    return json::array({value.x, value.y, value.z, value.w});
}

bool ReadVec3(const json& node, const char* key, glm::vec3& out)
{
    if (!node.contains(key) || !node[key].is_array() || node[key].size() != 3)
    {
        return false;
    }
    const json& arr = node[key];
    for (const json& component : arr)
    {
        if (!component.is_number())
        {
            return false;
        }
    }
    out = glm::vec3{arr[0].get<float>(), arr[1].get<float>(), arr[2].get<float>()};
    return true;
}

bool ReadQuat(const json& node, const char* key, glm::quat& out)
{
    if (!node.contains(key) || !node[key].is_array() || node[key].size() != 4)
    {
        return false;
    }
    const json& arr = node[key];
    for (const json& component : arr)
    {
        if (!component.is_number())
        {
            return false;
        }
    }
    out = glm::normalize(glm::quat{arr[3].get<float>(), arr[0].get<float>(), arr[1].get<float>(), arr[2].get<float>()});
    return true;
}

json PoseToJson(const Pose& pose)
{
    json root;
    root["asset_version"] = 1;
    root["name"] = pose.name;

    json bones = json::object();
    for (const auto& [boneName, transform] : pose.boneTransforms)
    {
        bones[boneName] = {
            {"translation", Vec3ToJson(transform.translation)},
            {"rotation", QuatToJson(transform.rotation)},
            {"scale", Vec3ToJson(transform.scale)},
        };
    }
    root["bone_transforms"] = std::move(bones);

    json metadata = json::object();
    if (pose.metadata.sourceAnimation.has_value())
    {
        metadata["source_animation"] = *pose.metadata.sourceAnimation;
    }
    if (pose.metadata.sourceFrame.has_value())
    {
        metadata["source_frame"] = *pose.metadata.sourceFrame;
    }
    if (pose.metadata.sourceTime.has_value())
    {
        metadata["source_time"] = *pose.metadata.sourceTime;
    }
    if (pose.metadata.notes.has_value())
    {
        metadata["notes"] = *pose.metadata.notes;
    }
    root["metadata"] = std::move(metadata);
    return root;
}

std::optional<Pose> PoseFromJson(const json& root, std::string* outError)
{
    if (!root.is_object())
    {
        Fail(outError, "Pose root must be an object");
        return std::nullopt;
    }
    if (!root.contains("bone_transforms") || !root["bone_transforms"].is_object())
    {
        Fail(outError, "Missing pose.bone_transforms object");
        return std::nullopt;
    }

    Pose pose;
    if (root.contains("name") && root["name"].is_string())
    {
        pose.name = root["name"].get<std::string>();
    }

    for (const auto& item : root["bone_transforms"].items())
    {
        const std::string& boneName = item.key();
        const json& node = item.value();
        if (!node.is_object())
        {
            Fail(outError, "Bone '" + boneName + "' must be an object");
            return std::nullopt;
        }
        BoneTransform transform;
        if (!ReadVec3(node, "translation", transform.translation) || !ReadQuat(node, "rotation", transform.rotation))
        {
            Fail(outError, "Bone '" + boneName + "' needs translation[3] and rotation[4]");
            return std::nullopt;
        }
        // Scale is optional and defaults to one
        ReadVec3(node, "scale", transform.scale);
        pose.boneTransforms[boneName] = transform;
    }

    if (root.contains("metadata") && root["metadata"].is_object())
    {
        const json& metadata = root["metadata"];
        if (metadata.contains("source_animation") && metadata["source_animation"].is_string())
        {
            pose.metadata.sourceAnimation = metadata["source_animation"].get<std::string>();
        }
        if (metadata.contains("source_frame") && metadata["source_frame"].is_number())
        {
            pose.metadata.sourceFrame = metadata["source_frame"].get<float>();
        }
        if (metadata.contains("source_time") && metadata["source_time"].is_number())
        {
            pose.metadata.sourceTime = metadata["source_time"].get<float>();
        }
        if (metadata.contains("notes") && metadata["notes"].is_string())
        {
            pose.metadata.notes = metadata["notes"].get<std::string>();
        }
    }

    return pose;
}
} // namespace

void PoseLibrary::AddPose(PoseId id, Pose pose)
{
    m_poses[id] = std::move(pose);
}

const Pose* PoseLibrary::Get(PoseId id) const
{
    const auto it = m_poses.find(id);
    return it != m_poses.end() ? &it->second : nullptr;
}

bool PoseLibrary::IsComplete() const
{
    return MissingPoses().empty();
}

std::vector<PoseId> PoseLibrary::MissingPoses() const
{
    std::vector<PoseId> missing;
    for (const PoseId id : AllPoses())
    {
        if (!m_poses.contains(id))
        {
            missing.push_back(id);
        }
    }
    return missing;
}

std::filesystem::path PoseLibrary::PosePath(const std::filesystem::path& directory, PoseId id)
{
    return directory / (std::string{PoseFileStem(id)} + ".pose.json");
}

std::size_t PoseLibrary::LoadFromDirectory(const std::filesystem::path& directory, std::string* outError)
{
    std::size_t loaded = 0;
    for (const PoseId id : AllPoses())
    {
        const std::filesystem::path path = PosePath(directory, id);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            continue;
        }

        std::string error;
        std::optional<Pose> pose = LoadPoseFile(path, &error);
        if (!pose.has_value())
        {
            std::cerr << "[PoseLibrary] Warning: " << error << "\n";
            Fail(outError, error);
            continue;
        }
        if (pose->name.empty())
        {
            pose->name = PoseFileStem(id);
        }
        AddPose(id, std::move(*pose));
        ++loaded;
    }

    std::cout << "[PoseLibrary] Loaded " << loaded << "/" << kPoseCount << " poses from " << directory.string() << "\n";
    return loaded;
}

bool PoseLibrary::SaveToDirectory(const std::filesystem::path& directory, std::string* outError) const
{
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        return Fail(outError, "Cannot create pose directory: " + directory.string());
    }

    for (const PoseId id : AllPoses())
    {
        const Pose* pose = Get(id);
        if (pose == nullptr)
        {
            continue;
        }
        if (!SavePoseFile(PosePath(directory, id), *pose, outError))
        {
            return false;
        }
    }
    return true;
}

std::optional<Pose> PoseLibrary::LoadPoseFile(const std::filesystem::path& path, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        Fail(outError, "Cannot open pose file: " + path.string());
        return std::nullopt;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        Fail(outError, "Invalid pose JSON in " + path.string() + ": " + ex.what());
        return std::nullopt;
    }

    return PoseFromJson(root, outError);
}

bool PoseLibrary::SavePoseFile(const std::filesystem::path& path, const Pose& pose, std::string* outError)
{
    std::ofstream stream(path);
    if (!stream.is_open())
    {
        return Fail(outError, "Cannot write pose file: " + path.string());
    }

    stream << PoseToJson(pose).dump(2) << "\n";
    return true;
}

std::optional<Pose> PoseLibrary::PoseFromJsonString(const std::string& text, std::string* outError)
{
    json root;
    try
    {
        root = json::parse(text);
    }
    catch (const std::exception& ex)
    {
        Fail(outError, std::string{"Invalid pose JSON: "} + ex.what());
        return std::nullopt;
    }
    return PoseFromJson(root, outError);
}

std::string PoseLibrary::PoseToJsonString(const Pose& pose)
{
    return PoseToJson(pose).dump(2);
}

} // namespace parkour::animation
