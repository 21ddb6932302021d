#include "parkour/assets/ClipLoader.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <utility>

#include <glm/geometric.hpp>
#include <glm/gtc/quaternion.hpp>

#include <nlohmann/json.hpp>

#define TINYGLTF_IMPLEMENTATION
#define TINYGLTF_NO_STB_IMAGE
#define TINYGLTF_NO_STB_IMAGE_WRITE
#define TINYGLTF_NO_INCLUDE_JSON
#include <tiny_gltf.h>

namespace parkour::assets
{
namespace
{
std::string ToLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// Textures are irrelevant to clip import; accept and drop them
bool SkipImageData(
    tinygltf::Image* /*image*/,
    const int /*imageIndex*/,
    std::string* /*err*/,
    std::string* /*warn*/,
    int /*reqWidth*/,
    int /*reqHeight*/,
    const unsigned char* /*bytes*/,
    int /*size*/,
    void* /*userData*/
)
{
    return true;
}

// Resolves the buffer bytes an accessor points at. Returns nullptr when any index is out of range.
const tinygltf::Buffer* ResolveBuffer(
    const tinygltf::Model& model,
    const tinygltf::Accessor& accessor,
    std::size_t elementSize,
    std::size_t* outStride,
    std::size_t* outBaseOffset
)
{
    if (accessor.bufferView < 0 || accessor.bufferView >= static_cast<int>(model.bufferViews.size()))
    {
        return nullptr;
    }
    const tinygltf::BufferView& view = model.bufferViews[static_cast<std::size_t>(accessor.bufferView)];
    if (view.buffer < 0 || view.buffer >= static_cast<int>(model.buffers.size()))
    {
        return nullptr;
    }

    const int byteStride = accessor.ByteStride(view);
    *outStride = byteStride > 0 ? static_cast<std::size_t>(byteStride) : elementSize;
    *outBaseOffset = static_cast<std::size_t>(view.byteOffset + accessor.byteOffset);
    return &model.buffers[static_cast<std::size_t>(view.buffer)];
}

// Reads `components` floats per element. Stops at the first element past the end of the buffer.
bool ReadAccessorFloats(
    const tinygltf::Model& model,
    const tinygltf::Accessor& accessor,
    int expectedType,
    std::size_t components,
    std::vector<float>* outValues
)
{
    if (accessor.type != expectedType || accessor.componentType != TINYGLTF_COMPONENT_TYPE_FLOAT)
    {
        return false;
    }

    std::size_t stride = 0;
    std::size_t baseOffset = 0;
    const std::size_t elementSize = components * sizeof(float);
    const tinygltf::Buffer* buffer = ResolveBuffer(model, accessor, elementSize, &stride, &baseOffset);
    if (buffer == nullptr)
    {
        return false;
    }

    outValues->clear();
    outValues->reserve(accessor.count * components);
    for (std::size_t i = 0; i < accessor.count; ++i)
    {
        const std::size_t offset = baseOffset + i * stride;
        if (offset + elementSize > buffer->data.size())
        {
            std::cout << "[GLTF] Warning: accessor data out of range at offset " << offset << " (buffer size "
                      << buffer->data.size() << ")\n";
            return false;
        }
        for (std::size_t c = 0; c < components; ++c)
        {
            float value = 0.0F;
            std::memcpy(&value, buffer->data.data() + offset + c * sizeof(float), sizeof(float));
            outValues->push_back(value);
        }
    }
    return true;
}

std::vector<glm::vec3> ToVec3(const std::vector<float>& raw)
{
    std::vector<glm::vec3> values;
    values.reserve(raw.size() / 3);
    for (std::size_t i = 0; i + 2 < raw.size(); i += 3)
    {
        values.emplace_back(raw[i], raw[i + 1], raw[i + 2]);
    }
    return values;
}

std::vector<glm::quat> ToQuat(const std::vector<float>& raw)
{
    std::vector<glm::quat> values;
    values.reserve(raw.size() / 4);
    for (std::size_t i = 0; i + 3 < raw.size(); i += 4)
    {
        // glTF stores (x, y, z, w), glm takes (w, x, y, z)
        glm::quat q{raw[i + 3], raw[i], raw[i + 1], raw[i + 2]};
        if (glm::length(q) > 1.0e-6F)
        {
            q = glm::normalize(q);
        }
        values.push_back(q);
    }
    return values;
}

template <typename T>
void AppendChannel(
    std::vector<animation::AnimationChannel<T>>& channels,
    int jointIndex,
    const std::vector<float>& times,
    std::vector<T> values,
    const char* path,
    const std::string& clipName
)
{
    if (values.size() != times.size())
    {
        std::cout << "[GLTF] Warning: " << path << " channel times/values count mismatch (" << times.size() << " vs "
                  << values.size() << ") for joint " << jointIndex << " in '" << clipName << "'\n";
        return;
    }

    animation::AnimationChannel<T> channel;
    channel.jointIndex = jointIndex;
    channel.times = times;
    channel.values = std::move(values);
    channels.push_back(std::move(channel));
}

animation::AnimationClip ReadClip(const tinygltf::Model& model, const tinygltf::Animation& anim, std::size_t index)
{
    animation::AnimationClip clip;
    clip.name = anim.name.empty() ? "animation_" + std::to_string(index) : anim.name;

    float maxTime = 0.0F;
    std::vector<float> times;
    std::vector<float> raw;

    for (const tinygltf::AnimationChannel& channel : anim.channels)
    {
        if (channel.target_node < 0 || channel.target_node >= static_cast<int>(model.nodes.size()))
        {
            continue;
        }
        if (channel.sampler < 0 || channel.sampler >= static_cast<int>(anim.samplers.size()))
        {
            continue;
        }

        const tinygltf::AnimationSampler& sampler = anim.samplers[static_cast<std::size_t>(channel.sampler)];
        if (sampler.input < 0 || sampler.input >= static_cast<int>(model.accessors.size()) || sampler.output < 0 ||
            sampler.output >= static_cast<int>(model.accessors.size()))
        {
            continue;
        }

        const tinygltf::Accessor& input = model.accessors[static_cast<std::size_t>(sampler.input)];
        const tinygltf::Accessor& output = model.accessors[static_cast<std::size_t>(sampler.output)];
        if (!ReadAccessorFloats(model, input, TINYGLTF_TYPE_SCALAR, 1, &times) || times.empty())
        {
            continue;
        }
        maxTime = std::max(maxTime, *std::max_element(times.begin(), times.end()));

        const int jointIndex = channel.target_node;
        if (channel.target_path == "translation")
        {
            if (ReadAccessorFloats(model, output, TINYGLTF_TYPE_VEC3, 3, &raw))
            {
                AppendChannel(clip.translations, jointIndex, times, ToVec3(raw), "translation", clip.name);
            }
        }
        else if (channel.target_path == "rotation")
        {
            if (ReadAccessorFloats(model, output, TINYGLTF_TYPE_VEC4, 4, &raw))
            {
                AppendChannel(clip.rotations, jointIndex, times, ToQuat(raw), "rotation", clip.name);
            }
        }
        else if (channel.target_path == "scale")
        {
            if (ReadAccessorFloats(model, output, TINYGLTF_TYPE_VEC3, 3, &raw))
            {
                AppendChannel(clip.scales, jointIndex, times, ToVec3(raw), "scale", clip.name);
            }
        }
    }

    clip.duration = maxTime;
    return clip;
}
} // namespace

ClipImportData ClipLoader::LoadFromFile(const std::filesystem::path& path)
{
    ClipImportData out;

    tinygltf::TinyGLTF loader;
    loader.SetImageLoader(&SkipImageData, nullptr);
    tinygltf::Model model;
    std::string warn;
    std::string err;

    const std::string ext = ToLower(path.extension().string());
    bool loaded = false;
    if (ext == ".glb")
    {
        loaded = loader.LoadBinaryFromFile(&model, &err, &warn, path.string());
    }
    else
    {
        loaded = loader.LoadASCIIFromFile(&model, &err, &warn, path.string());
    }

    if (!loaded)
    {
        out.error = "Failed to load glTF: " + path.generic_string();
        if (!err.empty())
        {
            out.error += " | " + err;
        }
        return out;
    }

    out.nodeNames.reserve(model.nodes.size());
    for (const tinygltf::Node& node : model.nodes)
    {
        out.nodeNames.push_back(node.name);
    }

    for (std::size_t i = 0; i < model.animations.size(); ++i)
    {
        animation::AnimationClip clip = ReadClip(model, model.animations[i], i);
        if (!clip.Valid())
        {
            std::cout << "[GLTF] Warning: clip '" << clip.name << "' is invalid (duration=" << clip.duration << ")\n";
            continue;
        }
        out.clips.push_back(std::move(clip));
    }

    if (out.clips.empty())
    {
        out.error = "glTF has no usable animations: " + path.generic_string();
        return out;
    }

    std::cout << "[GLTF] Animations found in " << path.filename().string() << ":\n";
    for (const animation::AnimationClip& clip : out.clips)
    {
        std::cout << "  - " << clip.name << " (" << clip.duration << "s)\n";
    }

    out.loaded = true;
    out.error = warn;
    return out;
}

} // namespace parkour::assets
