#include "parkour/animation/AnimationMixer.hpp"

#include <algorithm>
#include <cmath>

namespace parkour::animation
{

namespace
{
constexpr float kWeightEpsilon = 1.0e-5F;
} // namespace

void AnimationMixer::AddClip(std::unique_ptr<AnimationClip> clip)
{
    if (clip == nullptr || clip->name.empty())
    {
        return;
    }

    const std::string name = clip->name;
    m_clips[name] = std::move(clip);

    // Rebind a layer that was started before its clip arrived
    const auto layerIt = m_layers.find(name);
    if (layerIt != m_layers.end())
    {
        layerIt->second.clip = m_clips[name].get();
        layerIt->second.time = 0.0F;
    }
}

const AnimationClip* AnimationMixer::GetClip(const std::string& name) const
{
    const auto it = m_clips.find(name);
    return it != m_clips.end() ? it->second.get() : nullptr;
}

std::vector<std::string> AnimationMixer::ListClips() const
{
    std::vector<std::string> names;
    names.reserve(m_clips.size());
    for (const auto& [name, clip] : m_clips)
    {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void AnimationMixer::Play(const std::string& clip, float crossfade)
{
    if (m_layers.contains(clip))
    {
        return;
    }

    Layer layer;
    layer.clip = GetClip(clip);
    if (crossfade > 0.0F)
    {
        layer.fade = 0.0F;
        layer.fadeRate = 1.0F / crossfade;
    }
    m_layers.emplace(clip, std::move(layer));
}

void AnimationMixer::Stop(const std::string& clip)
{
    m_layers.erase(clip);
}

void AnimationMixer::SetWeight(const std::string& clip, float weight)
{
    const auto it = m_layers.find(clip);
    if (it != m_layers.end())
    {
        it->second.weight = std::clamp(weight, 0.0F, 1.0F);
    }
}

void AnimationMixer::SetLooping(const std::string& clip, bool looping)
{
    const auto it = m_layers.find(clip);
    if (it != m_layers.end())
    {
        it->second.looping = looping;
    }
}

bool AnimationMixer::IsPlaying(const std::string& clip) const
{
    return m_layers.contains(clip);
}

void AnimationMixer::Update(float dt)
{
    for (auto& [name, layer] : m_layers)
    {
        if (layer.fadeRate > 0.0F)
        {
            layer.fade = std::min(1.0F, layer.fade + layer.fadeRate * dt);
            if (layer.fade >= 1.0F)
            {
                layer.fadeRate = 0.0F;
            }
        }
        AdvanceLayer(layer, dt);
    }
}

void AnimationMixer::AdvanceLayer(Layer& layer, float dt)
{
    if (layer.clip == nullptr || layer.clip->duration <= 0.0F)
    {
        return;
    }

    const float duration = layer.clip->duration;
    layer.time += dt;
    if (layer.looping)
    {
        layer.time = std::fmod(layer.time, duration);
        if (layer.time < 0.0F)
        {
            layer.time += duration;
        }
    }
    else
    {
        layer.time = std::clamp(layer.time, 0.0F, duration);
    }
}

const AnimationMixer::Layer* AnimationMixer::FindLayer(const std::string& clip) const
{
    const auto it = m_layers.find(clip);
    return it != m_layers.end() ? &it->second : nullptr;
}

float AnimationMixer::Weight(const std::string& clip) const
{
    const auto it = m_layers.find(clip);
    return it != m_layers.end() ? it->second.weight : 0.0F;
}

float AnimationMixer::EffectiveWeight(const std::string& clip) const
{
    const auto it = m_layers.find(clip);
    return it != m_layers.end() ? LayerWeight(it->second) : 0.0F;
}

bool AnimationMixer::IsFinished(const std::string& clip) const
{
    const Layer* layer = FindLayer(clip);
    return layer != nullptr && layer->clip != nullptr && !layer->looping && layer->time >= layer->clip->duration;
}

bool AnimationMixer::IsLooping(const std::string& clip) const
{
    const Layer* layer = FindLayer(clip);
    return layer != nullptr && layer->looping;
}

bool AnimationMixer::IsBound(const std::string& clip) const
{
    const Layer* layer = FindLayer(clip);
    return layer != nullptr && layer->clip != nullptr;
}

float AnimationMixer::LayerTime(const std::string& clip) const
{
    const Layer* layer = FindLayer(clip);
    return layer != nullptr ? layer->time : 0.0F;
}

void AnimationMixer::ComputeBlendedTranslation(int jointIndex, glm::vec3& out) const
{
    glm::vec3 sum{0.0F};
    float totalWeight = 0.0F;
    for (const auto& [name, layer] : m_layers)
    {
        const float w = LayerWeight(layer);
        if (layer.clip == nullptr || w <= kWeightEpsilon || !layer.clip->HasTranslation(jointIndex))
        {
            continue;
        }
        glm::vec3 sample{0.0F};
        layer.clip->SampleTranslation(jointIndex, layer.time, sample);
        sum += sample * w;
        totalWeight += w;
    }

    if (totalWeight > kWeightEpsilon)
    {
        out = sum / totalWeight;
    }
}

void AnimationMixer::ComputeBlendedRotation(int jointIndex, glm::quat& out) const
{
    // Incremental slerp: each layer pulls the running result by w / (accumulated + w)
    glm::quat result{1.0F, 0.0F, 0.0F, 0.0F};
    float totalWeight = 0.0F;
    for (const auto& [name, layer] : m_layers)
    {
        const float w = LayerWeight(layer);
        if (layer.clip == nullptr || w <= kWeightEpsilon || !layer.clip->HasRotation(jointIndex))
        {
            continue;
        }
        glm::quat sample{1.0F, 0.0F, 0.0F, 0.0F};
        layer.clip->SampleRotation(jointIndex, layer.time, sample);
        const bool first = totalWeight <= 0.0F;
        totalWeight += w;
        result = first ? sample : SlerpShortest(result, sample, w / totalWeight);
    }

    if (totalWeight > kWeightEpsilon)
    {
        out = result;
    }
}

void AnimationMixer::ComputeBlendedScale(int jointIndex, glm::vec3& out) const
{
    glm::vec3 sum{0.0F};
    float totalWeight = 0.0F;
    for (const auto& [name, layer] : m_layers)
    {
        const float w = LayerWeight(layer);
        if (layer.clip == nullptr || w <= kWeightEpsilon || !layer.clip->HasScale(jointIndex))
        {
            continue;
        }
        glm::vec3 sample{1.0F};
        layer.clip->SampleScale(jointIndex, layer.time, sample);
        sum += sample * w;
        totalWeight += w;
    }

    if (totalWeight > kWeightEpsilon)
    {
        out = sum / totalWeight;
    }
}

std::string AnimationMixer::GetDebugInfo() const
{
    std::vector<std::string> names;
    names.reserve(m_layers.size());
    for (const auto& [name, layer] : m_layers)
    {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::string info = "Layers: " + std::to_string(m_layers.size());
    for (const std::string& name : names)
    {
        const Layer& layer = m_layers.at(name);
        info += " | " + name + " w=" + std::to_string(LayerWeight(layer)).substr(0, 4);
        if (layer.clip != nullptr && layer.clip->duration > 0.0F)
        {
            info += " [" + std::to_string(static_cast<int>(layer.time / layer.clip->duration * 100.0F)) + "%]";
        }
    }
    return info;
}

} // namespace parkour::animation
