#pragma once

#include "parkour/animation/AnimationPlayback.hpp"
#include "parkour/animation/AnimationClip.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace parkour::animation
{

// Weighted multi-layer playback over registered clips.
// Each playing clip is a layer whose effective weight is weight * fade.
class AnimationMixer final : public AnimationPlayback
{
public:
    AnimationMixer() = default;

    // Register a clip (takes ownership, replaces a clip with the same name)
    void AddClip(std::unique_ptr<AnimationClip> clip);
    [[nodiscard]] const AnimationClip* GetClip(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> ListClips() const;

    void Play(const std::string& clip, float crossfade) override;
    void Stop(const std::string& clip) override;
    void SetWeight(const std::string& clip, float weight) override;
    void SetLooping(const std::string& clip, bool looping) override;
    [[nodiscard]] bool IsPlaying(const std::string& clip) const override;

    // Advances layer time and fades. Looping layers wrap, one-shot layers hold their last frame.
    void Update(float dt);

    [[nodiscard]] float Weight(const std::string& clip) const;
    [[nodiscard]] float EffectiveWeight(const std::string& clip) const;
    // A one-shot layer that reached the end of its clip
    [[nodiscard]] bool IsFinished(const std::string& clip) const;
    [[nodiscard]] bool IsLooping(const std::string& clip) const;
    // False while the layer waits for its clip to be added
    [[nodiscard]] bool IsBound(const std::string& clip) const;
    [[nodiscard]] float LayerTime(const std::string& clip) const;
    [[nodiscard]] std::size_t ActiveLayerCount() const { return m_layers.size(); }

    // Weighted blend over all layers that animate the joint; `out` is untouched if none do
    void ComputeBlendedTranslation(int jointIndex, glm::vec3& out) const;
    void ComputeBlendedRotation(int jointIndex, glm::quat& out) const;
    void ComputeBlendedScale(int jointIndex, glm::vec3& out) const;

    [[nodiscard]] std::string GetDebugInfo() const;

private:
    struct Layer
    {
        const AnimationClip* clip = nullptr;  // owned by m_clips
        float time = 0.0F;
        bool looping = true;
        float weight = 1.0F;
        float fade = 1.0F;
        float fadeRate = 0.0F;  // per second, 0 when fully faded in
    };

    [[nodiscard]] static float LayerWeight(const Layer& layer) { return layer.weight * layer.fade; }
    static void AdvanceLayer(Layer& layer, float dt);
    [[nodiscard]] const Layer* FindLayer(const std::string& clip) const;

    std::unordered_map<std::string, std::unique_ptr<AnimationClip>> m_clips;
    std::unordered_map<std::string, Layer> m_layers;
};

} // namespace parkour::animation
