#pragma once

#include <string>

namespace parkour::animation
{

// Clips the locomotion layer drives through a playback sink
enum class LocomotionClip
{
    Idle,
    Walk,
    Run,
    StandingJump,
    RunningJump
};

// Sink for play/stop/weight commands. Clips are referenced by name.
class AnimationPlayback
{
public:
    virtual ~AnimationPlayback() = default;

    // Starts the clip if it is not already playing, fading it in over `crossfade` seconds
    virtual void Play(const std::string& clip, float crossfade) = 0;
    virtual void Stop(const std::string& clip) = 0;
    virtual void SetWeight(const std::string& clip, float weight) = 0;
    virtual void SetLooping(const std::string& clip, bool looping) = 0;
    [[nodiscard]] virtual bool IsPlaying(const std::string& clip) const = 0;
};

} // namespace parkour::animation
