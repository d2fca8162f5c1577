#pragma once

#include "animation/ResolvedSprite.hpp"
#include "content/ContentResult.hpp"
#include "engine/Geometry.hpp"

#include <memory>
#include <string>
#include <vector>

namespace emberfall {

/// One layer of a composited frame: which sheet, and where in it
struct LayerFrame {
    std::string sheet;
    Rect source;
};

/// AnimationPlayback component: per-entity cursor through the compiled
/// animations of a shared ResolvedSprite.
///
/// State changes come from outside (the sprite animation system mirrors the
/// entity's action and facing). Looping animations wrap; non-looping ones
/// hold their last frame and report isFinished() until the state changes.
class AnimationPlayback {
public:
    AnimationPlayback() = default;
    explicit AnimationPlayback(std::shared_ptr<const ResolvedSprite> sprite)
        : m_sprite(std::move(sprite)) {}

    /// Switch to another state. Setting the current state again is a no-op
    /// and keeps the frame index. An unknown state is logged and ignored,
    /// leaving the previous state active.
    ContentResult setState(const std::string& state);

    /// Advance by dt seconds
    void advance(float dt);

    /// Layers of the current frame in compositing order (empty if no state is active)
    std::vector<LayerFrame> currentFrame() const;

    const std::string& getCurrentState() const { return m_state; }
    int getFrameIndex() const { return m_frameIndex; }
    float getElapsed() const { return m_elapsed; }

    /// True when a non-looping animation has run past its last frame
    bool isFinished() const { return m_finished; }

    const CompiledAnimation* getActiveAnimation() const { return m_active; }
    const std::shared_ptr<const ResolvedSprite>& getSprite() const { return m_sprite; }

private:
    std::shared_ptr<const ResolvedSprite> m_sprite;
    const CompiledAnimation* m_active = nullptr;
    std::string m_state;
    float m_elapsed = 0.0f;
    int m_frameIndex = 0;
    bool m_finished = false;
};

} // namespace emberfall
