#pragma once

#include "ecs/Systems.hpp"

#include <string>
#include <unordered_map>

namespace emberfall {

/// Drives every AnimationPlayback from its sprite's action and facing, then
/// advances it. Emits animation_finished once each time a non-looping
/// animation completes.
class SpriteAnimationSystem : public System {
public:
    SpriteAnimationSystem() : System("sprite_animation") {}

    void update(float dt) override;
    void shutdown() override { m_rejected.clear(); }

private:
    /// Last state each entity's playback refused, so it is reported once
    std::unordered_map<Entity, std::string> m_rejected;
};

} // namespace emberfall
