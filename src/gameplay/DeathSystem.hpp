#pragma once

#include "ecs/Components.hpp"
#include "ecs/Systems.hpp"

namespace emberfall {

/// Handles entities whose state has become dead.
///
/// Each death is handled once: the sprite switches to its "dead" action,
/// held inputs are released, velocity stops and an entity_death event is
/// emitted. With despawnAfterAnimation the entity is destroyed once its
/// death animation has finished (immediately if it has none).
class DeathSystem : public System {
public:
    explicit DeathSystem(bool despawnAfterAnimation = false)
        : System("death"), m_despawnAfterAnimation(despawnAfterAnimation) {}

    void update(float dt) override;

    bool despawnsAfterAnimation() const { return m_despawnAfterAnimation; }

private:
    bool isDeathAnimationDone(Entity entity);

    bool m_despawnAfterAnimation = false;
};

} // namespace emberfall
