#pragma once

#include "ecs/Components.hpp"
#include "ecs/Systems.hpp"

namespace emberfall {

/// Turns the first held movement input into a velocity direction
class VelocitySystem : public System {
public:
    VelocitySystem() : System("velocity") {}

    void update(float dt) override;
};

/// Moves entities along their velocity and keeps the sprite's action and
/// facing in step with the motion.
///
/// Diagonal motion faces east or west: the horizontal component wins.
class MovementSystem : public System {
public:
    MovementSystem() : System("movement") {}

    void update(float dt) override;

    /// Facing for a non-zero direction
    static Direction facingFor(Vec2 direction);
};

} // namespace emberfall
