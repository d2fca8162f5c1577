#include "gameplay/MovementSystems.hpp"

#include <array>
#include <utility>

namespace emberfall {

namespace {

/// Movement inputs in priority order and the direction each one implies
const std::array<std::pair<InputAction, Vec2>, 4> MOVE_INPUTS = {{
    {InputAction::MoveUp,    Vec2(0.0f, -1.0f)},
    {InputAction::MoveDown,  Vec2(0.0f, 1.0f)},
    {InputAction::MoveLeft,  Vec2(-1.0f, 0.0f)},
    {InputAction::MoveRight, Vec2(1.0f, 0.0f)},
}};

} // anonymous namespace

void VelocitySystem::update(float /*dt*/) {
    getRegistry().each<Input, Velocity>([](Entity /*entity*/, const Input& input, Velocity& velocity) {
        velocity.direction = Vec2();
        for (const auto& [action, direction] : MOVE_INPUTS) {
            if (input.isHeld(action)) {
                velocity.direction = direction;
                break;
            }
        }
    });
}

void MovementSystem::update(float dt) {
    auto& registry = getRegistry();
    registry.each<Position, Velocity, Sprite>([&registry, dt](Entity entity, Position& position,
                                                            const Velocity& velocity, Sprite& sprite) {
        const auto* state = registry.tryGet<EntityState>(entity);
        if (state && state->isDead()) {
            return;     // Death owns the sprite from here on
        }

        bool canMove = !state || state->can(EntityStateFlag::CanMove);
        if (!canMove || velocity.direction.isZero()) {
            sprite.action = "stationary";
            return;
        }

        sprite.action = "moving";
        position.primaryPosition() += velocity.linear() * dt;
        sprite.direction = facingFor(velocity.direction);
    });
}

Direction MovementSystem::facingFor(Vec2 direction) {
    if (direction.x > 0.0f) return Direction::East;
    if (direction.x < 0.0f) return Direction::West;
    return direction.y < 0.0f ? Direction::North : Direction::South;
}

} // namespace emberfall
