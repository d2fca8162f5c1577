#pragma once

#include "content/ComponentSchema.hpp"
#include "ecs/Components.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace emberfall {

/// The built-in component kinds: position, state, physics, sprite, health,
/// mana, character, player, input and velocity.
class CoreComponentProvider : public ComponentSchemaProvider {
public:
    explicit CoreComponentProvider(std::string group = "emberfall.components")
        : m_group(std::move(group)) {}

    std::string getGroup() const override { return m_group; }
    void registerKinds(ComponentSchemaRegistry& registry) override;

private:
    std::string m_group;
};

// Field parsers shared by the attach functions. They expect default-filled
// fields and throw nlohmann::json::exception on malformed values.

Position parsePosition(const nlohmann::json& fields);
EntityState parseEntityState(const nlohmann::json& fields);
Physics parsePhysics(const nlohmann::json& fields);
Sprite parseSprite(const nlohmann::json& fields);
Health parseHealth(const nlohmann::json& fields);
Mana parseMana(const nlohmann::json& fields);
Velocity parseVelocity(const nlohmann::json& fields);

/// [x, y] or {"x":..,"y":..}
Vec2 parseVec2(const nlohmann::json& json);

} // namespace emberfall
