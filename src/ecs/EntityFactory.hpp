#pragma once

#include "content/ComponentSchema.hpp"
#include "content/ResolvedComponents.hpp"
#include "ecs/Components.hpp"
#include "ecs/Registry.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace emberfall {

/// Turns resolved templates into live entities
class EntityFactory {
public:
    using SpawnCallback = std::function<void(Registry&, Entity, const ResolvedComponents&)>;

    explicit EntityFactory(const ComponentSchemaRegistry& schemas) : m_schemas(schemas) {}

    /// Create an entity carrying every component of `resolved`. A sprite
    /// entity also gets an AnimationPlayback in its initial state.
    /// `position`, if given and the entity has a Position, replaces the
    /// authored primary position.
    /// Returns NullEntity if a component's fields cannot be applied.
    Entity spawn(Registry& registry, const ResolvedComponents& resolved,
                 std::optional<Vec2> position = std::nullopt);

    /// Register a custom callback run after spawning entities of a template
    void registerSpawnCallback(const std::string& templateName, SpawnCallback callback) {
        m_spawnCallbacks[templateName] = std::move(callback);
    }

    void clearSpawnCallbacks() { m_spawnCallbacks.clear(); }

private:
    void attachPlayback(Registry& registry, Entity entity, const ResolvedComponents& resolved);

    const ComponentSchemaRegistry& m_schemas;
    std::unordered_map<std::string, SpawnCallback> m_spawnCallbacks;
};

} // namespace emberfall
