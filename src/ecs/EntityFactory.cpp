#include "ecs/EntityFactory.hpp"
#include "animation/AnimationPlayback.hpp"
#include "engine/Log.hpp"

namespace emberfall {

Entity EntityFactory::spawn(Registry& registry, const ResolvedComponents& resolved,
                            std::optional<Vec2> position) {
    Entity entity = registry.create();
    std::string displayName = resolved.templateName;

    try {
        for (const auto& [kind, fields] : resolved.components) {
            const ComponentSchema* schema = m_schemas.getKind(kind);
            if (schema && schema->attach) {
                schema->attach(registry, entity, fields, resolved);
            } else {
                // Kinds without a typed component keep their fields as json
                auto* raw = registry.tryGet<RawComponents>(entity);
                if (!raw) {
                    raw = &registry.add<RawComponents>(entity);
                }
                raw->components[kind] = fields;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("EntityFactory: cannot spawn '{}': {}", resolved.templateName, e.what());
        registry.destroy(entity);
        return NullEntity;
    }

    if (auto* character = registry.tryGet<Character>(entity); character && !character->name.empty()) {
        displayName = character->name;
    }
    registry.add<Name>(entity, displayName, resolved.templateName);

    if (auto* pos = registry.tryGet<Position>(entity); pos && position) {
        pos->primaryPosition() = *position;
    }

    attachPlayback(registry, entity, resolved);

    auto callbackIt = m_spawnCallbacks.find(resolved.templateName);
    if (callbackIt != m_spawnCallbacks.end()) {
        callbackIt->second(registry, entity, resolved);
    }

    LOG_DEBUG("EntityFactory: spawned '{}' from template '{}'", displayName, resolved.templateName);
    return entity;
}

void EntityFactory::attachPlayback(Registry& registry, Entity entity, const ResolvedComponents& resolved) {
    auto* sprite = registry.tryGet<Sprite>(entity);
    if (!sprite || !resolved.sprite) {
        return;
    }

    auto& playback = registry.add<AnimationPlayback>(entity, resolved.sprite);
    std::string initial = sprite->animationState();
    if (playback.setState(initial) != ContentResult::Success) {
        LOG_WARN("EntityFactory: '{}' has no animation for initial state '{}'",
                 resolved.templateName, initial);
    }
}

} // namespace emberfall
