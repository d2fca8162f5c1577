#include "gameplay/DeathSystem.hpp"
#include "animation/AnimationPlayback.hpp"
#include "engine/Log.hpp"
#include "gameplay/GameplayEvents.hpp"

#include <vector>

namespace emberfall {

void DeathSystem::update(float /*dt*/) {
    auto& registry = getRegistry();

    registry.destroyIf<DeathRecord>([this, &registry](Entity entity) {
        return registry.get<DeathRecord>(entity).despawnPending && isDeathAnimationDone(entity);
    });

    std::vector<EventData> deaths;
    for (Entity entity : registry.collect<EntityState>()) {
        const auto& state = registry.get<EntityState>(entity);
        if (!state.isDead() || registry.has<DeathRecord>(entity)) continue;

        if (auto* sprite = registry.tryGet<Sprite>(entity)) {
            sprite->action = "dead";
        }
        if (auto* input = registry.tryGet<Input>(entity)) {
            input->clear();
        }
        if (auto* velocity = registry.tryGet<Velocity>(entity)) {
            velocity->direction = Vec2();
        }
        registry.add<DeathRecord>(entity, DeathRecord{m_despawnAfterAnimation});

        const auto* name = registry.tryGet<Name>(entity);
        GAME_LOG_DEBUG("DeathSystem: '{}' died", name ? name->name : std::string("entity"));

        EventData data;
        data.setInt("entity", Registry::toEventId(entity));
        if (name) data.setString("template", name->type);
        deaths.push_back(std::move(data));
    }

    // Emit after iterating so handlers may destroy other entities
    for (const auto& data : deaths) {
        getEvents().emit(GameplayEvent::EntityDeath, data);
    }
}

bool DeathSystem::isDeathAnimationDone(Entity entity) {
    auto& registry = getRegistry();
    const auto* sprite = registry.tryGet<Sprite>(entity);
    const auto* playback = registry.tryGet<AnimationPlayback>(entity);
    if (!sprite || !playback || !sprite->resolved) {
        return true;
    }

    std::string deathState = sprite->animationState();
    const CompiledAnimation* deathAnimation = nullptr;
    if (sprite->resolved->lookup(deathState, deathAnimation) == ContentResult::UnclaimedStateReference) {
        GAME_LOG_DEBUG("DeathSystem: no '{}' animation, despawning at once", deathState);
        return true;
    }
    return playback->getCurrentState() == deathState && playback->isFinished();
}

} // namespace emberfall
