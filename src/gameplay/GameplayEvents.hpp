#pragma once

#include "ecs/Registry.hpp"
#include "engine/EventBus.hpp"

namespace emberfall {

/// Event names emitted by the gameplay systems.
/// Every event carries the entity id under "entity".
namespace GameplayEvent {
    constexpr const char* EntityDeath = "entity_death";
    constexpr const char* AnimationFinished = "animation_finished";   // also carries "state"
}

inline Entity entityFromEventData(const EventData& data) {
    return data.hasInt("entity") ? Registry::fromEventId(data.getInt("entity")) : NullEntity;
}

} // namespace emberfall
