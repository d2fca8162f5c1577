#include "gameplay/SpriteAnimationSystem.hpp"
#include "animation/AnimationPlayback.hpp"
#include "ecs/Components.hpp"
#include "gameplay/GameplayEvents.hpp"

#include <iterator>
#include <vector>

namespace emberfall {

void SpriteAnimationSystem::update(float dt) {
    auto& registry = getRegistry();

    // Forget entities that no longer exist
    for (auto it = m_rejected.begin(); it != m_rejected.end();) {
        it = registry.valid(it->first) ? std::next(it) : m_rejected.erase(it);
    }

    std::vector<std::pair<Entity, std::string>> finished;

    registry.each<Sprite, AnimationPlayback>([this, dt, &finished](Entity entity, const Sprite& sprite,
                                                                  AnimationPlayback& playback) {
        std::string wanted = sprite.animationState();
        if (wanted != playback.getCurrentState()) {
            auto rejected = m_rejected.find(entity);
            if (rejected == m_rejected.end() || rejected->second != wanted) {
                if (playback.setState(wanted) == ContentResult::Success) {
                    m_rejected.erase(entity);
                } else {
                    m_rejected[entity] = wanted;
                }
            }
        }

        bool wasFinished = playback.isFinished();
        playback.advance(dt);
        if (playback.isFinished() && !wasFinished) {
            finished.emplace_back(entity, playback.getCurrentState());
        }
    });

    // Emit after iterating so handlers may change components freely
    for (const auto& [entity, state] : finished) {
        EventData data;
        data.setInt("entity", Registry::toEventId(entity));
        data.setString("state", state);
        getEvents().emit(GameplayEvent::AnimationFinished, data);
    }
}

} // namespace emberfall
