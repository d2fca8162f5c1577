#include "gameplay/GameplaySystemProvider.hpp"
#include "gameplay/DeathSystem.hpp"
#include "gameplay/MovementSystems.hpp"
#include "gameplay/ResourceSystems.hpp"
#include "gameplay/SpriteAnimationSystem.hpp"

namespace emberfall {

void GameplaySystemProvider::registerSystems(SystemScheduler& scheduler,
                                             const SystemSettingsLookup& settings) {
    scheduler.addSystem<VelocitySystem>();
    scheduler.addSystem<MovementSystem>();

    SystemSettings death = settings("death");
    scheduler.addSystem<DeathSystem>(death.getBool("despawn_after_animation", false));

    SystemSettings health = settings("health_regeneration");
    scheduler.addSystem<HealthRegenerationSystem>(
        health.getFloat("default_regeneration_amount",
                        HealthRegenerationSystem::DEFAULT_REGENERATION_AMOUNT));

    SystemSettings gathering = settings("mana_gathering");
    ManaGatheringSettings gatherSettings;
    gatherSettings.gatherAmount = gathering.getFloat("default_gather_amount", gatherSettings.gatherAmount);
    gatherSettings.minimumGatherAmount =
        gathering.getFloat("minimum_gather_amount", gatherSettings.minimumGatherAmount);
    gatherSettings.gatherRadius = gathering.getInt("default_gather_radius", gatherSettings.gatherRadius);
    gatherSettings.regenerationRate =
        gathering.getFloat("default_regeneration_rate", gatherSettings.regenerationRate);
    scheduler.addSystem<ManaGatheringSystem>(m_manaField, gatherSettings);

    SystemSettings replenishment = settings("mana_replenishment");
    scheduler.addSystem<ManaReplenishmentSystem>(
        m_manaField, replenishment.getFloat("default_replenishment_amount",
                                            ManaReplenishmentSystem::DEFAULT_REPLENISHMENT_AMOUNT));

    scheduler.addSystem<SpriteAnimationSystem>();
}

} // namespace emberfall
