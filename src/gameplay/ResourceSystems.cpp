#include "gameplay/ResourceSystems.hpp"

#include <algorithm>

namespace emberfall {

void HealthRegenerationSystem::update(float dt) {
    float amount = m_regenerationAmount * dt;
    getRegistry().each<Health, EntityState>([amount](Entity /*entity*/, Health& health,
                                                     const EntityState& state) {
        if (!state.can(EntityStateFlag::CanReplenishHealth) || health.isFull()) {
            return;
        }
        health.adjust(amount);
    });
}

void ManaGatheringSystem::update(float dt) {
    float amount = m_settings.gatherAmount * m_settings.regenerationRate * dt;
    int radius = m_settings.gatherRadius;

    getRegistry().each<Input, Mana, Position>([this, amount, radius](Entity /*entity*/, const Input& input,
                                                                     Mana& mana, const Position& position) {
        if (!input.isHeld(InputAction::ManaGather)) {
            return;
        }

        TileCoord center = toTile(position.map);
        for (int x = center.x - radius; x <= center.x + radius; ++x) {
            for (int y = center.y - radius; y <= center.y + radius; ++y) {
                gatherFromTile(x, y, amount, mana);
            }
        }
    });
}

void ManaGatheringSystem::gatherFromTile(int x, int y, float amount, Mana& mana) {
    ManaField::TileReserves* tile = m_field.getTile(x, y);
    if (!tile) return;

    for (auto& [type, reserve] : *tile) {
        if (reserve.current < m_settings.minimumGatherAmount) {
            continue;
        }

        // Never take more than the tile holds
        float taken = std::min(amount, reserve.current);
        reserve.current -= taken;

        float& store = mana.stores[type];
        store += taken;

        // Excess over the carrying limit goes back into the tile
        if (store > mana.max) {
            reserve.current += store - mana.max;
            store = mana.max;
        }

        m_field.queueReplenishment(x, y, type);
    }
}

void ManaReplenishmentSystem::update(float dt) {
    m_field.replenish(m_replenishmentAmount * dt);
}

} // namespace emberfall
