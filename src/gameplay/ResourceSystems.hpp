#pragma once

#include "ecs/Components.hpp"
#include "ecs/Systems.hpp"
#include "gameplay/ManaField.hpp"

namespace emberfall {

/// Regenerates health of entities whose state allows it
class HealthRegenerationSystem : public System {
public:
    static constexpr float DEFAULT_REGENERATION_AMOUNT = 1.0f;

    explicit HealthRegenerationSystem(float regenerationAmount = DEFAULT_REGENERATION_AMOUNT)
        : System("health_regeneration"), m_regenerationAmount(regenerationAmount) {}

    void update(float dt) override;

    float getRegenerationAmount() const { return m_regenerationAmount; }

private:
    float m_regenerationAmount;
};

/// Tuning of mana gathering
struct ManaGatheringSettings {
    float gatherAmount = 1.0f;          // Per second, per mana type and tile
    float minimumGatherAmount = 1.0f;   // Tiles holding less are skipped
    int gatherRadius = 1;               // In tiles around the entity
    float regenerationRate = 1.0f;      // Scales gatherAmount
};

/// Draws mana from the tiles around entities holding the mana gather input
class ManaGatheringSystem : public System {
public:
    ManaGatheringSystem(ManaField& field, ManaGatheringSettings settings = {})
        : System("mana_gathering"), m_field(field), m_settings(settings) {}

    void update(float dt) override;

    const ManaGatheringSettings& getSettings() const { return m_settings; }

private:
    void gatherFromTile(int x, int y, float amount, Mana& mana);

    ManaField& m_field;
    ManaGatheringSettings m_settings;
};

/// Refills drained mana tiles
class ManaReplenishmentSystem : public System {
public:
    static constexpr float DEFAULT_REPLENISHMENT_AMOUNT = 1.0f;

    ManaReplenishmentSystem(ManaField& field, float replenishmentAmount = DEFAULT_REPLENISHMENT_AMOUNT)
        : System("mana_replenishment"), m_field(field), m_replenishmentAmount(replenishmentAmount) {}

    void update(float dt) override;

    float getReplenishmentAmount() const { return m_replenishmentAmount; }

private:
    ManaField& m_field;
    float m_replenishmentAmount;
};

} // namespace emberfall
