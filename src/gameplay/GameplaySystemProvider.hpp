#pragma once

#include "ecs/Systems.hpp"
#include "gameplay/ManaField.hpp"

#include <string>

namespace emberfall {

/// Registers the built-in gameplay systems in tick order: velocity, movement,
/// death, health_regeneration, mana_gathering, mana_replenishment,
/// sprite_animation. Tunables come from the document's systems section.
class GameplaySystemProvider : public SystemProvider {
public:
    explicit GameplaySystemProvider(ManaField& manaField, std::string group = "emberfall.systems")
        : m_manaField(manaField), m_group(std::move(group)) {}

    std::string getGroup() const override { return m_group; }
    void registerSystems(SystemScheduler& scheduler, const SystemSettingsLookup& settings) override;

private:
    ManaField& m_manaField;
    std::string m_group;
};

} // namespace emberfall
