#pragma once

#include "animation/AnimationCompiler.hpp"
#include "content/ComponentSchema.hpp"
#include "content/TemplateResolver.hpp"
#include "content/TemplateStore.hpp"
#include "ecs/EntityFactory.hpp"
#include "ecs/Registry.hpp"
#include "ecs/Systems.hpp"
#include "engine/Config.hpp"
#include "engine/EventBus.hpp"
#include "engine/Time.hpp"
#include "gameplay/ManaField.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace emberfall {

/// Owns the whole entity core: templates, resolver, registry, systems and clock.
///
/// init() loads the entity document, resolves every template (any failure is
/// fatal and init returns false) and schedules the gameplay systems. After
/// that the simulation is driven by spawn() and tick().
class Simulation {
public:
    static constexpr float DEFAULT_FRAME_INTERVAL_MS = 100.0f;
    static constexpr int DEFAULT_TICK_RATE = 60;

    Simulation();
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /// Add component kinds from outside the core. Only providers whose group
    /// matches the document's components entry point group are used.
    /// Must be called before init().
    void addComponentProvider(std::unique_ptr<ComponentSchemaProvider> provider);

    /// Add systems from outside the core, matched like component providers
    void addSystemProvider(std::unique_ptr<SystemProvider> provider);

    /// Initialize from configuration, loading the document named by content.entities
    bool init(const Config& config);

    /// Initialize from configuration with an already-parsed entity document
    bool init(const Config& config, const nlohmann::json& document);

    void shutdown();

    /// Spawn an entity from a template (NullEntity on failure)
    Entity spawn(const std::string& templateName, std::optional<Vec2> position = std::nullopt);

    /// Advance the simulation by one tick
    void tick(double rawDeltaTime);

    /// Seconds per fixed tick (1 / simulation.tick_rate)
    double getTickInterval() const { return m_tickInterval; }

    bool isInitialized() const { return m_initialized; }
    const std::string& getLastError() const { return m_lastError; }

    Registry& getRegistry() { return m_registry; }
    EventBus& getEventBus() { return m_events; }
    TemplateStore& getTemplateStore() { return m_store; }
    TemplateResolver& getResolver() { return m_resolver; }
    ComponentSchemaRegistry& getSchemas() { return m_schemas; }
    AnimationCompiler& getCompiler() { return m_compiler; }
    EntityFactory& getFactory() { return m_factory; }
    SystemScheduler& getScheduler() { return m_scheduler; }
    ManaField& getManaField() { return m_manaField; }
    const Time& getTime() const { return m_time; }

private:
    void applyConfig(const Config& config);
    bool finishInit(const Config& config);
    void reset();
    bool fail(const std::string& message);

    Registry m_registry;
    EventBus m_events;
    Time m_time;

    TemplateStore m_store;
    ComponentSchemaRegistry m_schemas;
    AnimationCompiler m_compiler;
    TemplateResolver m_resolver;
    EntityFactory m_factory;

    ManaField m_manaField;
    SystemScheduler m_scheduler;

    std::vector<std::unique_ptr<ComponentSchemaProvider>> m_componentProviders;
    std::vector<std::unique_ptr<SystemProvider>> m_systemProviders;

    double m_tickInterval = 1.0 / DEFAULT_TICK_RATE;
    bool m_initialized = false;
    std::string m_lastError;
};

} // namespace emberfall
