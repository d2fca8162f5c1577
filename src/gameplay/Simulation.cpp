#include "gameplay/Simulation.hpp"
#include "ecs/CoreComponents.hpp"
#include "engine/Log.hpp"
#include "gameplay/GameplaySystemProvider.hpp"

namespace emberfall {

Simulation::Simulation()
    : m_resolver(m_store, m_schemas, m_compiler)
    , m_factory(m_schemas) {
}

Simulation::~Simulation() {
    shutdown();
}

void Simulation::addComponentProvider(std::unique_ptr<ComponentSchemaProvider> provider) {
    if (provider) {
        m_componentProviders.push_back(std::move(provider));
    }
}

void Simulation::addSystemProvider(std::unique_ptr<SystemProvider> provider) {
    if (provider) {
        m_systemProviders.push_back(std::move(provider));
    }
}

bool Simulation::init(const Config& config) {
    applyConfig(config);

    std::string path = config.getString("content.entities", "data/entities.json");
    if (m_store.loadFromFile(path) != ContentResult::Success) {
        return fail("cannot load entity document '" + path + "': " + m_store.getLastError());
    }
    return finishInit(config);
}

bool Simulation::init(const Config& config, const nlohmann::json& document) {
    applyConfig(config);

    if (m_store.loadFromJson(document) != ContentResult::Success) {
        return fail("invalid entity document: " + m_store.getLastError());
    }
    return finishInit(config);
}

void Simulation::applyConfig(const Config& config) {
    reset();
    m_lastError.clear();

    Log::init(config);

    float intervalMs = config.getFloat("animation.default_frame_interval_ms", DEFAULT_FRAME_INTERVAL_MS);
    m_compiler.setDefaultFrameInterval(intervalMs / 1000.0f);

    m_time.setMaxDelta(config.getFloat("simulation.max_delta", static_cast<float>(Time::DEFAULT_MAX_DELTA)));

    int tickRate = config.getInt("simulation.tick_rate", DEFAULT_TICK_RATE);
    if (tickRate <= 0) {
        LOG_WARN("Simulation: invalid tick rate {}, using {}", tickRate, DEFAULT_TICK_RATE);
        tickRate = DEFAULT_TICK_RATE;
    }
    m_tickInterval = 1.0 / tickRate;
}

bool Simulation::finishInit(const Config& config) {
    // Component kinds: the core set, then external providers of the document's group
    CoreComponentProvider core;
    m_schemas.registerProvider(core);
    for (auto& provider : m_componentProviders) {
        if (provider->getGroup() == m_store.getComponentsGroup()) {
            m_schemas.registerProvider(*provider);
        } else {
            LOG_INFO("Simulation: skipping component provider '{}' (document uses '{}')",
                     provider->getGroup(), m_store.getComponentsGroup());
        }
    }

    if (m_resolver.resolveAll() != ContentResult::Success) {
        return fail("template resolution failed: " + m_resolver.getLastError());
    }

    nlohmann::json manaTiles = config.getJson("simulation.mana_tiles");
    if (!manaTiles.is_null() && !m_manaField.loadFromJson(manaTiles)) {
        return fail("invalid simulation.mana_tiles");
    }

    m_scheduler.init(m_registry, m_events);
    SystemSettingsLookup settings = [this](const std::string& system) {
        return SystemSettings(m_store.getSystemSettings(system));
    };

    GameplaySystemProvider gameplay(m_manaField);
    gameplay.registerSystems(m_scheduler, settings);
    for (auto& provider : m_systemProviders) {
        if (provider->getGroup() == m_store.getSystemsGroup()) {
            provider->registerSystems(m_scheduler, settings);
        } else {
            LOG_INFO("Simulation: skipping system provider '{}' (document uses '{}')",
                     provider->getGroup(), m_store.getSystemsGroup());
        }
    }

    m_initialized = true;
    LOG_INFO("Simulation: ready with {} templates, {} component kinds, {} systems",
             m_store.templateCount(), m_schemas.kindCount(), m_scheduler.getSystemCount());
    return true;
}

void Simulation::shutdown() {
    if (!m_initialized) return;

    reset();
    LOG_INFO("Simulation: shut down");
}

void Simulation::reset() {
    m_scheduler.shutdown();
    m_registry.clear();
    m_events.clear();
    m_resolver.clearCache();
    m_store.clear();
    m_schemas.clear();
    m_manaField.clear();
    m_time = Time();
    m_initialized = false;
}

Entity Simulation::spawn(const std::string& templateName, std::optional<Vec2> position) {
    if (!m_initialized) {
        LOG_ERROR("Simulation: spawn('{}') before init", templateName);
        return NullEntity;
    }

    std::shared_ptr<const ResolvedComponents> resolved;
    if (m_resolver.resolve(templateName, resolved) != ContentResult::Success) {
        LOG_ERROR("Simulation: cannot spawn '{}': {}", templateName, m_resolver.getLastError());
        return NullEntity;
    }
    return m_factory.spawn(m_registry, *resolved, position);
}

void Simulation::tick(double rawDeltaTime) {
    if (!m_initialized) return;

    m_time.update(rawDeltaTime);
    m_scheduler.update(static_cast<float>(m_time.deltaTime()));
}

bool Simulation::fail(const std::string& message) {
    m_lastError = message;
    LOG_CRITICAL("Simulation: {}", message);
    return false;
}

} // namespace emberfall
