#pragma once

#include "ecs/Registry.hpp"
#include "engine/EventBus.hpp"
#include "engine/Log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace emberfall {

/// A named unit of per-tick gameplay logic. Systems read and write only
/// the component kinds they declare in their update loops.
class System {
public:
    explicit System(const std::string& name) : m_name(name) {}
    virtual ~System() = default;

    System(const System&) = delete;
    System& operator=(const System&) = delete;

    /// Called once when the scheduler accepts the system
    virtual void init(Registry& registry, EventBus& events) {
        m_registry = &registry;
        m_events = &events;
    }

    virtual void update(float dt) = 0;

    /// Called when removed or when the scheduler shuts down
    virtual void shutdown() {}

    const std::string& getName() const { return m_name; }

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

protected:
    Registry& getRegistry() { return *m_registry; }
    const Registry& getRegistry() const { return *m_registry; }
    EventBus& getEvents() { return *m_events; }

private:
    std::string m_name;
    bool m_enabled = true;
    Registry* m_registry = nullptr;
    EventBus* m_events = nullptr;
};

/// System scheduler - runs every enabled system once per tick, in the order
/// the systems were added
class SystemScheduler {
public:
    SystemScheduler() = default;
    ~SystemScheduler() { shutdown(); }

    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;

    void init(Registry& registry, EventBus& events) {
        m_registry = &registry;
        m_events = &events;
    }

    /// Construct and append a system. Returns nullptr (and keeps the existing
    /// one) if a system of the same name is already scheduled.
    template<typename T, typename... Args>
    T* addSystem(Args&&... args) {
        auto system = std::make_unique<T>(std::forward<Args>(args)...);
        T* ptr = system.get();
        return addSystem(std::move(system)) ? ptr : nullptr;
    }

    /// Append an existing system instance
    bool addSystem(std::unique_ptr<System> system) {
        if (!system || !m_registry || !m_events) {
            LOG_ERROR("SystemScheduler: addSystem called before init or with a null system");
            return false;
        }
        if (getSystem(system->getName())) {
            LOG_WARN("SystemScheduler: system '{}' is already scheduled", system->getName());
            return false;
        }
        system->init(*m_registry, *m_events);
        LOG_DEBUG("SystemScheduler: added system '{}' at position {}", system->getName(), m_systems.size());
        m_systems.push_back(std::move(system));
        return true;
    }

    /// First scheduled system of type T
    template<typename T>
    T* getSystem() {
        for (auto& system : m_systems) {
            if (T* typed = dynamic_cast<T*>(system.get())) {
                return typed;
            }
        }
        return nullptr;
    }

    System* getSystem(const std::string& name) {
        for (auto& system : m_systems) {
            if (system->getName() == name) {
                return system.get();
            }
        }
        return nullptr;
    }

    /// Shuts the system down and drops it; later systems keep their order
    bool removeSystem(const std::string& name) {
        auto it = std::find_if(m_systems.begin(), m_systems.end(),
            [&name](const auto& sys) { return sys->getName() == name; });
        if (it == m_systems.end()) {
            return false;
        }
        (*it)->shutdown();
        m_systems.erase(it);
        return true;
    }

    /// Run every enabled system once
    void update(float dt) {
        for (auto& system : m_systems) {
            if (system->isEnabled()) {
                system->update(dt);
            }
        }
    }

    void shutdown() {
        for (auto& system : m_systems) {
            system->shutdown();
        }
        m_systems.clear();
    }

    size_t getSystemCount() const { return m_systems.size(); }

    /// Names in execution order
    std::vector<std::string> getSystemNames() const {
        std::vector<std::string> names;
        names.reserve(m_systems.size());
        for (const auto& system : m_systems) {
            names.push_back(system->getName());
        }
        return names;
    }

    void setSystemEnabled(const std::string& name, bool enabled) {
        if (System* sys = getSystem(name)) {
            sys->setEnabled(enabled);
        }
    }

private:
    std::vector<std::unique_ptr<System>> m_systems;
    Registry* m_registry = nullptr;
    EventBus* m_events = nullptr;
};

/// Tunables of one system (its entry under entities.systems), read with
/// defaults. Absent keys and type mismatches yield the default.
class SystemSettings {
public:
    SystemSettings() = default;
    explicit SystemSettings(nlohmann::json values) : m_values(std::move(values)) {}

    float getFloat(const std::string& key, float defaultVal) const {
        const auto* value = find(key);
        return value && value->is_number() ? value->get<float>() : defaultVal;
    }

    int getInt(const std::string& key, int defaultVal) const {
        const auto* value = find(key);
        return value && value->is_number() ? value->get<int>() : defaultVal;
    }

    bool getBool(const std::string& key, bool defaultVal) const {
        const auto* value = find(key);
        return value && value->is_boolean() ? value->get<bool>() : defaultVal;
    }

    bool hasKey(const std::string& key) const { return find(key) != nullptr; }

private:
    const nlohmann::json* find(const std::string& key) const {
        if (!m_values.is_object()) return nullptr;
        auto it = m_values.find(key);
        return it != m_values.end() ? &*it : nullptr;
    }

    nlohmann::json m_values = nlohmann::json::object();
};

/// Looks up the settings of a system by name
using SystemSettingsLookup = std::function<SystemSettings(const std::string& system)>;

/// Supplies systems from outside the core. Providers are matched against the
/// document's systems entry point group.
class SystemProvider {
public:
    virtual ~SystemProvider() = default;

    virtual std::string getGroup() const = 0;
    virtual void registerSystems(SystemScheduler& scheduler, const SystemSettingsLookup& settings) = 0;
};

} // namespace emberfall
