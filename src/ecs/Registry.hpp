#pragma once

#include <entt/entt.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <utility>
#include <vector>

namespace emberfall {

/// Live entity handle. Entities are spawned from resolved templates and
/// carry typed components plus an optional animation playback cursor.
using Entity = entt::entity;

constexpr Entity NullEntity = entt::null;

/// Thin owner of the EnTT registry shared by the entity factory and every
/// gameplay system.
class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = default;
    Registry& operator=(Registry&&) = default;

    // --- Lifetime ---

    Entity create() { return m_registry.create(); }

    /// Create an entity and emplace each given component on it
    template<typename... Components>
    Entity create(Components&&... components) {
        Entity entity = m_registry.create();
        (m_registry.emplace<std::decay_t<Components>>(entity, std::forward<Components>(components)), ...);
        return entity;
    }

    /// Stale handles are ignored
    void destroy(Entity entity) {
        if (m_registry.valid(entity)) m_registry.destroy(entity);
    }

    /// Destroy every entity holding Components for which pred(entity) is true.
    /// Matches are gathered first so the predicate may inspect other entities.
    template<typename... Components, typename Pred>
    size_t destroyIf(Pred&& pred) {
        std::vector<Entity> doomed;
        for (Entity entity : m_registry.view<Components...>()) {
            if (pred(entity)) doomed.push_back(entity);
        }
        for (Entity entity : doomed) m_registry.destroy(entity);
        return doomed.size();
    }

    bool valid(Entity entity) const { return m_registry.valid(entity); }

    /// Live entities (destroyed slots awaiting reuse are not counted)
    size_t alive() const {
        const auto* entities = m_registry.storage<entt::entity>();
        return entities ? entities->free_list() : 0;
    }

    void clear() { m_registry.clear(); }

    // --- Components ---

    /// Returns a reference, or void for empty tag types
    template<typename Component, typename... Args>
    decltype(auto) add(Entity entity, Args&&... args) {
        return m_registry.emplace<Component>(entity, std::forward<Args>(args)...);
    }

    template<typename Component, typename... Args>
    decltype(auto) addOrReplace(Entity entity, Args&&... args) {
        return m_registry.emplace_or_replace<Component>(entity, std::forward<Args>(args)...);
    }

    template<typename Component>
    void remove(Entity entity) {
        m_registry.remove<Component>(entity);
    }

    template<typename Component>
    Component* tryGet(Entity entity) { return m_registry.try_get<Component>(entity); }

    template<typename Component>
    const Component* tryGet(Entity entity) const { return m_registry.try_get<Component>(entity); }

    template<typename Component>
    Component& get(Entity entity) { return m_registry.get<Component>(entity); }

    template<typename Component>
    const Component& get(Entity entity) const { return m_registry.get<Component>(entity); }

    template<typename Component>
    bool has(Entity entity) const { return m_registry.all_of<Component>(entity); }

    template<typename... Components>
    bool hasAll(Entity entity) const { return m_registry.all_of<Components...>(entity); }

    // --- Queries ---

    /// func(entity, components&...) for every entity holding all Components
    template<typename... Components, typename Func>
    void each(Func&& func) {
        m_registry.view<Components...>().each(std::forward<Func>(func));
    }

    template<typename... Components>
    size_t count() const {
        auto matching = m_registry.view<Components...>();
        return static_cast<size_t>(std::distance(matching.begin(), matching.end()));
    }

    /// Snapshot of matching entities; safe to destroy while iterating it
    template<typename... Components>
    std::vector<Entity> collect() {
        auto matching = m_registry.view<Components...>();
        return std::vector<Entity>(matching.begin(), matching.end());
    }

    // --- Event payload ids ---

    static int64_t toEventId(Entity entity) {
        return static_cast<int64_t>(entt::to_integral(entity));
    }

    static Entity fromEventId(int64_t id) {
        return static_cast<Entity>(static_cast<entt::id_type>(id));
    }

private:
    entt::registry m_registry;
};

} // namespace emberfall
