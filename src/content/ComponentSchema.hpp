#pragma once

#include "content/ResolvedComponents.hpp"
#include "ecs/Registry.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace emberfall {

/// Creates the typed component(s) of one kind on a freshly spawned entity
using ComponentAttachFn = std::function<void(Registry&, Entity, const nlohmann::json& fields,
                                             const ResolvedComponents& resolved)>;

/// A recognized component kind and its default fields
struct ComponentSchema {
    std::string kind;
    nlohmann::json defaults = nlohmann::json::object();
    ComponentAttachFn attach;       ///< Optional; without it fields are kept as raw json
};

class ComponentSchemaRegistry;

/// Supplies component kinds from outside the core. Providers are matched
/// against the document's components entry point group.
class ComponentSchemaProvider {
public:
    virtual ~ComponentSchemaProvider() = default;

    virtual std::string getGroup() const = 0;
    virtual void registerKinds(ComponentSchemaRegistry& registry) = 0;
};

/// Registry of every component kind templates may use
class ComponentSchemaRegistry {
public:
    ComponentSchemaRegistry() = default;

    /// Register (or replace) a kind. Defaults must be a json object.
    bool registerKind(ComponentSchema schema);

    /// Register every kind a provider offers
    void registerProvider(ComponentSchemaProvider& provider);

    bool hasKind(const std::string& kind) const;
    const ComponentSchema* getKind(const std::string& kind) const;

    /// Copy of a kind's default fields (empty object for unknown kinds)
    nlohmann::json makeDefault(const std::string& kind) const;

    /// Registered kinds, sorted
    std::vector<std::string> getKinds() const;

    size_t kindCount() const { return m_kinds.size(); }
    void clear() { m_kinds.clear(); }

private:
    std::unordered_map<std::string, ComponentSchema> m_kinds;
};

} // namespace emberfall
