#pragma once

#include "content/ContentResult.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace emberfall {

/// How a template mentions a component kind
enum class ComponentValueKind {
    Unset,      ///< Not mentioned; inherited verbatim from the parent (or absent)
    Default,    ///< Authored as null; present with every schema default
    Override    ///< Authored as an object; fields replace inherited ones
};

struct ComponentValue {
    ComponentValueKind kind = ComponentValueKind::Unset;
    nlohmann::json fields = nlohmann::json::object();   // Only meaningful for Override

    static ComponentValue makeDefault() { return {ComponentValueKind::Default, nlohmann::json::object()}; }
    static ComponentValue makeOverride(nlohmann::json fields) {
        return {ComponentValueKind::Override, std::move(fields)};
    }

    bool isSet() const { return kind != ComponentValueKind::Unset; }
};

/// A named, authored template. Immutable once stored.
struct EntityTemplate {
    std::string name;
    std::optional<std::string> parent;
    std::map<std::string, ComponentValue> components;

    /// Value for a kind, Unset if this template does not mention it
    ComponentValue getComponent(const std::string& kind) const {
        auto it = components.find(kind);
        return it != components.end() ? it->second : ComponentValue{};
    }
};

/// Authored templates plus the components/systems sections of the entity document.
///
/// Document layout:
/// {
///   "entities": {
///     "templates":  { "<name>": { "parent": "<name>", "components": { "<kind>": null | {...} } } },
///     "components": { "entry_point_group": "<group>" },
///     "systems":    { "entry_point_group": "<group>", "<system>": { "<tunable>": number } }
///   }
/// }
class TemplateStore {
public:
    static constexpr const char* DEFAULT_COMPONENTS_GROUP = "emberfall.components";
    static constexpr const char* DEFAULT_SYSTEMS_GROUP = "emberfall.systems";

    TemplateStore() = default;

    /// Load an entity document. Templates are added to those already stored;
    /// a document that fails to parse leaves the store unchanged.
    ContentResult loadFromFile(const std::string& path);
    ContentResult loadFromString(const std::string& jsonStr);
    ContentResult loadFromJson(const nlohmann::json& document);

    /// Store a template, replacing any template of the same name
    ContentResult addTemplate(EntityTemplate tmpl);

    /// Parse a single template definition
    ContentResult parseTemplate(const std::string& name, const nlohmann::json& json,
                                EntityTemplate& out);

    const EntityTemplate* getTemplate(const std::string& name) const;
    bool hasTemplate(const std::string& name) const;

    /// Template names, sorted
    std::vector<std::string> getTemplateNames() const;
    size_t templateCount() const { return m_templates.size(); }

    const std::string& getComponentsGroup() const { return m_componentsGroup; }
    const std::string& getSystemsGroup() const { return m_systemsGroup; }

    /// Tunables of one system (empty object if none were authored)
    const nlohmann::json& getSystemSettings(const std::string& system) const;

    const std::string& getLastError() const { return m_lastError; }

    void clear();

private:
    ContentResult fail(ContentResult result, const std::string& message);

    std::unordered_map<std::string, EntityTemplate> m_templates;
    std::string m_componentsGroup = DEFAULT_COMPONENTS_GROUP;
    std::string m_systemsGroup = DEFAULT_SYSTEMS_GROUP;
    std::unordered_map<std::string, nlohmann::json> m_systemSettings;
    std::string m_lastError;
};

} // namespace emberfall
