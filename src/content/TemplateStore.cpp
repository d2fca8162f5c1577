#include "content/TemplateStore.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <fstream>

namespace emberfall {

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

ContentResult TemplateStore::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return fail(ContentResult::InvalidDocument, "cannot open entity document: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        return fail(ContentResult::InvalidDocument,
                    "failed to parse entity document '" + path + "': " + e.what());
    }

    ContentResult result = loadFromJson(document);
    if (result == ContentResult::Success) {
        CONTENT_LOG_INFO("TemplateStore: loaded entity document {}", path);
    }
    return result;
}

ContentResult TemplateStore::loadFromString(const std::string& jsonStr) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::exception& e) {
        return fail(ContentResult::InvalidDocument,
                    std::string("failed to parse entity document: ") + e.what());
    }
    return loadFromJson(document);
}

ContentResult TemplateStore::loadFromJson(const nlohmann::json& document) {
    m_lastError.clear();

    if (!document.is_object() || !document.contains("entities") || !document["entities"].is_object()) {
        return fail(ContentResult::InvalidDocument, "document has no 'entities' object");
    }
    const auto& entities = document["entities"];

    // Parse everything first so a bad document leaves the store untouched
    std::vector<EntityTemplate> parsed;
    if (entities.contains("templates")) {
        const auto& templates = entities["templates"];
        if (!templates.is_object()) {
            return fail(ContentResult::InvalidDocument, "'entities.templates' must be an object");
        }
        for (auto it = templates.begin(); it != templates.end(); ++it) {
            EntityTemplate tmpl;
            ContentResult result = parseTemplate(it.key(), it.value(), tmpl);
            if (result != ContentResult::Success) {
                return result;
            }
            parsed.push_back(std::move(tmpl));
        }
    }

    std::string componentsGroup = m_componentsGroup;
    if (entities.contains("components")) {
        const auto& components = entities["components"];
        if (!components.is_object()) {
            return fail(ContentResult::InvalidDocument, "'entities.components' must be an object");
        }
        if (components.contains("entry_point_group")) {
            if (!components["entry_point_group"].is_string()) {
                return fail(ContentResult::InvalidDocument,
                            "'entities.components.entry_point_group' must be a string");
            }
            componentsGroup = components["entry_point_group"].get<std::string>();
        }
    }

    std::string systemsGroup = m_systemsGroup;
    std::unordered_map<std::string, nlohmann::json> systemSettings;
    if (entities.contains("systems")) {
        const auto& systems = entities["systems"];
        if (!systems.is_object()) {
            return fail(ContentResult::InvalidDocument, "'entities.systems' must be an object");
        }
        for (auto it = systems.begin(); it != systems.end(); ++it) {
            if (it.key() == "entry_point_group") {
                if (!it->is_string()) {
                    return fail(ContentResult::InvalidDocument,
                                "'entities.systems.entry_point_group' must be a string");
                }
                systemsGroup = it->get<std::string>();
            } else if (it->is_object()) {
                systemSettings[it.key()] = it.value();
            } else if (!it->is_null()) {
                return fail(ContentResult::InvalidDocument,
                            "settings of system '" + it.key() + "' must be an object");
            }
        }
    }

    for (auto& tmpl : parsed) {
        addTemplate(std::move(tmpl));
    }
    m_componentsGroup = std::move(componentsGroup);
    m_systemsGroup = std::move(systemsGroup);
    for (auto& [system, settings] : systemSettings) {
        m_systemSettings[system] = std::move(settings);
    }

    CONTENT_LOG_INFO("TemplateStore: {} templates, {} configured systems",
                     m_templates.size(), m_systemSettings.size());
    return ContentResult::Success;
}

ContentResult TemplateStore::parseTemplate(const std::string& name, const nlohmann::json& json,
                                           EntityTemplate& out) {
    if (name.empty()) {
        return fail(ContentResult::InvalidDocument, "template with empty name");
    }
    // An entirely null template is an empty one
    if (!json.is_null() && !json.is_object()) {
        return fail(ContentResult::InvalidDocument, "template '" + name + "' must be an object");
    }

    out = EntityTemplate{};
    out.name = name;
    if (json.is_null()) {
        return ContentResult::Success;
    }

    if (json.contains("parent")) {
        const auto& parent = json["parent"];
        if (parent.is_string()) {
            if (!parent.get<std::string>().empty()) {
                out.parent = parent.get<std::string>();
            }
        } else if (!parent.is_null()) {
            return fail(ContentResult::InvalidDocument,
                        "parent of template '" + name + "' must be a template name");
        }
    }

    if (json.contains("components")) {
        const auto& components = json["components"];
        if (!components.is_object()) {
            return fail(ContentResult::InvalidDocument,
                        "components of template '" + name + "' must be an object");
        }
        for (auto it = components.begin(); it != components.end(); ++it) {
            if (it->is_null()) {
                out.components[it.key()] = ComponentValue::makeDefault();
            } else if (it->is_object()) {
                out.components[it.key()] = ComponentValue::makeOverride(it.value());
            } else {
                return fail(ContentResult::InvalidDocument,
                            "component '" + it.key() + "' of template '" + name +
                            "' must be null or an object");
            }
        }
    }

    return ContentResult::Success;
}

ContentResult TemplateStore::addTemplate(EntityTemplate tmpl) {
    if (tmpl.name.empty()) {
        return fail(ContentResult::InvalidDocument, "template with empty name");
    }
    if (m_templates.count(tmpl.name)) {
        CONTENT_LOG_WARN("TemplateStore: overwriting template '{}'", tmpl.name);
    }
    CONTENT_LOG_DEBUG("TemplateStore: stored template '{}' (parent: {})",
                      tmpl.name, tmpl.parent.value_or("none"));
    std::string name = tmpl.name;
    m_templates[name] = std::move(tmpl);
    return ContentResult::Success;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

const EntityTemplate* TemplateStore::getTemplate(const std::string& name) const {
    auto it = m_templates.find(name);
    return it != m_templates.end() ? &it->second : nullptr;
}

bool TemplateStore::hasTemplate(const std::string& name) const {
    return m_templates.find(name) != m_templates.end();
}

std::vector<std::string> TemplateStore::getTemplateNames() const {
    std::vector<std::string> names;
    names.reserve(m_templates.size());
    for (const auto& [name, tmpl] : m_templates) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

const nlohmann::json& TemplateStore::getSystemSettings(const std::string& system) const {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = m_systemSettings.find(system);
    return it != m_systemSettings.end() ? it->second : empty;
}

void TemplateStore::clear() {
    m_templates.clear();
    m_systemSettings.clear();
    m_componentsGroup = DEFAULT_COMPONENTS_GROUP;
    m_systemsGroup = DEFAULT_SYSTEMS_GROUP;
    m_lastError.clear();
}

ContentResult TemplateStore::fail(ContentResult result, const std::string& message) {
    m_lastError = message;
    CONTENT_LOG_ERROR("TemplateStore: {} ({})", message, resultToString(result));
    return result;
}

} // namespace emberfall
