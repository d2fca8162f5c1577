#include "content/ComponentSchema.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace emberfall {

bool ComponentSchemaRegistry::registerKind(ComponentSchema schema) {
    if (schema.kind.empty()) {
        CONTENT_LOG_ERROR("ComponentSchemaRegistry: refusing kind with empty name");
        return false;
    }
    if (!schema.defaults.is_object()) {
        CONTENT_LOG_ERROR("ComponentSchemaRegistry: defaults of '{}' must be an object", schema.kind);
        return false;
    }

    if (m_kinds.count(schema.kind)) {
        CONTENT_LOG_WARN("ComponentSchemaRegistry: overwriting kind '{}'", schema.kind);
    }
    CONTENT_LOG_DEBUG("ComponentSchemaRegistry: registered kind '{}'", schema.kind);
    std::string kind = schema.kind;
    m_kinds[kind] = std::move(schema);
    return true;
}

void ComponentSchemaRegistry::registerProvider(ComponentSchemaProvider& provider) {
    size_t before = m_kinds.size();
    provider.registerKinds(*this);
    CONTENT_LOG_INFO("ComponentSchemaRegistry: provider '{}' added {} kinds",
                     provider.getGroup(), m_kinds.size() - before);
}

bool ComponentSchemaRegistry::hasKind(const std::string& kind) const {
    return m_kinds.find(kind) != m_kinds.end();
}

const ComponentSchema* ComponentSchemaRegistry::getKind(const std::string& kind) const {
    auto it = m_kinds.find(kind);
    return it != m_kinds.end() ? &it->second : nullptr;
}

nlohmann::json ComponentSchemaRegistry::makeDefault(const std::string& kind) const {
    if (const ComponentSchema* schema = getKind(kind)) {
        return schema->defaults;
    }
    return nlohmann::json::object();
}

std::vector<std::string> ComponentSchemaRegistry::getKinds() const {
    std::vector<std::string> kinds;
    kinds.reserve(m_kinds.size());
    for (const auto& [kind, schema] : m_kinds) {
        kinds.push_back(kind);
    }
    std::sort(kinds.begin(), kinds.end());
    return kinds;
}

} // namespace emberfall
