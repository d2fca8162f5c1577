#include "content/TemplateResolver.hpp"
#include "engine/Log.hpp"

#include <unordered_set>

namespace emberfall {

namespace {

constexpr const char* SPRITE_KIND = "sprite";
constexpr const char* ANIMATIONS_FIELD = "animations";

} // anonymous namespace

ContentResult TemplateResolver::resolve(const std::string& name,
                                        std::shared_ptr<const ResolvedComponents>& out) {
    m_lastError.clear();

    auto cached = m_cache.find(name);
    if (cached != m_cache.end()) {
        out = cached->second;
        return ContentResult::Success;
    }

    std::vector<const EntityTemplate*> chain;
    std::shared_ptr<const ResolvedComponents> base;
    ContentResult result = collectChain(name, chain, base);
    if (result != ContentResult::Success) {
        return result;
    }

    // chain[0] is `name`, chain.back() the topmost uncached ancestor
    std::shared_ptr<const ResolvedComponents> current = base;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        const EntityTemplate& tmpl = **it;

        auto resolved = std::make_shared<ResolvedComponents>();
        resolved->templateName = tmpl.name;
        if (current) {
            resolved->components = current->components;
        }

        result = applyTemplate(tmpl, resolved->components);
        if (result != ContentResult::Success) {
            return result;
        }

        // Share the ancestor's compiled sprite unless this template touches it
        if (resolved->has(SPRITE_KIND)) {
            if (current && current->sprite && !tmpl.getComponent(SPRITE_KIND).isSet()) {
                resolved->sprite = current->sprite;
            } else {
                result = m_compiler.compile(resolved->get(SPRITE_KIND), resolved->sprite);
                if (result != ContentResult::Success) {
                    return fail(result, "template '" + tmpl.name + "': " + m_compiler.getLastError());
                }
            }
        }

        CONTENT_LOG_DEBUG("TemplateResolver: resolved '{}' ({} components)",
                          tmpl.name, resolved->components.size());
        m_cache[tmpl.name] = resolved;
        current = std::move(resolved);
    }

    out = current;
    return ContentResult::Success;
}

ContentResult TemplateResolver::resolveAll() {
    std::vector<std::string> names = m_store.getTemplateNames();
    for (const auto& name : names) {
        std::shared_ptr<const ResolvedComponents> resolved;
        ContentResult result = resolve(name, resolved);
        if (result != ContentResult::Success) {
            return result;
        }
    }
    CONTENT_LOG_INFO("TemplateResolver: resolved {} templates", names.size());
    return ContentResult::Success;
}

ContentResult TemplateResolver::collectChain(const std::string& name,
                                             std::vector<const EntityTemplate*>& chain,
                                             std::shared_ptr<const ResolvedComponents>& base) {
    std::unordered_set<std::string> visited;
    std::string current = name;
    std::string child;

    while (true) {
        auto cached = m_cache.find(current);
        if (cached != m_cache.end()) {
            base = cached->second;
            return ContentResult::Success;
        }

        if (!visited.insert(current).second) {
            return fail(ContentResult::CyclicInheritance,
                        "inheritance of '" + name + "' loops back to '" + current + "'");
        }

        const EntityTemplate* tmpl = m_store.getTemplate(current);
        if (!tmpl) {
            if (child.empty()) {
                return fail(ContentResult::UnknownTemplate, "unknown template '" + current + "'");
            }
            return fail(ContentResult::UnknownTemplate,
                        "template '" + child + "' names unknown parent '" + current + "'");
        }

        chain.push_back(tmpl);
        if (!tmpl->parent) {
            return ContentResult::Success;
        }
        child = current;
        current = *tmpl->parent;
    }
}

ContentResult TemplateResolver::applyTemplate(const EntityTemplate& tmpl,
                                              std::map<std::string, nlohmann::json>& components) {
    for (const auto& [kind, value] : tmpl.components) {
        const ComponentSchema* schema = m_schemas.getKind(kind);
        if (!schema) {
            return fail(ContentResult::UnknownComponentKind,
                        "template '" + tmpl.name + "' uses unknown component kind '" + kind + "'");
        }

        switch (value.kind) {
            case ComponentValueKind::Unset:
                break;

            case ComponentValueKind::Default:
                components[kind] = schema->defaults;
                break;

            case ComponentValueKind::Override: {
                auto existing = components.find(kind);
                if (existing == components.end()) {
                    existing = components.emplace(kind, schema->defaults).first;
                }
                nlohmann::json& target = existing->second;

                for (auto field = value.fields.begin(); field != value.fields.end(); ++field) {
                    // A null field falls back to the schema default
                    if (field->is_null()) {
                        if (schema->defaults.contains(field.key())) {
                            target[field.key()] = schema->defaults[field.key()];
                        } else {
                            target.erase(field.key());
                        }
                    } else if (kind == SPRITE_KIND && field.key() == ANIMATIONS_FIELD) {
                        ContentResult result = mergeAnimations(target[ANIMATIONS_FIELD],
                                                               field.value(), tmpl.name);
                        if (result != ContentResult::Success) {
                            return result;
                        }
                    } else {
                        target[field.key()] = field.value();
                    }
                }
                break;
            }
        }
    }
    return ContentResult::Success;
}

ContentResult TemplateResolver::mergeAnimations(nlohmann::json& inherited, const nlohmann::json& added,
                                                const std::string& templateName) {
    if (!added.is_array()) {
        return fail(ContentResult::InvalidAnimationBlock,
                    "template '" + templateName + "': sprite animations must be an array");
    }
    if (!inherited.is_array()) {
        inherited = nlohmann::json::array();
    }

    std::unordered_set<std::string> claimed;
    for (const auto& block : added) {
        if (block.is_object() && block.contains("states") && block["states"].is_array()) {
            for (const auto& state : block["states"]) {
                if (state.is_string()) {
                    claimed.insert(state.get<std::string>());
                }
            }
        }
    }

    nlohmann::json merged = nlohmann::json::array();
    for (const auto& block : inherited) {
        if (!block.is_object() || !block.contains("states") || !block["states"].is_array()) {
            merged.push_back(block);
            continue;
        }

        nlohmann::json kept = nlohmann::json::array();
        for (const auto& state : block["states"]) {
            if (!state.is_string() || !claimed.count(state.get<std::string>())) {
                kept.push_back(state);
            }
        }
        if (kept.empty()) {
            continue;       // Every state of this block was reclaimed
        }

        nlohmann::json trimmed = block;
        trimmed["states"] = std::move(kept);
        if (trimmed.contains("state_rows") && trimmed["state_rows"].is_object()) {
            for (const auto& state : claimed) {
                trimmed["state_rows"].erase(state);
            }
        }
        merged.push_back(std::move(trimmed));
    }

    for (const auto& block : added) {
        merged.push_back(block);
    }
    inherited = std::move(merged);
    return ContentResult::Success;
}

ContentResult TemplateResolver::fail(ContentResult result, const std::string& message) {
    m_lastError = message;
    CONTENT_LOG_ERROR("TemplateResolver: {} ({})", message, resultToString(result));
    return result;
}

} // namespace emberfall
