#pragma once

#include "animation/AnimationCompiler.hpp"
#include "content/ComponentSchema.hpp"
#include "content/ContentResult.hpp"
#include "content/ResolvedComponents.hpp"
#include "content/TemplateStore.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace emberfall {

/// Flattens template inheritance into concrete component sets.
///
/// The chain from a template up to its root is collected iteratively and
/// checked for cycles before anything is merged, then applied root-first.
/// Every template on the way (ancestors included) is memoized, so entities
/// spawned from the same template share one ResolvedComponents and one
/// ResolvedSprite.
class TemplateResolver {
public:
    TemplateResolver(const TemplateStore& store, const ComponentSchemaRegistry& schemas,
                     AnimationCompiler& compiler)
        : m_store(store), m_schemas(schemas), m_compiler(compiler) {}

    /// Resolve a template by name. Fails with UnknownTemplate, CyclicInheritance,
    /// UnknownComponentKind or any sprite compilation error.
    ContentResult resolve(const std::string& name, std::shared_ptr<const ResolvedComponents>& out);

    /// Resolve every stored template, stopping at the first failure
    ContentResult resolveAll();

    bool isCached(const std::string& name) const { return m_cache.count(name) > 0; }
    size_t cacheSize() const { return m_cache.size(); }

    /// Drop memoized results (call after the store changes)
    void clearCache() { m_cache.clear(); }

    const std::string& getLastError() const { return m_lastError; }

private:
    /// Templates from `name` up to the first cached ancestor or the root
    ContentResult collectChain(const std::string& name, std::vector<const EntityTemplate*>& chain,
                               std::shared_ptr<const ResolvedComponents>& base);

    /// Apply one template's entries on top of inherited components
    ContentResult applyTemplate(const EntityTemplate& tmpl,
                                std::map<std::string, nlohmann::json>& components);

    /// Merge descendant animation blocks into inherited ones, per state
    ContentResult mergeAnimations(nlohmann::json& inherited, const nlohmann::json& added,
                                  const std::string& templateName);

    ContentResult fail(ContentResult result, const std::string& message);

    const TemplateStore& m_store;
    const ComponentSchemaRegistry& m_schemas;
    AnimationCompiler& m_compiler;

    std::unordered_map<std::string, std::shared_ptr<const ResolvedComponents>> m_cache;
    std::string m_lastError;
};

} // namespace emberfall
