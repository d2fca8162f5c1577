#pragma once

#include "animation/ResolvedSprite.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace emberfall {

/// Flat, fully concrete component set of one template after inheritance.
/// Every kind carries all of its schema fields.
struct ResolvedComponents {
    std::string templateName;
    std::map<std::string, nlohmann::json> components;
    std::shared_ptr<const ResolvedSprite> sprite;   ///< Null unless the template has a sprite

    bool has(const std::string& kind) const {
        return components.find(kind) != components.end();
    }

    /// Fields of a kind (null json if absent)
    const nlohmann::json& get(const std::string& kind) const {
        static const nlohmann::json none;
        auto it = components.find(kind);
        return it != components.end() ? it->second : none;
    }

    std::vector<std::string> kinds() const {
        std::vector<std::string> result;
        result.reserve(components.size());
        for (const auto& [kind, fields] : components) {
            result.push_back(kind);
        }
        return result;
    }
};

} // namespace emberfall
