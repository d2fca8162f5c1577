#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <fstream>
#include <sstream>

namespace emberfall {

namespace {

/// "simulation.max_delta" -> ["simulation", "max_delta"]
std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> segments;
    std::istringstream stream(key);
    std::string segment;
    while (std::getline(stream, segment, '.')) {
        segments.push_back(segment);
    }
    return segments;
}

/// Parse without exceptions; discarded values and non-object documents fail.
bool parseDocument(std::istream& in, const std::string& origin, nlohmann::json& out) {
    nlohmann::json parsed = nlohmann::json::parse(in, nullptr, false);
    if (parsed.is_discarded()) {
        LOG_ERROR("Config: '{}' is not valid JSON", origin);
        return false;
    }
    if (!parsed.is_object()) {
        LOG_ERROR("Config: '{}' must contain a JSON object", origin);
        return false;
    }
    out = std::move(parsed);
    return true;
}

} // anonymous namespace

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    return parseDocument(file, path, m_data);
}

bool Config::loadFromString(const std::string& jsonStr) {
    std::istringstream in(jsonStr);
    return parseDocument(in, "<string>", m_data);
}

bool Config::mergeFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    nlohmann::json overlay;
    if (!parseDocument(file, path, overlay)) {
        return false;
    }
    m_data.merge_patch(overlay);
    LOG_DEBUG("Config: merged overrides from '{}'", path);
    return true;
}

const nlohmann::json* Config::find(const std::string& key) const {
    nlohmann::json::json_pointer pointer;
    for (const auto& segment : splitKey(key)) {
        pointer /= segment;
    }
    if (!m_data.contains(pointer)) {
        return nullptr;
    }
    return &m_data.at(pointer);
}

nlohmann::json& Config::slot(const std::string& key) {
    nlohmann::json* node = &m_data;
    for (const auto& segment : splitKey(key)) {
        if (!node->is_object()) {
            if (!node->is_null()) {
                LOG_WARN("Config: replacing a non-object value on the path to '{}'", key);
            }
            *node = nlohmann::json::object();
        }
        node = &(*node)[segment];
    }
    return *node;
}

bool Config::hasKey(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    const auto* val = find(key);
    return val && val->is_string() ? val->get<std::string>() : defaultVal;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    const auto* val = find(key);
    return val && val->is_number_integer() ? val->get<int>() : defaultVal;
}

float Config::getFloat(const std::string& key, float defaultVal) const {
    const auto* val = find(key);
    return val && val->is_number() ? val->get<float>() : defaultVal;
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    const auto* val = find(key);
    return val && val->is_boolean() ? val->get<bool>() : defaultVal;
}

std::vector<std::string> Config::getStringList(const std::string& key) const {
    std::vector<std::string> names;
    if (const auto* val = find(key); val && val->is_array()) {
        for (const auto& entry : *val) {
            if (entry.is_string()) names.push_back(entry.get<std::string>());
        }
    }
    return names;
}

nlohmann::json Config::getJson(const std::string& key) const {
    const auto* val = find(key);
    return val ? *val : nlohmann::json();
}

void Config::setString(const std::string& key, const std::string& value) { slot(key) = value; }
void Config::setInt(const std::string& key, int value) { slot(key) = value; }
void Config::setFloat(const std::string& key, float value) { slot(key) = value; }
void Config::setBool(const std::string& key, bool value) { slot(key) = value; }

} // namespace emberfall
