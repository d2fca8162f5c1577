#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace emberfall {

/// Engine configuration: one JSON object read with dot-notation keys
/// ("simulation.max_delta"). Absent keys and type mismatches yield the
/// caller's default.
class Config {
public:
    /// Load configuration from a JSON file. Returns false if the file
    /// cannot be read; missing keys are handled via default values.
    bool loadFromFile(const std::string& path);

    /// Load configuration from a JSON string (useful for testing).
    bool loadFromString(const std::string& jsonStr);

    /// Apply another JSON file on top of the current configuration as a
    /// merge patch: nested objects merge, other values replace, and a null
    /// removes the key. Returns false (leaving the config untouched) if the
    /// file cannot be read or parsed.
    bool mergeFromFile(const std::string& path);

    // --- Getters (read with dot-notation key paths) ---

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    float       getFloat(const std::string& key, float defaultVal = 0.0f) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    /// Array of strings at key; non-string entries are skipped.
    std::vector<std::string> getStringList(const std::string& key) const;

    /// Raw value at key (null if absent), for structured sections.
    nlohmann::json getJson(const std::string& key) const;

    // --- Setters (write with dot-notation key paths) ---

    void setString(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setFloat(const std::string& key, float value);
    void setBool(const std::string& key, bool value);

    /// Check if a key exists (supports dot-notation, e.g. "log.level").
    bool hasKey(const std::string& key) const;

    const nlohmann::json& raw() const { return m_data; }

private:
    /// Value at a dot-separated key path, or nullptr.
    const nlohmann::json* find(const std::string& key) const;

    /// Writable value at a key path; intermediate objects are created.
    nlohmann::json& slot(const std::string& key);

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace emberfall
