#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace delve {

/// JSON-backed settings with dot-notation lookup ("dungeon.width").
/// Every getter takes a default, so a missing or partial config file
/// still yields a playable game.
class Config {
public:
    /// Load configuration from a JSON file. Returns false if the file
    /// cannot be read or parsed; the current contents are kept.
    bool loadFromFile(const std::string& path);

    /// Load configuration from a JSON string (useful for testing).
    bool loadFromString(const std::string& jsonStr);

    /// Merge another JSON file on top of the current configuration.
    /// Keys in the overlay win; keys absent from it are preserved.
    /// Returns false (config unchanged) if the file is missing or invalid.
    bool mergeFromFile(const std::string& path);

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    bool hasKey(const std::string& key) const;

    const nlohmann::json& raw() const { return m_data; }

    /// Why the last load or merge failed (empty after a success). Config is
    /// read before logging exists, so callers report this themselves.
    const std::string& getLastError() const { return m_lastError; }

private:
    const nlohmann::json* resolve(const std::string& key) const;

    bool parse(std::istream& in, nlohmann::json& out);
    static void mergeJson(nlohmann::json& base, const nlohmann::json& overlay);

    nlohmann::json m_data = nlohmann::json::object();
    std::string m_lastError;
};

} // namespace delve
