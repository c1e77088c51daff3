#include "engine/Config.hpp"

#include <fstream>
#include <sstream>

namespace delve {

bool Config::parse(std::istream& in, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        m_lastError = e.what();
        return false;
    }
    m_lastError.clear();
    return true;
}

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_lastError = "cannot open '" + path + "'";
        return false;
    }

    nlohmann::json parsed;
    if (!parse(file, parsed)) {
        return false;
    }
    m_data = std::move(parsed);
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    std::istringstream stream(jsonStr);
    nlohmann::json parsed;
    if (!parse(stream, parsed)) {
        return false;
    }
    m_data = std::move(parsed);
    return true;
}

bool Config::mergeFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_lastError = "cannot open '" + path + "'";
        return false;
    }

    nlohmann::json overlay;
    if (!parse(file, overlay)) {
        return false;
    }

    nlohmann::json merged = m_data;
    mergeJson(merged, overlay);
    m_data = std::move(merged);
    return true;
}

// ---------------------------------------------------------------------------
// Key resolution
// ---------------------------------------------------------------------------

const nlohmann::json* Config::resolve(const std::string& key) const {
    const nlohmann::json* current = &m_data;
    std::istringstream stream(key);
    std::string segment;

    while (std::getline(stream, segment, '.')) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

bool Config::hasKey(const std::string& key) const {
    return resolve(key) != nullptr;
}

// ---------------------------------------------------------------------------
// Getters
// ---------------------------------------------------------------------------

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    const auto* val = resolve(key);
    return (val && val->is_string()) ? val->get<std::string>() : defaultVal;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    const auto* val = resolve(key);
    return (val && val->is_number_integer()) ? val->get<int>() : defaultVal;
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    const auto* val = resolve(key);
    return (val && val->is_boolean()) ? val->get<bool>() : defaultVal;
}

// ---------------------------------------------------------------------------
// JSON merge
// ---------------------------------------------------------------------------

void Config::mergeJson(nlohmann::json& base, const nlohmann::json& overlay) {
    if (!overlay.is_object() || !base.is_object()) {
        base = overlay;
        return;
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        auto existing = base.find(it.key());
        if (existing != base.end() && existing->is_object() && it->is_object()) {
            mergeJson(*existing, *it);
        } else {
            base[it.key()] = *it;
        }
    }
}

} // namespace delve
