#pragma once

#include "ecs/EntityStore.hpp"
#include "ecs/Components.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

namespace delve {

enum class EntityCategory {
    Monster,
    Item,
    Feature,    // stairs and other fixed map furniture
    Player,
};

enum class ItemEffectKind {
    Heal,       // restore `amount` hp to the user
    Lightning,  // `amount` damage to the closest visible monster within `range`
    Fireball,   // `amount` damage to everything within `radius` of a target
};

struct ItemEffect {
    ItemEffectKind kind = ItemEffectKind::Heal;
    int amount = 0;
    int range = 0;
    int radius = 0;
};

/// Entity definition loaded from JSON
struct EntityDefinition {
    std::string type;
    std::string name;
    EntityCategory category = EntityCategory::Monster;

    Glyph glyph;
    bool blocks = false;
    bool alwaysVisible = false;

    // Optional components (nullopt means not defined)
    std::optional<Fighter> fighter;
    std::optional<ItemEffect> effect;
};

/// Creates entities from type definitions. Definitions come from a JSON
/// content file; registerDefaults() provides the stock bestiary when no
/// file is available.
class EntityFactory {
public:
    EntityFactory() = default;

    /// Register an entity definition (replaces any with the same type)
    void registerDefinition(const EntityDefinition& def) {
        m_definitions[def.type] = def;
    }

    /// Register the built-in player, monsters, items and stairs
    void registerDefaults();

    /// Register a definition from JSON
    bool registerFromJson(const nlohmann::json& json);

    /// Load definitions from a JSON file (array, {"entities": [...]}, or one object)
    bool loadFromFile(const std::string& path);

    /// Load definitions from a JSON string
    bool loadFromString(const std::string& jsonStr);

    bool hasDefinition(const std::string& type) const {
        return m_definitions.find(type) != m_definitions.end();
    }

    const EntityDefinition* getDefinition(const std::string& type) const {
        auto it = m_definitions.find(type);
        return it != m_definitions.end() ? &it->second : nullptr;
    }

    /// Append an entity of `type` to the store at `position`.
    /// Returns NullEntity for unknown types and for player definitions.
    Entity spawn(EntityStore& store, const std::string& type, const GridPosition& position) const;

    /// Player components at `position`, built from the "player" definition
    PlayerRecord makePlayer(const GridPosition& position) const;

    /// Get all registered definition types
    std::vector<std::string> getDefinitionTypes() const;

    void clear() {
        m_definitions.clear();
    }

private:
    bool registerAll(const nlohmann::json& json, const std::string& source);

    static std::optional<EntityCategory> parseCategory(const std::string& str);
    static std::optional<ItemEffectKind> parseEffectKind(const std::string& str);
    static Color parseColor(const nlohmann::json& json);

    std::unordered_map<std::string, EntityDefinition> m_definitions;
};

} // namespace delve
