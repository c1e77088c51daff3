#include "ecs/EntityFactory.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace delve {

void EntityFactory::registerDefaults() {
    EntityDefinition player;
    player.type = "player";
    player.name = "player";
    player.category = EntityCategory::Player;
    player.glyph = Glyph('@', Color::White(), RenderLayer::Actor);
    player.blocks = true;
    player.fighter = Fighter(100, 4, 1);
    registerDefinition(player);

    EntityDefinition orc;
    orc.type = "orc";
    orc.name = "orc";
    orc.category = EntityCategory::Monster;
    orc.glyph = Glyph('o', Color(63, 127, 63), RenderLayer::Actor);
    orc.blocks = true;
    orc.fighter = Fighter(20, 4, 0, 35);
    registerDefinition(orc);

    EntityDefinition troll;
    troll.type = "troll";
    troll.name = "troll";
    troll.category = EntityCategory::Monster;
    troll.glyph = Glyph('T', Color(0, 127, 0), RenderLayer::Actor);
    troll.blocks = true;
    troll.fighter = Fighter(30, 8, 2, 100);
    registerDefinition(troll);

    EntityDefinition potion;
    potion.type = "healing_potion";
    potion.name = "healing potion";
    potion.category = EntityCategory::Item;
    potion.glyph = Glyph('!', Color::Violet(), RenderLayer::Item);
    potion.alwaysVisible = true;
    potion.effect = ItemEffect{ItemEffectKind::Heal, 40, 0, 0};
    registerDefinition(potion);

    EntityDefinition lightning;
    lightning.type = "lightning_scroll";
    lightning.name = "lightning scroll";
    lightning.category = EntityCategory::Item;
    lightning.glyph = Glyph('#', Color::Yellow(), RenderLayer::Item);
    lightning.alwaysVisible = true;
    lightning.effect = ItemEffect{ItemEffectKind::Lightning, 40, 5, 0};
    registerDefinition(lightning);

    EntityDefinition fireball;
    fireball.type = "fireball_scroll";
    fireball.name = "fireball scroll";
    fireball.category = EntityCategory::Item;
    fireball.glyph = Glyph('#', Color::Red(), RenderLayer::Item);
    fireball.alwaysVisible = true;
    fireball.effect = ItemEffect{ItemEffectKind::Fireball, 25, 8, 3};
    registerDefinition(fireball);

    EntityDefinition stairs;
    stairs.type = "stairs";
    stairs.name = "stairs";
    stairs.category = EntityCategory::Feature;
    stairs.glyph = Glyph('>', Color::White(), RenderLayer::Feature);
    stairs.alwaysVisible = true;
    registerDefinition(stairs);
}

bool EntityFactory::registerFromJson(const nlohmann::json& json) {
    try {
        EntityDefinition def;

        // Required fields
        if (!json.contains("type")) {
            LOG_ERROR("Entity definition missing 'type' field");
            return false;
        }
        def.type = json["type"].get<std::string>();
        def.name = json.value("name", def.type);

        auto category = parseCategory(json.value("category", "monster"));
        if (!category) {
            LOG_ERROR("Entity definition '{}' has unknown category '{}'",
                      def.type, json.value("category", ""));
            return false;
        }
        def.category = *category;

        std::string symbol = json.value("glyph", "?");
        def.glyph.symbol = symbol.empty() ? '?' : symbol[0];
        if (json.contains("color")) {
            def.glyph.color = parseColor(json["color"]);
        }
        switch (def.category) {
            case EntityCategory::Item:    def.glyph.layer = RenderLayer::Item; break;
            case EntityCategory::Feature: def.glyph.layer = RenderLayer::Feature; break;
            default:                      def.glyph.layer = RenderLayer::Actor; break;
        }
        def.glyph.layer = json.value("layer", def.glyph.layer);

        bool defaultBlocks = def.category == EntityCategory::Monster ||
                             def.category == EntityCategory::Player;
        def.blocks = json.value("blocks", defaultBlocks);
        def.alwaysVisible = json.value("always_visible", def.category != EntityCategory::Monster &&
                                                         def.category != EntityCategory::Player);

        if (json.contains("fighter")) {
            const auto& f = json["fighter"];
            def.fighter = Fighter(f.value("hp", 10), f.value("power", 1),
                                  f.value("defense", 0), f.value("xp", 0));
        }

        if (json.contains("effect")) {
            const auto& e = json["effect"];
            auto kind = parseEffectKind(e.value("kind", ""));
            if (!kind) {
                LOG_ERROR("Entity definition '{}' has unknown effect kind '{}'",
                          def.type, e.value("kind", ""));
                return false;
            }
            def.effect = ItemEffect{*kind, e.value("amount", 0), e.value("range", 0),
                                    e.value("radius", 0)};
        }

        if ((def.category == EntityCategory::Monster || def.category == EntityCategory::Player) &&
            !def.fighter) {
            LOG_ERROR("Entity definition '{}' needs a 'fighter' block", def.type);
            return false;
        }
        if (def.category == EntityCategory::Item && !def.effect) {
            LOG_ERROR("Item definition '{}' needs an 'effect' block", def.type);
            return false;
        }

        registerDefinition(def);
        LOG_DEBUG("Registered entity definition: {}", def.type);
        return true;

    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse entity definition JSON: {}", e.what());
        return false;
    }
}

bool EntityFactory::registerAll(const nlohmann::json& json, const std::string& source) {
    const nlohmann::json* list = nullptr;
    if (json.is_array()) {
        list = &json;
    } else if (json.is_object() && json.contains("entities")) {
        list = &json["entities"];
    } else {
        return registerFromJson(json);
    }

    bool allOk = true;
    for (const auto& defJson : *list) {
        if (!registerFromJson(defJson)) {
            LOG_WARN("Skipped an entity definition from {}", source);
            allOk = false;
        }
    }
    return allOk;
}

bool EntityFactory::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open entity definitions file: {}", path);
        return false;
    }

    try {
        nlohmann::json json;
        file >> json;
        bool ok = registerAll(json, path);
        LOG_INFO("Loaded entity definitions from: {}", path);
        return ok;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse entity definitions file '{}': {}", path, e.what());
        return false;
    }
}

bool EntityFactory::loadFromString(const std::string& jsonStr) {
    try {
        return registerAll(nlohmann::json::parse(jsonStr), "string");
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse entity definitions JSON string: {}", e.what());
        return false;
    }
}

Entity EntityFactory::spawn(EntityStore& store, const std::string& type,
                            const GridPosition& position) const {
    const EntityDefinition* def = getDefinition(type);
    if (!def) {
        LOG_WARN("Unknown entity type: {}", type);
        return NullEntity;
    }
    if (def->category == EntityCategory::Player) {
        LOG_WARN("Refusing to spawn a second player from definition '{}'", type);
        return NullEntity;
    }

    Entity entity = store.create(position, def->glyph, Name{def->name});
    auto& registry = store.registry();

    if (def->blocks) {
        registry.add<BlocksMovement>(entity);
    }
    if (def->alwaysVisible) {
        registry.add<AlwaysVisible>(entity);
    }
    if (def->fighter) {
        registry.add<Fighter>(entity, *def->fighter);
        registry.add<CharacterLevel>(entity);
    }

    switch (def->category) {
        case EntityCategory::Monster:
            registry.add<MonsterTag>(entity, MonsterTag{def->type});
            break;
        case EntityCategory::Item:
            registry.add<ItemTag>(entity, ItemTag{def->type});
            break;
        case EntityCategory::Feature:
            if (def->type == "stairs") {
                registry.add<StairsTag>(entity);
            }
            break;
        case EntityCategory::Player:
            break;
    }

    return entity;
}

PlayerRecord EntityFactory::makePlayer(const GridPosition& position) const {
    PlayerRecord record;
    record.position = position;

    const EntityDefinition* def = getDefinition("player");
    if (!def || def->category != EntityCategory::Player || !def->fighter) {
        LOG_WARN("No usable 'player' definition; using built-in stats");
        record.fighter = Fighter(100, 4, 1);
        return record;
    }

    record.glyph = def->glyph;
    record.name = Name{def->name};
    record.fighter = *def->fighter;
    return record;
}

std::vector<std::string> EntityFactory::getDefinitionTypes() const {
    std::vector<std::string> types;
    types.reserve(m_definitions.size());
    for (const auto& [type, def] : m_definitions) {
        types.push_back(type);
    }
    return types;
}

std::optional<EntityCategory> EntityFactory::parseCategory(const std::string& str) {
    if (str == "monster") return EntityCategory::Monster;
    if (str == "item")    return EntityCategory::Item;
    if (str == "feature") return EntityCategory::Feature;
    if (str == "player")  return EntityCategory::Player;
    return std::nullopt;
}

std::optional<ItemEffectKind> EntityFactory::parseEffectKind(const std::string& str) {
    if (str == "heal")      return ItemEffectKind::Heal;
    if (str == "lightning") return ItemEffectKind::Lightning;
    if (str == "fireball")  return ItemEffectKind::Fireball;
    return std::nullopt;
}

Color EntityFactory::parseColor(const nlohmann::json& json) {
    if (json.is_array()) {
        uint8_t r = json.size() > 0 ? json[0].get<uint8_t>() : 255;
        uint8_t g = json.size() > 1 ? json[1].get<uint8_t>() : 255;
        uint8_t b = json.size() > 2 ? json[2].get<uint8_t>() : 255;
        uint8_t a = json.size() > 3 ? json[3].get<uint8_t>() : 255;
        return Color(r, g, b, a);
    } else if (json.is_string()) {
        std::string str = json.get<std::string>();
        // "#RRGGBB"
        bool isHex = str.length() == 7 && str[0] == '#' &&
            std::all_of(str.begin() + 1, str.end(),
                        [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
        if (isHex) {
            unsigned long hex = std::stoul(str.substr(1), nullptr, 16);
            return Color(static_cast<uint8_t>((hex >> 16) & 0xFF),
                         static_cast<uint8_t>((hex >> 8) & 0xFF),
                         static_cast<uint8_t>(hex & 0xFF), 255);
        }
    }
    return Color::White();
}

} // namespace delve
