#pragma once

#include "world/DungeonMap.hpp"
#include "ecs/EntityStore.hpp"

#include <string>
#include <vector>
#include <random>
#include <cstdint>

namespace delve {

class EntityFactory;
class Config;

/// A value that changes with dungeon depth: `value` applies from
/// `fromDepth` onwards until a later step takes over.
struct DepthStep {
    int value = 0;
    int fromDepth = 1;
};

/// Value in effect at `depth`, or 0 before the first step
int valueForDepth(const std::vector<DepthStep>& steps, int depth);

/// A spawnable definition type with a depth-dependent weight
struct SpawnEntry {
    std::string type;
    std::vector<DepthStep> weight;
};

/// Configuration for the room-and-corridor generator
struct LevelGenConfig {
    int width = 80;
    int height = 43;
    int maxRooms = 30;
    int roomMinSize = 6;
    int roomMaxSize = 10;
    uint32_t seed = 0;              // 0 = seed from std::random_device

    std::vector<DepthStep> maxMonstersPerRoom{{2, 1}, {3, 4}, {5, 6}};
    std::vector<DepthStep> maxItemsPerRoom{{1, 1}, {2, 4}};

    std::vector<SpawnEntry> monsters{
        {"orc",   {{80, 1}}},
        {"troll", {{15, 3}, {30, 5}, {60, 7}}},
    };
    std::vector<SpawnEntry> items{
        {"healing_potion",   {{35, 1}}},
        {"lightning_scroll", {{25, 4}}},
        {"fireball_scroll",  {{25, 6}}},
    };

    /// Read `dungeon.*`, keeping defaults for missing keys
    static LevelGenConfig fromConfig(const Config& config);
};

/// Axis-aligned room; x/y/w/h include the surrounding wall ring
struct Room {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    GridPosition center() const { return {x + w / 2, y + h / 2}; }

    bool intersects(const Room& other) const {
        return x <= other.x + other.w && x + w >= other.x &&
               y <= other.y + other.h && y + h >= other.y;
    }
};

/// Produces a new level. Implementations append monsters, items and the
/// stairs to `store` and may move the player (slot 0) to its starting
/// tile, but never add, remove or reorder the player itself.
class ILevelGenerator {
public:
    virtual ~ILevelGenerator() = default;

    /// Build the level for `depth` and return its map
    virtual DungeonMap generate(EntityStore& store, int depth) = 0;
};

/// Random non-overlapping rooms joined by L-shaped corridors. The player
/// starts in the first room, the stairs sit in the centre of the last.
class RoomsLevelGenerator : public ILevelGenerator {
public:
    RoomsLevelGenerator(const EntityFactory& factory, LevelGenConfig config = {});

    DungeonMap generate(EntityStore& store, int depth) override;

    const std::vector<Room>& getRooms() const { return m_rooms; }
    const LevelGenConfig& getConfig() const { return m_config; }

private:
    void carveRoom(DungeonMap& map, const Room& room);
    void carveHorizontal(DungeonMap& map, int x1, int x2, int y);
    void carveVertical(DungeonMap& map, int y1, int y2, int x);
    void populateRoom(EntityStore& store, const DungeonMap& map, const Room& room, int depth);

    /// Roll a definition type from weighted entries; empty when all weights are 0
    std::string weightedSelect(const std::vector<SpawnEntry>& entries, int depth);

    int randomInt(int lo, int hi);

    const EntityFactory& m_factory;
    LevelGenConfig m_config;
    std::vector<Room> m_rooms;
    std::mt19937 m_rng;
};

} // namespace delve
