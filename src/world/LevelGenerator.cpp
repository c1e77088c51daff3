#include "world/LevelGenerator.hpp"
#include "ecs/EntityFactory.hpp"
#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace delve {

int valueForDepth(const std::vector<DepthStep>& steps, int depth) {
    int value = 0;
    int bestFrom = 0;
    for (const auto& step : steps) {
        if (step.fromDepth <= depth && step.fromDepth >= bestFrom) {
            value = step.value;
            bestFrom = step.fromDepth;
        }
    }
    return value;
}

LevelGenConfig LevelGenConfig::fromConfig(const Config& config) {
    LevelGenConfig cfg;
    cfg.width       = config.getInt("dungeon.width", cfg.width);
    cfg.height      = config.getInt("dungeon.height", cfg.height);
    cfg.maxRooms    = config.getInt("dungeon.max_rooms", cfg.maxRooms);
    cfg.roomMinSize = config.getInt("dungeon.room_min_size", cfg.roomMinSize);
    cfg.roomMaxSize = config.getInt("dungeon.room_max_size", cfg.roomMaxSize);
    cfg.seed        = static_cast<uint32_t>(std::max(0, config.getInt("dungeon.seed", 0)));

    if (cfg.width < 3 || cfg.height < 3) {
        LOG_WARN("dungeon size {}x{} too small, using 80x43", cfg.width, cfg.height);
        cfg.width = 80;
        cfg.height = 43;
    }
    return cfg;
}

RoomsLevelGenerator::RoomsLevelGenerator(const EntityFactory& factory, LevelGenConfig config)
    : m_factory(factory),
      m_config(std::move(config)),
      m_rng(m_config.seed != 0 ? m_config.seed : std::random_device{}()) {
    m_config.roomMinSize = std::max(3, m_config.roomMinSize);
    m_config.roomMaxSize = std::max(m_config.roomMinSize, m_config.roomMaxSize);
}

int RoomsLevelGenerator::randomInt(int lo, int hi) {
    if (hi <= lo) return lo;
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(m_rng);
}

DungeonMap RoomsLevelGenerator::generate(EntityStore& store, int depth) {
    DungeonMap map(m_config.width, m_config.height);
    m_rooms.clear();

    for (int attempt = 0; attempt < m_config.maxRooms; ++attempt) {
        Room room;
        room.w = randomInt(m_config.roomMinSize, m_config.roomMaxSize);
        room.h = randomInt(m_config.roomMinSize, m_config.roomMaxSize);
        if (room.w >= m_config.width || room.h >= m_config.height) continue;
        room.x = randomInt(0, m_config.width - room.w - 1);
        room.y = randomInt(0, m_config.height - room.h - 1);

        bool overlaps = std::any_of(m_rooms.begin(), m_rooms.end(),
            [&room](const Room& other) { return room.intersects(other); });
        if (overlaps) continue;

        carveRoom(map, room);

        if (!m_rooms.empty()) {
            GridPosition prev = m_rooms.back().center();
            GridPosition cur = room.center();
            if (randomInt(0, 1) == 1) {
                carveHorizontal(map, prev.x, cur.x, prev.y);
                carveVertical(map, prev.y, cur.y, cur.x);
            } else {
                carveVertical(map, prev.y, cur.y, prev.x);
                carveHorizontal(map, prev.x, cur.x, cur.y);
            }
        }
        m_rooms.push_back(room);
    }

    // A map too small for any random room still gets one room
    if (m_rooms.empty() && m_config.width >= 3 && m_config.height >= 3) {
        Room room{0, 0, m_config.width - 1, m_config.height - 1};
        carveRoom(map, room);
        m_rooms.push_back(room);
        LOG_WARN("LevelGenerator: no random room fit; carved a single {}x{} room",
                 room.w, room.h);
    }

    if (Entity player = store.player(); player != NullEntity && !m_rooms.empty()) {
        store.registry().get<GridPosition>(player) = m_rooms.front().center();
    }

    for (size_t i = 1; i < m_rooms.size(); ++i) {
        populateRoom(store, map, m_rooms[i], depth);
    }

    if (!m_rooms.empty()) {
        m_factory.spawn(store, "stairs", m_rooms.back().center());
    }

    GAME_LOG_DEBUG("Generated depth {}: {} rooms, {} entities", depth, m_rooms.size(), store.size());
    return map;
}

void RoomsLevelGenerator::carveRoom(DungeonMap& map, const Room& room) {
    for (int y = room.y + 1; y < room.y + room.h; ++y) {
        for (int x = room.x + 1; x < room.x + room.w; ++x) {
            map.setTile(x, y, TileType::Floor);
        }
    }
}

void RoomsLevelGenerator::carveHorizontal(DungeonMap& map, int x1, int x2, int y) {
    for (int x = std::min(x1, x2); x <= std::max(x1, x2); ++x) {
        map.setTile(x, y, TileType::Floor);
    }
}

void RoomsLevelGenerator::carveVertical(DungeonMap& map, int y1, int y2, int x) {
    for (int y = std::min(y1, y2); y <= std::max(y1, y2); ++y) {
        map.setTile(x, y, TileType::Floor);
    }
}

void RoomsLevelGenerator::populateRoom(EntityStore& store, const DungeonMap& map,
                                       const Room& room, int depth) {
    auto randomFloor = [&]() {
        return GridPosition{randomInt(room.x + 1, room.x + room.w - 1),
                            randomInt(room.y + 1, room.y + room.h - 1)};
    };

    int monsterCount = randomInt(0, valueForDepth(m_config.maxMonstersPerRoom, depth));
    for (int i = 0; i < monsterCount; ++i) {
        GridPosition pos = randomFloor();
        if (!map.isWalkable(pos) || store.blockingEntityAt(pos) != NullEntity) continue;

        std::string type = weightedSelect(m_config.monsters, depth);
        if (!type.empty()) {
            m_factory.spawn(store, type, pos);
        }
    }

    int itemCount = randomInt(0, valueForDepth(m_config.maxItemsPerRoom, depth));
    for (int i = 0; i < itemCount; ++i) {
        GridPosition pos = randomFloor();
        if (!map.isWalkable(pos) || !store.entitiesAt(pos).empty()) continue;

        std::string type = weightedSelect(m_config.items, depth);
        if (!type.empty()) {
            m_factory.spawn(store, type, pos);
        }
    }
}

std::string RoomsLevelGenerator::weightedSelect(const std::vector<SpawnEntry>& entries, int depth) {
    int totalWeight = 0;
    for (const auto& entry : entries) {
        totalWeight += std::max(0, valueForDepth(entry.weight, depth));
    }
    if (totalWeight <= 0) return {};

    int roll = randomInt(1, totalWeight);
    int cumulative = 0;
    for (const auto& entry : entries) {
        cumulative += std::max(0, valueForDepth(entry.weight, depth));
        if (roll <= cumulative) return entry.type;
    }
    return entries.back().type;
}

} // namespace delve
