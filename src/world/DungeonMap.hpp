#pragma once

#include "world/TileMask.hpp"

#include <vector>
#include <cstdint>

namespace delve {

enum class TileType : uint8_t {
    Wall,
    Floor,
};

/// One dungeon level's terrain plus its two visibility layers: the live
/// field of view and the tiles the player has ever seen. A new map starts
/// with nothing explored.
class DungeonMap {
public:
    DungeonMap() = default;

    /// Create a map of the given size filled with walls
    DungeonMap(int width, int height);

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < m_width && y < m_height;
    }
    bool inBounds(const GridPosition& pos) const { return inBounds(pos.x, pos.y); }

    TileType getTile(int x, int y) const;
    void setTile(int x, int y, TileType type);

    /// Floor tiles can be walked on; everything out of bounds is a wall
    bool isWalkable(int x, int y) const { return getTile(x, y) == TileType::Floor; }
    bool isWalkable(const GridPosition& pos) const { return isWalkable(pos.x, pos.y); }

    /// Walls block sight
    bool isOpaque(int x, int y) const { return getTile(x, y) == TileType::Wall; }

    // --- Visibility layers ---

    /// Mark a tile as currently visible; visible tiles become explored
    void markVisible(int x, int y);
    void clearVisible() { m_visible.clear(); }

    bool isVisible(const GridPosition& pos) const { return m_visible.contains(pos); }
    bool isExplored(const GridPosition& pos) const { return m_explored.contains(pos); }

    const TileMask& visibleTiles() const { return m_visible; }
    const TileMask& exploredTiles() const { return m_explored; }

private:
    int m_width = 0;
    int m_height = 0;
    std::vector<TileType> m_tiles;
    TileMask m_visible;
    TileMask m_explored;
};

} // namespace delve
