#include "world/DungeonMap.hpp"

namespace delve {

DungeonMap::DungeonMap(int width, int height)
    : m_width(width > 0 ? width : 0),
      m_height(height > 0 ? height : 0),
      m_tiles(static_cast<size_t>(m_width * m_height), TileType::Wall),
      m_visible(m_width, m_height),
      m_explored(m_width, m_height) {}

TileType DungeonMap::getTile(int x, int y) const {
    if (!inBounds(x, y)) {
        return TileType::Wall;
    }
    return m_tiles[static_cast<size_t>(y * m_width + x)];
}

void DungeonMap::setTile(int x, int y, TileType type) {
    if (inBounds(x, y)) {
        m_tiles[static_cast<size_t>(y * m_width + x)] = type;
    }
}

void DungeonMap::markVisible(int x, int y) {
    if (!inBounds(x, y)) return;
    m_visible.set(x, y, true);
    m_explored.set(x, y, true);
}

} // namespace delve
