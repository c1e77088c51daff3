#pragma once

#include "ecs/Components.hpp"

#include <vector>
#include <algorithm>
#include <cstdint>

namespace delve {

/// A set of tiles on a fixed-size grid, stored as one flag per cell.
/// Out-of-bounds positions are never contained.
class TileMask {
public:
    TileMask() = default;
    TileMask(int width, int height)
        : m_width(width), m_height(height),
          m_cells(static_cast<size_t>(width > 0 && height > 0 ? width * height : 0), 0) {}

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < m_width && y < m_height;
    }

    bool contains(const GridPosition& pos) const { return contains(pos.x, pos.y); }

    bool contains(int x, int y) const {
        return inBounds(x, y) && m_cells[index(x, y)] != 0;
    }

    void insert(const GridPosition& pos) { set(pos.x, pos.y, true); }
    void erase(const GridPosition& pos) { set(pos.x, pos.y, false); }

    void set(int x, int y, bool value) {
        if (inBounds(x, y)) {
            m_cells[index(x, y)] = value ? 1 : 0;
        }
    }

    void clear() { std::fill(m_cells.begin(), m_cells.end(), 0); }

    /// Number of tiles in the set
    int count() const {
        int n = 0;
        for (uint8_t cell : m_cells) n += cell;
        return n;
    }

private:
    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x);
    }

    int m_width = 0;
    int m_height = 0;
    std::vector<uint8_t> m_cells;
};

} // namespace delve
