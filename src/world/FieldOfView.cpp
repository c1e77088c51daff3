#include "world/FieldOfView.hpp"

namespace delve {

namespace {

// Octant transforms: column n is (xx, xy, yx, yy) for octant n
constexpr int kOctants[4][8] = {
    {1, 0, 0, -1, -1, 0, 0, 1},
    {0, 1, -1, 0, 0, -1, 1, 0},
    {0, 1, 1, 0, 0, -1, -1, 0},
    {1, 0, 0, 1, -1, 0, 0, -1},
};

} // namespace

void FieldOfView::compute(DungeonMap& map, const GridPosition& origin, int radius) {
    map.clearVisible();
    if (!map.inBounds(origin)) {
        return;
    }
    map.markVisible(origin.x, origin.y);

    for (int oct = 0; oct < 8; ++oct) {
        castLight(map, origin, radius, 1, 1.0f, 0.0f,
                  kOctants[0][oct], kOctants[1][oct],
                  kOctants[2][oct], kOctants[3][oct]);
    }
}

void FieldOfView::castLight(DungeonMap& map, const GridPosition& origin, int radius,
                            int row, float startSlope, float endSlope,
                            int xx, int xy, int yx, int yy) {
    if (startSlope < endSlope) return;

    float nextStartSlope = startSlope;
    const int radiusSq = radius * radius;

    for (int i = row; i <= radius; ++i) {
        bool blocked = false;
        for (int dx = -i, dy = -i; dx <= 0; ++dx) {
            float leftSlope = (static_cast<float>(dx) - 0.5f) / (static_cast<float>(dy) + 0.5f);
            float rightSlope = (static_cast<float>(dx) + 0.5f) / (static_cast<float>(dy) - 0.5f);

            if (startSlope < rightSlope) continue;
            if (endSlope > leftSlope) break;

            int mx = origin.x + dx * xx + dy * xy;
            int my = origin.y + dx * yx + dy * yy;

            if (dx * dx + dy * dy <= radiusSq) {
                map.markVisible(mx, my);
            }

            if (blocked) {
                if (map.isOpaque(mx, my)) {
                    nextStartSlope = rightSlope;
                    continue;
                }
                blocked = false;
                startSlope = nextStartSlope;
            } else if (map.isOpaque(mx, my) && i < radius) {
                blocked = true;
                castLight(map, origin, radius, i + 1, startSlope, leftSlope, xx, xy, yx, yy);
                nextStartSlope = rightSlope;
            }
        }
        if (blocked) break;
    }
}

} // namespace delve
