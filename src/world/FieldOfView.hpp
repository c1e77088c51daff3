#pragma once

#include "world/DungeonMap.hpp"

namespace delve {

/// Recursive shadowcasting over the eight octants around an origin.
/// Results are written into the map's live-visible layer (which also
/// marks those tiles explored).
class FieldOfView {
public:
    static constexpr int DefaultRadius = 10;

    /// Clear the live layer and recompute it from `origin`
    static void compute(DungeonMap& map, const GridPosition& origin, int radius = DefaultRadius);

private:
    static void castLight(DungeonMap& map, const GridPosition& origin, int radius,
                          int row, float startSlope, float endSlope,
                          int xx, int xy, int yx, int yy);
};

} // namespace delve
