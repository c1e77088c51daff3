#include "world/Visibility.hpp"
#include "world/DungeonMap.hpp"

namespace delve {

bool isDrawable(const Registry& registry, Entity entity, const DungeonMap& map) {
    const auto* pos = registry.tryGet<GridPosition>(entity);
    if (!pos) {
        return false;
    }
    return isDrawable(*pos, registry.has<AlwaysVisible>(entity),
                      map.visibleTiles(), map.exploredTiles());
}

} // namespace delve
