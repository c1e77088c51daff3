#pragma once

#include "world/TileMask.hpp"
#include "ecs/Registry.hpp"

namespace delve {

class DungeonMap;

/// Render-candidate rule. Anything in the live field of view is drawable;
/// an always-visible entity (stairs, items) additionally stays drawable on
/// any tile the player has explored.
inline bool isDrawable(const GridPosition& pos, bool alwaysVisible,
                       const TileMask& liveFov, const TileMask& explored) {
    return liveFov.contains(pos) || (alwaysVisible && explored.contains(pos));
}

/// Convenience overload reading the entity's components and the map's layers.
/// Entities without a position are never drawable.
bool isDrawable(const Registry& registry, Entity entity, const DungeonMap& map);

} // namespace delve
