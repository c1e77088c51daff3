#pragma once

#include "ecs/Registry.hpp"

namespace delve {

class GameSession;
class CombatResolver;

/// Hostile melee behaviour: a monster the player can see closes in one
/// step per turn and attacks once adjacent. Monsters out of sight wait.
class MonsterAI {
public:
    /// Give every living monster on the level its turn, in creation order.
    /// Stops early if the player dies.
    static void takeTurns(GameSession& session, CombatResolver& combat);

    /// One monster's turn. Returns true if it moved or attacked.
    static bool takeTurn(GameSession& session, CombatResolver& combat, Entity monster);

private:
    static bool stepToward(GameSession& session, Entity monster, const GridPosition& target);
};

} // namespace delve
