#include "gameplay/MonsterAI.hpp"
#include "gameplay/GameSession.hpp"
#include "gameplay/Combat.hpp"

#include <vector>

namespace delve {

namespace {

int sign(int v) {
    return (v > 0) - (v < 0);
}

} // anonymous namespace

void MonsterAI::takeTurns(GameSession& session, CombatResolver& combat) {
    auto& registry = session.getRegistry();

    // Snapshot: nothing is created or erased during monster turns
    std::vector<Entity> monsters;
    for (Entity entity : session.getStore().entities()) {
        if (registry.has<MonsterTag>(entity)) {
            monsters.push_back(entity);
        }
    }

    for (Entity monster : monsters) {
        const auto* playerFighter = session.getPlayerFighter();
        if (!playerFighter || !playerFighter->alive) break;
        takeTurn(session, combat, monster);
    }
}

bool MonsterAI::takeTurn(GameSession& session, CombatResolver& combat, Entity monster) {
    auto& registry = session.getRegistry();
    Entity player = session.getPlayer();

    const auto* fighter = registry.tryGet<Fighter>(monster);
    const auto* pos = registry.tryGet<GridPosition>(monster);
    const auto* playerPos = registry.tryGet<GridPosition>(player);
    if (!fighter || !fighter->alive || !pos || !playerPos) return false;

    // Sight is symmetric: the monster sees the player iff its tile is in FOV
    if (!session.getMap().isVisible(*pos)) return false;

    if (pos->chebyshev(*playerPos) <= 1) {
        combat.attack(monster, player);
        return true;
    }

    return stepToward(session, monster, *playerPos);
}

bool MonsterAI::stepToward(GameSession& session, Entity monster, const GridPosition& target) {
    auto& registry = session.getRegistry();
    auto& pos = registry.get<GridPosition>(monster);

    int dx = sign(target.x - pos.x);
    int dy = sign(target.y - pos.y);

    // Diagonal first, then each axis alone
    const GridPosition candidates[] = {
        {pos.x + dx, pos.y + dy},
        {pos.x + dx, pos.y},
        {pos.x, pos.y + dy},
    };

    for (const auto& next : candidates) {
        if (next == pos) continue;
        if (!session.getMap().isWalkable(next)) continue;
        if (session.getStore().blockingEntityAt(next) != NullEntity) continue;
        pos = next;
        return true;
    }
    return false;
}

} // namespace delve
