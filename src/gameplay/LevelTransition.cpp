#include "gameplay/LevelTransition.hpp"
#include "gameplay/GameSession.hpp"
#include "world/LevelGenerator.hpp"
#include "world/FieldOfView.hpp"
#include "engine/Log.hpp"

#include <cstdlib>

namespace delve {

bool LevelTransition::canDescend(const GameSession& session) {
    const auto& store = session.getStore();
    const auto& registry = store.registry();

    const auto* playerPos = registry.tryGet<GridPosition>(session.getPlayer());
    if (!playerPos) return false;

    for (Entity entity : store.entities()) {
        if (!registry.has<StairsTag>(entity)) continue;
        const auto* pos = registry.tryGet<GridPosition>(entity);
        if (pos && *pos == *playerPos) {
            return true;
        }
    }
    return false;
}

void LevelTransition::descend(GameSession& session, ILevelGenerator& generator, int fovRadius) {
    auto& registry = session.m_store.registry();
    Entity player = session.m_player;

    if (auto* fighter = registry.tryGet<Fighter>(player)) {
        int healed = fighter->heal(restAmount(fighter->maxHp));
        session.m_events.emit(Events::Rest, EventData().setInt("healed", healed));
    }

    Entity slot0 = session.m_store.player();
    if (slot0 == NullEntity || slot0 != player || !registry.has<PlayerTag>(slot0)) {
        LOG_CRITICAL("Descent invariant violated: store slot 0 holds {} but the player is {}",
                     static_cast<uint32_t>(entt::to_integral(slot0)),
                     static_cast<uint32_t>(entt::to_integral(player)));
        std::abort();
    }

    PlayerRecord record = session.m_store.extractPlayer();
    size_t discarded = session.m_store.size() - 1;

    session.m_depth += 1;
    session.m_store = EntityStore::seededWith(record);
    session.m_map = generator.generate(session.m_store, session.m_depth);

    if (auto* pos = session.m_store.registry().tryGet<GridPosition>(player)) {
        FieldOfView::compute(session.m_map, *pos, fovRadius);
    }

    GAME_LOG_INFO("Descended to depth {} ({} entities discarded, {} generated)",
                  session.m_depth, discarded, session.m_store.size() - 1);
    session.m_events.emit(Events::Descend, EventData().setInt("depth", session.m_depth));
}

} // namespace delve
