#include "gameplay/TurnController.hpp"
#include "gameplay/GameSession.hpp"
#include "gameplay/Combat.hpp"
#include "gameplay/MonsterAI.hpp"
#include "gameplay/LevelTransition.hpp"
#include "ecs/EntityFactory.hpp"
#include "world/LevelGenerator.hpp"
#include "engine/Log.hpp"

#include <spdlog/fmt/fmt.h>

#include <limits>

namespace delve {

namespace {

/// Closest living monster in FOV within `range` (0 = unlimited)
Entity closestVisibleMonster(GameSession& session, int range) {
    auto& registry = session.getRegistry();
    const auto* playerPos = registry.tryGet<GridPosition>(session.getPlayer());
    if (!playerPos) return NullEntity;

    int limitSq = range > 0 ? range * range : std::numeric_limits<int>::max();
    Entity closest = NullEntity;
    int bestDistSq = std::numeric_limits<int>::max();

    for (Entity entity : session.getStore().entities()) {
        if (!registry.has<MonsterTag>(entity)) continue;
        const auto* fighter = registry.tryGet<Fighter>(entity);
        const auto* pos = registry.tryGet<GridPosition>(entity);
        if (!fighter || !fighter->alive || !pos) continue;
        if (!session.getMap().isVisible(*pos)) continue;

        int distSq = playerPos->distanceSquared(*pos);
        if (distSq <= limitSq && distSq < bestDistSq) {
            closest = entity;
            bestDistSq = distSq;
        }
    }
    return closest;
}

} // anonymous namespace

TurnController::TurnController(ILevelGenerator& generator)
    : m_generator(generator) {}

bool TurnController::submit(GameSession& session, const PlayerAction& action) {
    if (m_state == TurnState::PlayerDead) {
        return false;
    }

    if (m_state == TurnState::LevelUp) {
        if (action.kind != PlayerAction::Kind::ChooseStat) {
            return false;
        }
        return handleChooseStat(session, action.index);
    }

    bool consumed = false;
    switch (action.kind) {
        case PlayerAction::Kind::Move:       consumed = handleMove(session, action.dx, action.dy); break;
        case PlayerAction::Kind::Wait:       consumed = true; break;
        case PlayerAction::Kind::Descend:    consumed = handleDescend(session); break;
        case PlayerAction::Kind::PickUp:     consumed = handlePickUp(session); break;
        case PlayerAction::Kind::UseItem:    consumed = handleUseItem(session, action.index); break;
        case PlayerAction::Kind::ChooseStat: consumed = false; break;
    }

    if (consumed) {
        ++m_turns;
        endTurn(session);
    }
    return consumed;
}

bool TurnController::handleMove(GameSession& session, int dx, int dy) {
    if (dx == 0 && dy == 0) return false;

    auto& registry = session.getRegistry();
    Entity player = session.getPlayer();
    auto& pos = registry.get<GridPosition>(player);
    GridPosition target{pos.x + dx, pos.y + dy};

    Entity blocker = session.getStore().blockingEntityAt(target);
    if (blocker != NullEntity) {
        const auto* fighter = registry.tryGet<Fighter>(blocker);
        if (fighter && fighter->alive) {
            CombatResolver combat(session.getStore(), session.getEvents());
            combat.attack(player, blocker);
            return true;
        }
    }

    if (!session.getMap().isWalkable(target) || blocker != NullEntity) {
        session.notify("That way is blocked.", "impossible");
        return false;
    }

    pos = target;
    return true;
}

bool TurnController::handleDescend(GameSession& session) {
    if (!LevelTransition::canDescend(session)) {
        session.notify("There are no stairs here.", "impossible");
        return false;
    }
    LevelTransition::descend(session, m_generator, session.getFovRadius());
    return true;
}

bool TurnController::handlePickUp(GameSession& session) {
    auto& registry = session.getRegistry();
    const auto& playerPos = registry.get<GridPosition>(session.getPlayer());

    for (Entity entity : session.getStore().entitiesAt(playerPos)) {
        const auto* item = registry.tryGet<ItemTag>(entity);
        if (!item) continue;

        if (session.getInventory().isFull()) {
            session.notify("Your inventory is full.", "impossible");
            return false;
        }

        std::string itemId = item->itemId;
        std::string name = Combat::displayName(registry, entity);
        session.getInventory().add(itemId);
        session.getStore().erase(entity);
        session.notify(fmt::format("You picked up the {}!", name));
        return true;
    }

    session.notify("There is nothing here to pick up.", "impossible");
    return false;
}

bool TurnController::handleUseItem(GameSession& session, int slot) {
    auto& inventory = session.getInventory();
    const std::string* itemId = inventory.at(slot);
    if (!itemId) {
        session.notify("You have no item in that slot.", "impossible");
        return false;
    }

    const EntityDefinition* def = session.getFactory().getDefinition(*itemId);
    if (!def || !def->effect) {
        GAME_LOG_WARN("Inventory item '{}' has no usable effect", *itemId);
        session.notify("You can't use that.", "impossible");
        return false;
    }

    auto& registry = session.getRegistry();
    Entity player = session.getPlayer();
    const ItemEffect& effect = *def->effect;
    CombatResolver combat(session.getStore(), session.getEvents());

    switch (effect.kind) {
        case ItemEffectKind::Heal: {
            auto& fighter = registry.get<Fighter>(player);
            if (fighter.isFullHealth()) {
                session.notify("Your health is already full.", "impossible");
                return false;
            }
            int healed = fighter.heal(effect.amount);
            session.notify(fmt::format("You consume the {}, and recover {} HP!", def->name, healed),
                           "recovered");
            break;
        }
        case ItemEffectKind::Lightning: {
            Entity target = closestVisibleMonster(session, effect.range);
            if (target == NullEntity) {
                session.notify("No enemy is close enough to strike.", "impossible");
                return false;
            }
            session.notify(fmt::format("A lightning bolt strikes the {} with a loud thunder!",
                                       Combat::displayName(registry, target)));
            combat.strike(player, target, effect.amount);
            break;
        }
        case ItemEffectKind::Fireball: {
            Entity target = closestVisibleMonster(session, effect.range);
            if (target == NullEntity) {
                session.notify("There is no target in range for the fireball.", "impossible");
                return false;
            }
            GridPosition center = registry.get<GridPosition>(target);
            session.notify(fmt::format("The fireball explodes, burning everything within {} tiles!",
                                       effect.radius));
            combat.burst(center, effect.radius, effect.amount);
            break;
        }
    }

    inventory.take(slot);
    return true;
}

bool TurnController::handleChooseStat(GameSession& session, int index) {
    auto& progression = session.getProgression();
    if (!progression.choose(session.getRegistry(), session.getPlayer(), statChoiceFromIndex(index))) {
        return false;
    }

    m_state = TurnState::PlayerTurn;
    runProgression(session);
    return true;
}

void TurnController::endTurn(GameSession& session) {
    if (!playerDead(session)) {
        CombatResolver combat(session.getStore(), session.getEvents());
        MonsterAI::takeTurns(session, combat);
    }

    session.recomputeFov();

    if (playerDead(session)) {
        m_state = TurnState::PlayerDead;
        GAME_LOG_INFO("Player died on depth {} after {} turns", session.getDepth(), m_turns);
        return;
    }

    runProgression(session);
}

void TurnController::runProgression(GameSession& session) {
    TickResult result = session.getProgression().tick(session.getRegistry(), session.getPlayer());
    m_state = result == TickResult::ChoicePending ? TurnState::LevelUp : TurnState::PlayerTurn;
}

bool TurnController::playerDead(const GameSession& session) const {
    const auto* fighter = session.getPlayerFighter();
    return !fighter || !fighter->alive;
}

} // namespace delve
