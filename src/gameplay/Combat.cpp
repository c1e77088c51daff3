#include "gameplay/Combat.hpp"
#include "gameplay/ExperienceLedger.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace delve {

namespace Combat {

std::optional<int> applyDamage(Registry& registry, Entity target, int amount) {
    auto* fighter = registry.tryGet<Fighter>(target);
    if (!fighter) {
        return std::nullopt;
    }
    return fighter->takeDamage(amount);
}

void makeRemains(Registry& registry, Entity entity) {
    if (!registry.valid(entity)) return;

    std::string name = displayName(registry, entity);
    registry.addOrReplace<Glyph>(entity, Glyph('%', Color::DarkRed(), RenderLayer::Remains));
    registry.remove<BlocksMovement>(entity);
    if (!registry.has<PlayerTag>(entity)) {
        registry.addOrReplace<Name>(entity, Name("remains of " + name));
    }
}

std::string displayName(const Registry& registry, Entity entity) {
    if (const auto* name = registry.tryGet<Name>(entity)) {
        return name->name;
    }
    return "something";
}

} // namespace Combat

CombatResolver::CombatResolver(EntityStore& store, EventBus& events)
    : m_store(store), m_events(events) {}

AttackResult CombatResolver::attack(Entity attacker, Entity target) {
    auto& registry = m_store.registry();
    const auto* attackerFighter = registry.tryGet<Fighter>(attacker);
    const auto* targetFighter = registry.tryGet<Fighter>(target);
    if (!attackerFighter || !targetFighter) {
        return {};
    }
    return resolve(attacker, target, attackerFighter->power - targetFighter->defense);
}

AttackResult CombatResolver::strike(Entity source, Entity target, int amount) {
    return resolve(source, target, amount);
}

AttackResult CombatResolver::resolve(Entity attacker, Entity target, int amount) {
    auto& registry = m_store.registry();
    AttackResult result;

    const auto* targetFighter = registry.tryGet<Fighter>(target);
    if (!targetFighter || !targetFighter->alive) {
        return result;
    }

    result.damage = std::max(0, amount);
    m_events.emit(Events::Attack, EventData()
        .setString("attacker", Combat::displayName(registry, attacker))
        .setString("target", Combat::displayName(registry, target))
        .setInt("damage", result.damage)
        .setBool("player_attacker", m_store.isPlayer(attacker)));

    std::optional<int> yield = Combat::applyDamage(registry, target, result.damage);
    if (!yield) {
        return result;
    }

    result.killed = true;
    if (auto* attackerFighter = registry.tryGet<Fighter>(attacker)) {
        attackerFighter->xp += *yield;
        result.xpAwarded = *yield;
    }
    reportKill(attacker, target, result.xpAwarded);
    return result;
}

BurstResult CombatResolver::burst(const GridPosition& center, int radius, int amount) {
    auto& registry = m_store.registry();
    Entity player = m_store.player();
    BurstResult result;
    ExperienceLedger ledger(player);

    int radiusSq = radius * radius;

    // Phase 1: damage the whole affected set, collecting kill credits
    for (Entity entity : m_store.entities()) {
        const auto* pos = registry.tryGet<GridPosition>(entity);
        const auto* fighter = registry.tryGet<Fighter>(entity);
        if (!pos || !fighter || !fighter->alive) continue;
        if (pos->distanceSquared(center) > radiusSq) continue;

        result.affected.push_back(entity);
        m_events.emit(Events::Attack, EventData()
            .setString("attacker", "the blast")
            .setString("target", Combat::displayName(registry, entity))
            .setInt("damage", std::max(0, amount))
            .setBool("player_attacker", false));

        if (std::optional<int> yield = Combat::applyDamage(registry, entity, amount)) {
            result.killed.push_back(entity);
            if (entity == player) {
                result.playerKilled = true;
            }
            ledger.record(entity, *yield);
        }
    }

    // Phase 2: report deaths, then pay the player once
    for (Entity victim : result.killed) {
        reportKill(player, victim, victim == player ? 0 : registry.get<Fighter>(victim).xpYield);
    }
    result.xpCredited = ledger.settle(registry);

    GAME_LOG_DEBUG("Burst at ({}, {}) r={} hit {} killed {} credited {} xp",
                   center.x, center.y, radius, result.affected.size(),
                   result.killed.size(), result.xpCredited);
    return result;
}

void CombatResolver::reportKill(Entity attacker, Entity victim, int yield) {
    auto& registry = m_store.registry();
    std::string victimName = Combat::displayName(registry, victim);

    if (m_store.isPlayer(victim)) {
        Combat::makeRemains(registry, victim);
        GAME_LOG_INFO("Player killed by {}", Combat::displayName(registry, attacker));
        m_events.emit(Events::PlayerDied, EventData().setString("victim", victimName));
        return;
    }

    Combat::makeRemains(registry, victim);
    GAME_LOG_DEBUG("{} killed {} (+{} xp)", Combat::displayName(registry, attacker), victimName, yield);
    m_events.emit(Events::Kill, EventData()
        .setString("attacker", Combat::displayName(registry, attacker))
        .setString("victim", victimName)
        .setInt("xp", yield)
        .setBool("player_kill", m_store.isPlayer(attacker)));
}

} // namespace delve
