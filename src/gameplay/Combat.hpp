#pragma once

#include "ecs/EntityStore.hpp"
#include "events/EventBus.hpp"

#include <optional>
#include <string>
#include <vector>

namespace delve {

namespace Combat {

/// Reduce a living fighter's hp. Returns the victim's experience yield
/// exactly once, on the call that kills it; nullopt for non-lethal hits,
/// dead targets, entities without a Fighter and non-positive amounts.
std::optional<int> applyDamage(Registry& registry, Entity target, int amount);

/// Turn a dead entity into a non-blocking corpse glyph. The entity stays
/// in the store.
void makeRemains(Registry& registry, Entity entity);

/// Name used in narrative messages ("something" when unnamed)
std::string displayName(const Registry& registry, Entity entity);

} // namespace Combat

struct AttackResult {
    int damage = 0;
    bool killed = false;
    int xpAwarded = 0;
};

struct BurstResult {
    std::vector<Entity> affected;
    std::vector<Entity> killed;
    int xpCredited = 0;
    bool playerKilled = false;
};

/// Resolves attacks against the entities of one store and reports them on
/// the event bus. Whoever lands a killing blow is credited directly;
/// area effects go through an ExperienceLedger that only pays the player.
class CombatResolver {
public:
    CombatResolver(EntityStore& store, EventBus& events);

    /// Melee: damage is attacker power minus target defense
    AttackResult attack(Entity attacker, Entity target);

    /// Fixed damage from `source` to one target (spells); kill credit
    /// goes to `source`
    AttackResult strike(Entity source, Entity target, int amount);

    /// Damage every living fighter within `radius` (inclusive, Euclidean)
    /// of `center`, the player included. Kill yields are summed and paid
    /// to the player after the whole set is processed.
    BurstResult burst(const GridPosition& center, int radius, int amount);

private:
    AttackResult resolve(Entity attacker, Entity target, int amount);
    void reportKill(Entity attacker, Entity victim, int yield);

    EntityStore& m_store;
    EventBus& m_events;
};

} // namespace delve
