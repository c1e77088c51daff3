#pragma once

#include "ecs/Registry.hpp"
#include "ecs/Components.hpp"

#include <vector>
#include <cstddef>

namespace delve {

/// The player's components captured by value, so the player can be carried
/// from one store into the next without depending on the old registry.
struct PlayerRecord {
    Entity handle = NullEntity;
    GridPosition position;
    Glyph glyph{'@', Color::White(), RenderLayer::Actor};
    Name name{"player"};
    Fighter fighter;
    CharacterLevel level;
};

/// Ordered collection of every entity on the current dungeon level.
///
/// Component data lives in an EnTT registry; the store adds a creation order
/// on top of it. Slot 0 always holds the player: the player is the first
/// entity created in any store and can never be erased from one.
class EntityStore {
public:
    static constexpr size_t PlayerSlot = 0;

    EntityStore() = default;

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;
    EntityStore(EntityStore&&) = default;
    EntityStore& operator=(EntityStore&&) = default;

    /// Build a fresh store whose only entity is the player described by
    /// `record`, keeping the record's handle.
    static EntityStore seededWith(const PlayerRecord& record);

    /// Create the player in an empty store. Returns NullEntity (and logs)
    /// if the store already has entities.
    Entity createPlayer(const PlayerRecord& record);

    /// Append a new entity with the given components
    template<typename... Components>
    Entity create(Components&&... components) {
        Entity entity = m_registry.create(std::forward<Components>(components)...);
        m_order.push_back(entity);
        return entity;
    }

    /// Remove a non-player entity. Returns false for the player or for
    /// entities this store does not hold.
    bool erase(Entity entity);

    /// Copy the player's components out by value. The caller must have
    /// checked that slot 0 holds a player.
    PlayerRecord extractPlayer() const;

    size_t size() const { return m_order.size(); }
    bool empty() const { return m_order.empty(); }

    /// Entity at a creation-order slot, or NullEntity when out of range
    Entity at(size_t index) const {
        return index < m_order.size() ? m_order[index] : NullEntity;
    }

    /// Entity in the player slot (NullEntity for an empty store)
    Entity player() const { return at(PlayerSlot); }

    bool isPlayer(Entity entity) const {
        return !m_order.empty() && m_order[PlayerSlot] == entity;
    }

    bool contains(Entity entity) const;

    /// First blocking entity on a tile, or NullEntity
    Entity blockingEntityAt(const GridPosition& pos) const;

    /// All entities on a tile, in creation order
    std::vector<Entity> entitiesAt(const GridPosition& pos) const;

    const std::vector<Entity>& entities() const { return m_order; }

    Registry& registry() { return m_registry; }
    const Registry& registry() const { return m_registry; }

private:
    Registry m_registry;
    std::vector<Entity> m_order;
};

} // namespace delve
