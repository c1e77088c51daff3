#include "ecs/EntityStore.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace delve {

EntityStore EntityStore::seededWith(const PlayerRecord& record) {
    EntityStore store;
    store.createPlayer(record);
    return store;
}

Entity EntityStore::createPlayer(const PlayerRecord& record) {
    if (!m_order.empty()) {
        LOG_ERROR("EntityStore: player must be the first entity (store holds {})",
                  m_order.size());
        return NullEntity;
    }

    Entity player = record.handle == NullEntity
        ? m_registry.create()
        : m_registry.createWithHint(record.handle);

    m_registry.add<PlayerTag>(player);
    m_registry.add<GridPosition>(player, record.position);
    m_registry.add<Glyph>(player, record.glyph);
    m_registry.add<Name>(player, record.name);
    m_registry.add<Fighter>(player, record.fighter);
    m_registry.add<CharacterLevel>(player, record.level);
    m_registry.add<BlocksMovement>(player);

    m_order.push_back(player);
    return player;
}

bool EntityStore::erase(Entity entity) {
    if (isPlayer(entity)) {
        return false;
    }
    auto it = std::find(m_order.begin(), m_order.end(), entity);
    if (it == m_order.end()) {
        return false;
    }
    m_order.erase(it);
    m_registry.destroy(entity);
    return true;
}

PlayerRecord EntityStore::extractPlayer() const {
    Entity player = this->player();

    PlayerRecord record;
    record.handle = player;
    record.position = m_registry.get<GridPosition>(player);
    record.glyph = m_registry.get<Glyph>(player);
    record.name = m_registry.get<Name>(player);
    record.fighter = m_registry.get<Fighter>(player);
    record.level = m_registry.get<CharacterLevel>(player);
    return record;
}

bool EntityStore::contains(Entity entity) const {
    return std::find(m_order.begin(), m_order.end(), entity) != m_order.end();
}

Entity EntityStore::blockingEntityAt(const GridPosition& pos) const {
    for (Entity entity : m_order) {
        if (!m_registry.hasAll<BlocksMovement, GridPosition>(entity)) continue;
        if (m_registry.get<GridPosition>(entity) == pos) {
            return entity;
        }
    }
    return NullEntity;
}

std::vector<Entity> EntityStore::entitiesAt(const GridPosition& pos) const {
    std::vector<Entity> result;
    for (Entity entity : m_order) {
        const auto* position = m_registry.tryGet<GridPosition>(entity);
        if (position && *position == pos) {
            result.push_back(entity);
        }
    }
    return result;
}

} // namespace delve
