#pragma once

#include "ecs/EntityStore.hpp"
#include "world/DungeonMap.hpp"
#include "world/FieldOfView.hpp"
#include "events/EventBus.hpp"
#include "gameplay/MessageLog.hpp"
#include "gameplay/Inventory.hpp"
#include "gameplay/Progression.hpp"

namespace delve {

class EntityFactory;
class ILevelGenerator;

/// Everything one run of the game mutates: the current level (store, map,
/// depth) and what outlives it (inventory, message log, progression).
/// Owned by the game loop and passed explicitly to every operation.
class GameSession {
public:
    GameSession(const EntityFactory& factory, ProgressionRules rules = {},
                int fovRadius = FieldOfView::DefaultRadius);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /// Create the player, generate depth 1 and compute the first field of
    /// view. Returns false if the factory cannot build a player.
    bool start(ILevelGenerator& generator);

    /// Recompute live FOV from the player's position
    void recomputeFov();

    EntityStore& getStore() { return m_store; }
    const EntityStore& getStore() const { return m_store; }
    Registry& getRegistry() { return m_store.registry(); }
    const Registry& getRegistry() const { return m_store.registry(); }

    DungeonMap& getMap() { return m_map; }
    const DungeonMap& getMap() const { return m_map; }

    /// Stable player handle for the whole session
    Entity getPlayer() const { return m_player; }

    int getDepth() const { return m_depth; }
    int getFovRadius() const { return m_fovRadius; }

    EventBus& getEvents() { return m_events; }
    MessageLog& getLog() { return m_log; }
    const MessageLog& getLog() const { return m_log; }
    Inventory& getInventory() { return m_inventory; }
    const Inventory& getInventory() const { return m_inventory; }
    ProgressionMachine& getProgression() { return m_progression; }
    const ProgressionMachine& getProgression() const { return m_progression; }
    const EntityFactory& getFactory() const { return m_factory; }

    /// Player's fighter, or nullptr before start()
    const Fighter* getPlayerFighter() const { return m_store.registry().tryGet<Fighter>(m_player); }

    /// Emit a plain narrative line ("info", "impossible", "recovered", "welcome", "danger")
    void notify(const std::string& text, const std::string& tone = "info");

private:
    friend class LevelTransition;

    const EntityFactory& m_factory;
    EventBus m_events;
    MessageLog m_log;
    EntityStore m_store;
    DungeonMap m_map;
    Inventory m_inventory;
    ProgressionMachine m_progression;
    Entity m_player = NullEntity;
    int m_depth = 1;
    int m_fovRadius;
};

} // namespace delve
