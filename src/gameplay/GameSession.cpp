#include "gameplay/GameSession.hpp"
#include "ecs/EntityFactory.hpp"
#include "world/LevelGenerator.hpp"
#include "engine/Log.hpp"

namespace delve {

GameSession::GameSession(const EntityFactory& factory, ProgressionRules rules, int fovRadius)
    : m_factory(factory),
      m_progression(rules),
      m_fovRadius(fovRadius > 0 ? fovRadius : FieldOfView::DefaultRadius) {
    m_log.subscribe(m_events);
    m_progression.setEventBus(&m_events);
}

bool GameSession::start(ILevelGenerator& generator) {
    if (!m_factory.hasDefinition("player")) {
        LOG_ERROR("GameSession: no 'player' definition registered");
        return false;
    }

    m_store = EntityStore::seededWith(m_factory.makePlayer({0, 0}));
    m_player = m_store.player();
    m_depth = 1;
    m_inventory = Inventory{};

    m_map = generator.generate(m_store, m_depth);
    recomputeFov();

    GAME_LOG_INFO("Session started: {}x{} map, {} entities",
                  m_map.getWidth(), m_map.getHeight(), m_store.size());
    notify("Hello and welcome, adventurer, to yet another dungeon!", "welcome");
    return true;
}

void GameSession::recomputeFov() {
    const auto* pos = m_store.registry().tryGet<GridPosition>(m_player);
    if (!pos) {
        m_map.clearVisible();
        return;
    }
    FieldOfView::compute(m_map, *pos, m_fovRadius);
}

void GameSession::notify(const std::string& text, const std::string& tone) {
    m_events.emit(Events::Notice, EventData().setString("text", text).setString("tone", tone));
}

} // namespace delve
