#pragma once

#include "rendering/IRenderer.hpp"
#include "ecs/Registry.hpp"
#include "gameplay/TurnController.hpp"

#include <vector>

namespace delve {

class GameSession;

/// Layout for the glyph grid and the panels below it
struct DungeonRenderConfig {
    int cellSize = 16;          // Pixels per map cell
    int fontSize = 16;
    int panelRows = 7;          // Rows under the map for status and messages
    int barWidth = 20;          // Health bar width in cells
};

/// Draws a session through an IRenderer: explored terrain, drawable
/// entities lowest layer first, the status panel, the message log and the
/// level-up menu when it is open.
class DungeonRenderer {
public:
    explicit DungeonRenderer(IRenderer* renderer, DungeonRenderConfig config = {});

    void render(const GameSession& session, TurnState state);

    /// Entities passing the visibility rule, ordered by render layer
    /// (creation order within a layer)
    static std::vector<Entity> collectDrawable(const GameSession& session);

    const DungeonRenderConfig& getConfig() const { return m_config; }

private:
    void drawMap(const GameSession& session);
    void drawEntities(const GameSession& session);
    void drawStatusPanel(const GameSession& session);
    void drawMessages(const GameSession& session);
    void drawLevelUpMenu(const GameSession& session);
    void drawDeathBanner();

    Rect cellRect(int x, int y) const;

    IRenderer* m_renderer;
    DungeonRenderConfig m_config;
};

} // namespace delve
