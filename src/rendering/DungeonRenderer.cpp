#include "rendering/DungeonRenderer.hpp"
#include "gameplay/GameSession.hpp"
#include "world/Visibility.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <string>

namespace delve {

namespace {

constexpr Color DarkWall   = {0, 0, 100, 255};
constexpr Color DarkFloor  = {50, 50, 150, 255};
constexpr Color LightWall  = {130, 110, 50, 255};
constexpr Color LightFloor = {200, 180, 50, 255};
constexpr Color BarFilled  = {0, 96, 0, 255};
constexpr Color BarEmpty   = {64, 16, 16, 255};

} // anonymous namespace

DungeonRenderer::DungeonRenderer(IRenderer* renderer, DungeonRenderConfig config)
    : m_renderer(renderer), m_config(config) {}

Rect DungeonRenderer::cellRect(int x, int y) const {
    float size = static_cast<float>(m_config.cellSize);
    return {static_cast<float>(x) * size, static_cast<float>(y) * size, size, size};
}

std::vector<Entity> DungeonRenderer::collectDrawable(const GameSession& session) {
    const auto& registry = session.getRegistry();
    const auto& map = session.getMap();

    std::vector<Entity> drawable;
    for (Entity entity : session.getStore().entities()) {
        if (!registry.has<Glyph>(entity)) continue;
        if (isDrawable(registry, entity, map)) {
            drawable.push_back(entity);
        }
    }

    std::stable_sort(drawable.begin(), drawable.end(), [&registry](Entity a, Entity b) {
        return registry.get<Glyph>(a).layer < registry.get<Glyph>(b).layer;
    });
    return drawable;
}

void DungeonRenderer::render(const GameSession& session, TurnState state) {
    if (!m_renderer) return;

    m_renderer->clear(Color::Black());
    drawMap(session);
    drawEntities(session);
    drawStatusPanel(session);
    drawMessages(session);

    if (state == TurnState::LevelUp) {
        drawLevelUpMenu(session);
    } else if (state == TurnState::PlayerDead) {
        drawDeathBanner();
    }
}

void DungeonRenderer::drawMap(const GameSession& session) {
    const auto& map = session.getMap();
    for (int y = 0; y < map.getHeight(); ++y) {
        for (int x = 0; x < map.getWidth(); ++x) {
            GridPosition pos{x, y};
            bool wall = map.isOpaque(x, y);
            if (map.isVisible(pos)) {
                m_renderer->drawRectangle(cellRect(x, y), wall ? LightWall : LightFloor);
            } else if (map.isExplored(pos)) {
                m_renderer->drawRectangle(cellRect(x, y), wall ? DarkWall : DarkFloor);
            }
        }
    }
}

void DungeonRenderer::drawEntities(const GameSession& session) {
    const auto& registry = session.getRegistry();
    for (Entity entity : collectDrawable(session)) {
        const auto& pos = registry.get<GridPosition>(entity);
        const auto& glyph = registry.get<Glyph>(entity);

        std::string symbol(1, glyph.symbol);
        Rect cell = cellRect(pos.x, pos.y);
        int width = m_renderer->measureTextWidth(symbol, m_config.fontSize);
        float offset = (cell.width - static_cast<float>(width)) * 0.5f;
        m_renderer->drawText(symbol, {cell.x + offset, cell.y}, m_config.fontSize, glyph.color);
    }
}

void DungeonRenderer::drawStatusPanel(const GameSession& session) {
    const auto& registry = session.getRegistry();
    const Fighter* fighter = session.getPlayerFighter();
    if (!fighter) return;

    int top = session.getMap().getHeight() + 1;
    int level = 1;
    if (const auto* lvl = registry.tryGet<CharacterLevel>(session.getPlayer())) {
        level = lvl->level;
    }

    // Health bar
    Rect bar = cellRect(0, top);
    bar.width = static_cast<float>(m_config.barWidth * m_config.cellSize);
    m_renderer->drawRectangle(bar, BarEmpty);
    if (fighter->maxHp > 0 && fighter->hp > 0) {
        Rect filled = bar;
        filled.width = bar.width * static_cast<float>(fighter->hp) / static_cast<float>(fighter->maxHp);
        m_renderer->drawRectangle(filled, BarFilled);
    }
    m_renderer->drawText(fmt::format("HP: {}/{}", fighter->hp, fighter->maxHp),
                         {bar.x + 2.0f, bar.y}, m_config.fontSize, Color::White());

    // The level is already raised while a stat choice is pending; the cost
    // of that level has not been paid yet
    const auto& progression = session.getProgression();
    int next = progression.isAwaitingChoice() ? progression.getPendingCost()
                                              : progression.getRules().threshold(level);
    float lineHeight = static_cast<float>(m_config.cellSize);
    m_renderer->drawText(fmt::format("XP: {}/{}", fighter->xp, next),
                         {0.0f, bar.y + lineHeight}, m_config.fontSize, Color::White());
    m_renderer->drawText(fmt::format("Level: {}", level),
                         {0.0f, bar.y + lineHeight * 2.0f}, m_config.fontSize, Color::White());
    m_renderer->drawText(fmt::format("Dungeon level: {}", session.getDepth()),
                         {0.0f, bar.y + lineHeight * 3.0f}, m_config.fontSize, Color::White());

    const auto& inventory = session.getInventory();
    if (!inventory.isEmpty()) {
        std::string line = "Items:";
        for (int i = 0; i < std::min(inventory.size(), 9); ++i) {
            const auto* def = session.getFactory().getDefinition(*inventory.at(i));
            line += fmt::format(" {}) {}", i + 1, def ? def->name : *inventory.at(i));
        }
        m_renderer->drawText(line, {0.0f, bar.y + lineHeight * 4.0f}, m_config.fontSize, Color::Gray());
    }
}

void DungeonRenderer::drawMessages(const GameSession& session) {
    const auto& messages = session.getLog().getMessages();
    int top = session.getMap().getHeight() + 1;
    int rows = std::max(1, m_config.panelRows - 1);
    float left = static_cast<float>((m_config.barWidth + 2) * m_config.cellSize);

    // Newest message at the bottom
    int shown = std::min(rows, static_cast<int>(messages.size()));
    for (int i = 0; i < shown; ++i) {
        const Message& msg = messages[messages.size() - static_cast<size_t>(shown - i)];
        float y = static_cast<float>((top + i) * m_config.cellSize);
        m_renderer->drawText(msg.fullText(), {left, y}, m_config.fontSize, msg.color);
    }
}

void DungeonRenderer::drawLevelUpMenu(const GameSession& session) {
    const auto& rules = session.getProgression().getRules();
    const Fighter* fighter = session.getPlayerFighter();
    if (!fighter) return;

    const std::string lines[] = {
        "Level Up",
        "Congratulations! You level up!",
        "Select an attribute to increase.",
        fmt::format("a) Constitution (+{} HP, from {})", rules.healthBonus, fighter->maxHp),
        fmt::format("b) Strength (+{} attack, from {})", rules.powerBonus, fighter->power),
        fmt::format("c) Agility (+{} defense, from {})", rules.defenseBonus, fighter->defense),
    };

    int widest = 0;
    for (const auto& line : lines) {
        widest = std::max(widest, m_renderer->measureTextWidth(line, m_config.fontSize));
    }

    float lineHeight = static_cast<float>(m_config.cellSize);
    Rect box{lineHeight, lineHeight,
             static_cast<float>(widest) + lineHeight * 2.0f,
             lineHeight * (static_cast<float>(std::size(lines)) + 2.0f)};
    m_renderer->drawRectangle(box, Color::Black());
    m_renderer->drawRectangleOutline(box, Color::White(), 2.0f);

    for (size_t i = 0; i < std::size(lines); ++i) {
        m_renderer->drawText(lines[i], {box.x + lineHeight, box.y + lineHeight * static_cast<float>(i + 1)},
                             m_config.fontSize, i == 0 ? Color::Yellow() : Color::White());
    }
}

void DungeonRenderer::drawDeathBanner() {
    const std::string text = "You died. Press Escape to quit.";
    int width = m_renderer->measureTextWidth(text, m_config.fontSize * 2);
    float x = static_cast<float>(m_renderer->getScreenWidth() - width) * 0.5f;
    m_renderer->drawText(text, {x, static_cast<float>(m_config.cellSize * 2)},
                         m_config.fontSize * 2, Color::Red());
}

} // namespace delve
