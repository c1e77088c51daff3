#pragma once

#include "engine/Config.hpp"
#include "engine/Window.hpp"
#include "engine/Input.hpp"
#include "rendering/IRenderer.hpp"
#include "rendering/DungeonRenderer.hpp"
#include "ecs/EntityFactory.hpp"
#include "world/LevelGenerator.hpp"
#include "gameplay/GameSession.hpp"
#include "gameplay/TurnController.hpp"
#include "gameplay/InputActions.hpp"

#include <string>
#include <memory>

namespace delve {

/// Version string shown in the window title and the startup log
inline constexpr const char* kDelveVersion = "0.1.0";

/// Owns the window, the content and the running session, and drives the
/// read-input / resolve-turn / draw loop.
class Engine {
public:
    bool init(const std::string& configPath = "config.json");
    void run();
    void shutdown();

private:
    void loadContent();
    void processInput();
    void render();

    Config m_config;
    Window m_window;
    Input m_input;
    InputActionMap m_actions;
    std::unique_ptr<IRenderer> m_renderer;
    std::unique_ptr<DungeonRenderer> m_dungeonRenderer;

    EntityFactory m_entityFactory;
    std::unique_ptr<RoomsLevelGenerator> m_generator;
    std::unique_ptr<GameSession> m_session;
    std::unique_ptr<TurnController> m_turns;

    bool m_running = false;
};

} // namespace delve
