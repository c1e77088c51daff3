#include "engine/Engine.hpp"
#include "engine/Log.hpp"
#include "rendering/RaylibRenderer.hpp"

#include <spdlog/fmt/fmt.h>

#include <filesystem>

namespace delve {

bool Engine::init(const std::string& configPath) {
    // Load configuration
    if (!m_config.loadFromFile(configPath)) {
        // Initialize logging with defaults before reporting the error
        Log::init("", "debug");
        LOG_WARN("Could not load config ({}), using defaults", m_config.getLastError());
    } else {
        Log::init(
            m_config.getString("logging.file", ""),
            m_config.getString("logging.level", "debug")
        );
        LOG_INFO("Configuration loaded from '{}'", configPath);
    }

    // Per-device overrides: "config.json" -> "config.local.json"
    {
        namespace fs = std::filesystem;
        fs::path base(configPath);
        fs::path localFile = base.parent_path()
            / (base.stem().string() + ".local" + base.extension().string());

        if (m_config.mergeFromFile(localFile.string())) {
            LOG_INFO("Per-device config merged from '{}'", localFile.string());
        } else if (std::filesystem::exists(localFile)) {
            LOG_WARN("Ignoring per-device config: {}", m_config.getLastError());
        }
    }

    LOG_INFO("Delve v{} starting...", kDelveVersion);

    loadContent();

    LevelGenConfig genConfig = LevelGenConfig::fromConfig(m_config);
    DungeonRenderConfig renderConfig;
    renderConfig.cellSize = m_config.getInt("window.cell_size", renderConfig.cellSize);
    renderConfig.fontSize = renderConfig.cellSize;

    // The window fits the map plus the panel unless the config says otherwise
    WindowConfig winCfg;
    winCfg.width  = m_config.getInt("window.width", genConfig.width * renderConfig.cellSize);
    winCfg.height = m_config.getInt("window.height",
                                    (genConfig.height + renderConfig.panelRows) * renderConfig.cellSize);
    winCfg.title  = fmt::format("{} v{}", m_config.getString("window.title", "Delve"), kDelveVersion);
    winCfg.vsync  = m_config.getBool("window.vsync", true);

    if (!m_window.init(winCfg)) {
        LOG_CRITICAL("Failed to create window");
        return false;
    }

    auto renderer = std::make_unique<RaylibRenderer>();
    if (!renderer->init(winCfg.width, winCfg.height)) {
        LOG_CRITICAL("Failed to initialize renderer");
        return false;
    }
    std::string fontPath = m_config.getString("window.font", "");
    if (!fontPath.empty()) {
        renderer->loadGlyphFont(fontPath, renderConfig.fontSize);
    }
    m_renderer = std::move(renderer);
    m_dungeonRenderer = std::make_unique<DungeonRenderer>(m_renderer.get(), renderConfig);

    m_actions.registerRoguelikeDefaults();
    m_actions.applyConfig(m_config);

    m_generator = std::make_unique<RoomsLevelGenerator>(m_entityFactory, genConfig);
    m_session = std::make_unique<GameSession>(
        m_entityFactory,
        ProgressionRules::fromConfig(m_config),
        m_config.getInt("fov.radius", FieldOfView::DefaultRadius));
    m_turns = std::make_unique<TurnController>(*m_generator);

    if (!m_session->start(*m_generator)) {
        LOG_CRITICAL("Failed to start a game session");
        return false;
    }

    m_running = true;
    LOG_INFO("Engine initialized successfully");
    return true;
}

void Engine::loadContent() {
    std::string path = m_config.getString("content.definitions", "data/entities.json");

    m_entityFactory.registerDefaults();
    if (m_entityFactory.loadFromFile(path)) {
        LOG_INFO("Entity definitions loaded from '{}'", path);
    } else {
        LOG_WARN("Using built-in entity definitions");
    }
}

void Engine::run() {
    LOG_INFO("Entering main loop");

    while (m_running && !m_window.shouldClose()) {
        processInput();
        render();
    }

    LOG_INFO("Main loop exited");
}

void Engine::processInput() {
    if (m_actions.isActionPressed(Actions::Quit, m_input, false)) {
        m_running = false;
        return;
    }

    auto action = translateActions(
        [this](const std::string& name, bool allowRepeat) {
            return m_actions.isActionPressed(name, m_input, allowRepeat);
        },
        m_turns->getState());
    if (action) {
        m_turns->submit(*m_session, *action);
    }
}

void Engine::render() {
    if (m_window.wasResized()) {
        m_renderer->setScreenSize(m_window.getWidth(), m_window.getHeight());
    }
    m_renderer->beginFrame();
    m_dungeonRenderer->render(*m_session, m_turns->getState());
    m_renderer->endFrame();
}

void Engine::shutdown() {
    LOG_INFO("Shutting down...");

    m_turns.reset();
    m_session.reset();
    m_generator.reset();
    m_dungeonRenderer.reset();

    if (m_renderer) {
        m_renderer->shutdown();
        m_renderer.reset();
    }
    m_window.shutdown();

    LOG_INFO("Shutdown complete");
    Log::shutdown();
}

} // namespace delve
