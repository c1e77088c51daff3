#include "engine/Window.hpp"
#include "engine/Log.hpp"

#include <raylib.h>

namespace delve {

bool Window::init(const WindowConfig& config) {
    unsigned int flags = FLAG_WINDOW_RESIZABLE;
    if (config.vsync) {
        flags |= FLAG_VSYNC_HINT;
    }
    SetConfigFlags(flags);
    SetTraceLogLevel(LOG_WARNING);

    InitWindow(config.width, config.height, config.title.c_str());

    if (!IsWindowReady()) {
        LOG_ERROR("Failed to open a {}x{} window", config.width, config.height);
        return false;
    }

    if (config.targetFps > 0) {
        SetTargetFPS(config.targetFps);
    }
    // Escape is a game key, not an instant quit
    SetExitKey(KEY_NULL);

    LOG_INFO("Window opened: {}x{} '{}'", config.width, config.height, config.title);
    m_initialized = true;
    return true;
}

void Window::shutdown() {
    if (m_initialized) {
        CloseWindow();
        m_initialized = false;
    }
}

bool Window::shouldClose() const {
    return WindowShouldClose();
}

int Window::getWidth() const {
    return GetScreenWidth();
}

int Window::getHeight() const {
    return GetScreenHeight();
}

bool Window::wasResized() const {
    return IsWindowResized();
}

} // namespace delve
