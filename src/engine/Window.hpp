#pragma once

#include <string>

namespace delve {

struct WindowConfig {
    int         width      = 1280;
    int         height     = 720;
    std::string title      = "Delve";
    bool        vsync      = true;
    int         targetFps  = 60;
};

class Window {
public:
    bool init(const WindowConfig& config);
    void shutdown();

    bool shouldClose() const;

    int  getWidth() const;
    int  getHeight() const;

    /// True on the frame the user resized the window
    bool wasResized() const;

    bool isInitialized() const { return m_initialized; }

private:
    bool m_initialized = false;
};

} // namespace delve
