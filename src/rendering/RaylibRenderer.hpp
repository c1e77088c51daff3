#pragma once

#include "rendering/IRenderer.hpp"
#include <raylib.h>
#include <string>

namespace delve {

/// Raylib backend. Text goes through raylib's default font unless a
/// monospace glyph font has been loaded, in which case every cell glyph and
/// panel line is drawn with it.
class RaylibRenderer : public IRenderer {
public:
    RaylibRenderer() = default;
    ~RaylibRenderer() override;

    RaylibRenderer(const RaylibRenderer&) = delete;
    RaylibRenderer& operator=(const RaylibRenderer&) = delete;

    bool init(int screenWidth, int screenHeight) override;
    void shutdown() override;

    void beginFrame() override;
    void endFrame() override;
    void clear(const Color& color) override;

    int getScreenWidth() const override { return m_screenWidth; }
    int getScreenHeight() const override { return m_screenHeight; }
    void setScreenSize(int width, int height) override;

    void drawRectangle(const Rect& rect, const Color& color) override;
    void drawRectangleOutline(const Rect& rect, const Color& color,
                              float thickness = 1.0f) override;
    void drawText(const std::string& text, Vec2 position, int fontSize,
                  const Color& color) override;
    int measureTextWidth(const std::string& text, int fontSize) override;

    /// Load a TTF/OTF glyph font rasterized at `baseSize` pixels. Returns
    /// false (keeping the default font) if the file cannot be loaded.
    bool loadGlyphFont(const std::string& path, int baseSize);

    bool hasGlyphFont() const { return m_hasFont; }

private:
    void unloadGlyphFont();

    int m_screenWidth = 0;
    int m_screenHeight = 0;
    bool m_initialized = false;

    ::Font m_font{};
    bool m_hasFont = false;
};

} // namespace delve
