#include "rendering/RaylibRenderer.hpp"
#include "engine/Log.hpp"

namespace delve {

namespace {

::Color toRaylib(const Color& c) {
    return {c.r, c.g, c.b, c.a};
}

} // anonymous namespace

RaylibRenderer::~RaylibRenderer() {
    if (m_initialized) {
        shutdown();
    }
}

bool RaylibRenderer::init(int screenWidth, int screenHeight) {
    if (!IsWindowReady()) {
        LOG_ERROR("RaylibRenderer: no window to draw into");
        return false;
    }
    m_screenWidth = screenWidth;
    m_screenHeight = screenHeight;
    m_initialized = true;
    LOG_INFO("RaylibRenderer: ready ({}x{})", screenWidth, screenHeight);
    return true;
}

void RaylibRenderer::shutdown() {
    unloadGlyphFont();
    m_initialized = false;
    LOG_INFO("RaylibRenderer: shut down");
}

bool RaylibRenderer::loadGlyphFont(const std::string& path, int baseSize) {
    if (!m_initialized) {
        LOG_WARN("RaylibRenderer: font '{}' requested before init", path);
        return false;
    }
    if (!FileExists(path.c_str())) {
        LOG_WARN("RaylibRenderer: glyph font '{}' not found, using default font", path);
        return false;
    }

    ::Font font = LoadFontEx(path.c_str(), baseSize, nullptr, 0);
    if (font.texture.id == 0) {
        LOG_WARN("RaylibRenderer: failed to load glyph font '{}'", path);
        return false;
    }

    unloadGlyphFont();
    m_font = font;
    m_hasFont = true;
    SetTextureFilter(m_font.texture, TEXTURE_FILTER_POINT);
    LOG_INFO("RaylibRenderer: glyph font '{}' at {}px", path, baseSize);
    return true;
}

void RaylibRenderer::unloadGlyphFont() {
    if (m_hasFont) {
        UnloadFont(m_font);
        m_font = ::Font{};
        m_hasFont = false;
    }
}

void RaylibRenderer::beginFrame() {
    BeginDrawing();
}

void RaylibRenderer::endFrame() {
    EndDrawing();
}

void RaylibRenderer::clear(const Color& color) {
    ClearBackground(toRaylib(color));
}

void RaylibRenderer::setScreenSize(int width, int height) {
    m_screenWidth = width;
    m_screenHeight = height;
}

void RaylibRenderer::drawRectangle(const Rect& rect, const Color& color) {
    DrawRectangleRec({rect.x, rect.y, rect.width, rect.height}, toRaylib(color));
}

void RaylibRenderer::drawRectangleOutline(const Rect& rect, const Color& color, float thickness) {
    DrawRectangleLinesEx({rect.x, rect.y, rect.width, rect.height}, thickness, toRaylib(color));
}

void RaylibRenderer::drawText(const std::string& text, Vec2 position, int fontSize,
                              const Color& color) {
    if (m_hasFont) {
        DrawTextEx(m_font, text.c_str(), {position.x, position.y},
                   static_cast<float>(fontSize), 0.0f, toRaylib(color));
        return;
    }
    DrawText(text.c_str(), static_cast<int>(position.x), static_cast<int>(position.y),
             fontSize, toRaylib(color));
}

int RaylibRenderer::measureTextWidth(const std::string& text, int fontSize) {
    if (m_hasFont) {
        return static_cast<int>(MeasureTextEx(m_font, text.c_str(),
                                              static_cast<float>(fontSize), 0.0f).x);
    }
    return MeasureText(text.c_str(), fontSize);
}

} // namespace delve
