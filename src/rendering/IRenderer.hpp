#pragma once

#include <string>
#include <cstdint>

namespace delve {

/// Color representation with RGBA components
struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
        : r(r), g(g), b(b), a(a) {}

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    static constexpr Color White()     { return {255, 255, 255, 255}; }
    static constexpr Color Black()     { return {0, 0, 0, 255}; }
    static constexpr Color Red()       { return {255, 64, 64, 255}; }
    static constexpr Color DarkRed()   { return {191, 0, 0, 255}; }
    static constexpr Color Green()     { return {63, 255, 63, 255}; }
    static constexpr Color Orange()    { return {255, 127, 0, 255}; }
    static constexpr Color Yellow()    { return {255, 255, 63, 255}; }
    static constexpr Color Violet()    { return {127, 0, 255, 255}; }
    static constexpr Color LightBlue() { return {63, 159, 255, 255}; }
    static constexpr Color Gray()      { return {128, 128, 128, 255}; }
    static constexpr Color DarkGray()  { return {40, 40, 40, 255}; }
};

/// 2D vector for screen-space positions
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x, float y) : x(x), y(y) {}
};

/// Screen-space rectangle
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x, float y, float w, float h)
        : x(x), y(y), width(w), height(h) {}
};

/// Abstract renderer interface. The game only ever draws filled cells
/// and text, so that is all a backend has to provide.
class IRenderer {
public:
    virtual ~IRenderer() = default;

    /// Initialize the renderer (called after window creation)
    virtual bool init(int screenWidth, int screenHeight) = 0;

    /// Shutdown and release resources
    virtual void shutdown() = 0;

    virtual void beginFrame() = 0;
    virtual void endFrame() = 0;

    virtual void clear(const Color& color) = 0;

    virtual int getScreenWidth() const = 0;
    virtual int getScreenHeight() const = 0;
    virtual void setScreenSize(int width, int height) = 0;

    /// Draw a filled rectangle
    virtual void drawRectangle(const Rect& rect, const Color& color) = 0;

    /// Draw a rectangle outline
    virtual void drawRectangleOutline(const Rect& rect, const Color& color, float thickness = 1.0f) = 0;

    /// Draw text with the backend's default font
    virtual void drawText(const std::string& text, Vec2 position, int fontSize,
                         const Color& color) = 0;

    /// Measure text width (for layout)
    virtual int measureTextWidth(const std::string& text, int fontSize) = 0;
};

} // namespace delve
