#pragma once

namespace delve {

/// Keys the game can bind. Values are raylib's key codes so they pass
/// straight through to the backend.
enum class Key : int {
    A = 65, B = 66, C = 67, D = 68, E = 69, F = 70, G = 71, H = 72,
    I = 73, J = 74, K = 75, L = 76, M = 77, N = 78, O = 79, P = 80,
    Q = 81, R = 82, S = 83, T = 84, U = 85, V = 86, W = 87, X = 88,
    Y = 89, Z = 90,

    Num0 = 48, Num1 = 49, Num2 = 50, Num3 = 51, Num4 = 52,
    Num5 = 53, Num6 = 54, Num7 = 55, Num8 = 56, Num9 = 57,

    Up = 265, Down = 264, Left = 263, Right = 262,
    Home = 268, End = 269, PageUp = 266, PageDown = 267,

    Space = 32,
    Enter = 257,
    Escape = 256,
    Tab = 258,
    Backspace = 259,

    Comma = 44,
    Minus = 45,
    Period = 46,
    Slash = 47,
    Semicolon = 59,
    Equal = 61,

    LeftShift = 340, RightShift = 344,
    LeftControl = 341, RightControl = 345,
    LeftAlt = 342, RightAlt = 346,
};

/// Keyboard state for the current frame, read from raylib
class Input {
public:
    bool isKeyPressed(Key key) const;
    bool isKeyDown(Key key) const;

    /// Key auto-repeat while held (raylib's pressed-repeat)
    bool isKeyRepeated(Key key) const;
};

} // namespace delve
