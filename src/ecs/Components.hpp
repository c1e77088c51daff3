#pragma once

#include "rendering/IRenderer.hpp"

#include <string>
#include <optional>
#include <algorithm>
#include <cstdlib>

namespace delve {

/// Integer tile position on the dungeon grid
struct GridPosition {
    int x = 0;
    int y = 0;

    constexpr GridPosition() = default;
    constexpr GridPosition(int px, int py) : x(px), y(py) {}

    constexpr bool operator==(const GridPosition& other) const {
        return x == other.x && y == other.y;
    }
    constexpr bool operator!=(const GridPosition& other) const { return !(*this == other); }

    /// Chessboard distance (diagonal steps count as one)
    int chebyshev(const GridPosition& other) const {
        return std::max(std::abs(other.x - x), std::abs(other.y - y));
    }

    /// Squared Euclidean distance
    int distanceSquared(const GridPosition& other) const {
        int dx = other.x - x;
        int dy = other.y - y;
        return dx * dx + dy * dy;
    }
};

/// Render layers, drawn low to high
namespace RenderLayer {
    constexpr int Remains = 0;
    constexpr int Feature = 1;
    constexpr int Item    = 2;
    constexpr int Actor   = 3;
}

/// Glyph component - visual representation on the grid
struct Glyph {
    char symbol = '?';
    Color color = Color::White();
    int layer = RenderLayer::Actor;

    constexpr Glyph() = default;
    constexpr Glyph(char sym, Color col) : symbol(sym), color(col) {}
    constexpr Glyph(char sym, Color col, int renderLayer)
        : symbol(sym), color(col), layer(renderLayer) {}
};

/// Tag: the entity occupies its tile for movement purposes
struct BlocksMovement {};

/// Tag: drawable whenever its tile has been explored, even outside FOV
struct AlwaysVisible {};

/// Combat profile. Holds the running experience counter for whoever
/// carries it; only the player's counter is ever consumed.
struct Fighter {
    int hp = 10;
    int maxHp = 10;
    int power = 1;
    int defense = 0;
    bool alive = true;
    int xpYield = 0;   // Awarded for the killing blow; fixed at creation
    int xp = 0;

    constexpr Fighter() = default;
    constexpr Fighter(int maxHealth, int pwr, int def, int yield = 0)
        : hp(maxHealth), maxHp(maxHealth), power(pwr), defense(def), xpYield(yield) {}

    /// Apply damage. When this hit is the one that kills, flips `alive`
    /// and returns the experience yield; otherwise returns nullopt.
    /// A dead fighter can never yield twice.
    std::optional<int> takeDamage(int amount) {
        if (!alive || amount <= 0) {
            return std::nullopt;
        }
        hp -= amount;
        if (hp > 0) {
            return std::nullopt;
        }
        hp = 0;
        alive = false;
        return std::max(0, xpYield);
    }

    /// Heal, saturating at maxHp. Returns health actually restored.
    int heal(int amount) {
        if (amount <= 0 || hp >= maxHp) {
            return 0;
        }
        int restored = std::min(amount, maxHp - hp);
        hp += restored;
        return restored;
    }

    bool isFullHealth() const { return hp >= maxHp; }
};

/// Character level counter (meaningful for the player)
struct CharacterLevel {
    int level = 1;
};

/// Name shown in messages
struct Name {
    std::string name;

    Name() = default;
    explicit Name(const std::string& n) : name(n) {}
};

/// Tag component for the player entity
struct PlayerTag {};

/// Tag component for monsters; `type` is the definition id
struct MonsterTag {
    std::string type;
};

/// Tag component for the down staircase
struct StairsTag {};

/// Item lying on the floor; `itemId` is the definition id
struct ItemTag {
    std::string itemId;
};

} // namespace delve
