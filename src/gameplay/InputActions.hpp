#pragma once

#include "engine/Input.hpp"
#include "gameplay/TurnController.hpp"

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <functional>

namespace delve {

class Config;

/// A keyboard binding for an action, with optional modifiers
struct InputBinding {
    Key key = Key::Space;
    bool requireShift = false;
    bool requireCtrl = false;
    bool requireAlt = false;
};

/// Action names understood by the game
namespace Actions {
    inline constexpr const char* MoveUp        = "move_up";
    inline constexpr const char* MoveDown      = "move_down";
    inline constexpr const char* MoveLeft      = "move_left";
    inline constexpr const char* MoveRight     = "move_right";
    inline constexpr const char* MoveUpLeft    = "move_up_left";
    inline constexpr const char* MoveUpRight   = "move_up_right";
    inline constexpr const char* MoveDownLeft  = "move_down_left";
    inline constexpr const char* MoveDownRight = "move_down_right";
    inline constexpr const char* Wait          = "wait";
    inline constexpr const char* Descend       = "descend";
    inline constexpr const char* PickUp        = "pick_up";
    inline constexpr const char* Quit          = "quit";

    /// "use_item_1" .. "use_item_9"
    std::string useItem(int number);
    /// "choose_stat_1" .. "choose_stat_3"
    std::string chooseStat(int number);
}

/// Input action map: maps named actions to key bindings.
/// Game code queries actions instead of raw keys.
class InputActionMap {
public:
    /// Register a named action with a default key binding
    void registerAction(const std::string& name, Key defaultKey, bool shift = false);

    /// Add an additional binding to an existing action
    void addBinding(const std::string& name, Key key, bool shift = false);

    /// Remove all bindings for an action
    void clearBindings(const std::string& name);

    /// Rebind an action to a single binding (replaces all existing bindings)
    void rebind(const std::string& name, const InputBinding& binding);

    /// Check if an action was just pressed this frame. Key auto-repeat
    /// counts too when `allowRepeat` is set.
    bool isActionPressed(const std::string& name, const Input& input, bool allowRepeat = true) const;

    bool hasAction(const std::string& name) const {
        return m_actions.count(name) > 0;
    }

    /// Get the bindings for an action
    const std::vector<InputBinding>& getBindings(const std::string& name) const;

    /// Get all registered action names
    std::vector<std::string> getActionNames() const;

    void clearAll() { m_actions.clear(); }

    /// Arrow keys, vi keys and the numpad-free roguelike layout
    void registerRoguelikeDefaults();

    /// Apply `input.<action>` overrides: a key name ("k", "shift+period")
    /// or an array of them. Returns the number of actions rebound.
    int applyConfig(const Config& config);

    /// Parse "shift+period", "up", "g", "1" ... into a binding
    static std::optional<InputBinding> parseBinding(const std::string& text);

    /// Parse a single key name
    static std::optional<Key> parseKey(const std::string& name);

private:
    bool checkModifiers(const InputBinding& binding, const Input& input) const;

    std::unordered_map<std::string, std::vector<InputBinding>> m_actions;
};

/// Asks whether an action fired this frame; `allowRepeat` admits a held key
using ActionQuery = std::function<bool(const std::string& action, bool allowRepeat)>;

/// Turn this frame's pressed actions into a player action. Only level-up
/// choices are produced while the level-up menu is open, and nothing once
/// the player is dead. Movement and waiting follow key auto-repeat; every
/// other action needs a fresh press.
std::optional<PlayerAction> translateActions(const ActionQuery& isPressed, TurnState state);

} // namespace delve
