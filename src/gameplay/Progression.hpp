#pragma once

#include "ecs/Registry.hpp"

#include <optional>

namespace delve {

class Config;
class EventBus;

/// Stat picked on level-up
enum class StatChoice {
    Constitution,   // +health
    Strength,       // +power
    Agility,        // +defense
};

/// Menu index (0..2) to a stat; anything else is no choice
std::optional<StatChoice> statChoiceFromIndex(int index);

/// Display name for a stat
const char* statChoiceName(StatChoice choice);

/// Experience curve and level-up bonuses
struct ProgressionRules {
    int base = 200;
    int factor = 150;
    int healthBonus = 20;
    int powerBonus = 1;
    int defenseBonus = 1;

    /// Experience needed to leave `level`
    int threshold(int level) const { return base + level * factor; }

    /// Read `progression.*`, keeping defaults for missing keys
    static ProgressionRules fromConfig(const Config& config);
};

enum class ProgressionState {
    Idle,
    ThresholdReached,
    AwaitingChoice,
};

enum class TickResult {
    Idle,
    ChoicePending,
};

/// Level-up state machine for the player.
///
/// tick() runs once per turn after every attack has been resolved. When the
/// player's experience reaches the threshold for its current level the
/// machine raises the level and waits for a stat choice; choose() pays the
/// threshold out of the experience counter and applies the stat. Several
/// thresholds crossed at once take one tick/choose round each.
class ProgressionMachine {
public:
    explicit ProgressionMachine(ProgressionRules rules = {});

    /// Events (level_up) go here when set
    void setEventBus(EventBus* events) { m_events = events; }

    TickResult tick(Registry& registry, Entity player);

    /// Apply a stat choice. Returns false, changing nothing, when no choice
    /// is pending or `choice` is empty.
    bool choose(Registry& registry, Entity player, std::optional<StatChoice> choice);

    ProgressionState getState() const { return m_state; }
    bool isAwaitingChoice() const { return m_state == ProgressionState::AwaitingChoice; }

    /// Experience that the pending choice will consume
    int getPendingCost() const { return m_pendingCost; }

    const ProgressionRules& getRules() const { return m_rules; }

private:
    ProgressionRules m_rules;
    ProgressionState m_state = ProgressionState::Idle;
    int m_pendingCost = 0;
    EventBus* m_events = nullptr;
};

} // namespace delve
