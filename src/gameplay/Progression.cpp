#include "gameplay/Progression.hpp"
#include "ecs/Components.hpp"
#include "events/EventBus.hpp"
#include "engine/Config.hpp"
#include "engine/Log.hpp"

namespace delve {

std::optional<StatChoice> statChoiceFromIndex(int index) {
    switch (index) {
        case 0: return StatChoice::Constitution;
        case 1: return StatChoice::Strength;
        case 2: return StatChoice::Agility;
        default: return std::nullopt;
    }
}

const char* statChoiceName(StatChoice choice) {
    switch (choice) {
        case StatChoice::Constitution: return "Constitution";
        case StatChoice::Strength:     return "Strength";
        case StatChoice::Agility:      return "Agility";
    }
    return "Unknown";
}

ProgressionRules ProgressionRules::fromConfig(const Config& config) {
    ProgressionRules rules;
    rules.base         = config.getInt("progression.base", rules.base);
    rules.factor       = config.getInt("progression.factor", rules.factor);
    rules.healthBonus  = config.getInt("progression.health_bonus", rules.healthBonus);
    rules.powerBonus   = config.getInt("progression.power_bonus", rules.powerBonus);
    rules.defenseBonus = config.getInt("progression.defense_bonus", rules.defenseBonus);

    const ProgressionRules defaults;
    if (rules.factor <= 0) {
        LOG_WARN("progression.factor must be positive (got {}), using {}", rules.factor, defaults.factor);
        rules.factor = defaults.factor;
    }
    // A negative base would make thresholds free and pay experience out of choose()
    if (rules.base < 0) {
        LOG_WARN("progression.base must not be negative (got {}), using {}", rules.base, defaults.base);
        rules.base = defaults.base;
    }

    auto checkBonus = [](const char* key, int& value, int fallback) {
        if (value < 0) {
            LOG_WARN("progression.{} must not be negative (got {}), using {}", key, value, fallback);
            value = fallback;
        }
    };
    checkBonus("health_bonus", rules.healthBonus, defaults.healthBonus);
    checkBonus("power_bonus", rules.powerBonus, defaults.powerBonus);
    checkBonus("defense_bonus", rules.defenseBonus, defaults.defenseBonus);
    return rules;
}

ProgressionMachine::ProgressionMachine(ProgressionRules rules)
    : m_rules(rules) {}

TickResult ProgressionMachine::tick(Registry& registry, Entity player) {
    if (m_state == ProgressionState::AwaitingChoice) {
        return TickResult::ChoicePending;
    }

    auto* fighter = registry.tryGet<Fighter>(player);
    auto* level = registry.tryGet<CharacterLevel>(player);
    if (!fighter || !level) {
        return TickResult::Idle;
    }

    int threshold = m_rules.threshold(level->level);
    if (fighter->xp < threshold) {
        return TickResult::Idle;
    }

    m_state = ProgressionState::ThresholdReached;
    m_pendingCost = threshold;
    level->level += 1;

    GAME_LOG_INFO("Level up: now level {} (xp {}, cost {})", level->level, fighter->xp, threshold);
    if (m_events) {
        m_events->emit(Events::LevelUp, EventData().setInt("level", level->level));
    }

    m_state = ProgressionState::AwaitingChoice;
    return TickResult::ChoicePending;
}

bool ProgressionMachine::choose(Registry& registry, Entity player, std::optional<StatChoice> choice) {
    if (m_state != ProgressionState::AwaitingChoice || !choice) {
        return false;
    }

    auto* fighter = registry.tryGet<Fighter>(player);
    if (!fighter) {
        GAME_LOG_ERROR("ProgressionMachine: level-up target has no Fighter");
        return false;
    }

    fighter->xp -= m_pendingCost;
    switch (*choice) {
        case StatChoice::Constitution:
            fighter->maxHp += m_rules.healthBonus;
            fighter->hp += m_rules.healthBonus;
            break;
        case StatChoice::Strength:
            fighter->power += m_rules.powerBonus;
            break;
        case StatChoice::Agility:
            fighter->defense += m_rules.defenseBonus;
            break;
    }

    GAME_LOG_DEBUG("Chose {} (xp now {})", statChoiceName(*choice), fighter->xp);
    m_pendingCost = 0;
    m_state = ProgressionState::Idle;
    return true;
}

} // namespace delve
