#include "gameplay/ExperienceLedger.hpp"
#include "ecs/Components.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace delve {

ExperienceLedger::ExperienceLedger(Entity beneficiary)
    : m_beneficiary(beneficiary) {
    m_excluded.push_back(beneficiary);
}

void ExperienceLedger::exclude(Entity entity) {
    if (!isExcluded(entity)) {
        m_excluded.push_back(entity);
    }
}

bool ExperienceLedger::isExcluded(Entity entity) const {
    return std::find(m_excluded.begin(), m_excluded.end(), entity) != m_excluded.end();
}

bool ExperienceLedger::record(Entity victim, int yield) {
    if (yield < 0 || isExcluded(victim)) {
        return false;
    }
    m_credits.push_back({victim, yield});
    return true;
}

int ExperienceLedger::pending() const {
    int total = 0;
    for (const auto& credit : m_credits) {
        total += credit.yield;
    }
    return total;
}

int ExperienceLedger::settle(Registry& registry) {
    int total = pending();
    m_credits.clear();

    auto* fighter = registry.tryGet<Fighter>(m_beneficiary);
    if (!fighter) {
        if (total > 0) {
            GAME_LOG_WARN("ExperienceLedger: beneficiary has no Fighter, dropping {} xp", total);
        }
        return 0;
    }

    fighter->xp += total;
    return total;
}

} // namespace delve
