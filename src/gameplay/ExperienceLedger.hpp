#pragma once

#include "ecs/Registry.hpp"

#include <vector>

namespace delve {

/// One kill waiting to be credited
struct KillCredit {
    Entity victim = NullEntity;
    int yield = 0;
};

/// Collects kill credits during a multi-target effect and pays the sum to
/// the beneficiary once the whole affected set has been processed.
///
/// The beneficiary is always excluded: its own death never pays it.
class ExperienceLedger {
public:
    explicit ExperienceLedger(Entity beneficiary);

    /// Never record kills of this entity
    void exclude(Entity entity);
    bool isExcluded(Entity entity) const;

    /// Record a kill. Returns false (and records nothing) for excluded
    /// victims and negative yields.
    bool record(Entity victim, int yield);

    /// Sum of recorded yields
    int pending() const;

    const std::vector<KillCredit>& credits() const { return m_credits; }
    Entity beneficiary() const { return m_beneficiary; }

    /// Add the pending sum to the beneficiary's experience in one step and
    /// clear the ledger. Returns the amount credited.
    int settle(Registry& registry);

private:
    Entity m_beneficiary;
    std::vector<Entity> m_excluded;
    std::vector<KillCredit> m_credits;
};

} // namespace delve
