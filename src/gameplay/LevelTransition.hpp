#pragma once

namespace delve {

class GameSession;
class ILevelGenerator;

/// Moves the player down one level. The player is the only entity that
/// survives: it is healed, carried into a fresh store under the same
/// handle, and the generator builds everything else anew.
class LevelTransition {
public:
    /// True when stairs share the player's tile
    static bool canDescend(const GameSession& session);

    /// Heal, reseed the store with the player, increment depth, generate
    /// the new level and recompute FOV.
    ///
    /// Aborts the process if store slot 0 is not the session's player:
    /// carrying anything else forward would lose the player.
    static void descend(GameSession& session, ILevelGenerator& generator, int fovRadius);

    /// Health restored by resting before a descent
    static int restAmount(int maxHp) { return maxHp / 2; }
};

} // namespace delve
