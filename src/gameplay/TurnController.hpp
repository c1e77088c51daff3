#pragma once

#include <string>

namespace delve {

class GameSession;
class ILevelGenerator;

/// A player command for one turn
struct PlayerAction {
    enum class Kind {
        Move,       // dx, dy; bumping a living blocker attacks it
        Wait,
        Descend,
        PickUp,
        UseItem,    // index = inventory slot
        ChooseStat, // index = level-up menu entry
    };

    Kind kind = Kind::Wait;
    int dx = 0;
    int dy = 0;
    int index = 0;

    static PlayerAction move(int dx, int dy) { return {Kind::Move, dx, dy, 0}; }
    static PlayerAction wait() { return {Kind::Wait, 0, 0, 0}; }
    static PlayerAction descend() { return {Kind::Descend, 0, 0, 0}; }
    static PlayerAction pickUp() { return {Kind::PickUp, 0, 0, 0}; }
    static PlayerAction useItem(int slot) { return {Kind::UseItem, 0, 0, slot}; }
    static PlayerAction chooseStat(int option) { return {Kind::ChooseStat, 0, 0, option}; }
};

enum class TurnState {
    PlayerTurn,
    LevelUp,    // only ChooseStat is accepted
    PlayerDead, // nothing is accepted
};

/// Runs the turn sequence: the player's action, then the monsters, then
/// field of view, then the progression tick.
class TurnController {
public:
    explicit TurnController(ILevelGenerator& generator);

    /// Apply one player action. Returns true if it was accepted (used a
    /// turn, or resolved a level-up choice).
    bool submit(GameSession& session, const PlayerAction& action);

    TurnState getState() const { return m_state; }

    /// Turns the player has spent this session
    int getTurnCount() const { return m_turns; }

private:
    bool handleMove(GameSession& session, int dx, int dy);
    bool handleDescend(GameSession& session);
    bool handlePickUp(GameSession& session);
    bool handleUseItem(GameSession& session, int slot);
    bool handleChooseStat(GameSession& session, int index);

    /// Monsters, FOV, then progression
    void endTurn(GameSession& session);

    /// Tick progression and enter LevelUp if a choice is pending
    void runProgression(GameSession& session);

    bool playerDead(const GameSession& session) const;

    ILevelGenerator& m_generator;
    TurnState m_state = TurnState::PlayerTurn;
    int m_turns = 0;
};

} // namespace delve
