#include <gtest/gtest.h>

#include "gameplay/InputActions.hpp"
#include "engine/Config.hpp"

#include <algorithm>
#include <set>

using namespace delve;

// ============================================================================
// Key parsing
// ============================================================================

TEST(InputParseTest, SingleCharacters) {
    EXPECT_EQ(InputActionMap::parseKey("k"), Key::K);
    EXPECT_EQ(InputActionMap::parseKey("K"), Key::K);
    EXPECT_EQ(InputActionMap::parseKey("7"), Key::Num7);
    EXPECT_EQ(InputActionMap::parseKey("."), Key::Period);
    EXPECT_EQ(InputActionMap::parseKey(","), Key::Comma);
    EXPECT_FALSE(InputActionMap::parseKey("@").has_value());
}

TEST(InputParseTest, NamedKeys) {
    EXPECT_EQ(InputActionMap::parseKey("up"), Key::Up);
    EXPECT_EQ(InputActionMap::parseKey("escape"), Key::Escape);
    EXPECT_EQ(InputActionMap::parseKey("period"), Key::Period);
    EXPECT_EQ(InputActionMap::parseKey("pagedown"), Key::PageDown);
    EXPECT_FALSE(InputActionMap::parseKey("hyperspace").has_value());
    EXPECT_FALSE(InputActionMap::parseKey("").has_value());
}

TEST(InputParseTest, BindingsWithModifiers) {
    auto plain = InputActionMap::parseBinding("g");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->key, Key::G);
    EXPECT_FALSE(plain->requireShift);

    auto stairs = InputActionMap::parseBinding("Shift+Period");
    ASSERT_TRUE(stairs.has_value());
    EXPECT_EQ(stairs->key, Key::Period);
    EXPECT_TRUE(stairs->requireShift);
    EXPECT_FALSE(stairs->requireCtrl);

    auto combo = InputActionMap::parseBinding("ctrl+alt+q");
    ASSERT_TRUE(combo.has_value());
    EXPECT_TRUE(combo->requireCtrl);
    EXPECT_TRUE(combo->requireAlt);
    EXPECT_EQ(combo->key, Key::Q);

    EXPECT_FALSE(InputActionMap::parseBinding("meta+q").has_value());
    EXPECT_FALSE(InputActionMap::parseBinding("shift+").has_value());
}

// ============================================================================
// InputActionMap
// ============================================================================

TEST(InputActionMapTest, RegisterAndRebind) {
    InputActionMap map;
    map.registerAction("jump", Key::Space);
    map.addBinding("jump", Key::W);
    EXPECT_TRUE(map.hasAction("jump"));
    EXPECT_EQ(map.getBindings("jump").size(), 2u);

    InputBinding binding;
    binding.key = Key::Up;
    binding.requireShift = true;
    map.rebind("jump", binding);
    ASSERT_EQ(map.getBindings("jump").size(), 1u);
    EXPECT_EQ(map.getBindings("jump")[0].key, Key::Up);

    map.clearBindings("jump");
    EXPECT_TRUE(map.hasAction("jump"));
    EXPECT_TRUE(map.getBindings("jump").empty());

    EXPECT_TRUE(map.getBindings("missing").empty());
    map.clearAll();
    EXPECT_FALSE(map.hasAction("jump"));
}

TEST(InputActionMapTest, UnknownActionNeverPressed) {
    InputActionMap map;
    Input input;
    EXPECT_FALSE(map.isActionPressed("nothing", input));
}

TEST(InputActionMapTest, RoguelikeDefaults) {
    InputActionMap map;
    map.registerRoguelikeDefaults();

    EXPECT_EQ(map.getBindings(Actions::MoveUp).size(), 2u);
    EXPECT_EQ(map.getBindings(Actions::MoveUp)[1].key, Key::K);
    EXPECT_EQ(map.getBindings(Actions::MoveDownRight)[0].key, Key::N);

    const auto& wait = map.getBindings(Actions::Wait);
    ASSERT_EQ(wait.size(), 1u);
    EXPECT_FALSE(wait[0].requireShift);
    const auto& descend = map.getBindings(Actions::Descend);
    ASSERT_EQ(descend.size(), 2u);
    EXPECT_EQ(descend[0].key, Key::Period);
    EXPECT_TRUE(descend[0].requireShift);

    EXPECT_EQ(map.getBindings(Actions::useItem(1))[0].key, Key::Num1);
    EXPECT_EQ(map.getBindings(Actions::useItem(9))[0].key, Key::Num9);
    EXPECT_EQ(map.getBindings(Actions::chooseStat(3))[1].key, Key::C);

    auto names = map.getActionNames();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    // 8 moves, wait, descend, pick up, quit, 9 items, 3 stats
    EXPECT_EQ(names.size(), 24u);
}

TEST(InputActionMapTest, ConfigOverrides) {
    Config config;
    ASSERT_TRUE(config.loadFromString(R"({
        "input": {
            "wait": [".", "space"],
            "pick_up": "comma",
            "quit": "nonsense",
            "descend": 5
        }
    })"));

    InputActionMap map;
    map.registerRoguelikeDefaults();
    EXPECT_EQ(map.applyConfig(config), 2);

    const auto& wait = map.getBindings(Actions::Wait);
    ASSERT_EQ(wait.size(), 2u);
    EXPECT_EQ(wait[1].key, Key::Space);
    EXPECT_EQ(map.getBindings(Actions::PickUp)[0].key, Key::Comma);

    // Unparseable overrides keep the defaults
    EXPECT_EQ(map.getBindings(Actions::Quit)[0].key, Key::Escape);
    EXPECT_EQ(map.getBindings(Actions::Descend).size(), 2u);
}

TEST(InputActionMapTest, ConfigWithoutInputSection) {
    Config config;
    ASSERT_TRUE(config.loadFromString(R"({ "window": { "width": 800 } })"));
    InputActionMap map;
    EXPECT_EQ(map.applyConfig(config), 0);
}

// ============================================================================
// translateActions
// ============================================================================

namespace {

// Fresh presses this frame
ActionQuery pressing(std::set<std::string> pressed) {
    return [pressed = std::move(pressed)](const std::string& name, bool) {
        return pressed.count(name) > 0;
    };
}

// Keys held down from an earlier frame: only auto-repeat reports them
ActionQuery holding(std::set<std::string> held) {
    return [held = std::move(held)](const std::string& name, bool allowRepeat) {
        return allowRepeat && held.count(name) > 0;
    };
}

} // anonymous namespace

TEST(TranslateActionsTest, NothingPressed) {
    EXPECT_FALSE(translateActions(pressing({}), TurnState::PlayerTurn).has_value());
}

TEST(TranslateActionsTest, Movement) {
    auto action = translateActions(pressing({Actions::MoveUpLeft}), TurnState::PlayerTurn);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(action->kind, PlayerAction::Kind::Move);
    EXPECT_EQ(action->dx, -1);
    EXPECT_EQ(action->dy, -1);

    action = translateActions(pressing({Actions::MoveRight}), TurnState::PlayerTurn);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(action->dx, 1);
    EXPECT_EQ(action->dy, 0);
}

TEST(TranslateActionsTest, Commands) {
    EXPECT_EQ(translateActions(pressing({Actions::Descend}), TurnState::PlayerTurn)->kind,
              PlayerAction::Kind::Descend);
    EXPECT_EQ(translateActions(pressing({Actions::Wait}), TurnState::PlayerTurn)->kind,
              PlayerAction::Kind::Wait);
    EXPECT_EQ(translateActions(pressing({Actions::PickUp}), TurnState::PlayerTurn)->kind,
              PlayerAction::Kind::PickUp);

    auto use = translateActions(pressing({Actions::useItem(4)}), TurnState::PlayerTurn);
    ASSERT_TRUE(use.has_value());
    EXPECT_EQ(use->kind, PlayerAction::Kind::UseItem);
    EXPECT_EQ(use->index, 3);
}

TEST(TranslateActionsTest, LevelUpOnlyOffersChoices) {
    auto keys = pressing({Actions::MoveUp, Actions::useItem(2), Actions::chooseStat(2)});

    auto normal = translateActions(keys, TurnState::PlayerTurn);
    ASSERT_TRUE(normal.has_value());
    EXPECT_EQ(normal->kind, PlayerAction::Kind::Move);

    auto menu = translateActions(keys, TurnState::LevelUp);
    ASSERT_TRUE(menu.has_value());
    EXPECT_EQ(menu->kind, PlayerAction::Kind::ChooseStat);
    EXPECT_EQ(menu->index, 1);

    EXPECT_FALSE(translateActions(pressing({Actions::MoveUp}), TurnState::LevelUp).has_value());
}

TEST(TranslateActionsTest, DeadPlayerProducesNothing) {
    auto keys = pressing({Actions::Wait, Actions::chooseStat(1)});
    EXPECT_FALSE(translateActions(keys, TurnState::PlayerDead).has_value());
}

TEST(TranslateActionsTest, HeldKeyDoesNotPickAStat) {
    auto held = holding({Actions::useItem(1), Actions::chooseStat(1)});
    EXPECT_FALSE(translateActions(held, TurnState::LevelUp).has_value());

    auto fresh = translateActions(pressing({Actions::chooseStat(1)}), TurnState::LevelUp);
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(fresh->kind, PlayerAction::Kind::ChooseStat);
    EXPECT_EQ(fresh->index, 0);
}

TEST(TranslateActionsTest, HeldKeyRepeatsOnlyMovementAndWait) {
    auto move = translateActions(holding({Actions::MoveLeft}), TurnState::PlayerTurn);
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(move->kind, PlayerAction::Kind::Move);
    EXPECT_EQ(move->dx, -1);

    EXPECT_EQ(translateActions(holding({Actions::Wait}), TurnState::PlayerTurn)->kind,
              PlayerAction::Kind::Wait);

    EXPECT_FALSE(translateActions(holding({Actions::useItem(1)}), TurnState::PlayerTurn).has_value());
    EXPECT_FALSE(translateActions(holding({Actions::Descend}), TurnState::PlayerTurn).has_value());
    EXPECT_FALSE(translateActions(holding({Actions::PickUp}), TurnState::PlayerTurn).has_value());
}
