#include <gtest/gtest.h>

#include "gameplay/MessageLog.hpp"

using namespace delve;

TEST(MessageLogTest, StartsEmpty) {
    MessageLog log;
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(log.capacity(), MessageLog::DefaultCapacity);
    EXPECT_EQ(log.latest(), "");
}

TEST(MessageLogTest, IdenticalMessagesStack) {
    MessageLog log;
    log.add("The orc attacks you.");
    log.add("The orc attacks you.");
    log.add("The orc attacks you.");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.getMessages().front().count, 3);
    EXPECT_EQ(log.latest(), "The orc attacks you. (x3)");

    log.add("You feel better.");
    log.add("The orc attacks you.");
    EXPECT_EQ(log.size(), 3u);
}

TEST(MessageLogTest, StackingCanBeDisabled) {
    MessageLog log;
    log.add("Hello", MessageColor::Default, false);
    log.add("Hello", MessageColor::Default, false);
    EXPECT_EQ(log.size(), 2u);
}

TEST(MessageLogTest, OldestDroppedAtCapacity) {
    MessageLog log(3);
    log.add("one");
    log.add("two");
    log.add("three");
    log.add("four");
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log.getMessages().front().text, "two");
    EXPECT_EQ(log.getMessages().back().text, "four");
}

TEST(MessageLogTest, ZeroCapacityHoldsOne) {
    MessageLog log(0);
    log.add("a");
    log.add("b");
    EXPECT_EQ(log.size(), 1u);
    EXPECT_EQ(log.latest(), "b");
}

class MessageLogEventsTest : public ::testing::Test {
protected:
    void SetUp() override { log.subscribe(events); }

    EventBus events;
    MessageLog log;
};

TEST_F(MessageLogEventsTest, FormatsProgressEvents) {
    events.emit(Events::Rest, EventData().setInt("healed", 12));
    EXPECT_EQ(log.latest(), "You take a moment to rest, and recover 12 health.");
    EXPECT_EQ(log.getMessages().back().color, MessageColor::Recovered);

    events.emit(Events::Descend, EventData().setInt("depth", 4));
    EXPECT_EQ(log.latest(), "After a rare moment of peace, you descend to depth 4.");

    events.emit(Events::LevelUp, EventData().setInt("level", 3));
    EXPECT_EQ(log.latest(), "Your battle skills grow stronger! You reach level 3!");
}

TEST_F(MessageLogEventsTest, FormatsCombatEvents) {
    events.emit(Events::Attack, EventData()
        .setString("attacker", "player").setString("target", "orc")
        .setInt("damage", 4).setBool("player_attacker", true));
    EXPECT_EQ(log.latest(), "Player attacks orc for 4 hit points.");
    EXPECT_EQ(log.getMessages().back().color, MessageColor::PlayerAttack);

    events.emit(Events::Attack, EventData()
        .setString("attacker", "troll").setString("target", "player").setInt("damage", 0));
    EXPECT_EQ(log.latest(), "Troll attacks player but does no damage.");
    EXPECT_EQ(log.getMessages().back().color, MessageColor::EnemyAttack);

    events.emit(Events::Kill, EventData()
        .setString("victim", "orc").setInt("xp", 35).setBool("player_kill", true));
    EXPECT_EQ(log.latest(), "Orc is dead! You gain 35 experience points.");

    events.emit(Events::Kill, EventData().setString("victim", "orc").setBool("player_kill", false));
    EXPECT_EQ(log.latest(), "Orc is dead!");

    events.emit(Events::PlayerDied);
    EXPECT_EQ(log.latest(), "You died!");
}

TEST_F(MessageLogEventsTest, NoticeToneSelectsColor) {
    events.emit(Events::Notice, EventData().setString("text", "That way is blocked.")
                                          .setString("tone", "impossible"));
    EXPECT_EQ(log.latest(), "That way is blocked.");
    EXPECT_EQ(log.getMessages().back().color, MessageColor::Impossible);

    events.emit(Events::Notice, EventData().setString("text", "Hi"));
    EXPECT_EQ(log.getMessages().back().color, MessageColor::Default);
}

TEST_F(MessageLogEventsTest, UnsubscribeStopsListening) {
    log.unsubscribe();
    EXPECT_EQ(events.handlerCount(Events::Rest), 0u);
    events.emit(Events::Rest, EventData().setInt("healed", 5));
    EXPECT_TRUE(log.empty());
}

TEST(MessageLogLifetimeTest, DestructionRemovesHandlers) {
    EventBus events;
    {
        MessageLog log;
        log.subscribe(events);
        EXPECT_EQ(events.handlerCount(Events::Kill), 1u);
    }
    EXPECT_EQ(events.handlerCount(Events::Kill), 0u);
    events.emit(Events::Kill, EventData().setString("victim", "orc"));
}
