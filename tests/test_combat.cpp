#include <gtest/gtest.h>

#include "gameplay/Combat.hpp"
#include "gameplay/ExperienceLedger.hpp"
#include "ecs/EntityFactory.hpp"

using namespace delve;

// =============================================================================
// ExperienceLedger
// =============================================================================

TEST(ExperienceLedgerTest, BeneficiaryIsAlwaysExcluded) {
    Registry registry;
    Entity player = registry.create(Fighter(100, 4, 1));
    ExperienceLedger ledger(player);

    EXPECT_TRUE(ledger.isExcluded(player));
    EXPECT_FALSE(ledger.record(player, 50));
    EXPECT_EQ(ledger.pending(), 0);
}

TEST(ExperienceLedgerTest, SettlePaysSumOnceAndClears) {
    Registry registry;
    Entity player = registry.create(Fighter(100, 4, 1));
    Entity a = registry.create();
    Entity b = registry.create();
    ExperienceLedger ledger(player);

    EXPECT_TRUE(ledger.record(a, 35));
    EXPECT_TRUE(ledger.record(b, 100));
    EXPECT_FALSE(ledger.record(b, -5));
    EXPECT_EQ(ledger.credits().size(), 2u);
    EXPECT_EQ(ledger.pending(), 135);

    EXPECT_EQ(ledger.settle(registry), 135);
    EXPECT_EQ(registry.get<Fighter>(player).xp, 135);

    // Settling again pays nothing
    EXPECT_EQ(ledger.settle(registry), 0);
    EXPECT_EQ(registry.get<Fighter>(player).xp, 135);
}

TEST(ExperienceLedgerTest, ExtraExclusions) {
    Registry registry;
    Entity player = registry.create(Fighter(100, 4, 1));
    Entity ally = registry.create();
    ExperienceLedger ledger(player);
    ledger.exclude(ally);
    EXPECT_FALSE(ledger.record(ally, 10));
}

TEST(ExperienceLedgerTest, BeneficiaryWithoutFighterGetsNothing) {
    Registry registry;
    Entity ghost = registry.create();
    Entity victim = registry.create();
    ExperienceLedger ledger(ghost);
    ledger.record(victim, 20);
    EXPECT_EQ(ledger.settle(registry), 0);
    EXPECT_TRUE(ledger.credits().empty());
}

// =============================================================================
// Damage primitives
// =============================================================================

TEST(CombatTest, ApplyDamageYieldsExactlyOnce) {
    Registry registry;
    Entity orc = registry.create(Fighter(20, 4, 0, 35));

    EXPECT_FALSE(Combat::applyDamage(registry, orc, 10).has_value());
    auto yield = Combat::applyDamage(registry, orc, 15);
    ASSERT_TRUE(yield.has_value());
    EXPECT_EQ(*yield, 35);
    EXPECT_FALSE(registry.get<Fighter>(orc).alive);
    EXPECT_EQ(registry.get<Fighter>(orc).hp, 0);

    EXPECT_FALSE(Combat::applyDamage(registry, orc, 100).has_value());
}

TEST(CombatTest, ApplyDamageIgnoresNonFightersAndZero) {
    Registry registry;
    Entity rock = registry.create(GridPosition{1, 1});
    Entity orc = registry.create(Fighter(20, 4, 0, 35));
    EXPECT_FALSE(Combat::applyDamage(registry, rock, 50).has_value());
    EXPECT_FALSE(Combat::applyDamage(registry, orc, 0).has_value());
    EXPECT_EQ(registry.get<Fighter>(orc).hp, 20);
}

TEST(CombatTest, MakeRemains) {
    Registry registry;
    Entity orc = registry.create(Name("orc"), Glyph('o', Color::Green()), BlocksMovement{});
    Combat::makeRemains(registry, orc);

    EXPECT_EQ(registry.get<Glyph>(orc).symbol, '%');
    EXPECT_EQ(registry.get<Glyph>(orc).layer, RenderLayer::Remains);
    EXPECT_FALSE(registry.has<BlocksMovement>(orc));
    EXPECT_EQ(registry.get<Name>(orc).name, "remains of orc");
}

TEST(CombatTest, DisplayNameFallback) {
    Registry registry;
    Entity nameless = registry.create();
    EXPECT_EQ(Combat::displayName(registry, nameless), "something");
}

// =============================================================================
// CombatResolver
// =============================================================================

class CombatResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory.registerDefaults();
        store = EntityStore::seededWith(factory.makePlayer({5, 5}));
        player = store.player();

        events.on(Events::Kill, [this](const EventData& data) {
            kills.push_back(data);
        });
        events.on(Events::PlayerDied, [this](const EventData&) {
            ++playerDeaths;
        });
    }

    Fighter& fighter(Entity e) { return store.registry().get<Fighter>(e); }

    EntityFactory factory;
    EntityStore store;
    EventBus events;
    Entity player = NullEntity;
    std::vector<EventData> kills;
    int playerDeaths = 0;
};

TEST_F(CombatResolverTest, MeleeDamageIsPowerMinusDefense) {
    Entity troll = factory.spawn(store, "troll", {6, 5});
    CombatResolver combat(store, events);

    AttackResult result = combat.attack(player, troll);
    EXPECT_EQ(result.damage, 2);
    EXPECT_FALSE(result.killed);
    EXPECT_EQ(fighter(troll).hp, 28);
}

TEST_F(CombatResolverTest, KillingBlowCreditsThePlayer) {
    Entity orc = factory.spawn(store, "orc", {6, 5});
    fighter(orc).hp = 3;
    CombatResolver combat(store, events);

    AttackResult result = combat.attack(player, orc);
    EXPECT_TRUE(result.killed);
    EXPECT_EQ(result.xpAwarded, 35);
    EXPECT_EQ(fighter(player).xp, 35);

    ASSERT_EQ(kills.size(), 1u);
    EXPECT_EQ(kills[0].getInt("xp"), 35);
    EXPECT_TRUE(kills[0].getBool("player_kill"));
    EXPECT_EQ(kills[0].getString("victim"), "orc");

    // The corpse stays in the store but stops blocking
    EXPECT_TRUE(store.contains(orc));
    EXPECT_EQ(store.blockingEntityAt({6, 5}), NullEntity);
}

TEST_F(CombatResolverTest, AttackingTheDeadDoesNothing) {
    Entity orc = factory.spawn(store, "orc", {6, 5});
    fighter(orc).hp = 1;
    CombatResolver combat(store, events);
    combat.attack(player, orc);

    AttackResult again = combat.attack(player, orc);
    EXPECT_FALSE(again.killed);
    EXPECT_EQ(fighter(player).xp, 35);
    EXPECT_EQ(kills.size(), 1u);
}

TEST_F(CombatResolverTest, MonsterKillCreditsTheMonster) {
    Entity troll = factory.spawn(store, "troll", {6, 5});
    Entity orc = factory.spawn(store, "orc", {7, 5});
    CombatResolver combat(store, events);

    combat.strike(troll, orc, 50);
    EXPECT_EQ(fighter(troll).xp, 35);
    EXPECT_EQ(fighter(player).xp, 0);
    ASSERT_EQ(kills.size(), 1u);
    EXPECT_FALSE(kills[0].getBool("player_kill"));
}

TEST_F(CombatResolverTest, PlayerDeathIsReportedNotCredited) {
    Entity troll = factory.spawn(store, "troll", {6, 5});
    fighter(player).hp = 5;
    CombatResolver combat(store, events);

    AttackResult result = combat.attack(troll, player);
    EXPECT_TRUE(result.killed);
    EXPECT_FALSE(fighter(player).alive);
    EXPECT_EQ(playerDeaths, 1);
    EXPECT_TRUE(kills.empty());
    EXPECT_EQ(store.registry().get<Glyph>(player).symbol, '%');
    EXPECT_EQ(store.registry().get<Name>(player).name, "player");
}

TEST_F(CombatResolverTest, BurstCreditsSumOnce) {
    Entity orcA = factory.spawn(store, "orc", {10, 10});
    Entity orcB = factory.spawn(store, "orc", {11, 10});
    Entity troll = factory.spawn(store, "troll", {10, 12});
    Entity farOrc = factory.spawn(store, "orc", {20, 20});
    CombatResolver combat(store, events);

    BurstResult result = combat.burst({10, 10}, 3, 30);

    EXPECT_EQ(result.affected.size(), 3u);
    EXPECT_EQ(result.killed.size(), 3u);
    EXPECT_FALSE(result.playerKilled);
    EXPECT_EQ(result.xpCredited, 35 + 35 + 100);
    EXPECT_EQ(fighter(player).xp, 170);
    EXPECT_EQ(kills.size(), 3u);

    EXPECT_FALSE(fighter(orcA).alive);
    EXPECT_FALSE(fighter(orcB).alive);
    EXPECT_FALSE(fighter(troll).alive);
    EXPECT_TRUE(fighter(farOrc).alive);
}

TEST_F(CombatResolverTest, BurstRadiusIsInclusive) {
    Entity edge = factory.spawn(store, "orc", {13, 10});
    Entity outside = factory.spawn(store, "orc", {13, 11});
    CombatResolver combat(store, events);

    combat.burst({10, 10}, 3, 1);
    EXPECT_EQ(fighter(edge).hp, 19);
    EXPECT_EQ(fighter(outside).hp, 20);
}

TEST_F(CombatResolverTest, BurstCatchingThePlayerPaysOnlyOtherKills) {
    store.registry().get<GridPosition>(player) = {10, 10};
    fighter(player).hp = 10;
    Entity orc = factory.spawn(store, "orc", {11, 10});
    CombatResolver combat(store, events);

    BurstResult result = combat.burst({10, 10}, 2, 25);

    EXPECT_TRUE(result.playerKilled);
    EXPECT_FALSE(fighter(orc).alive);
    EXPECT_EQ(result.xpCredited, 35);
    EXPECT_EQ(fighter(player).xp, 35);
    EXPECT_EQ(playerDeaths, 1);
    EXPECT_EQ(kills.size(), 1u);
}

TEST_F(CombatResolverTest, BurstSkipsCorpses) {
    Entity orc = factory.spawn(store, "orc", {10, 10});
    CombatResolver combat(store, events);
    combat.burst({10, 10}, 1, 50);
    ASSERT_FALSE(fighter(orc).alive);

    BurstResult second = combat.burst({10, 10}, 1, 50);
    EXPECT_TRUE(second.affected.empty());
    EXPECT_EQ(fighter(player).xp, 35);
}
