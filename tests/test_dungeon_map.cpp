#include <gtest/gtest.h>

#include "world/TileMask.hpp"
#include "world/DungeonMap.hpp"
#include "world/FieldOfView.hpp"

using namespace delve;

namespace {

/// Walls around an open floor
DungeonMap openRoom(int width, int height) {
    DungeonMap map(width, height);
    for (int y = 1; y < height - 1; ++y) {
        for (int x = 1; x < width - 1; ++x) {
            map.setTile(x, y, TileType::Floor);
        }
    }
    return map;
}

} // anonymous namespace

// =============================================================================
// TileMask Tests
// =============================================================================

TEST(TileMaskTest, InsertEraseContains) {
    TileMask mask(10, 10);
    EXPECT_EQ(mask.count(), 0);

    mask.insert({3, 4});
    EXPECT_TRUE(mask.contains({3, 4}));
    EXPECT_FALSE(mask.contains({4, 3}));
    EXPECT_EQ(mask.count(), 1);

    mask.erase({3, 4});
    EXPECT_FALSE(mask.contains({3, 4}));
}

TEST(TileMaskTest, OutOfBoundsIsNeverContained) {
    TileMask mask(4, 4);
    mask.insert({-1, 0});
    mask.insert({4, 4});
    EXPECT_EQ(mask.count(), 0);
    EXPECT_FALSE(mask.contains({-1, 0}));
    EXPECT_FALSE(mask.contains({100, 100}));
}

TEST(TileMaskTest, Clear) {
    TileMask mask(4, 4);
    mask.insert({1, 1});
    mask.insert({2, 2});
    mask.clear();
    EXPECT_EQ(mask.count(), 0);
}

// =============================================================================
// DungeonMap Tests
// =============================================================================

TEST(DungeonMapTest, StartsAsSolidRock) {
    DungeonMap map(8, 6);
    EXPECT_EQ(map.getWidth(), 8);
    EXPECT_EQ(map.getHeight(), 6);
    for (int y = 0; y < 6; ++y) {
        for (int x = 0; x < 8; ++x) {
            EXPECT_FALSE(map.isWalkable(x, y));
            EXPECT_TRUE(map.isOpaque(x, y));
        }
    }
    EXPECT_EQ(map.exploredTiles().count(), 0);
}

TEST(DungeonMapTest, OutOfBoundsIsWall) {
    DungeonMap map = openRoom(5, 5);
    EXPECT_TRUE(map.isWalkable(2, 2));
    EXPECT_EQ(map.getTile(-1, 2), TileType::Wall);
    EXPECT_EQ(map.getTile(5, 2), TileType::Wall);
    map.setTile(9, 9, TileType::Floor);
    EXPECT_FALSE(map.isWalkable(9, 9));
}

TEST(DungeonMapTest, VisibleTilesBecomeExplored) {
    DungeonMap map = openRoom(6, 6);
    map.markVisible(2, 3);
    EXPECT_TRUE(map.isVisible({2, 3}));
    EXPECT_TRUE(map.isExplored({2, 3}));

    map.clearVisible();
    EXPECT_FALSE(map.isVisible({2, 3}));
    EXPECT_TRUE(map.isExplored({2, 3}));
}

// =============================================================================
// FieldOfView Tests
// =============================================================================

TEST(FieldOfViewTest, OpenRoomWithinRadius) {
    DungeonMap map = openRoom(31, 31);
    GridPosition center{15, 15};
    FieldOfView::compute(map, center, 10);

    EXPECT_TRUE(map.isVisible(center));
    EXPECT_TRUE(map.isVisible({20, 15}));
    EXPECT_TRUE(map.isVisible({15, 5}));
    EXPECT_TRUE(map.isVisible({25, 15}));
    EXPECT_TRUE(map.isVisible({21, 21}));

    // Beyond the radius
    EXPECT_FALSE(map.isVisible({26, 15}));
    EXPECT_FALSE(map.isVisible({23, 23}));
}

TEST(FieldOfViewTest, WallsBlockSightButAreSeen) {
    DungeonMap map(20, 5);
    for (int x = 1; x < 19; ++x) {
        map.setTile(x, 2, TileType::Floor);
    }
    map.setTile(10, 2, TileType::Wall);

    FieldOfView::compute(map, {2, 2}, 15);
    EXPECT_TRUE(map.isVisible({9, 2}));
    EXPECT_TRUE(map.isVisible({10, 2}));
    EXPECT_FALSE(map.isVisible({11, 2}));
    EXPECT_FALSE(map.isVisible({15, 2}));
}

TEST(FieldOfViewTest, RecomputeReplacesLiveButKeepsExplored) {
    DungeonMap map(30, 3);
    for (int x = 1; x < 29; ++x) {
        map.setTile(x, 1, TileType::Floor);
    }

    FieldOfView::compute(map, {2, 1}, 4);
    EXPECT_TRUE(map.isVisible({5, 1}));

    FieldOfView::compute(map, {25, 1}, 4);
    EXPECT_FALSE(map.isVisible({5, 1}));
    EXPECT_TRUE(map.isExplored({5, 1}));
    EXPECT_TRUE(map.isVisible({22, 1}));
}

TEST(FieldOfViewTest, OriginOutsideMapSeesNothing) {
    DungeonMap map = openRoom(10, 10);
    FieldOfView::compute(map, {4, 4}, 5);
    ASSERT_GT(map.visibleTiles().count(), 0);

    FieldOfView::compute(map, {-5, 40}, 5);
    EXPECT_EQ(map.visibleTiles().count(), 0);
}
