#include <gtest/gtest.h>
#include <glm/glm.hpp>

#include "../game/SpatialGrid.h"
#include "../game/TableWorld.h"

namespace
{
    // 90x132 cards in a 2x3 block of 48px cells sit 3px/6px inside the block.
    constexpr float kCell = 48.0f;
    const glm::vec2 kCardSize(90.0f, 132.0f);
    const GridSpan kSpan{2, 3};

    glm::vec2 CellPos(int cx, int cy)
    {
        return {cx * kCell + 3.0f, cy * kCell + 6.0f};
    }
}

TEST(SpatialGrid, MarginCentersObjectInItsBlock)
{
    SpatialGrid grid(kCell);
    const glm::vec2 m = grid.marginFor(kCardSize, kSpan);
    EXPECT_FLOAT_EQ(m.x, 3.0f);
    EXPECT_FLOAT_EQ(m.y, 6.0f);
}

TEST(SpatialGrid, SnapRoundsToNearestCell)
{
    SpatialGrid grid(kCell);
    const glm::vec2 p = grid.snapPosition({10.0f, 10.0f}, kCardSize, kSpan);
    EXPECT_FLOAT_EQ(p.x, 3.0f);
    EXPECT_FLOAT_EQ(p.y, 6.0f);

    const glm::vec2 q = grid.snapPosition({80.0f, -40.0f}, kCardSize, kSpan);
    EXPECT_EQ(q, CellPos(2, -1));
}

TEST(SpatialGrid, HalfwayPositionsSnapToEvenCell)
{
    SpatialGrid grid(kCell);
    // Block origin exactly half a cell past a line.
    EXPECT_EQ(grid.snapPosition({27.0f, 6.0f}, kCardSize, kSpan), CellPos(0, 0));
    EXPECT_EQ(grid.snapPosition({75.0f, 6.0f}, kCardSize, kSpan), CellPos(2, 0));
    EXPECT_EQ(grid.snapPosition({3.0f, -18.0f}, kCardSize, kSpan), CellPos(0, 0));
    EXPECT_EQ(grid.snapPosition({3.0f, -66.0f}, kCardSize, kSpan), CellPos(0, -2));
}

TEST(SpatialGrid, SnapIsIdempotent)
{
    SpatialGrid grid(kCell);
    const glm::vec2 samples[] = {{-131.7f, 55.2f}, {0.0f, 0.0f}, {999.4f, -12.0f}};
    for (const auto& s : samples)
    {
        const glm::vec2 once = grid.snapPosition(s, kCardSize, kSpan);
        EXPECT_EQ(grid.snapPosition(once, kCardSize, kSpan), once);
    }
}

TEST(SpatialGrid, GridCellOfSnappedObject)
{
    SpatialGrid grid(kCell);
    TableWorld world(kCardSize, kSpan);
    ObjectId id = world.spawnCard("7♣", CellPos(-4, 2));
    EXPECT_EQ(grid.gridCellOf(*world.find(id)), glm::ivec2(-4, 2));
}

TEST(SpatialGrid, FreeSlotPrefersRightThenLeft)
{
    SpatialGrid grid(kCell);
    TableWorld world(kCardSize, kSpan);
    ObjectId deck = world.spawnDeck(std::make_unique<Deck>(std::vector<std::string>{"A♠"}, 1u), CellPos(0, 0));

    auto slot = grid.findFreeSlot(world, *world.find(deck), kCardSize, kSpan);
    ASSERT_TRUE(slot.has_value());
    EXPECT_EQ(*slot, CellPos(2, 0));

    world.spawnCard("2♠", CellPos(2, 0));
    slot = grid.findFreeSlot(world, *world.find(deck), kCardSize, kSpan);
    ASSERT_TRUE(slot.has_value());
    EXPECT_EQ(*slot, CellPos(-2, 0));

    world.spawnCard("3♠", CellPos(-2, 0));
    slot = grid.findFreeSlot(world, *world.find(deck), kCardSize, kSpan);
    ASSERT_TRUE(slot.has_value());
    EXPECT_EQ(*slot, CellPos(0, -3));
}

TEST(SpatialGrid, FreeSlotExhausted)
{
    SpatialGrid grid(kCell);
    TableWorld world(kCardSize, kSpan);
    ObjectId deck = world.spawnDeck(std::make_unique<Deck>(), CellPos(0, 0));

    const glm::ivec2 ring[] = {{2, 0}, {-2, 0}, {0, -3}, {0, 3}, {2, -3}, {2, 3}, {-2, -3}, {-2, 3}};
    std::vector<ObjectId> ringIds;
    for (const auto& c : ring) ringIds.push_back(world.spawnCard("X", CellPos(c.x, c.y)));

    EXPECT_FALSE(grid.findFreeSlot(world, *world.find(deck), kCardSize, kSpan).has_value());

    // Ignored objects never block.
    auto slot = grid.findFreeSlot(world, *world.find(deck), kCardSize, kSpan, {ringIds[3]});
    ASSERT_TRUE(slot.has_value());
    EXPECT_EQ(*slot, CellPos(0, 3));
}

TEST(SpatialGrid, InHandCardsDoNotBlock)
{
    SpatialGrid grid(kCell);
    TableWorld world(kCardSize, kSpan);
    ObjectId deck = world.spawnDeck(std::make_unique<Deck>(), CellPos(0, 0));
    ObjectId card = world.spawnCard("Q♦", CellPos(2, 0));
    world.find(card)->setInHand(true);

    auto slot = grid.findFreeSlot(world, *world.find(deck), kCardSize, kSpan);
    ASSERT_TRUE(slot.has_value());
    EXPECT_EQ(*slot, CellPos(2, 0));
}
