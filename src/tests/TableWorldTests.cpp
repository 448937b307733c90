#include <gtest/gtest.h>
#include <glm/glm.hpp>
#include <algorithm>

#include "../game/TableWorld.h"

namespace
{
    std::vector<ObjectId> ZOrder(const TableWorld& world)
    {
        std::vector<ObjectId> ids;
        for (const auto& obj : world.getObjects()) ids.push_back(obj->getId());
        return ids;
    }

    size_t MemberCount(const TableWorld& world, GroupId g)
    {
        const Amarre* a = world.findGroup(g);
        return a ? a->members.size() : 0;
    }
}

// ---------- TableObject ----------

TEST(TableObject, ScaleKeepsTopLeftAndRoundsSize)
{
    TableObject obj(1, ObjectKind::Card, {10.0f, 20.0f}, {90.0f, 132.0f}, {2, 3});
    EXPECT_TRUE(obj.setScale(1.5f));
    EXPECT_EQ(obj.getPosition(), glm::vec2(10.0f, 20.0f));
    EXPECT_EQ(obj.getSize(), glm::vec2(135.0f, 198.0f));

    // Sub-epsilon change is a no-op.
    EXPECT_FALSE(obj.setScale(1.5004f));
}

TEST(TableObject, ScaleNeverCollapses)
{
    TableObject obj(1, ObjectKind::Card, {0.0f, 0.0f}, {90.0f, 132.0f}, {2, 3});
    obj.setScale(0.0f);
    EXPECT_FLOAT_EQ(obj.getScale(), 0.01f);
    EXPECT_EQ(obj.getSize(), glm::vec2(1.0f, 1.0f));
}

TEST(TableObject, ShadowTrailThrottlesAndExpires)
{
    TableObject obj(1, ObjectKind::Card, {0.0f, 0.0f}, {90.0f, 132.0f}, {2, 3});

    obj.captureShadowSample(0.00f, 8.0f);
    obj.setPosition({3.0f, 0.0f});
    obj.captureShadowSample(0.10f, 8.0f);      // too close
    EXPECT_EQ(obj.getShadowTrail().size(), 1u);

    obj.setPosition({10.0f, 0.0f});
    obj.captureShadowSample(0.20f, 8.0f);
    ASSERT_EQ(obj.getShadowTrail().size(), 2u);

    obj.trimShadowTrail(0.30f, 0.25f);
    ASSERT_EQ(obj.getShadowTrail().size(), 1u);
    EXPECT_FLOAT_EQ(obj.getShadowTrail().front().position.x, 10.0f);

    // Clock went backwards: samples from the future are dropped.
    obj.trimShadowTrail(0.05f, 0.25f);
    EXPECT_TRUE(obj.getShadowTrail().empty());

    // An empty trail captures again right away.
    obj.captureShadowSample(1.0f, 8.0f);
    EXPECT_EQ(obj.getShadowTrail().size(), 1u);
}

// ---------- Objects ----------

TEST(TableWorld, TopmostHitSkipsHandCards)
{
    TableWorld world;
    ObjectId a = world.spawnCard("A♠", {0.0f, 0.0f});
    ObjectId b = world.spawnCard("2♠", {10.0f, 10.0f});

    ASSERT_NE(world.topmostAt({50.0f, 50.0f}), nullptr);
    EXPECT_EQ(world.topmostAt({50.0f, 50.0f})->getId(), b);

    world.find(b)->setInHand(true);
    EXPECT_EQ(world.topmostAt({50.0f, 50.0f})->getId(), a);
    EXPECT_EQ(world.topmostAt({-5.0f, 0.0f}), nullptr);
}

TEST(TableWorld, BringToFrontReordersOnlyThatObject)
{
    TableWorld world;
    ObjectId a = world.spawnCard("A", {0, 0});
    ObjectId b = world.spawnCard("B", {0, 0});
    ObjectId c = world.spawnCard("C", {0, 0});

    world.bringToFront(a);
    EXPECT_EQ(ZOrder(world), (std::vector<ObjectId>{b, c, a}));

    world.bringToFront(999);
    EXPECT_EQ(ZOrder(world), (std::vector<ObjectId>{b, c, a}));
}

TEST(TableWorld, StaleIdsAreNoOps)
{
    TableWorld world;
    ObjectId a = world.spawnCard("A", {0, 0});

    EXPECT_FALSE(world.remove(999));
    EXPECT_FALSE(world.detach(999));
    EXPECT_FALSE(world.detach(a));
    EXPECT_EQ(world.attemptStack(999, a), kNoGroup);
    EXPECT_EQ(world.createGroup(a, a), kNoGroup);
    EXPECT_EQ(world.find(999), nullptr);
    EXPECT_EQ(world.getObjects().size(), 1u);
}

TEST(TableWorld, DeckLookup)
{
    TableWorld world;
    EXPECT_EQ(world.deck(), nullptr);
    world.spawnCard("A", {0, 0});
    ObjectId d = world.spawnDeck(std::make_unique<Deck>(std::vector<std::string>{"K♠", "Q♠"}, 3u), {100, 0});
    ASSERT_NE(world.deck(), nullptr);
    EXPECT_EQ(world.deck()->getId(), d);
    EXPECT_EQ(world.deck()->getDeck()->size(), 2u);
}

// ---------- Groups ----------

TEST(TableWorld, StackingTwoLooseCardsCreatesGroupAnchoredOnTarget)
{
    TableWorld world;
    ObjectId target = world.spawnCard("A♠", {3.0f, 6.0f});
    ObjectId dragged = world.spawnCard("2♠", {20.0f, 30.0f});

    GroupId g = world.attemptStack(dragged, target);
    ASSERT_NE(g, kNoGroup);
    EXPECT_EQ(MemberCount(world, g), 2u);
    EXPECT_EQ(world.groupAnchor(g)->getId(), target);
    // Members collapse onto the anchor.
    EXPECT_EQ(world.find(dragged)->getPosition(), glm::vec2(3.0f, 6.0f));
    EXPECT_TRUE(world.checkGroupInvariants());
}

TEST(TableWorld, StackingGrowsAndMergesGroups)
{
    TableWorld world;
    ObjectId a = world.spawnCard("A", {0, 0});
    ObjectId b = world.spawnCard("B", {0, 0});
    ObjectId c = world.spawnCard("C", {0, 0});
    ObjectId d = world.spawnCard("D", {0, 0});
    ObjectId e = world.spawnCard("E", {0, 0});

    GroupId g1 = world.attemptStack(b, a);
    // Grouped dragged card pulls a loose target in.
    EXPECT_EQ(world.attemptStack(b, c), g1);
    EXPECT_EQ(MemberCount(world, g1), 3u);

    GroupId g2 = world.attemptStack(e, d);
    ASSERT_NE(g2, g1);

    // Loose dragged card joins the target's group.
    ObjectId f = world.spawnCard("F", {0, 0});
    EXPECT_EQ(world.attemptStack(f, d), g2);
    EXPECT_EQ(MemberCount(world, g2), 3u);

    // Both grouped: the dragged group survives.
    EXPECT_EQ(world.attemptStack(e, a), g2);
    EXPECT_EQ(world.findGroup(g1), nullptr);
    EXPECT_EQ(MemberCount(world, g2), 6u);
    EXPECT_EQ(world.getGroups().size(), 1u);
    EXPECT_TRUE(world.checkGroupInvariants());
}

TEST(TableWorld, GroupMovesAndScalesAsOne)
{
    TableWorld world;
    ObjectId a = world.spawnCard("A", {0, 0});
    ObjectId b = world.spawnCard("B", {0, 0});
    GroupId g = world.attemptStack(b, a);

    world.moveGroup(g, {144.0f, -48.0f});
    world.setGroupScale(g, 1.15f);
    for (ObjectId id : {a, b})
    {
        EXPECT_EQ(world.find(id)->getPosition(), glm::vec2(144.0f, -48.0f));
        EXPECT_NEAR(world.find(id)->getScale(), 1.15f, 1e-6f);
    }
}

TEST(TableWorld, DetachBelowTwoDissolves)
{
    TableWorld world;
    ObjectId a = world.spawnCard("A", {0, 0});
    ObjectId b = world.spawnCard("B", {0, 0});
    GroupId g = world.attemptStack(b, a);
    world.setGroupScale(g, 1.15f);

    EXPECT_TRUE(world.detach(b));
    EXPECT_EQ(world.findGroup(g), nullptr);
    EXPECT_EQ(world.find(a)->getGroup(), kNoGroup);
    EXPECT_FLOAT_EQ(world.find(a)->getScale(), 1.0f);
    EXPECT_FLOAT_EQ(world.find(b)->getScale(), 1.0f);
    EXPECT_TRUE(world.checkGroupInvariants());
}

TEST(TableWorld, RemovingAGroupedCardKeepsInvariants)
{
    TableWorld world;
    ObjectId a = world.spawnCard("A", {0, 0});
    ObjectId b = world.spawnCard("B", {0, 0});
    ObjectId c = world.spawnCard("C", {0, 0});
    GroupId g = world.attemptStack(b, a);
    world.attemptStack(c, a);

    EXPECT_TRUE(world.remove(a));
    ASSERT_NE(world.findGroup(g), nullptr);
    EXPECT_EQ(MemberCount(world, g), 2u);
    EXPECT_EQ(world.groupAnchor(g)->getId(), b);
    EXPECT_TRUE(world.checkGroupInvariants());

    EXPECT_TRUE(world.remove(b));
    EXPECT_EQ(world.findGroup(g), nullptr);
    EXPECT_EQ(world.dissolveUndersized(), 0);
    EXPECT_TRUE(world.checkGroupInvariants());
}

TEST(TableWorld, DecksAndHandCardsNeverStack)
{
    TableWorld world;
    ObjectId card = world.spawnCard("A", {0, 0});
    ObjectId deck = world.spawnDeck(std::make_unique<Deck>(), {0, 0});
    EXPECT_EQ(world.attemptStack(card, deck), kNoGroup);

    ObjectId hand = world.spawnCard("B", {0, 0});
    world.find(hand)->setInHand(true);
    EXPECT_EQ(world.attemptStack(card, hand), kNoGroup);
    EXPECT_TRUE(world.getGroups().empty());
}

TEST(TableWorld, BringGroupToFrontKeepsMemberOrder)
{
    TableWorld world;
    ObjectId a = world.spawnCard("A", {0, 0});
    ObjectId b = world.spawnCard("B", {0, 0});
    ObjectId c = world.spawnCard("C", {300, 0});
    GroupId g = world.attemptStack(b, a);

    world.bringGroupToFront(g);
    EXPECT_EQ(ZOrder(world), (std::vector<ObjectId>{c, a, b}));
}
