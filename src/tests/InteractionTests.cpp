#include <gtest/gtest.h>
#include <glm/glm.hpp>
#include <memory>
#include <string>
#include <vector>

#include "../engine/core/IInputState.h"
#include "../engine/events/EventManager.h"
#include "../engine/events/TableEvents.h"
#include "../game/GameConfig.h"
#include "../game/TableScene.h"
#include "../game/systems/TableInteractionSystem.h"

namespace
{
    // ---------- tiny helpers ----------
    class FakeInputState : public IInputState
    {
    public:
        glm::vec2 pointer{0.0f};
        bool modifier = false;
        uint32_t ms = 1000;

        glm::vec2 pointerPosition() const override { return pointer; }
        bool isModifierDown() const override { return modifier; }
        uint32_t ticksMs() const override { return ms; }
    };

    glm::vec2 CellPos(int cx, int cy)
    {
        return {cx * 48.0f + 3.0f, cy * 48.0f + 6.0f};
    }

    // Records every event of one type while alive.
    struct EventProbe
    {
        EventManager::SubscriptionId id;
        std::vector<std::string> seen;

        explicit EventProbe(EventType type)
        {
            id = EventManager::getInstance().subscribe(type, [this](const Event& e) {
                seen.push_back(e.toString());
            });
        }
        ~EventProbe() { EventManager::getInstance().unsubscribe(id); }
    };
}

class InteractionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        cfg.width = 800;
        cfg.height = 600;
        scene = std::make_unique<TableScene>(cfg);
        sys = std::make_unique<TableInteractionSystem>(*scene, input, InteractionSettings::fromConfig(cfg));
    }

    void TearDown() override
    {
        sys.reset();
        scene.reset();
    }

    glm::vec2 ScreenOf(const glm::vec2& world) const { return scene->camera.worldToScreen(world); }

    // Screen point over the middle of a resting 90x132 card at `topLeft`.
    glm::vec2 CenterOf(const glm::vec2& topLeft) const { return ScreenOf(topLeft + glm::vec2(45.0f, 66.0f)); }

    void Press(const glm::vec2& p)
    {
        input.pointer = p;
        sys->onMouseButtonDown(MouseButton::Left, static_cast<int>(p.x), static_cast<int>(p.y));
    }

    void MoveTo(const glm::vec2& p)
    {
        input.pointer = p;
        input.ms += 16;
        sys->update(1.0f / 60.0f);
    }

    void Release(const glm::vec2& p)
    {
        input.pointer = p;
        sys->onMouseButtonUp(MouseButton::Left, static_cast<int>(p.x), static_cast<int>(p.y));
    }

    void DragAndDrop(const glm::vec2& from, const glm::vec2& to)
    {
        Press(from);
        MoveTo(to);
        Release(to);
    }

    ObjectId SpawnDeck(std::vector<std::string> cards, const glm::vec2& at)
    {
        return scene->world.spawnDeck(std::make_unique<Deck>(std::move(cards), 1u), at);
    }

    GameConfigData cfg;
    FakeInputState input;
    std::unique_ptr<TableScene> scene;
    std::unique_ptr<TableInteractionSystem> sys;
};

// ---------- stacking ----------

TEST_F(InteractionTest, DroppingOneCardOnAnotherFormsAGroupThatMovesTogether)
{
    ObjectId a = scene->world.spawnCard("A♠", CellPos(0, 0));
    ObjectId b = scene->world.spawnCard("2♠", CellPos(4, 0));

    DragAndDrop(CenterOf(CellPos(4, 0)), CenterOf(CellPos(0, 0)));
    EXPECT_FALSE(sys->isDragging());

    const GroupId g = scene->world.find(a)->getGroup();
    ASSERT_NE(g, kNoGroup);
    EXPECT_EQ(scene->world.find(b)->getGroup(), g);
    ASSERT_NE(scene->world.findGroup(g), nullptr);
    EXPECT_EQ(scene->world.findGroup(g)->members.size(), 2u);

    // Drag the stack one block to the right.
    Press(CenterOf(CellPos(0, 0)));
    EXPECT_EQ(sys->getDraggedGroup(), g);
    MoveTo(CenterOf(CellPos(2, 0)));
    EXPECT_EQ(scene->world.find(a)->getPosition(), scene->world.find(b)->getPosition());
    Release(CenterOf(CellPos(2, 0)));

    EXPECT_EQ(scene->world.find(a)->getPosition(), CellPos(2, 0));
    EXPECT_EQ(scene->world.find(b)->getPosition(), CellPos(2, 0));
    EXPECT_FLOAT_EQ(scene->world.find(a)->getScale(), 1.0f);
    EXPECT_TRUE(scene->world.checkGroupInvariants());
}

TEST_F(InteractionTest, ModifierDragPullsTopCardOffItsStack)
{
    ObjectId a = scene->world.spawnCard("A", CellPos(0, 0));
    ObjectId b = scene->world.spawnCard("B", CellPos(0, 0));
    GroupId g = scene->world.attemptStack(b, a);
    ASSERT_NE(g, kNoGroup);

    input.modifier = true;
    DragAndDrop(CenterOf(CellPos(0, 0)), CenterOf(CellPos(4, 0)));

    EXPECT_EQ(scene->world.findGroup(g), nullptr);
    EXPECT_EQ(scene->world.find(b)->getPosition(), CellPos(4, 0));
    EXPECT_EQ(scene->world.find(a)->getPosition(), CellPos(0, 0));
    EXPECT_TRUE(scene->world.checkGroupInvariants());
}

TEST_F(InteractionTest, DropSnapsToGrid)
{
    ObjectId a = scene->world.spawnCard("A", CellPos(0, 0));
    DragAndDrop(CenterOf(CellPos(0, 0)), CenterOf(CellPos(3, -2)) + glm::vec2(7.0f, -9.0f));
    EXPECT_EQ(scene->world.find(a)->getPosition(), CellPos(3, -2));
}

// ---------- deck ----------

TEST_F(InteractionTest, DropOnDeckWithoutFreeNeighbourReverts)
{
    SpawnDeck({"K♠"}, CellPos(0, 0));
    const glm::ivec2 ring[] = {{2, 0}, {-2, 0}, {0, -3}, {0, 3}, {2, -3}, {2, 3}, {-2, -3}, {-2, 3}};
    for (const auto& c : ring) scene->world.spawnCard("X", CellPos(c.x, c.y));

    ObjectId card = scene->world.spawnCard("7♥", CellPos(6, 0));
    DragAndDrop(CenterOf(CellPos(6, 0)), CenterOf(CellPos(0, 0)));

    EXPECT_EQ(scene->world.find(card)->getPosition(), CellPos(6, 0));
    EXPECT_EQ(scene->world.find(card)->getGroup(), kNoGroup);
}

TEST_F(InteractionTest, DropOnDeckMovesToFirstFreeNeighbour)
{
    SpawnDeck({"K♠"}, CellPos(0, 0));
    ObjectId card = scene->world.spawnCard("7♥", CellPos(6, 0));

    DragAndDrop(CenterOf(CellPos(6, 0)), CenterOf(CellPos(0, 0)));
    EXPECT_EQ(scene->world.find(card)->getPosition(), CellPos(2, 0));
}

TEST_F(InteractionTest, ControlDoubleClickOnDeckDrawsOneCard)
{
    ObjectId deck = SpawnDeck({"A♠", "K♥", "Q♣"}, CellPos(0, 0));
    EventProbe drawn(EventType::CardDrawn);

    input.modifier = true;
    Press(CenterOf(CellPos(0, 0)));
    Release(CenterOf(CellPos(0, 0)));
    EXPECT_EQ(scene->world.getObjects().size(), 1u);

    input.ms += 200;
    Press(CenterOf(CellPos(0, 0)));

    ASSERT_EQ(scene->world.getObjects().size(), 2u);
    ASSERT_TRUE(sys->isDragging());
    const TableObject* card = scene->world.find(sys->getDragged());
    ASSERT_NE(card, nullptr);
    EXPECT_TRUE(card->isCard());
    EXPECT_EQ(card->getLabel(), "Q♣");
    EXPECT_EQ(card->getPosition(), CellPos(2, 0));
    EXPECT_EQ(scene->world.find(deck)->getDeck()->size(), 2u);
    EXPECT_EQ(drawn.seen.size(), 1u);

    // Releasing the fresh card over the deck does not shuffle it back.
    const ObjectId cardId = card->getId();
    Release(CenterOf(CellPos(0, 0)));
    ASSERT_NE(scene->world.find(cardId), nullptr);
    EXPECT_EQ(scene->world.find(cardId)->getPosition(), CellPos(2, 0));
    EXPECT_EQ(scene->world.find(deck)->getDeck()->size(), 2u);
}

TEST_F(InteractionTest, SlowOrPlainDoubleClickDoesNotDraw)
{
    SpawnDeck({"A♠", "K♥"}, CellPos(0, 0));

    input.modifier = true;
    Press(CenterOf(CellPos(0, 0)));
    Release(CenterOf(CellPos(0, 0)));
    input.ms += 600;
    Press(CenterOf(CellPos(0, 0)));
    Release(CenterOf(CellPos(0, 0)));
    EXPECT_EQ(scene->world.getObjects().size(), 1u);

    input.modifier = false;
    input.ms += 1000;
    Press(CenterOf(CellPos(0, 0)));
    Release(CenterOf(CellPos(0, 0)));
    input.ms += 100;
    Press(CenterOf(CellPos(0, 0)));
    Release(CenterOf(CellPos(0, 0)));
    EXPECT_EQ(scene->world.getObjects().size(), 1u);
}

TEST_F(InteractionTest, DrawingTheLastCardRemovesTheDeck)
{
    SpawnDeck({"K♠"}, CellPos(0, 0));
    EventProbe exhausted(EventType::DeckExhausted);

    input.modifier = true;
    Press(CenterOf(CellPos(0, 0)));
    Release(CenterOf(CellPos(0, 0)));
    input.ms += 100;
    Press(CenterOf(CellPos(0, 0)));

    EXPECT_EQ(scene->world.deck(), nullptr);
    ASSERT_EQ(scene->world.getObjects().size(), 1u);
    EXPECT_EQ(scene->world.getObjects().front()->getLabel(), "K♠");
    EXPECT_EQ(exhausted.seen.size(), 1u);
    EXPECT_TRUE(sys->isDragging());
}

TEST_F(InteractionTest, ModifierReleaseOverDeckShufflesCardBack)
{
    ObjectId deck = SpawnDeck({"A♠", "K♥"}, CellPos(0, 0));
    ObjectId card = scene->world.spawnCard("7♣", CellPos(2, 0));
    EventProbe returned(EventType::CardReturnedToDeck);

    input.modifier = true;
    DragAndDrop(CenterOf(CellPos(2, 0)), CenterOf(CellPos(0, 0)));

    EXPECT_EQ(scene->world.find(card), nullptr);
    EXPECT_EQ(scene->world.find(deck)->getDeck()->size(), 3u);
    EXPECT_EQ(returned.seen.size(), 1u);
}

TEST_F(InteractionTest, EveryUpdateRefreshesDragAndHandLayout)
{
    ObjectId a = scene->world.spawnCard("A", CellPos(0, 0));
    ObjectId h = scene->world.spawnCard("H", CellPos(6, 0));
    ASSERT_TRUE(scene->hand.addCard(scene->world, h));

    // Frames shorter than the nominal frame time still advance the scene.
    input.pointer = {0.0f, 0.0f};
    sys->update(0.001f);
    ASSERT_TRUE(scene->world.find(h)->getHandRect().has_value());

    const glm::vec2 start = CenterOf(CellPos(0, 0));
    Press(start);
    const glm::vec2 lifted = scene->world.find(a)->getPosition();
    input.pointer = start + glm::vec2(30.0f, -20.0f);
    sys->update(0.001f);
    EXPECT_EQ(scene->world.find(a)->getPosition(), lifted + glm::vec2(30.0f, -20.0f));
    Release(input.pointer);

    input.pointer = scene->world.find(h)->getHandRect()->center();
    sys->update(0.001f);
    EXPECT_EQ(scene->hand.getHovered(), h);
}

// ---------- hand ----------

TEST_F(InteractionTest, CardDroppedInBandJoinsHandAndCanBePlayedBack)
{
    ObjectId card = scene->world.spawnCard("5♦", CellPos(2, 0));

    DragAndDrop(CenterOf(CellPos(2, 0)), {400.0f, 560.0f});
    ASSERT_TRUE(scene->hand.contains(card));
    EXPECT_TRUE(scene->world.find(card)->isInHand());

    MoveTo({0.0f, 0.0f});
    ASSERT_TRUE(scene->world.find(card)->getHandRect().has_value());
    const Rect shown = *scene->world.find(card)->getHandRect();
    EXPECT_NEAR(shown.center().x, 400.0f, 1e-3f);

    // World picking ignores hand cards; the hand picks them instead.
    Press(shown.center());
    ASSERT_EQ(sys->getDragged(), card);
    MoveTo({400.0f, 150.0f});
    Release({400.0f, 150.0f});

    EXPECT_FALSE(scene->hand.contains(card));
    EXPECT_FALSE(scene->world.find(card)->isInHand());
    EXPECT_FALSE(scene->world.find(card)->getHandRect().has_value());
    const glm::vec2 p = scene->world.find(card)->getPosition();
    EXPECT_EQ(scene->grid.snapPosition(p, {90.0f, 132.0f}, {2, 3}), p);
}

TEST_F(InteractionTest, GroupsNeverEnterTheHand)
{
    ObjectId a = scene->world.spawnCard("A", CellPos(0, 0));
    ObjectId b = scene->world.spawnCard("B", CellPos(0, 0));
    scene->world.attemptStack(b, a);

    DragAndDrop(CenterOf(CellPos(0, 0)), {400.0f, 560.0f});
    EXPECT_EQ(scene->hand.size(), 0u);
    EXPECT_NE(scene->world.find(a)->getGroup(), kNoGroup);
}

// ---------- camera ----------

TEST_F(InteractionTest, PressOnEmptyTablePans)
{
    Press({50.0f, 50.0f});
    EXPECT_TRUE(sys->isPanning());
    EXPECT_FALSE(sys->isDragging());

    MoveTo({80.0f, 50.0f});
    EXPECT_FLOAT_EQ(scene->camera.getCenter().x, -30.0f);
    EXPECT_FLOAT_EQ(scene->camera.getCenter().y, 0.0f);

    Release({80.0f, 50.0f});
    EXPECT_FALSE(sys->isPanning());
}

TEST_F(InteractionTest, WheelZoomsAroundPointer)
{
    input.pointer = {600.0f, 200.0f};
    const glm::vec2 before = scene->camera.screenToWorld(input.pointer);

    sys->onMouseWheel(1);
    EXPECT_NEAR(scene->camera.getZoom(), 1.2f, 1e-5f);
    const glm::vec2 after = scene->camera.screenToWorld(input.pointer);
    EXPECT_NEAR(after.x, before.x, 1e-3f);
    EXPECT_NEAR(after.y, before.y, 1e-3f);
}

TEST_F(InteractionTest, EscapeDoublePressRecentersOnDeck)
{
    SpawnDeck({"A♠"}, CellPos(0, 0));
    scene->camera.centerOn({500.0f, 500.0f});

    input.ms = 1000;
    sys->onKeyDown(Key::Escape);
    EXPECT_EQ(scene->camera.getCenter(), glm::vec2(500.0f, 500.0f));
    input.ms = 1300;
    sys->onKeyDown(Key::Escape);
    EXPECT_EQ(scene->camera.getCenter(), glm::vec2(48.0f, 72.0f));
}

TEST_F(InteractionTest, SlowEscapePressesDoNotRecenter)
{
    scene->camera.centerOn({500.0f, 500.0f});

    input.ms = 1000;
    sys->onKeyDown(Key::Escape);
    input.ms = 1800;
    sys->onKeyDown(Key::Escape);
    EXPECT_EQ(scene->camera.getCenter(), glm::vec2(500.0f, 500.0f));

    sys->onKeyDown(Key::Other);
    input.ms = 1900;
    sys->onKeyDown(Key::Escape);
    // No deck on the table: back to the origin.
    EXPECT_EQ(scene->camera.getCenter(), glm::vec2(0.0f, 0.0f));
}

// ---------- robustness ----------

TEST_F(InteractionTest, DraggedObjectRemovedMidDragEndsTheDrag)
{
    ObjectId card = scene->world.spawnCard("A", CellPos(0, 0));
    Press(CenterOf(CellPos(0, 0)));
    ASSERT_TRUE(sys->isDragging());

    scene->world.remove(card);
    MoveTo({10.0f, 10.0f});
    EXPECT_FALSE(sys->isDragging());
    Release({10.0f, 10.0f});
}

TEST_F(InteractionTest, OnlyTheLeftButtonInteracts)
{
    scene->world.spawnCard("A", CellPos(0, 0));
    input.pointer = CenterOf(CellPos(0, 0));
    sys->onMouseButtonDown(MouseButton::Right, static_cast<int>(input.pointer.x), static_cast<int>(input.pointer.y));
    EXPECT_FALSE(sys->isDragging());
    EXPECT_FALSE(sys->isPanning());

    sys->onMouseButtonUp(MouseButton::Left, 0, 0);
    EXPECT_FALSE(sys->isDragging());
}

TEST_F(InteractionTest, SystemListensThroughTheEventManager)
{
    ObjectId a = scene->world.spawnCard("A", CellPos(0, 0));
    const glm::vec2 from = CenterOf(CellPos(0, 0));
    const glm::vec2 to = CenterOf(CellPos(2, 0));

    input.pointer = from;
    EventManager::getInstance().emit(MouseButtonDownEvent(MouseButton::Left, static_cast<int>(from.x), static_cast<int>(from.y)));
    EXPECT_TRUE(sys->isDragging());
    MoveTo(to);
    EventManager::getInstance().emit(MouseButtonUpEvent(MouseButton::Left, static_cast<int>(to.x), static_cast<int>(to.y)));
    EXPECT_FALSE(sys->isDragging());
    EXPECT_EQ(scene->world.find(a)->getPosition(), CellPos(2, 0));
}
