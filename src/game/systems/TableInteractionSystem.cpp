// TableInteractionSystem.cpp

#include "TableInteractionSystem.h"
#include "../TableScene.h"
#include "../GameConfig.h"
#include "../LogBus.h"
#include "../../engine/events/TableEvents.h"
#include <algorithm>
#include <iostream>

InteractionSettings InteractionSettings::fromConfig(const GameConfigData& cfg) {
    InteractionSettings s;
    s.liftScale           = cfg.liftScale;
    s.doubleClickMs       = static_cast<uint32_t>(std::max(0, cfg.doubleClickMs));
    s.escapeDoublePressMs = static_cast<uint32_t>(std::max(0, cfg.escapeDoublePressMs));
    s.shadowLifetime      = cfg.shadowLifetime;
    s.shadowMinDistance   = cfg.shadowMinDistance;
    return s;
}

namespace {
    // Milliseconds from `then` to `now`; negative when the clock went backwards.
    int64_t ageMs(uint32_t now, uint32_t then) {
        return static_cast<int64_t>(now) - static_cast<int64_t>(then);
    }
}

TableInteractionSystem::TableInteractionSystem(TableScene& scene, const IInputState& input,
                                               const InteractionSettings& settings)
    : scene(scene), input(input), settings(settings)
{
    auto& events = EventManager::getInstance();
    subscriptions.push_back(events.subscribe(EventType::MouseButtonDown,
        [this](const Event& e){
            const auto& mbe = static_cast<const MouseButtonDownEvent&>(e);
            onMouseButtonDown(mbe.getButton(), mbe.getX(), mbe.getY());
        }));
    subscriptions.push_back(events.subscribe(EventType::MouseButtonUp,
        [this](const Event& e){
            const auto& mue = static_cast<const MouseButtonUpEvent&>(e);
            onMouseButtonUp(mue.getButton(), mue.getX(), mue.getY());
        }));
    subscriptions.push_back(events.subscribe(EventType::MouseWheel,
        [this](const Event& e){
            onMouseWheel(static_cast<const MouseWheelEvent&>(e).getSteps());
        }));
    subscriptions.push_back(events.subscribe(EventType::KeyDown,
        [this](const Event& e){
            onKeyDown(static_cast<const KeyDownEvent&>(e).getKey());
        }));
}

TableInteractionSystem::~TableInteractionSystem() {
    for (auto id : subscriptions) {
        EventManager::getInstance().unsubscribe(id);
    }
}

// -----------------------------------------------------------------------------
// Event handlers
// -----------------------------------------------------------------------------

void TableInteractionSystem::onMouseButtonDown(MouseButton button, int x, int y) {
    if (button != MouseButton::Left || isDragging()) return;

    const glm::vec2 screen(static_cast<float>(x), static_cast<float>(y));
    const uint32_t now = input.ticksMs();

    // The hand sits on top of the table, so it gets first pick.
    ObjectId handHit = scene.hand.pickAt(scene.world, screen);
    if (handHit != kNoObject) {
        lastClicked = kNoObject;
        beginHandDrag(handHit, screen);
        return;
    }

    const glm::vec2 worldPointer = scene.camera.screenToWorld(screen);
    TableObject* hit = scene.world.topmostAt(worldPointer);
    if (!hit) {
        lastClicked = kNoObject;
        panning = true;
        panLast = screen;
        return;
    }

    const bool modifier = input.isModifierDown();
    if (hit->isDeck() && modifier && isRepeatClick(hit->getId(), now)) {
        lastClicked = kNoObject;
        drawFromDeck(*hit);
        return;
    }

    lastClicked = hit->getId();
    lastClickMs = now;
    beginDrag(*hit, worldPointer, modifier);
}

void TableInteractionSystem::onMouseButtonUp(MouseButton button, int x, int y) {
    if (button != MouseButton::Left) return;
    if (isDragging()) {
        endDrag(glm::vec2(static_cast<float>(x), static_cast<float>(y)));
    }
    panning = false;
}

void TableInteractionSystem::onMouseWheel(int steps) {
    scene.camera.adjustZoom(steps, input.pointerPosition());
}

void TableInteractionSystem::onKeyDown(Key key) {
    if (key != Key::Escape) return;

    const uint32_t now = input.ticksMs();
    if (escapeArmed) {
        int64_t age = ageMs(now, lastEscapeMs);
        if (age >= 0 && age <= static_cast<int64_t>(settings.escapeDoublePressMs)) {
            escapeArmed = false;
            recenter();
            return;
        }
    }
    escapeArmed = true;
    lastEscapeMs = now;
}

void TableInteractionSystem::update(float deltaTime) {
    (void)deltaTime;

    const float now = static_cast<float>(input.ticksMs()) / 1000.0f;
    const glm::vec2 pointer = input.pointerPosition();

    if (isDragging()) {
        followPointer(pointer, now);
    } else if (panning) {
        glm::vec2 delta = pointer - panLast;
        if (delta.x != 0.0f || delta.y != 0.0f) {
            scene.camera.pan(delta);
            panLast = pointer;
        }
    }

    for (const auto& obj : scene.world.getObjects()) {
        obj->trimShadowTrail(now, settings.shadowLifetime);
    }

    scene.hand.layout(scene.world, scene.camera.getScreenSize(), pointer,
                      draggingFromHand ? dragged : kNoObject);
}

// -----------------------------------------------------------------------------
// Drag lifecycle
// -----------------------------------------------------------------------------

void TableInteractionSystem::beginDrag(TableObject& obj, const glm::vec2& worldPointer, bool modifier) {
    preDragPosition = obj.getPosition();
    draggedGroup = kNoGroup;

    if (obj.isCard() && obj.getGroup() != kNoGroup) {
        if (modifier) {
            scene.world.detach(obj.getId());
            LogBus::info("Pulled " + obj.getLabel() + " off its stack");
        } else {
            draggedGroup = obj.getGroup();
        }
    }

    if (draggedGroup != kNoGroup) {
        scene.world.bringGroupToFront(draggedGroup);
        scene.world.setGroupScale(draggedGroup, settings.liftScale);
    } else {
        scene.world.bringToFront(obj.getId());
        obj.setScale(settings.liftScale);
    }

    dragOffset = worldPointer - obj.getPosition();
    dragged = obj.getId();
}

void TableInteractionSystem::beginHandDrag(ObjectId id, const glm::vec2& screenPointer) {
    TableObject* card = scene.world.find(id);
    if (!card) return;

    // Put the card in world space where it shows on screen, and keep the
    // grab point at the same relative spot on the face.
    const Rect shown = card->getHandRect() ? *card->getHandRect() : card->getRect();
    glm::vec2 grab(0.5f);
    if (shown.w > 0.0f && shown.h > 0.0f) {
        grab = (screenPointer - shown.topLeft()) / shown.size();
    }

    card->setHandHovered(false);
    card->setScale(settings.liftScale);
    dragOffset = grab * card->getSize();
    card->setPosition(scene.camera.screenToWorld(screenPointer) - dragOffset);
    card->clearShadowTrail();
    scene.world.bringToFront(id);

    preDragPosition = card->getPosition();
    draggedGroup = kNoGroup;
    draggingFromHand = true;
    dragged = id;
}

void TableInteractionSystem::followPointer(const glm::vec2& screenPointer, float now) {
    TableObject* obj = scene.world.find(dragged);
    if (!obj) {
        resetDrag();
        return;
    }

    const glm::vec2 target = scene.camera.screenToWorld(screenPointer) - dragOffset;
    const Amarre* group = scene.world.findGroup(draggedGroup);
    if (group) {
        scene.world.moveGroup(draggedGroup, target);
        for (ObjectId member : group->members) {
            if (TableObject* card = scene.world.find(member)) {
                card->captureShadowSample(now, settings.shadowMinDistance);
            }
        }
    } else {
        obj->setPosition(target);
        obj->captureShadowSample(now, settings.shadowMinDistance);
    }
}

void TableInteractionSystem::endDrag(const glm::vec2& screenPointer) {
    followPointer(screenPointer, static_cast<float>(input.ticksMs()) / 1000.0f);

    const ObjectId id = dragged;
    const bool fromHand = draggingFromHand;
    const bool freshDraw = draggingFreshDraw;
    const glm::vec2 fallback = preDragPosition;
    GroupId group = draggedGroup;
    resetDrag();

    TableObject* obj = scene.world.find(id);
    if (!obj) return;
    if (group != kNoGroup && !scene.world.findGroup(group)) group = kNoGroup;

    if (group != kNoGroup) scene.world.setGroupScale(group, 1.0f);
    else obj->setScale(1.0f);

    // 1. Hand
    if (obj->isCard() && group == kNoGroup) {
        if (scene.hand.handleDrop(scene.world, scene.camera, id, screenPointer)) {
            if (!fromHand) LogBus::info(obj->getLabel() + " moved to hand");
            return;
        }
        if (fromHand) {
            scene.hand.removeCard(scene.world, id);
            LogBus::info(obj->getLabel() + " played from hand");
        }
    }

    // 2. Ctrl-release on the deck puts the card back.
    if (obj->isCard() && group == kNoGroup && !freshDraw && input.isModifierDown()) {
        if (returnToDeck(*obj)) return;
    }

    TableObject* subject = (group != kNoGroup) ? scene.world.groupAnchor(group) : obj;
    if (!subject) return;

    // 3. Grid
    scene.grid.snap(*subject);
    if (group != kNoGroup) scene.world.moveGroup(group, subject->getPosition());

    // 4. Keep the deck uncovered
    TableObject* deckObj = scene.world.deck();
    if (deckObj && deckObj != subject && subject->getRect().intersects(deckObj->getRect())) {
        std::vector<ObjectId> ignore{subject->getId()};
        if (const Amarre* a = scene.world.findGroup(group)) ignore = a->members;

        auto slot = scene.grid.findFreeSlot(scene.world, *deckObj, subject->getSize(), subject->getSpan(), ignore);
        glm::vec2 target = fallback;
        if (slot) {
            target = *slot;
        } else {
            LogBus::warn("No free slot beside the deck; drop reverted");
        }
        if (group != kNoGroup) scene.world.moveGroup(group, target);
        else subject->setPosition(target);
    }

    // 5. Stacking
    if (subject->isCard()) {
        resolveMerge(*subject, group);
    }
    scene.world.dissolveUndersized();
}

void TableInteractionSystem::resetDrag() {
    dragged = kNoObject;
    draggedGroup = kNoGroup;
    dragOffset = glm::vec2(0.0f);
    draggingFromHand = false;
    draggingFreshDraw = false;
}

// -----------------------------------------------------------------------------
// Deck
// -----------------------------------------------------------------------------

bool TableInteractionSystem::drawFromDeck(TableObject& deckObj) {
    const ObjectId deckId = deckObj.getId();
    Deck* deck = deckObj.getDeck();
    if (!deck || deck->isEmpty()) {
        scene.world.remove(deckId);
        EventManager::getInstance().emit(DeckExhaustedEvent(deckId));
        return false;
    }

    auto slot = scene.grid.findFreeSlot(scene.world, deckObj,
                                        scene.world.getCardSize(), scene.world.getCardSpan());
    if (!slot) {
        LogBus::warn("No room beside the deck to draw a card");
        return false;
    }

    std::optional<std::string> label = deck->draw();
    if (!label) return false;
    const size_t remaining = deck->size();

    const ObjectId cardId = scene.world.spawnCard(*label, *slot);
    EventManager::getInstance().emit(CardDrawnEvent(cardId, *label, remaining));

    if (remaining == 0) {
        scene.world.remove(deckId);
        EventManager::getInstance().emit(DeckExhaustedEvent(deckId));
    }

    TableObject* card = scene.world.find(cardId);
    preDragPosition = card->getPosition();
    scene.world.bringToFront(cardId);
    card->setScale(settings.liftScale);
    dragOffset = card->getSize() * 0.5f;
    draggedGroup = kNoGroup;
    draggingFreshDraw = true;
    dragged = cardId;
    return true;
}

bool TableInteractionSystem::returnToDeck(TableObject& card) {
    TableObject* deckObj = scene.world.deck();
    if (!deckObj || !deckObj->getDeck()) return false;
    if (!card.getRect().intersects(deckObj->getRect())) return false;

    const std::string label = card.getLabel();
    Deck* deck = deckObj->getDeck();
    deck->shuffleIn(label);
    scene.world.remove(card.getId());

    EventManager::getInstance().emit(CardReturnedToDeckEvent(label, deck->size()));
    return true;
}

void TableInteractionSystem::resolveMerge(TableObject& subject, GroupId group) {
    TableObject* other = scene.world.topmostCardOverlapping(subject.getRect(), subject.getId(), group);
    if (!other) return;

    GroupId merged = scene.world.attemptStack(subject.getId(), other->getId());
    if (const Amarre* a = scene.world.findGroup(merged)) {
        std::cout << "[TableInteraction] Stack " << a->id << " now holds "
                  << a->members.size() << " cards\n";
    }
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

bool TableInteractionSystem::isRepeatClick(ObjectId id, uint32_t now) const {
    if (lastClicked == kNoObject || lastClicked != id) return false;
    int64_t age = ageMs(now, lastClickMs);
    return age >= 0 && age <= static_cast<int64_t>(settings.doubleClickMs);
}

void TableInteractionSystem::recenter() {
    glm::vec2 target(0.0f);
    if (const TableObject* deckObj = scene.world.deck()) {
        target = deckObj->getRect().center();
    }
    scene.camera.centerOn(target);
    std::cout << "[TableInteraction] Camera recentered on ("
              << target.x << ", " << target.y << ")\n";
}
