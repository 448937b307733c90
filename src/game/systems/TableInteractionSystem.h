// TableInteractionSystem.h

#pragma once

#include "../../engine/core/IUpdatable.h"
#include "../../engine/core/IInputState.h"
#include "../../engine/events/Event.h"
#include "../../engine/events/EventManager.h"
#include "../TableObject.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

struct TableScene;
struct GameConfigData;

struct InteractionSettings {
    float liftScale = 1.15f;
    uint32_t doubleClickMs = 400;
    uint32_t escapeDoublePressMs = 500;
    float shadowLifetime = 0.25f;
    float shadowMinDistance = 8.0f;

    static InteractionSettings fromConfig(const GameConfigData& cfg);
};

/*  Pointer/keyboard state machine for the table: picking, dragging,
    the Ctrl+double-click draw, panning, wheel zoom and the Escape
    double-press recenter.                                            */
class TableInteractionSystem : public IUpdatable {
public:
    TableInteractionSystem(TableScene& scene, const IInputState& input,
                           const InteractionSettings& settings = {});
    ~TableInteractionSystem() override;

    TableInteractionSystem(const TableInteractionSystem&) = delete;
    TableInteractionSystem& operator=(const TableInteractionSystem&) = delete;

    void update(float deltaTime) override;

    void onMouseButtonDown(MouseButton button, int x, int y);
    void onMouseButtonUp(MouseButton button, int x, int y);
    void onMouseWheel(int steps);
    void onKeyDown(Key key);

    bool isDragging() const { return dragged != kNoObject; }
    bool isPanning() const { return panning; }
    ObjectId getDragged() const { return dragged; }
    GroupId getDraggedGroup() const { return draggedGroup; }

private:
    void beginDrag(TableObject& obj, const glm::vec2& worldPointer, bool modifier);
    void beginHandDrag(ObjectId id, const glm::vec2& screenPointer);
    void followPointer(const glm::vec2& screenPointer, float now);
    void endDrag(const glm::vec2& screenPointer);
    void resetDrag();

    bool drawFromDeck(TableObject& deckObj);
    bool returnToDeck(TableObject& card);
    void resolveMerge(TableObject& subject, GroupId group);

    bool isRepeatClick(ObjectId id, uint32_t now) const;
    void recenter();

    TableScene& scene;
    const IInputState& input;
    InteractionSettings settings;

    // drag
    ObjectId dragged = kNoObject;
    GroupId draggedGroup = kNoGroup;
    glm::vec2 dragOffset{0.0f};
    glm::vec2 preDragPosition{0.0f};
    bool draggingFromHand = false;
    bool draggingFreshDraw = false;

    // pan
    bool panning = false;
    glm::vec2 panLast{0.0f};

    // click tracking
    ObjectId lastClicked = kNoObject;
    uint32_t lastClickMs = 0;

    bool escapeArmed = false;
    uint32_t lastEscapeMs = 0;

    std::vector<EventManager::SubscriptionId> subscriptions;
};
