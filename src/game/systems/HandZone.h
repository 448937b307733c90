// HandZone.h

#pragma once
#include <glm/glm.hpp>
#include <vector>
#include "../TableObject.h"

class TableWorld;
class Camera2D;
struct GameConfigData;

struct HandSettings {
    float marginRatio = 0.08f;        // left/right, of screen width
    float bottomMarginRatio = 0.0f;   // of screen height
    float arcHeightRatio = 0.15f;
    float hoverLiftRatio = 0.20f;
    float zoneHeightRatio = 0.25f;    // drop band at the bottom
    float maxScale = 1.5f;
    float hoverScale = 1.5f;          // on top of the fan scale
    float hangDepthRatio = 0.40f;     // of a card height, below the screen edge

    static HandSettings fromConfig(const GameConfigData& cfg);
};

/*  Screen-anchored fan of cards along the bottom edge. Cards in the
    hand keep their TableObject but live in screen space until they
    are dragged back onto the table.                                  */
class HandZone {
public:
    explicit HandZone(const HandSettings& settings = {});

    bool addCard(TableWorld& world, ObjectId id);
    bool removeCard(TableWorld& world, ObjectId id);
    bool contains(ObjectId id) const;
    const std::vector<ObjectId>& getCards() const { return cards; }
    size_t size() const { return cards.size(); }

    float zoneTop(float screenH) const;
    bool isInZone(float screenY, float screenH) const;

    // Accepts an ungrouped card whose pointer or screen rect reaches
    // the drop band.
    bool handleDrop(TableWorld& world, const Camera2D& camera, ObjectId id, const glm::vec2& pointerScreen);

    // Recomputes every hand rect except `skip` (the card being dragged).
    void layout(TableWorld& world, const glm::vec2& screenSize,
                const glm::vec2& pointerScreen, ObjectId skip = kNoObject);

    // Hit-test in screen space; the hovered card wins, then the top of the fan.
    ObjectId pickAt(const TableWorld& world, const glm::vec2& screenPoint) const;

    ObjectId getHovered() const { return hovered; }

    // Back-to-front, hovered card last.
    std::vector<ObjectId> drawOrder() const;

    const HandSettings& getSettings() const { return settings; }

private:
    HandSettings settings;
    std::vector<ObjectId> cards;
    ObjectId hovered = kNoObject;
};
