// HandZone.cpp

#include "HandZone.h"
#include "../TableWorld.h"
#include "../GameConfig.h"
#include "../../engine/render/Camera2D.h"
#include <algorithm>

HandSettings HandSettings::fromConfig(const GameConfigData& cfg) {
    HandSettings s;
    s.marginRatio       = cfg.handMarginRatio;
    s.bottomMarginRatio = cfg.handBottomMarginRatio;
    s.arcHeightRatio    = cfg.handArcHeightRatio;
    s.hoverLiftRatio    = cfg.handHoverLiftRatio;
    s.zoneHeightRatio   = cfg.handZoneHeightRatio;
    s.maxScale          = cfg.handScale;
    s.hoverScale        = cfg.handHoverScale;
    s.hangDepthRatio    = cfg.handHangDepthRatio;
    return s;
}

HandZone::HandZone(const HandSettings& settings)
    : settings(settings)
{}

bool HandZone::addCard(TableWorld& world, ObjectId id) {
    TableObject* card = world.find(id);
    if (!card || !card->isCard()) return false;

    // A card is either stacked or in the hand, never both.
    if (card->getGroup() != kNoGroup) world.detach(id);

    card->setInHand(true);
    card->setScale(1.0f);
    card->clearShadowTrail();
    if (!contains(id)) cards.push_back(id);
    return true;
}

bool HandZone::removeCard(TableWorld& world, ObjectId id) {
    auto it = std::find(cards.begin(), cards.end(), id);
    if (it == cards.end()) return false;
    cards.erase(it);
    if (hovered == id) hovered = kNoObject;

    if (TableObject* card = world.find(id)) {
        card->setInHand(false);
        card->setHandHovered(false);
        card->clearHandRect();
    }
    return true;
}

bool HandZone::contains(ObjectId id) const {
    return std::find(cards.begin(), cards.end(), id) != cards.end();
}

float HandZone::zoneTop(float screenH) const {
    return screenH * (1.0f - settings.zoneHeightRatio);
}

bool HandZone::isInZone(float screenY, float screenH) const {
    return screenY >= zoneTop(screenH);
}

bool HandZone::handleDrop(TableWorld& world, const Camera2D& camera, ObjectId id, const glm::vec2& pointerScreen) {
    TableObject* card = world.find(id);
    if (!card || !card->isCard()) return false;
    if (card->getGroup() != kNoGroup) return false;

    const float top = zoneTop(camera.getScreenSize().y);
    const Rect r = card->getRect();
    const float cardBottom = camera.worldToScreen(glm::vec2(r.left(), r.bottom())).y;

    if (pointerScreen.y < top && cardBottom < top) return false;
    return addCard(world, id);
}

void HandZone::layout(TableWorld& world, const glm::vec2& screenSize,
                      const glm::vec2& pointerScreen, ObjectId skip)
{
    // Forget cards that were removed from the table behind our back.
    cards.erase(std::remove_if(cards.begin(), cards.end(),
                               [&world](ObjectId id) {
                                   const TableObject* c = world.find(id);
                                   return !c || !c->isInHand();
                               }),
                cards.end());

    std::vector<TableObject*> laid;
    for (ObjectId id : cards) {
        TableObject* card = world.find(id);
        if (id == skip) {
            card->setHandHovered(false);
            continue;
        }
        laid.push_back(card);
    }

    if (laid.empty()) {
        hovered = kNoObject;
        return;
    }

    const float w = screenSize.x;
    const float h = screenSize.y;
    const glm::vec2 base = world.getCardSize();
    const int count = static_cast<int>(laid.size());

    const float margin = w * settings.marginRatio;
    const float usable = std::max(0.0f, w - 2.0f * margin);
    const float baseScale = std::max(0.1f, std::min(settings.maxScale, usable / (base.x * count)));
    const float cardW = base.x * baseScale;

    const float arcHeight = h * settings.arcHeightRatio;
    const float hoverLift = h * settings.hoverLiftRatio;
    const float bottomMargin = h * settings.bottomMarginRatio;
    const float hang = base.y * settings.hangDepthRatio;

    std::vector<float> centers(count);
    std::vector<float> lifts(count);
    if (count == 1) {
        centers[0] = w * 0.5f;
        lifts[0] = arcHeight;
    } else {
        const float start = margin + cardW * 0.5f;
        const float step = std::max(0.0f, usable - cardW) / static_cast<float>(count - 1);
        for (int i = 0; i < count; ++i) {
            centers[i] = start + step * i;
            float n = static_cast<float>(i) / static_cast<float>(count - 1) * 2.0f - 1.0f;
            lifts[i] = arcHeight * (1.0f - n * n);
        }
    }

    auto rectFor = [&](int i, bool isHovered) {
        float s = isHovered ? baseScale * settings.hoverScale : baseScale;
        float lift = isHovered ? std::max(lifts[i], hoverLift) : lifts[i];
        float sw = base.x * s;
        float sh = base.y * s;
        return Rect(centers[i] - sw * 0.5f, h + hang - sh - lift - bottomMargin, sw, sh);
    };

    // Last frame's hovered card keeps priority while the pointer stays
    // inside its enlarged rect.
    int hoveredIndex = -1;
    for (int i = 0; i < count; ++i) {
        if (laid[i]->getId() == hovered && rectFor(i, true).contains(pointerScreen)) {
            hoveredIndex = i;
            break;
        }
    }
    if (hoveredIndex < 0) {
        for (int i = 0; i < count; ++i) {
            if (rectFor(i, false).contains(pointerScreen)) {
                hoveredIndex = i;
                break;
            }
        }
    }
    hovered = hoveredIndex >= 0 ? laid[hoveredIndex]->getId() : kNoObject;

    for (int i = 0; i < count; ++i) {
        bool isHovered = (i == hoveredIndex);
        laid[i]->setHandRect(rectFor(i, isHovered));
        laid[i]->setHandHovered(isHovered);
    }
}

ObjectId HandZone::pickAt(const TableWorld& world, const glm::vec2& screenPoint) const {
    if (hovered != kNoObject) {
        const TableObject* card = world.find(hovered);
        if (card && card->getHandRect() && card->getHandRect()->contains(screenPoint)) return hovered;
    }
    for (auto it = cards.rbegin(); it != cards.rend(); ++it) {
        const TableObject* card = world.find(*it);
        if (!card || !card->isInHand() || !card->getHandRect()) continue;
        if (card->getHandRect()->contains(screenPoint)) return *it;
    }
    return kNoObject;
}

std::vector<ObjectId> HandZone::drawOrder() const {
    std::vector<ObjectId> order;
    order.reserve(cards.size());
    for (ObjectId id : cards) {
        if (id != hovered) order.push_back(id);
    }
    if (hovered != kNoObject && contains(hovered)) order.push_back(hovered);
    return order;
}
