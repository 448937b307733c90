// TableObject.h

#pragma once

#include "Rect.h"
#include "Deck.h"
#include <glm/glm.hpp>
#include <deque>
#include <memory>
#include <optional>
#include <string>

using ObjectId = int;
using GroupId  = int;

constexpr ObjectId kNoObject = -1;
constexpr GroupId  kNoGroup  = -1;

enum class ObjectKind {
    Card,
    Deck
};

// Footprint in grid cells.
struct GridSpan {
    int cols = 1;
    int rows = 1;
};

struct ShadowSample {
    glm::vec2 position;
    float scale;
    float time;     // seconds
};

/*  One draggable thing on the table. Cards and decks share the same
    geometry; the kind decides which extra state is meaningful.       */
class TableObject {
public:
    TableObject(ObjectId id, ObjectKind kind, const glm::vec2& position,
                const glm::vec2& baseSize, GridSpan span);

    ObjectId getId() const { return id; }
    ObjectKind getKind() const { return kind; }
    bool isCard() const { return kind == ObjectKind::Card; }
    bool isDeck() const { return kind == ObjectKind::Deck; }

    // --- Geometry ---
    const glm::vec2& getPosition() const { return position; }
    void setPosition(const glm::vec2& p) { position = p; }
    const glm::vec2& getBaseSize() const { return baseSize; }
    glm::vec2 getSize() const;
    Rect getRect() const { return Rect(position, getSize()); }
    GridSpan getSpan() const { return span; }

    float getScale() const { return scale; }
    // Top-left stays where it is. Returns false for a no-op change.
    bool setScale(float s);

    // --- Shadow trail ---
    void captureShadowSample(float now, float minDistance);
    void trimShadowTrail(float now, float lifetime);
    void clearShadowTrail();
    const std::deque<ShadowSample>& getShadowTrail() const { return shadowTrail; }

    // --- Card state ---
    const std::string& getLabel() const { return label; }
    void setLabel(const std::string& l) { label = l; }

    GroupId getGroup() const { return group; }
    void setGroup(GroupId g) { group = g; }

    bool isInHand() const { return inHand; }
    void setInHand(bool v) { inHand = v; }

    bool isHandHovered() const { return handHovered; }
    void setHandHovered(bool v) { handHovered = v; }

    const std::optional<Rect>& getHandRect() const { return handRect; }
    void setHandRect(const Rect& r) { handRect = r; }
    void clearHandRect() { handRect.reset(); }

    // --- Deck state (kind == Deck only) ---
    Deck* getDeck() { return deck.get(); }
    const Deck* getDeck() const { return deck.get(); }
    void attachDeck(std::unique_ptr<Deck> d) { deck = std::move(d); }

private:
    ObjectId id;
    ObjectKind kind;
    glm::vec2 position;
    glm::vec2 baseSize;
    GridSpan span;
    float scale = 1.0f;

    std::deque<ShadowSample> shadowTrail;
    std::optional<glm::vec2> lastShadowSample;

    std::string label;
    GroupId group = kNoGroup;
    bool inHand = false;
    bool handHovered = false;
    std::optional<Rect> handRect;

    std::unique_ptr<Deck> deck;
};
