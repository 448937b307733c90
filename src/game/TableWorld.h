// TableWorld.h
#pragma once
#include <memory>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "TableObject.h"

// A stack of cards that move and scale as one. members[0] is the anchor.
struct Amarre {
    GroupId id = kNoGroup;
    std::vector<ObjectId> members;
    float scale = 1.0f;
};

/*  Owns every object on the table (back-to-front z-order) and the
    group table. Cards refer to groups by id only.                   */
class TableWorld {
public:
    explicit TableWorld(const glm::vec2& cardSize = {90.0f, 132.0f},
                        GridSpan cardSpan = {2, 3});

    // --- Objects ---
    ObjectId spawnCard(const std::string& label, const glm::vec2& position);
    ObjectId spawnDeck(std::unique_ptr<Deck> deck, const glm::vec2& position);
    bool remove(ObjectId id);

    TableObject* find(ObjectId id);
    const TableObject* find(ObjectId id) const;

    // Top-most object under a world point; in-hand cards are skipped.
    TableObject* topmostAt(const glm::vec2& worldPoint);

    // Top-most card (not in hand, not in `ignoreGroup`, not `self`)
    // whose rect overlaps `rect`.
    TableObject* topmostCardOverlapping(const Rect& rect, ObjectId self, GroupId ignoreGroup);

    void bringToFront(ObjectId id);
    void bringGroupToFront(GroupId g);

    TableObject* deck();
    const TableObject* deck() const;

    const std::vector<std::unique_ptr<TableObject>>& getObjects() const { return objects; }
    const glm::vec2& getCardSize() const { return cardSize; }
    GridSpan getCardSpan() const { return cardSpan; }

    // --- Groups ---
    GroupId createGroup(ObjectId anchor, ObjectId other);
    bool addToGroup(GroupId g, ObjectId card);
    // Reparents every member of `absorbed` into `survivor`.
    GroupId mergeGroups(GroupId survivor, GroupId absorbed);
    // Stacks `dragged` with `other`, creating, growing or uniting groups.
    GroupId attemptStack(ObjectId dragged, ObjectId other);
    bool detach(ObjectId card);
    void moveGroup(GroupId g, const glm::vec2& position);
    void setGroupScale(GroupId g, float scale);
    // Snaps members onto the anchor and applies the group scale.
    void syncGroup(GroupId g);
    int dissolveUndersized();

    Amarre* findGroup(GroupId g);
    const Amarre* findGroup(GroupId g) const;
    const std::vector<Amarre>& getGroups() const { return groups; }
    TableObject* groupAnchor(GroupId g);

    // True when every group has >= 2 live members that point back at it,
    // and no card points at a missing group.
    bool checkGroupInvariants() const;

private:
    void dissolve(GroupId g);
    size_t indexOf(ObjectId id) const;

    std::vector<std::unique_ptr<TableObject>> objects;
    std::vector<Amarre> groups;

    glm::vec2 cardSize;
    GridSpan cardSpan;
    ObjectId nextObjectId = 1;
    GroupId nextGroupId = 1;
};
