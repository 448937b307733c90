// TableWorld.cpp
#include "TableWorld.h"
#include "LogBus.h"
#include <algorithm>
#include <iostream>

TableWorld::TableWorld(const glm::vec2& cardSize, GridSpan cardSpan)
    : cardSize(cardSize), cardSpan(cardSpan)
{}

ObjectId TableWorld::spawnCard(const std::string& label, const glm::vec2& position) {
    auto obj = std::make_unique<TableObject>(nextObjectId++, ObjectKind::Card, position, cardSize, cardSpan);
    obj->setLabel(label);
    ObjectId id = obj->getId();
    objects.push_back(std::move(obj));
    return id;
}

ObjectId TableWorld::spawnDeck(std::unique_ptr<Deck> d, const glm::vec2& position) {
    auto obj = std::make_unique<TableObject>(nextObjectId++, ObjectKind::Deck, position, cardSize, cardSpan);
    obj->setLabel("Deck");
    obj->attachDeck(d ? std::move(d) : std::make_unique<Deck>());
    ObjectId id = obj->getId();
    objects.push_back(std::move(obj));
    std::cout << "[TableWorld] Spawned deck (ID: " << id << ", "
              << objects.back()->getDeck()->size() << " cards)\n";
    return id;
}

bool TableWorld::remove(ObjectId id) {
    size_t idx = indexOf(id);
    if (idx == objects.size()) return false;

    if (objects[idx]->getGroup() != kNoGroup) {
        detach(id);
        idx = indexOf(id);
    }
    objects.erase(objects.begin() + static_cast<std::ptrdiff_t>(idx));
    return true;
}

TableObject* TableWorld::find(ObjectId id) {
    size_t idx = indexOf(id);
    return idx == objects.size() ? nullptr : objects[idx].get();
}

const TableObject* TableWorld::find(ObjectId id) const {
    size_t idx = indexOf(id);
    return idx == objects.size() ? nullptr : objects[idx].get();
}

TableObject* TableWorld::topmostAt(const glm::vec2& worldPoint) {
    for (auto it = objects.rbegin(); it != objects.rend(); ++it) {
        TableObject& obj = **it;
        if (obj.isInHand()) continue;
        if (obj.getRect().contains(worldPoint)) return &obj;
    }
    return nullptr;
}

TableObject* TableWorld::topmostCardOverlapping(const Rect& rect, ObjectId self, GroupId ignoreGroup) {
    for (auto it = objects.rbegin(); it != objects.rend(); ++it) {
        TableObject& obj = **it;
        if (!obj.isCard() || obj.isInHand() || obj.getId() == self) continue;
        if (ignoreGroup != kNoGroup && obj.getGroup() == ignoreGroup) continue;
        if (obj.getRect().intersects(rect)) return &obj;
    }
    return nullptr;
}

void TableWorld::bringToFront(ObjectId id) {
    size_t idx = indexOf(id);
    if (idx == objects.size() || idx + 1 == objects.size()) return;
    auto obj = std::move(objects[idx]);
    objects.erase(objects.begin() + static_cast<std::ptrdiff_t>(idx));
    objects.push_back(std::move(obj));
}

void TableWorld::bringGroupToFront(GroupId g) {
    const Amarre* group = findGroup(g);
    if (!group) return;
    // Stable partition keeps the members' relative order.
    std::stable_partition(objects.begin(), objects.end(),
                          [g](const std::unique_ptr<TableObject>& o) { return o->getGroup() != g; });
}

TableObject* TableWorld::deck() {
    for (auto& obj : objects) {
        if (obj->isDeck()) return obj.get();
    }
    return nullptr;
}

const TableObject* TableWorld::deck() const {
    for (const auto& obj : objects) {
        if (obj->isDeck()) return obj.get();
    }
    return nullptr;
}

// -----------------------------------------------------------------------------
// Groups
// -----------------------------------------------------------------------------

GroupId TableWorld::createGroup(ObjectId anchorId, ObjectId otherId) {
    if (anchorId == otherId) return kNoGroup;
    TableObject* anchor = find(anchorId);
    TableObject* other  = find(otherId);
    if (!anchor || !other) return kNoGroup;
    if (!anchor->isCard() || !other->isCard()) return kNoGroup;
    if (anchor->isInHand() || other->isInHand()) return kNoGroup;
    if (anchor->getGroup() != kNoGroup || other->getGroup() != kNoGroup) return kNoGroup;

    Amarre group;
    group.id = nextGroupId++;
    group.members = {anchorId, otherId};
    group.scale = 1.0f;
    anchor->setGroup(group.id);
    other->setGroup(group.id);
    groups.push_back(group);

    syncGroup(group.id);
    LogBus::info("Stacked " + anchor->getLabel() + " with " + other->getLabel());
    return group.id;
}

bool TableWorld::addToGroup(GroupId g, ObjectId cardId) {
    Amarre* group = findGroup(g);
    TableObject* card = find(cardId);
    if (!group || !card || !card->isCard() || card->isInHand()) return false;
    if (card->getGroup() == g) return true;
    if (card->getGroup() != kNoGroup) return false;

    group->members.push_back(cardId);
    card->setGroup(g);
    syncGroup(g);
    return true;
}

GroupId TableWorld::mergeGroups(GroupId survivorId, GroupId absorbedId) {
    if (survivorId == absorbedId) return survivorId;
    Amarre* survivor = findGroup(survivorId);
    Amarre* absorbed = findGroup(absorbedId);
    if (!survivor || !absorbed) return kNoGroup;

    for (ObjectId member : absorbed->members) {
        if (TableObject* card = find(member)) {
            card->setGroup(survivorId);
            survivor->members.push_back(member);
        }
    }
    absorbed->members.clear();

    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [absorbedId](const Amarre& a) { return a.id == absorbedId; }),
                 groups.end());

    syncGroup(survivorId);
    return survivorId;
}

GroupId TableWorld::attemptStack(ObjectId draggedId, ObjectId otherId) {
    TableObject* dragged = find(draggedId);
    TableObject* other   = find(otherId);
    if (!dragged || !other || draggedId == otherId) return kNoGroup;

    const GroupId a = dragged->getGroup();
    const GroupId b = other->getGroup();

    if (a == kNoGroup && b == kNoGroup) return createGroup(otherId, draggedId);
    if (a != kNoGroup && b == kNoGroup) return addToGroup(a, otherId) ? a : kNoGroup;
    if (a == kNoGroup && b != kNoGroup) return addToGroup(b, draggedId) ? b : kNoGroup;
    return mergeGroups(a, b);
}

bool TableWorld::detach(ObjectId cardId) {
    TableObject* card = find(cardId);
    if (!card || card->getGroup() == kNoGroup) return false;

    const GroupId g = card->getGroup();
    card->setGroup(kNoGroup);
    card->setScale(1.0f);

    if (Amarre* group = findGroup(g)) {
        auto& m = group->members;
        m.erase(std::remove(m.begin(), m.end(), cardId), m.end());
        if (m.size() < 2) dissolve(g);
    }
    return true;
}

void TableWorld::moveGroup(GroupId g, const glm::vec2& position) {
    Amarre* group = findGroup(g);
    if (!group) return;
    for (ObjectId member : group->members) {
        if (TableObject* card = find(member)) card->setPosition(position);
    }
}

void TableWorld::setGroupScale(GroupId g, float scale) {
    Amarre* group = findGroup(g);
    if (!group) return;
    group->scale = scale;
    for (ObjectId member : group->members) {
        if (TableObject* card = find(member)) card->setScale(scale);
    }
}

void TableWorld::syncGroup(GroupId g) {
    TableObject* anchor = groupAnchor(g);
    if (!anchor) return;
    const Amarre* group = findGroup(g);
    for (ObjectId member : group->members) {
        if (TableObject* card = find(member)) {
            card->setScale(group->scale);
            card->setPosition(anchor->getPosition());
        }
    }
}

int TableWorld::dissolveUndersized() {
    // Drop members that no longer exist, then anything below two.
    std::vector<GroupId> doomed;
    for (auto& group : groups) {
        auto& m = group.members;
        m.erase(std::remove_if(m.begin(), m.end(),
                               [this](ObjectId id) { return find(id) == nullptr; }),
                m.end());
        if (m.size() < 2) doomed.push_back(group.id);
    }
    for (GroupId g : doomed) dissolve(g);
    return static_cast<int>(doomed.size());
}

void TableWorld::dissolve(GroupId g) {
    auto it = std::find_if(groups.begin(), groups.end(), [g](const Amarre& a) { return a.id == g; });
    if (it == groups.end()) return;

    for (ObjectId member : it->members) {
        if (TableObject* card = find(member)) {
            card->setGroup(kNoGroup);
            card->setScale(1.0f);
        }
    }
    groups.erase(it);
    std::cout << "[TableWorld] Dissolved group " << g << "\n";
}

Amarre* TableWorld::findGroup(GroupId g) {
    for (auto& group : groups) {
        if (group.id == g) return &group;
    }
    return nullptr;
}

const Amarre* TableWorld::findGroup(GroupId g) const {
    for (const auto& group : groups) {
        if (group.id == g) return &group;
    }
    return nullptr;
}

TableObject* TableWorld::groupAnchor(GroupId g) {
    const Amarre* group = findGroup(g);
    if (!group) return nullptr;
    for (ObjectId member : group->members) {
        if (TableObject* card = find(member)) return card;
    }
    return nullptr;
}

bool TableWorld::checkGroupInvariants() const {
    for (const auto& group : groups) {
        if (group.members.size() < 2) return false;
        for (ObjectId member : group.members) {
            const TableObject* card = find(member);
            if (!card || !card->isCard() || card->isInHand()) return false;
            if (card->getGroup() != group.id) return false;
        }
    }
    for (const auto& obj : objects) {
        if (obj->getGroup() == kNoGroup) continue;
        const Amarre* group = findGroup(obj->getGroup());
        if (!group) return false;
        if (std::find(group->members.begin(), group->members.end(), obj->getId()) == group->members.end())
            return false;
    }
    return true;
}

size_t TableWorld::indexOf(ObjectId id) const {
    for (size_t i = 0; i < objects.size(); ++i) {
        if (objects[i]->getId() == id) return i;
    }
    return objects.size();
}
