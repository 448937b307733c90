// TableObject.cpp

#include "TableObject.h"
#include <algorithm>
#include <cmath>

namespace {
    constexpr float kMinScale = 0.01f;
    constexpr float kScaleEpsilon = 1e-3f;
}

TableObject::TableObject(ObjectId id, ObjectKind kind, const glm::vec2& position,
                         const glm::vec2& baseSize, GridSpan span)
    : id(id), kind(kind), position(position), baseSize(baseSize), span(span)
{}

glm::vec2 TableObject::getSize() const {
    return glm::vec2(std::max(1.0f, std::round(baseSize.x * scale)),
                     std::max(1.0f, std::round(baseSize.y * scale)));
}

bool TableObject::setScale(float s) {
    s = std::max(s, kMinScale);
    if (std::abs(s - scale) < kScaleEpsilon) return false;
    scale = s;
    return true;
}

void TableObject::captureShadowSample(float now, float minDistance) {
    if (lastShadowSample) {
        glm::vec2 d = position - *lastShadowSample;
        if (glm::dot(d, d) < minDistance * minDistance) return;
    }
    shadowTrail.push_back({position, scale, now});
    lastShadowSample = position;
}

void TableObject::trimShadowTrail(float now, float lifetime) {
    // Samples stamped in the future are clock skew; drop them too.
    shadowTrail.erase(
        std::remove_if(shadowTrail.begin(), shadowTrail.end(),
                       [&](const ShadowSample& s) {
                           float age = now - s.time;
                           return age < 0.0f || age > lifetime;
                       }),
        shadowTrail.end());
    if (shadowTrail.empty()) lastShadowSample.reset();
}

void TableObject::clearShadowTrail() {
    shadowTrail.clear();
    lastShadowSample.reset();
}
