// Rect.h

#pragma once
#include <glm/glm.hpp>

// Axis-aligned box, top-left origin, y grows downward.
// Edges are half-open: the right and bottom edges are outside.
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    Rect() = default;
    Rect(float x, float y, float w, float h) : x(x), y(y), w(w), h(h) {}
    Rect(const glm::vec2& topLeft, const glm::vec2& size)
        : x(topLeft.x), y(topLeft.y), w(size.x), h(size.y) {}

    float left()   const { return x; }
    float top()    const { return y; }
    float right()  const { return x + w; }
    float bottom() const { return y + h; }

    glm::vec2 topLeft() const { return {x, y}; }
    glm::vec2 size()    const { return {w, h}; }
    glm::vec2 center()  const { return {x + w * 0.5f, y + h * 0.5f}; }

    bool contains(const glm::vec2& p) const {
        return p.x >= x && p.x < right() && p.y >= y && p.y < bottom();
    }

    // Touching edges do not count as overlap.
    bool intersects(const Rect& o) const {
        if (w <= 0.0f || h <= 0.0f || o.w <= 0.0f || o.h <= 0.0f) return false;
        return x < o.right() && o.x < right() && y < o.bottom() && o.y < bottom();
    }
};
