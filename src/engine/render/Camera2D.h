// Camera2D.h

#pragma once

#include <glm/glm.hpp>

// Top-down table camera. World space is unbounded; screen space is the
// viewport in pixels with the origin at the top-left corner.
class Camera2D {
public:
    Camera2D(float screenW, float screenH,
             float minZoom = 0.25f, float maxZoom = 2.0f, float zoomStep = 1.2f);

    glm::vec2 worldToScreen(const glm::vec2& p) const;
    glm::vec2 screenToWorld(const glm::vec2& p) const;

    // Multiplies zoom by zoomStep^steps, keeping the world point under
    // `cursorScreen` fixed. Returns false when the zoom did not change.
    bool adjustZoom(int steps, const glm::vec2& cursorScreen);
    void pan(const glm::vec2& deltaScreen);
    void centerOn(const glm::vec2& worldPoint);

    void setScreenSize(float w, float h);
    void setZoom(float z);

    glm::vec2 getCenter() const { return center; }
    float getZoom() const { return zoom; }
    float getMinZoom() const { return minZoom; }
    float getMaxZoom() const { return maxZoom; }
    glm::vec2 getScreenSize() const { return screenSize; }
    glm::vec2 getScreenCenter() const { return screenSize * 0.5f; }

    // World-space box covered by the viewport.
    void visibleWorldBounds(glm::vec2& outMin, glm::vec2& outMax) const;

    // Pixel-space ortho projection (y down) for the 2D renderers.
    glm::mat4 getScreenProjection() const;

private:
    glm::vec2 center{0.0f, 0.0f};
    glm::vec2 screenSize;
    float zoom = 1.0f;
    float minZoom;
    float maxZoom;
    float zoomStep;
};
