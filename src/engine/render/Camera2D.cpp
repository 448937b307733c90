// Camera2D.cpp

#include "Camera2D.h"

#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

namespace {
    constexpr float kZoomEpsilon = 1e-6f;
}

Camera2D::Camera2D(float screenW, float screenH, float minZoom, float maxZoom, float zoomStep)
    : screenSize(screenW, screenH),
      minZoom(std::min(minZoom, maxZoom)),
      maxZoom(std::max(minZoom, maxZoom)),
      zoomStep(zoomStep)
{
    zoom = std::clamp(1.0f, this->minZoom, this->maxZoom);
}

glm::vec2 Camera2D::worldToScreen(const glm::vec2& p) const {
    return getScreenCenter() + (p - center) * zoom;
}

glm::vec2 Camera2D::screenToWorld(const glm::vec2& p) const {
    glm::vec2 offset = p - getScreenCenter();
    if (zoom != 0.0f) {
        offset /= zoom;
    }
    return center + offset;
}

bool Camera2D::adjustZoom(int steps, const glm::vec2& cursorScreen) {
    if (steps == 0) return false;

    float target = zoom * std::pow(zoomStep, static_cast<float>(steps));
    target = std::clamp(target, minZoom, maxZoom);
    if (std::abs(target - zoom) < kZoomEpsilon) return false;

    glm::vec2 worldBefore = screenToWorld(cursorScreen);
    zoom = target;
    glm::vec2 worldAfter = screenToWorld(cursorScreen);
    center += worldBefore - worldAfter;
    return true;
}

void Camera2D::pan(const glm::vec2& deltaScreen) {
    center -= deltaScreen / std::max(zoom, kZoomEpsilon);
}

void Camera2D::centerOn(const glm::vec2& worldPoint) {
    center = worldPoint;
}

void Camera2D::setScreenSize(float w, float h) {
    screenSize = glm::vec2(w, h);
}

void Camera2D::setZoom(float z) {
    zoom = std::clamp(z, minZoom, maxZoom);
}

void Camera2D::visibleWorldBounds(glm::vec2& outMin, glm::vec2& outMax) const {
    glm::vec2 a = screenToWorld(glm::vec2(0.0f));
    glm::vec2 b = screenToWorld(screenSize);
    outMin = glm::min(a, b);
    outMax = glm::max(a, b);
}

glm::mat4 Camera2D::getScreenProjection() const {
    return glm::ortho(0.0f, screenSize.x, screenSize.y, 0.0f, -1.0f, 1.0f);
}
