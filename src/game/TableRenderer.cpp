// TableRenderer.cpp

#include "TableRenderer.h"
#include "TableScene.h"
#include "GameConfig.h"
#include "ui/CardImageFactory.h"
#include "../engine/render/SpriteRenderer.h"
#include "../engine/render/GridRenderer.h"
#include <glad/glad.h>
#include <algorithm>

namespace {
    constexpr float kShadowAlpha = 160.0f / 255.0f;
    constexpr float kHandBandAlpha = 0.06f;
}

TableRenderer::TableRenderer(const GameConfigData& cfg)
    : sprites(std::make_unique<SpriteRenderer>()),
      grid(std::make_unique<GridRenderer>(cfg.cellSize, cfg.dashLength, cfg.gapLength)),
      images(std::make_unique<CardImageFactory>(cfg.cardFontPath, cfg.cardBoldFontPath,
                                                glm::vec2(cfg.cardWidth, cfg.cardHeight),
                                                cfg.renderScale)),
      shadowLifetime(cfg.shadowLifetime)
{}

TableRenderer::~TableRenderer() = default;

void TableRenderer::draw(const TableScene& scene, const InteractionView& view, float nowSeconds) {
    const glm::vec2 screen = scene.camera.getScreenSize();

    if (view.dragged != kNoObject || view.panning) {
        grid->draw(scene.camera);
    }

    sprites->begin(scene.camera.getScreenProjection());

    // Drop band hint while something is in flight.
    if (view.dragged != kNoObject) {
        const float top = scene.hand.zoneTop(screen.y);
        sprites->drawRect({0.0f, top}, {screen.x, screen.y - top}, glm::vec3(1.0f), kHandBandAlpha);
    }

    auto isDraggedNow = [&](const TableObject& obj) {
        if (obj.getId() == view.dragged) return true;
        return view.draggedGroup != kNoGroup && obj.getGroup() == view.draggedGroup;
    };

    for (const auto& obj : scene.world.getObjects()) {
        if (obj->isInHand() || isDraggedNow(*obj)) continue;
        drawWorldObject(scene, *obj, nowSeconds);
    }

    for (ObjectId id : scene.hand.drawOrder()) {
        if (id == view.dragged) continue;
        if (const TableObject* card = scene.world.find(id)) drawHandCard(*card);
    }

    // Dragged object (and the rest of its stack) on top of everything.
    if (view.dragged != kNoObject) {
        for (const auto& obj : scene.world.getObjects()) {
            if (!isDraggedNow(*obj) || obj->getId() == view.dragged) continue;
            drawWorldObject(scene, *obj, nowSeconds);
        }
        if (const TableObject* obj = scene.world.find(view.dragged)) {
            drawWorldObject(scene, *obj, nowSeconds);
        }
    }

    sprites->end();
}

void TableRenderer::drawWorldObject(const TableScene& scene, const TableObject& obj, float nowSeconds) {
    const Texture2D* tex = images->imageFor(obj);
    if (!tex || !tex->isValid()) return;

    drawShadowTrail(scene, obj, tex->getID(), nowSeconds);

    const float zoom = scene.camera.getZoom();
    const glm::vec2 topLeft = scene.camera.worldToScreen(obj.getPosition());
    sprites->drawTexture(tex->getID(), topLeft, obj.getSize() * zoom);
}

void TableRenderer::drawShadowTrail(const TableScene& scene, const TableObject& obj, unsigned int texture, float nowSeconds) {
    const auto& trail = obj.getShadowTrail();
    if (trail.empty() || shadowLifetime <= 0.0f) return;

    const float zoom = scene.camera.getZoom();
    const glm::vec2 base = obj.getBaseSize();

    for (const auto& sample : trail) {
        const float age = nowSeconds - sample.time;
        if (age < 0.0f || age > shadowLifetime) continue;
        const float fade = 1.0f - age / shadowLifetime;

        const glm::vec2 size = glm::max(glm::round(base * sample.scale), glm::vec2(1.0f));
        sprites->drawTexture(texture,
                             scene.camera.worldToScreen(sample.position),
                             size * zoom,
                             glm::vec3(0.0f),
                             kShadowAlpha * fade);
    }
}

void TableRenderer::drawHandCard(const TableObject& obj) {
    const auto& rect = obj.getHandRect();
    if (!rect) return;
    const Texture2D* tex = images->imageFor(obj);
    if (!tex || !tex->isValid()) return;
    sprites->drawTexture(tex->getID(), rect->topLeft(), rect->size());
}
