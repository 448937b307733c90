// TableRenderer.h

#pragma once

#include "TableObject.h"
#include <glm/glm.hpp>
#include <memory>

struct TableScene;
struct GameConfigData;
class SpriteRenderer;
class GridRenderer;
class CardImageFactory;

// What the render pass needs to know about the pointer state machine.
struct InteractionView {
    ObjectId dragged = kNoObject;
    GroupId draggedGroup = kNoGroup;
    bool panning = false;
};

/*  Draws the table in layers: grid (only while dragging or panning),
    the drop band, world objects back-to-front with their shadow
    trails, the hand fan, and finally whatever is being dragged.      */
class TableRenderer {
public:
    explicit TableRenderer(const GameConfigData& cfg);
    ~TableRenderer();

    void draw(const TableScene& scene, const InteractionView& view, float nowSeconds);

private:
    void drawWorldObject(const TableScene& scene, const TableObject& obj, float nowSeconds);
    void drawShadowTrail(const TableScene& scene, const TableObject& obj, unsigned int texture, float nowSeconds);
    void drawHandCard(const TableObject& obj);

    std::unique_ptr<SpriteRenderer> sprites;
    std::unique_ptr<GridRenderer> grid;
    std::unique_ptr<CardImageFactory> images;
    float shadowLifetime;
};
