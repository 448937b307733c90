// SpatialGrid.cpp

#include "SpatialGrid.h"
#include "TableWorld.h"
#include <algorithm>
#include <cmath>

SpatialGrid::SpatialGrid(float cellSize)
    : cellSize(cellSize > 0.0f ? cellSize : 48.0f)
{}

glm::vec2 SpatialGrid::marginFor(const glm::vec2& size, GridSpan span) const {
    return glm::vec2(std::max(0.0f, (span.cols * cellSize - size.x) * 0.5f),
                     std::max(0.0f, (span.rows * cellSize - size.y) * 0.5f));
}

glm::ivec2 SpatialGrid::gridCellOf(const glm::vec2& topLeft, const glm::vec2& size, GridSpan span) const {
    glm::vec2 origin = topLeft - marginFor(size, span);
    // Halfway positions go to the even cell.
    return glm::ivec2(static_cast<int>(std::nearbyint(origin.x / cellSize)),
                      static_cast<int>(std::nearbyint(origin.y / cellSize)));
}

glm::ivec2 SpatialGrid::gridCellOf(const TableObject& obj) const {
    return gridCellOf(obj.getPosition(), obj.getSize(), obj.getSpan());
}

glm::vec2 SpatialGrid::cellToPosition(const glm::ivec2& cell, const glm::vec2& size, GridSpan span) const {
    glm::vec2 p = glm::vec2(cell) * cellSize + marginFor(size, span);
    // Committed positions are whole pixels.
    return glm::vec2(std::trunc(p.x), std::trunc(p.y));
}

glm::vec2 SpatialGrid::snapPosition(const glm::vec2& topLeft, const glm::vec2& size, GridSpan span) const {
    return cellToPosition(gridCellOf(topLeft, size, span), size, span);
}

void SpatialGrid::snap(TableObject& obj) const {
    obj.setPosition(snapPosition(obj.getPosition(), obj.getSize(), obj.getSpan()));
}

std::optional<glm::vec2> SpatialGrid::findFreeSlot(const TableWorld& world,
                                                   const TableObject& anchor,
                                                   const glm::vec2& size,
                                                   GridSpan span,
                                                   const std::vector<ObjectId>& ignore) const
{
    const glm::ivec2 origin = gridCellOf(anchor);
    const int sx = span.cols;
    const int sy = span.rows;
    const glm::ivec2 offsets[] = {
        { sx,   0}, {-sx,   0}, {  0, -sy}, {  0,  sy},
        { sx, -sy}, { sx,  sy}, {-sx, -sy}, {-sx,  sy}
    };

    for (const auto& off : offsets) {
        glm::vec2 pos = cellToPosition(origin + off, size, span);
        Rect candidate(pos, size);

        bool blocked = false;
        for (const auto& obj : world.getObjects()) {
            if (obj->getId() == anchor.getId() || obj->isInHand()) continue;
            if (std::find(ignore.begin(), ignore.end(), obj->getId()) != ignore.end()) continue;
            if (obj->getRect().intersects(candidate)) { blocked = true; break; }
        }
        if (!blocked) return pos;
    }
    return std::nullopt;
}
