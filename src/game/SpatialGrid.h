// SpatialGrid.h

#pragma once
#include <optional>
#include <vector>
#include <glm/glm.hpp>
#include "TableObject.h"

class TableWorld;

/*  Uniform square grid the table snaps to. An object reserves a
    span-sized block of cells and sits centered inside it.          */
class SpatialGrid {
public:
    explicit SpatialGrid(float cellSize = 48.0f);

    float getCellSize() const { return cellSize; }

    // Offset that centers `size` inside a span-sized block.
    glm::vec2 marginFor(const glm::vec2& size, GridSpan span) const;

    glm::vec2 snapPosition(const glm::vec2& topLeft, const glm::vec2& size, GridSpan span) const;
    void snap(TableObject& obj) const;

    glm::ivec2 gridCellOf(const glm::vec2& topLeft, const glm::vec2& size, GridSpan span) const;
    glm::ivec2 gridCellOf(const TableObject& obj) const;

    glm::vec2 cellToPosition(const glm::ivec2& cell, const glm::vec2& size, GridSpan span) const;

    // First neighbour block around `anchor` (right, left, up, down, then
    // the diagonals) that overlaps nothing on the table. `ignore` and
    // the anchor itself never block; neither do in-hand cards.
    std::optional<glm::vec2> findFreeSlot(const TableWorld& world,
                                          const TableObject& anchor,
                                          const glm::vec2& size,
                                          GridSpan span,
                                          const std::vector<ObjectId>& ignore = {}) const;

private:
    float cellSize;
};
