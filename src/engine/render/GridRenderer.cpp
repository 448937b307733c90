// GridRenderer.cpp

#include "GridRenderer.h"
#include "../utils/Shader.h"
#include "../utils/ShaderLibrary.h"
#include <glad/glad.h>
#include <algorithm>
#include <cmath>

GridRenderer::GridRenderer(float cellSize, float dashLength, float gapLength)
    : cellSize(std::max(1.0f, cellSize)),
      dashLength(std::max(1.0f, dashLength)),
      gapLength(std::max(0.0f, gapLength))
{
    lineShader = ShaderLibrary::get("assets/shaders/ui/line.vert", "assets/shaders/ui/line.frag");

    vao.bind();
    vbo.bind();
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 2 * sizeof(float), (void*)0);
    glEnableVertexAttribArray(0);
    VertexArray::unbind();
}

void GridRenderer::draw(const Camera2D& camera) {
    rebuild(camera);
    if (vertices.empty()) return;

    glDisable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    lineShader->use();
    lineShader->setUniform("u_Projection", camera.getScreenProjection());
    lineShader->setUniform("u_Color", color);
    lineShader->setUniform("u_Alpha", alpha);

    vao.bind();
    vbo.upload(static_cast<GLsizeiptr>(vertices.size() * sizeof(float)), vertices.data(), GL_DYNAMIC_DRAW);
    glDrawArrays(GL_LINES, 0, static_cast<GLsizei>(vertices.size() / 2));
    VertexArray::unbind();

    glDisable(GL_BLEND);
}

void GridRenderer::rebuild(const Camera2D& camera) {
    vertices.clear();

    glm::vec2 lo, hi;
    camera.visibleWorldBounds(lo, hi);

    const float startX = std::floor(lo.x / cellSize) * cellSize;
    const float endX   = std::ceil(hi.x / cellSize) * cellSize;
    const float startY = std::floor(lo.y / cellSize) * cellSize;
    const float endY   = std::ceil(hi.y / cellSize) * cellSize;

    for (float x = startX; x <= endX; x += cellSize) {
        appendDashedLine(camera, {x, startY}, {x, endY});
    }
    for (float y = startY; y <= endY; y += cellSize) {
        appendDashedLine(camera, {startX, y}, {endX, y});
    }
}

// Dash and gap lengths are world units, so the pattern zooms with the table.
void GridRenderer::appendDashedLine(const Camera2D& camera, const glm::vec2& from, const glm::vec2& to) {
    const glm::vec2 delta = to - from;
    const float length = glm::length(delta);
    if (length <= 0.0f) return;
    const glm::vec2 dir = delta / length;

    for (float progress = 0.0f; progress < length; progress += dashLength + gapLength) {
        const float dashEnd = std::min(progress + dashLength, length);
        const glm::vec2 a = camera.worldToScreen(from + dir * progress);
        const glm::vec2 b = camera.worldToScreen(from + dir * dashEnd);
        vertices.insert(vertices.end(), {std::round(a.x), std::round(a.y), std::round(b.x), std::round(b.y)});
    }
}
