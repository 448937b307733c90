// GridRenderer.h

#pragma once

#include "Camera2D.h"
#include "../utils/GLResource.h"
#include <glm/glm.hpp>
#include <memory>
#include <vector>

class Shader;

// Dashed table grid over whatever part of the world is on screen.
class GridRenderer {
public:
    GridRenderer(float cellSize, float dashLength = 10.0f, float gapLength = 6.0f);

    void draw(const Camera2D& camera);

    void setColor(const glm::vec3& c, float a) { color = c; alpha = a; }

private:
    void rebuild(const Camera2D& camera);
    void appendDashedLine(const Camera2D& camera, const glm::vec2& from, const glm::vec2& to);

    std::shared_ptr<Shader> lineShader;
    VertexArray vao;
    BufferObject vbo{GL_ARRAY_BUFFER};
    std::vector<float> vertices;   // screen-space x,y pairs

    float cellSize;
    float dashLength;
    float gapLength;
    glm::vec3 color{1.0f};
    float alpha = 150.0f / 255.0f;
};
