// SpriteRenderer.h

#pragma once

#include "../utils/GLResource.h"
#include <glm/glm.hpp>
#include <memory>

class Shader;

// Screen-space textured or flat quads with tint and alpha.
class SpriteRenderer {
public:
    SpriteRenderer();

    // Binds the program and enables alpha blending until end().
    void begin(const glm::mat4& projection);
    void drawTexture(GLuint texture, const glm::vec2& topLeft, const glm::vec2& size,
                     const glm::vec3& tint = glm::vec3(1.0f), float alpha = 1.0f);
    void drawRect(const glm::vec2& topLeft, const glm::vec2& size,
                  const glm::vec3& color, float alpha = 1.0f);
    void end();

private:
    void drawQuad(const glm::vec2& topLeft, const glm::vec2& size);

    std::shared_ptr<Shader> shader;
    VertexArray vao;
    BufferObject vbo{GL_ARRAY_BUFFER};
    BufferObject ebo{GL_ELEMENT_ARRAY_BUFFER};
};
